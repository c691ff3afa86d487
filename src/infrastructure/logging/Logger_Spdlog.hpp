#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"

namespace burrow::host::infrastructure::logging
{

class Logger_Spdlog final : public burrow::host::application::ports::ILogger
{
 public:
  // stderr, plus settings.file when set
  explicit Logger_Spdlog(const burrow::host::domain::Settings::Logging& s);

  // explicit sinks (tests, embedding)
  Logger_Spdlog(const burrow::host::domain::Settings::Logging& s,
                std::vector<spdlog::sink_ptr> sinks);

  void log(std::string_view msg) override;

  int verbosity() const override
  {
    return verbosity_;
  }

  // Physical lines for msg, without line terminators.
  static std::vector<std::string> format_lines(std::string_view prefix, std::string_view msg);

 private:
  void setup(std::vector<spdlog::sink_ptr> sinks);

  const std::string prefix_;
  const int verbosity_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace burrow::host::infrastructure::logging
