#pragma once

#include <unistd.h>

#include <optional>
#include <string>
#include <vector>

#include "application/ports/ILogger.hpp"

namespace burrow::host::infrastructure::process
{

class ExecutableLocator
{
 public:
  explicit ExecutableLocator(burrow::host::application::ports::ILogger& log) : log_(log) {}

  // Looks name up on build_search_path(). A name containing '/' is checked as
  // given. Returns std::nullopt when nothing matches; the caller decides
  // whether that is fatal.
  std::optional<std::string> which(const std::string& name, int mode = F_OK | X_OK) const;

  // Same lookup over an explicit directory list, without logging.
  static std::optional<std::string> find_in(const std::string& name,
                                            const std::vector<std::string>& dirs,
                                            int mode = F_OK | X_OK);

  static bool is_accessible(const std::string& path, int mode);

 private:
  burrow::host::application::ports::ILogger& log_;
};

}  // namespace burrow::host::infrastructure::process
