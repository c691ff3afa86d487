#pragma once

#include <string_view>

namespace burrow::host::application::ports
{

struct ILogger
{
  virtual ~ILogger() = default;

  // Writes one (possibly multi-line) message to the diagnostic stream.
  virtual void log(std::string_view msg) = 0;

  virtual int verbosity() const = 0;

  void debug1(std::string_view msg)
  {
    if (verbosity() >= 1) log(msg);
  }
  void debug2(std::string_view msg)
  {
    if (verbosity() >= 2) log(msg);
  }
  void debug3(std::string_view msg)
  {
    if (verbosity() >= 3) log(msg);
  }
};

}  // namespace burrow::host::application::ports
