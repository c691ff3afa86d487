#pragma once

#include <stdexcept>
#include <string>

namespace burrow::host::domain
{

// Unrecoverable configuration problem. Raised by callers, never caught here.
class Fatal : public std::runtime_error
{
 public:
  explicit Fatal(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace burrow::host::domain
