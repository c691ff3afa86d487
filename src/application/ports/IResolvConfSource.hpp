#pragma once

#include <string>
#include <vector>

namespace burrow::host::application::ports
{

enum class ReadStatus
{
  ok,
  absent  // not found / not accessible; the caller skips the file
};

struct ResolvConfRead
{
  ReadStatus status{ReadStatus::absent};
  std::vector<std::string> lines;
  std::string reason;  // set when status == absent
};

struct IResolvConfSource
{
  virtual ~IResolvConfSource() = default;

  // Any failure other than "absent" is thrown, never reported through the result.
  virtual ResolvConfRead read(const std::string& path) = 0;
};

}  // namespace burrow::host::application::ports
