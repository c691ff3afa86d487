#pragma once

#include <string>

#include "application/ports/IResolvConfSource.hpp"

namespace burrow::host::infrastructure::resolv
{

class ResolvConf_File final : public burrow::host::application::ports::IResolvConfSource
{
 public:
  burrow::host::application::ports::ResolvConfRead read(const std::string& path) override;

  // errno values treated as "file absent or not accessible"
  static bool is_absent_error(int err);
};

}  // namespace burrow::host::infrastructure::resolv
