#pragma once

#include <string>

namespace burrow::host::domain
{

struct Settings
{
  struct Logging
  {
    std::string prefix{};
    int verbosity{0};
    std::string file{};  // empty = stderr only
  } logging;

  struct Resolver
  {
    std::string resolvConf{"/etc/resolv.conf"};
    std::string resolvedResolvConf{"/run/systemd/resolve/resolv.conf"};
  } resolver;

  std::string configPath{"burrow-host.toml"};
};

}  // namespace burrow::host::domain
