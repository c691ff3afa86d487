#include "application/services/NameServerSelector.hpp"

#include <utility>
#include <vector>

using burrow::host::domain::AddressFamily;
using burrow::host::domain::NameServer;

namespace burrow::host::application::services
{

namespace
{
constexpr const char* kFallbackNameServer = "127.0.0.1";
}  // namespace

NameServer NameServerSelector::select(bool systemdResolved)
{
  auto servers = discovery_.discover(systemdResolved);
  if (servers.empty()) return NameServer{AddressFamily::ipv4, kFallbackNameServer};

  // Fisher-Yates
  for (std::size_t i = servers.size() - 1; i > 0; --i)
  {
    const std::size_t j = rng_.uniform(i + 1);
    std::swap(servers[i], servers[j]);
  }
  return servers.front();
}

}  // namespace burrow::host::application::services
