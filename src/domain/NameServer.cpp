#include "domain/NameServer.hpp"

#include <sys/socket.h>

namespace burrow::host::domain
{

NameServer family_ip(const std::string& ip)
{
  if (ip.find(':') != std::string::npos) return NameServer{AddressFamily::ipv6, ip};
  return NameServer{AddressFamily::ipv4, ip};
}

int to_af(AddressFamily family)
{
  switch (family)
  {
    case AddressFamily::ipv4: return AF_INET;
    case AddressFamily::ipv6: return AF_INET6;
  }
  return AF_UNSPEC;
}

std::string family_to_string(int af)
{
  if (af == AF_INET6) return "AF_INET6";
  if (af == AF_INET) return "AF_INET";
  return std::to_string(af);
}

std::string family_to_string(AddressFamily family)
{
  return family_to_string(to_af(family));
}

}  // namespace burrow::host::domain
