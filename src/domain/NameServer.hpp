#pragma once

#include <string>

namespace burrow::host::domain
{

enum class AddressFamily
{
  ipv4,
  ipv6
};

struct NameServer
{
  AddressFamily family{AddressFamily::ipv4};
  std::string ip;

  bool operator==(const NameServer&) const = default;
};

// IPv6 iff the text contains a colon. No validation is done.
NameServer family_ip(const std::string& ip);

// "AF_INET" / "AF_INET6"; anything else is rendered as its socket-layer number.
std::string family_to_string(AddressFamily family);
std::string family_to_string(int af);

int to_af(AddressFamily family);

}  // namespace burrow::host::domain
