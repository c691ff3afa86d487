#pragma once

#include <string>

#include "domain/NameServer.hpp"

namespace burrow::host::infrastructure::net
{

// true if ip can be bound on this host. EADDRNOTAVAIL yields false; any
// other failure (bad address text, family mismatch, ...) throws
// boost::system::system_error.
bool is_local(const std::string& ip, burrow::host::domain::AddressFamily family);

}  // namespace burrow::host::infrastructure::net
