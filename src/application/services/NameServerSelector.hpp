#pragma once

#include "application/ports/IRandomSource.hpp"
#include "application/services/NameServerDiscovery.hpp"
#include "domain/NameServer.hpp"

namespace burrow::host::application::services
{

class NameServerSelector
{
 public:
  NameServerSelector(const NameServerDiscovery& discovery, ports::IRandomSource& rng)
      : discovery_(discovery), rng_(rng)
  {
  }

  // One discovered nameserver, picked at random when there are several;
  // 127.0.0.1 when none is configured.
  domain::NameServer select(bool systemdResolved);

 private:
  const NameServerDiscovery& discovery_;
  ports::IRandomSource& rng_;
};

}  // namespace burrow::host::application::services
