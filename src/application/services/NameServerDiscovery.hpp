#pragma once

#include <string>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "application/ports/IResolvConfSource.hpp"
#include "domain/NameServer.hpp"
#include "domain/Settings.hpp"

namespace burrow::host::application::services
{

class NameServerDiscovery
{
 public:
  NameServerDiscovery(ports::IResolvConfSource& source, ports::ILogger& logger,
                      const domain::Settings& s)
      : source_(source), log_(logger), cfg_(s)
  {
  }

  // Nameservers from the primary resolv.conf, or, when systemdResolved is set,
  // from the file systemd-resolved keeps its upstream servers in (only).
  std::vector<domain::NameServer> discover(bool systemdResolved) const;

  std::vector<std::string> files_for(bool systemdResolved) const;

  static std::vector<domain::NameServer> parse(const std::vector<std::string>& lines);

 private:
  ports::IResolvConfSource& source_;
  ports::ILogger& log_;
  const domain::Settings& cfg_;
};

}  // namespace burrow::host::application::services
