#include "application/services/NameServerDiscovery.hpp"

#include "shared/text/Text.hpp"

using burrow::host::domain::NameServer;
using burrow::host::application::ports::ReadStatus;

namespace burrow::host::application::services
{

// Helper: "[a, b]" for logging
static std::string ip_list(const std::vector<NameServer>& v)
{
  std::string out = "[";
  for (size_t i = 0; i < v.size(); ++i)
  {
    if (i) out += ", ";
    out += "'" + v[i].ip + "'";
  }
  out += "]";
  return out;
}

std::vector<std::string> NameServerDiscovery::files_for(bool systemdResolved) const
{
  // With systemd-resolved, resolvConf points at the 127.0.0.53 stub; the real
  // upstream servers live in the resolved copy.
  if (systemdResolved) return {cfg_.resolver.resolvedResolvConf};
  return {cfg_.resolver.resolvConf};
}

std::vector<NameServer> NameServerDiscovery::parse(const std::vector<std::string>& lines)
{
  std::vector<NameServer> out;
  for (const auto& line : lines)
  {
    const auto words = shared::text::split_ws(shared::text::to_lower(line));
    if (words.size() >= 2 && words[0] == "nameserver") out.push_back(domain::family_ip(words[1]));
  }
  return out;
}

std::vector<NameServer> NameServerDiscovery::discover(bool systemdResolved) const
{
  std::vector<NameServer> servers;
  for (const auto& file : files_for(systemdResolved))
  {
    const auto rd = source_.read(file);
    if (rd.status == ReadStatus::absent)
    {
      log_.debug3("Failed to read " + file + " when looking for DNS servers: " + rd.reason);
      continue;
    }

    auto found = parse(rd.lines);
    log_.debug2("Found DNS servers in " + file + ": " + ip_list(found));
    servers.insert(servers.end(), found.begin(), found.end());
  }
  return servers;
}

}  // namespace burrow::host::application::services
