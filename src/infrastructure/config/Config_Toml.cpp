#include "infrastructure/config/Config_Toml.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <exception>
#include <fstream>
#include <toml++/toml.hpp>

using burrow::host::domain::Settings;
namespace fs = boost::filesystem;

namespace burrow::host::infrastructure::config
{

namespace
{
constexpr const char* kDefaultResolvConf = "/etc/resolv.conf";
constexpr const char* kDefaultResolvedResolvConf = "/run/systemd/resolve/resolv.conf";

static void ensure_resolver_paths(Settings::Resolver& r)
{
  if (r.resolvConf.empty()) r.resolvConf = kDefaultResolvConf;
  if (r.resolvedResolvConf.empty()) r.resolvedResolvConf = kDefaultResolvedResolvConf;
}
}  // namespace

void Config_Toml::write_default(const fs::path& path, Settings& s)
{
  if (path.has_parent_path()) fs::create_directories(path.parent_path());
  std::ofstream out(path.string());

  // Header
  out << "# burrow-host.toml - auto-generated initial configuration\n\n";

  // [logging]
  out << "[logging]\n";
  out << "prefix    = \"" << s.logging.prefix << "\"\n";
  out << "verbosity = " << s.logging.verbosity << "\n";
  out << "file      = \"" << s.logging.file << "\"\n\n";

  // [resolver]
  ensure_resolver_paths(s.resolver);
  out << "[resolver]\n";
  out << "resolvConf         = \"" << s.resolver.resolvConf << "\"\n";
  out << "resolvedResolvConf = \"" << s.resolver.resolvedResolvConf << "\"\n";

  out.close();
}

Settings Config_Toml::load_or_create(const std::string& configPath)
{
  Settings s;
  s.configPath = configPath;
  const fs::path path{configPath};

  if (!fs::exists(path))
  {
    write_default(path, s);
    return s;
  }

  toml::table tbl;
  try
  {
    tbl = toml::parse_file(path.string());
  }
  catch (const std::exception&)
  {
    // if parsing fails, recreate with defaults
    write_default(path, s);
    return s;
  }

  // ---------------------------
  // [logging]
  // ---------------------------
  if (auto log = tbl["logging"].as_table())
  {
    if (auto v = (*log)["prefix"].value<std::string>()) s.logging.prefix = *v;
    if (auto v = (*log)["verbosity"].value<int64_t>())
      s.logging.verbosity = *v < 0 ? 0 : static_cast<int>(*v);
    if (auto v = (*log)["file"].value<std::string>()) s.logging.file = *v;
  }

  // ---------------------------
  // [resolver]
  // ---------------------------
  if (auto r = tbl["resolver"].as_table())
  {
    if (auto v = (*r)["resolvConf"].value<std::string>()) s.resolver.resolvConf = *v;
    if (auto v = (*r)["resolvedResolvConf"].value<std::string>())
      s.resolver.resolvedResolvConf = *v;
  }

  ensure_resolver_paths(s.resolver);
  return s;
}

}  // namespace burrow::host::infrastructure::config
