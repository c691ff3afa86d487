#include "infrastructure/process/ExecutableLocator.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>

#include "infrastructure/process/SearchPath.hpp"

namespace fs = boost::filesystem;

namespace burrow::host::infrastructure::process
{

bool ExecutableLocator::is_accessible(const std::string& path, int mode)
{
  boost::system::error_code ec;
  const auto st = fs::status(path, ec);
  if (ec || !fs::exists(st)) return false;
  if (fs::is_directory(st)) return false;
  return ::access(path.c_str(), mode) == 0;
}

std::optional<std::string> ExecutableLocator::find_in(const std::string& name,
                                                      const std::vector<std::string>& dirs,
                                                      int mode)
{
  if (name.empty()) return std::nullopt;

  if (name.find('/') != std::string::npos)
  {
    if (is_accessible(name, mode)) return name;
    return std::nullopt;
  }

  for (const auto& dir : dirs)
  {
    if (dir.empty()) continue;
    const std::string full = (fs::path{dir} / name).string();
    if (is_accessible(full, mode)) return full;
  }
  return std::nullopt;
}

std::optional<std::string> ExecutableLocator::which(const std::string& name, int mode) const
{
  const auto dirs = build_search_path();
  auto rv = find_in(name, dirs, mode);
  if (rv)
    log_.debug2("which() found '" + name + "' at " + *rv);
  else
    log_.debug2("which() could not find '" + name + "' in " + join_search_path(dirs));
  return rv;
}

}  // namespace burrow::host::infrastructure::process
