#include "infrastructure/process/SearchPath.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdlib>

#include "shared/text/Text.hpp"

namespace burrow::host::infrastructure::process
{

namespace
{
constexpr const char* kDefaultPath = "/bin:/usr/bin";

// Privileged helpers (iptables, nft, pfctl, ...) usually live in the sbin
// directories, which neither PATH nor the default path reliably contain.
const std::vector<std::string> kFallbackDirs = {"/bin", "/usr/bin", "/sbin", "/usr/sbin"};

void append_unique(std::vector<std::string>& out, const std::vector<std::string>& dirs)
{
  for (const auto& d : dirs)
  {
    if (d.empty()) continue;
    if (std::find(out.begin(), out.end(), d) != out.end()) continue;
    out.push_back(d);
  }
}
}  // namespace

std::vector<std::string> default_path()
{
  std::string value;
  const size_t n = ::confstr(_CS_PATH, nullptr, 0);
  if (n > 0)
  {
    value.resize(n);
    ::confstr(_CS_PATH, value.data(), n);
    value.resize(n - 1);  // drop the terminating NUL
  }
  if (value.empty()) value = kDefaultPath;
  return shared::text::split(value, kPathSeparator);
}

std::vector<std::string> build_search_path(const std::optional<std::string>& inherited)
{
  std::vector<std::string> out;
  if (inherited) append_unique(out, shared::text::split(*inherited, kPathSeparator));
  append_unique(out, default_path());
  append_unique(out, kFallbackDirs);
  return out;
}

std::vector<std::string> build_search_path()
{
  const char* env = std::getenv("PATH");
  if (!env) return build_search_path(std::nullopt);
  return build_search_path(std::string{env});
}

std::string join_search_path(const std::vector<std::string>& dirs)
{
  return shared::text::join(dirs, std::string(1, kPathSeparator));
}

ProcessEnvironment build_subprocess_environment()
{
  return ProcessEnvironment{
      {"PATH", join_search_path(build_search_path())},
      {"LC_ALL", "C"},
  };
}

std::vector<std::string> to_envp(const ProcessEnvironment& env)
{
  std::vector<std::string> out;
  out.reserve(env.size());
  for (const auto& [key, value] : env) out.push_back(key + "=" + value);
  return out;
}

}  // namespace burrow::host::infrastructure::process
