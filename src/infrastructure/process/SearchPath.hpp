#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace burrow::host::infrastructure::process
{

using ProcessEnvironment = std::map<std::string, std::string>;

constexpr char kPathSeparator = ':';

// Platform default search path (confstr(_CS_PATH)), split.
std::vector<std::string> default_path();

// inherited PATH, then the platform default, then /bin /usr/bin /sbin /usr/sbin.
// Empty segments are dropped; duplicates keep their first position.
std::vector<std::string> build_search_path(const std::optional<std::string>& inherited);

// Same, reading PATH from the current environment.
std::vector<std::string> build_search_path();

std::string join_search_path(const std::vector<std::string>& dirs);

// Exactly PATH and LC_ALL=C, so helper output is parseable whatever the
// caller's locale.
ProcessEnvironment build_subprocess_environment();

// "KEY=VALUE" strings for execve-style APIs.
std::vector<std::string> to_envp(const ProcessEnvironment& env);

}  // namespace burrow::host::infrastructure::process
