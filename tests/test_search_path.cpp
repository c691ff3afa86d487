#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/process/SearchPath.hpp"

using namespace burrow::host::infrastructure::process;

namespace {

std::size_t count_of(const std::vector<std::string>& v, const std::string& s) {
  return static_cast<std::size_t>(std::count(v.begin(), v.end(), s));
}

std::size_t index_of(const std::vector<std::string>& v, const std::string& s) {
  return static_cast<std::size_t>(std::find(v.begin(), v.end(), s) - v.begin());
}

// Restores PATH when the test ends.
class PathGuard {
 public:
  PathGuard() {
    if (const char* p = std::getenv("PATH")) saved_ = p;
  }
  ~PathGuard() {
    if (saved_)
      ::setenv("PATH", saved_->c_str(), 1);
    else
      ::unsetenv("PATH");
  }

 private:
  std::optional<std::string> saved_;
};

}  // namespace

TEST(SearchPath, DefaultPathIsNotEmpty) {
  auto dirs = default_path();
  ASSERT_FALSE(dirs.empty());
  EXPECT_GT(count_of(dirs, "/bin") + count_of(dirs, "/usr/bin"), 0u);
}

TEST(SearchPath, InheritedFirstThenDefaultsThenFallbacks) {
  auto dirs = build_search_path(std::string{"/opt/tools/bin:/usr/local/bin"});
  ASSERT_GE(dirs.size(), 6u);
  EXPECT_EQ(dirs[0], "/opt/tools/bin");
  EXPECT_EQ(dirs[1], "/usr/local/bin");
  EXPECT_LT(index_of(dirs, "/usr/local/bin"), index_of(dirs, "/sbin"));
  EXPECT_EQ(dirs.back(), "/usr/sbin");
}

TEST(SearchPath, DuplicatesKeepFirstPosition) {
  auto dirs = build_search_path(std::string{"/usr/sbin:/usr/bin:/home/u/bin:/usr/bin:/bin"});
  for (const char* d : {"/bin", "/usr/bin", "/sbin", "/usr/sbin", "/home/u/bin"})
    EXPECT_EQ(count_of(dirs, d), 1u) << d;

  EXPECT_EQ(dirs[0], "/usr/sbin");
  EXPECT_EQ(dirs[1], "/usr/bin");
  EXPECT_EQ(dirs[2], "/home/u/bin");
  EXPECT_EQ(dirs[3], "/bin");
}

TEST(SearchPath, EmptySegmentsDropped) {
  auto dirs = build_search_path(std::string{"::/opt/x::"});
  EXPECT_EQ(count_of(dirs, ""), 0u);
  EXPECT_EQ(dirs[0], "/opt/x");
}

TEST(SearchPath, NoInheritedPath) {
  auto dirs = build_search_path(std::nullopt);
  EXPECT_EQ(count_of(dirs, "/sbin"), 1u);
  EXPECT_EQ(count_of(dirs, "/usr/sbin"), 1u);
  EXPECT_EQ(count_of(dirs, "/bin"), 1u);
  EXPECT_EQ(count_of(dirs, "/usr/bin"), 1u);
}

TEST(SearchPath, ReadsProcessEnvironment) {
  PathGuard guard;
  ::setenv("PATH", "/srv/a:/srv/b", 1);
  auto dirs = build_search_path();
  ASSERT_GE(dirs.size(), 2u);
  EXPECT_EQ(dirs[0], "/srv/a");
  EXPECT_EQ(dirs[1], "/srv/b");

  ::unsetenv("PATH");
  EXPECT_EQ(build_search_path(), build_search_path(std::nullopt));
}

TEST(SearchPath, Join) {
  EXPECT_EQ(join_search_path({"/a", "/b", "/c"}), "/a:/b:/c");
  EXPECT_EQ(join_search_path({}), "");
}

TEST(SubprocessEnvironment, ExactlyPathAndLocale) {
  PathGuard guard;
  ::setenv("PATH", "/srv/tools", 1);
  ::setenv("LANG", "de_DE.UTF-8", 1);

  auto env = build_subprocess_environment();
  ASSERT_EQ(env.size(), 2u);
  EXPECT_EQ(env.at("LC_ALL"), "C");
  EXPECT_EQ(env.at("PATH"), join_search_path(build_search_path()));
  EXPECT_EQ(env.at("PATH").rfind("/srv/tools:", 0), 0u);
  EXPECT_EQ(env.count("LANG"), 0u);
}

TEST(SubprocessEnvironment, ToEnvp) {
  ProcessEnvironment env{{"PATH", "/bin:/usr/bin"}, {"LC_ALL", "C"}};
  auto envp = to_envp(env);
  ASSERT_EQ(envp.size(), 2u);
  EXPECT_EQ(envp[0], "LC_ALL=C");
  EXPECT_EQ(envp[1], "PATH=/bin:/usr/bin");
}
