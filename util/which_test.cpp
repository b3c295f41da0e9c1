#include "util/which.hpp"

#include <stdlib.h>
#include <sys/stat.h>

#include <fstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

const std::string test_tmpdir = "/tmp/snippet_runner_testdir";

void createExecutable(const std::string& path) {
  { std::ofstream os(path); }
  chmod(path.c_str(), S_IRWXU);
}

// NOLINTNEXTLINE
TEST(Which, Which) {
  util::TempDir tmpdir1(test_tmpdir + "/which");
  util::TempDir tmpdir2(test_tmpdir + "/which");
  createExecutable(tmpdir1.Path() + "/cmd");
  createExecutable(tmpdir2.Path() + "/cmd");
  createExecutable(tmpdir2.Path() + "/cmd2");
  std::string path = tmpdir1.Path() + ":" + tmpdir2.Path();
  setenv("PATH", path.c_str(), 1);

  EXPECT_EQ(util::which("cmd", false), tmpdir1.Path() + "/cmd");
  EXPECT_EQ(util::which("cmd2", false), tmpdir2.Path() + "/cmd2");
}

// NOLINTNEXTLINE
TEST(Which, WhichSkipsNonExecutable) {
  util::TempDir tmpdir1(test_tmpdir + "/which");
  util::TempDir tmpdir2(test_tmpdir + "/which");
  { std::ofstream os(tmpdir1.Path() + "/tool"); }
  createExecutable(tmpdir2.Path() + "/tool");
  std::string path = tmpdir1.Path() + ":" + tmpdir2.Path();
  setenv("PATH", path.c_str(), 1);

  EXPECT_EQ(util::which("tool", false), tmpdir2.Path() + "/tool");
}

// NOLINTNEXTLINE
TEST(Which, WhichNotFound) {
  util::TempDir tmpdir1(test_tmpdir + "/which");
  setenv("PATH", tmpdir1.Path().c_str(), 1);
  EXPECT_EQ(util::which("missing", false), "");
}

// NOLINTNEXTLINE
TEST(Which, WhichEmptyPath) {
  unsetenv("PATH");
  EXPECT_THROW(util::which("cmd", false), std::exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST(Which, WhichUsesCache) {
  std::string path;
  {
    util::TempDir tmpdir1(test_tmpdir + "/which");
    createExecutable(tmpdir1.Path() + "/cached");
    setenv("PATH", tmpdir1.Path().c_str(), 1);
    path = util::which("cached");
    EXPECT_EQ(path, tmpdir1.Path() + "/cached");
  }
  EXPECT_EQ(util::which("cached"), path);
}

// NOLINTNEXTLINE
TEST(Which, WhichCacheDisabled) {
  std::string path;
  {
    util::TempDir tmpdir1(test_tmpdir + "/which");
    createExecutable(tmpdir1.Path() + "/uncached");
    setenv("PATH", tmpdir1.Path().c_str(), 1);
    path = util::which("uncached");
    EXPECT_EQ(path, tmpdir1.Path() + "/uncached");
  }
  EXPECT_EQ(util::which("uncached", false), "");
}

}  // namespace
