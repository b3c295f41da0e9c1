#include "util/file.hpp"

#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fstream>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

const std::string test_tmpdir = "/tmp/snippet_runner_testdir";

void writeFile(const std::string& path, const std::string& content) {
  std::ofstream of(path);
  of << content;
}

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  std::string str((std::istreambuf_iterator<char>(t)),
                  std::istreambuf_iterator<char>());
  return str;
}

// NOLINTNEXTLINE
TEST(File, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("a", "b"), "a/b");
  EXPECT_EQ(util::File::JoinPath("a/", "b"), "a/b");
  EXPECT_EQ(util::File::JoinPath("a", "/b"), "/b");
  EXPECT_EQ(util::File::JoinPath("a", ""), "a");
}

// NOLINTNEXTLINE
TEST(File, BaseDir) {
  EXPECT_EQ(util::File::BaseDir("/a/b/c"), "/a/b");
  EXPECT_EQ(util::File::BaseDir("/a"), "/");
  EXPECT_EQ(util::File::BaseDir("a"), ".");
}

// NOLINTNEXTLINE
TEST(File, Absolute) {
  EXPECT_EQ(util::File::Absolute("/a/b"), "/a/b");
  char* cwd = getcwd(nullptr, 0);
  ASSERT_NE(cwd, nullptr);
  EXPECT_EQ(util::File::Absolute("x"), std::string(cwd) + "/x");
  free(cwd);  // NOLINT
}

// NOLINTNEXTLINE
TEST(File, MakeDirs) {
  util::TempDir tmp(test_tmpdir);
  std::string path = util::File::JoinPath(tmp.Path(), "a/b/c");
  util::File::MakeDirs(path);
  EXPECT_TRUE(util::File::IsDirectory(path));
  util::File::MakeDirs(path);  // Already there.
  EXPECT_TRUE(util::File::IsDirectory(path));
}

// NOLINTNEXTLINE
TEST(File, MakeDirsOverFile) {
  util::TempDir tmp(test_tmpdir);
  std::string path = util::File::JoinPath(tmp.Path(), "file");
  writeFile(path, "x");
  EXPECT_THROW(util::File::MakeDirs(path), std::system_error);  // NOLINT
}

// NOLINTNEXTLINE
TEST(File, Write) {
  util::TempDir tmp(test_tmpdir);
  std::string path = util::File::JoinPath(tmp.Path(), "dir/file");
  util::File::Write(path, "hello");
  EXPECT_EQ(readFile(path), "hello");
  EXPECT_THAT(util::File::ListDir(util::File::BaseDir(path)),
              ElementsAre("file"));
}

// NOLINTNEXTLINE
TEST(File, WriteReplaces) {
  util::TempDir tmp(test_tmpdir);
  std::string path = util::File::JoinPath(tmp.Path(), "file");
  util::File::Write(path, "a much longer first content");
  util::File::Write(path, "second");
  EXPECT_EQ(readFile(path), "second");
  EXPECT_THAT(util::File::ListDir(tmp.Path()), ElementsAre("file"));
}

// NOLINTNEXTLINE
TEST(File, WriteHonorsUmask) {
  util::TempDir tmp(test_tmpdir);
  std::string dir = util::File::JoinPath(tmp.Path(), "out");
  std::string path = util::File::JoinPath(dir, "file");
  mode_t old_mask = umask(022);
  util::File::Write(path, "x");
  umask(old_mask);
  struct stat file_stat {};
  struct stat dir_stat {};
  ASSERT_EQ(stat(path.c_str(), &file_stat), 0);
  ASSERT_EQ(stat(dir.c_str(), &dir_stat), 0);
  EXPECT_EQ(file_stat.st_mode & 0777, 0644u);
  EXPECT_EQ(dir_stat.st_mode & 0777, 0755u);
}

// NOLINTNEXTLINE
TEST(File, ListDirSorted) {
  util::TempDir tmp(test_tmpdir);
  writeFile(util::File::JoinPath(tmp.Path(), "b"), "");
  writeFile(util::File::JoinPath(tmp.Path(), "a"), "");
  writeFile(util::File::JoinPath(tmp.Path(), "B"), "");
  util::File::MakeDirs(util::File::JoinPath(tmp.Path(), "c"));
  EXPECT_THAT(util::File::ListDir(tmp.Path()), ElementsAre("B", "a", "b", "c"));
}

// NOLINTNEXTLINE
TEST(File, ListDirEmpty) {
  util::TempDir tmp(test_tmpdir);
  EXPECT_THAT(util::File::ListDir(tmp.Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST(File, ListDirMissing) {
  util::TempDir tmp(test_tmpdir);
  EXPECT_THROW(  // NOLINT
      util::File::ListDir(util::File::JoinPath(tmp.Path(), "missing")),
      util::file_not_found);
}

// NOLINTNEXTLINE
TEST(File, IsRegularFile) {
  util::TempDir tmp(test_tmpdir);
  std::string file = util::File::JoinPath(tmp.Path(), "file");
  std::string dir = util::File::JoinPath(tmp.Path(), "dir");
  std::string link = util::File::JoinPath(tmp.Path(), "link");
  writeFile(file, "");
  util::File::MakeDirs(dir);
  ASSERT_EQ(symlink(dir.c_str(), link.c_str()), 0);
  EXPECT_TRUE(util::File::IsRegularFile(file));
  EXPECT_FALSE(util::File::IsRegularFile(dir));
  EXPECT_FALSE(util::File::IsRegularFile(link));
  EXPECT_FALSE(util::File::IsRegularFile(tmp.Path() + "/missing"));
}

// NOLINTNEXTLINE
TEST(TempDir, RemovedOnDestruction) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    path = tmp.Path();
    writeFile(util::File::JoinPath(path, "file"), "x");
    EXPECT_TRUE(util::File::IsDirectory(path));
  }
  EXPECT_FALSE(util::File::IsDirectory(path));
}

}  // namespace
