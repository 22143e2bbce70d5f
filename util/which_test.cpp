#include "util/which.hpp"
#include <sys/stat.h>
#include <cstdlib>
#include <fstream>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

const std::string test_tmpdir = "/tmp/codebox_testdir";

void createFile(const std::string& path, bool executable = true) {
  { std::ofstream os(path); }
  chmod(path.c_str(), executable ? S_IRWXU : S_IRUSR | S_IWUSR);
}

// NOLINTNEXTLINE
TEST(Which, Which) {
  util::TempDir tmpdir1(test_tmpdir + "/which");
  util::TempDir tmpdir2(test_tmpdir + "/which");
  createFile(tmpdir1.Path() + "/cmd");
  createFile(tmpdir2.Path() + "/cmd");
  createFile(tmpdir2.Path() + "/cmd2");
  std::string path = tmpdir1.Path() + ":" + tmpdir2.Path();
  setenv("PATH", path.c_str(), 1);

  EXPECT_EQ(util::which("cmd", false), tmpdir1.Path() + "/cmd");
  EXPECT_EQ(util::which("cmd2", false), tmpdir2.Path() + "/cmd2");
}

// NOLINTNEXTLINE
TEST(Which, WhichSkipsNonExecutables) {
  util::TempDir tmpdir1(test_tmpdir + "/which");
  util::TempDir tmpdir2(test_tmpdir + "/which");
  createFile(tmpdir1.Path() + "/cmd", /*executable=*/false);
  createFile(tmpdir2.Path() + "/cmd");
  util::File::MakeDirs(tmpdir1.Path() + "/dir");
  std::string path = tmpdir1.Path() + "::" + tmpdir2.Path();
  setenv("PATH", path.c_str(), 1);

  EXPECT_EQ(util::which("cmd", false), tmpdir2.Path() + "/cmd");
  EXPECT_EQ(util::which("dir", false), "");
}

// NOLINTNEXTLINE
TEST(Which, WhichNotFound) {
  util::TempDir tmpdir1(test_tmpdir + "/which");
  setenv("PATH", tmpdir1.Path().c_str(), 1);
  EXPECT_EQ(util::which("codebox-missing-cmd", false), "");
}

// NOLINTNEXTLINE
TEST(Which, WhichInIgnoresPath) {
  util::TempDir on_path(test_tmpdir + "/which");
  util::TempDir listed(test_tmpdir + "/which");
  createFile(on_path.Path() + "/cmd");
  createFile(listed.Path() + "/cmd");
  setenv("PATH", on_path.Path().c_str(), 1);

  EXPECT_EQ(util::which_in("cmd", listed.Path()), listed.Path() + "/cmd");
  EXPECT_EQ(util::which_in("cmd", ""), "");
  EXPECT_EQ(util::which_in("cmd", on_path.Path() + ":" + listed.Path()),
            on_path.Path() + "/cmd");
}

// NOLINTNEXTLINE
TEST(Which, WhichUsesCache) {
  std::string path;
  {
    util::TempDir tmpdir1(test_tmpdir + "/which");
    createFile(tmpdir1.Path() + "/cached_cmd");
    setenv("PATH", tmpdir1.Path().c_str(), 1);
    path = util::which("cached_cmd");
    EXPECT_EQ(path, tmpdir1.Path() + "/cached_cmd");
  }
  EXPECT_EQ(util::which("cached_cmd"), path);
}

// NOLINTNEXTLINE
TEST(Which, WhichCacheDisabled) {
  std::string path;
  {
    util::TempDir tmpdir1(test_tmpdir + "/which");
    createFile(tmpdir1.Path() + "/uncached_cmd");
    setenv("PATH", tmpdir1.Path().c_str(), 1);
    path = util::which("uncached_cmd");
    EXPECT_EQ(path, tmpdir1.Path() + "/uncached_cmd");
  }
  EXPECT_EQ(util::which("uncached_cmd", false), "");
}

}  // namespace
