#include "sandbox/cgroup_limiter.hpp"
#include <dirent.h>
#include "gflags/gflags.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

const std::string test_tmpdir = "/tmp/codebox_testdir";

int countEntries(const std::string& path) {
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) return -1;
  int count = 0;
  while (struct dirent* ent = readdir(dir)) {
    std::string name = ent->d_name;
    if (name != "." && name != "..") count++;
  }
  closedir(dir);
  return count;
}

// NOLINTNEXTLINE
TEST(CgroupLimiter, ScoreLeavesRootUntouched) {
  gflags::FlagSaver flag_saver;
  // A directory that looks like a cgroup without the memory controller.
  util::TempDir root(test_tmpdir);
  const std::string subtree_control =
      util::File::JoinPath(root.Path(), "cgroup.subtree_control");
  util::File::Write(util::File::JoinPath(root.Path(), "cgroup.controllers"),
                    "memory pids\n");
  util::File::Write(subtree_control, "");
  FLAGS_cgroup_root = root.Path();

  EXPECT_EQ(sandbox::CgroupLimiter::Score(), -1);
  EXPECT_EQ(util::File::Read(subtree_control), "");
  EXPECT_EQ(countEntries(root.Path()), 2);
}

// NOLINTNEXTLINE
TEST(CgroupLimiter, NoCgroupRoot) {
  gflags::FlagSaver flag_saver;
  FLAGS_cgroup_root = "/nonexistent/cgroup";
  EXPECT_EQ(sandbox::CgroupLimiter::Score(), -1);
}

}  // namespace
