#include "sandbox/cgroup_limiter.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <system_error>
#include <thread>
#include <vector>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"

namespace {

static const constexpr char* kCgroupMount = "/sys/fs/cgroup";

// Reads a control file, returning false if it does not exist or cannot be
// read.
bool ReadControlFile(const std::string& path, std::string* contents) {
  try {
    *contents = util::File::Read(path);
  } catch (const std::system_error& e) {
    VLOG(1) << e.what();
    return false;
  }
  return true;
}

// Removes an empty cgroup. Its processes may take a moment to disappear after
// being killed.
bool RemoveCgroup(const std::string& path) {
  for (int attempt = 0; attempt < 50; attempt++) {
    if (rmdir(path.c_str()) == 0 || errno == ENOENT) return true;
    if (errno != EBUSY) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  PLOG(WARNING) << "Unable to remove cgroup " << path;
  return false;
}

}  // namespace

namespace sandbox {

std::string CgroupLimiter::Root() {
  if (!FLAGS_cgroup_root.empty()) return FLAGS_cgroup_root;
  std::string self;
  if (!ReadControlFile("/proc/self/cgroup", &self)) return "";
  for (absl::string_view line : absl::StrSplit(self, '\n')) {
    if (absl::ConsumePrefix(&line, "0::")) {
      return absl::StrCat(kCgroupMount, line);
    }
  }
  return "";
}

CgroupLimiter::~CgroupLimiter() {
  if (path_.empty()) return;
  if (!KillAll()) LOG(WARNING) << "Processes may be left in " << path_;
  RemoveCgroup(path_);
}

int64_t CgroupLimiter::ReadKey(const std::string& file,
                               const std::string& key) const {
  std::string contents;
  if (!ReadControlFile(util::File::JoinPath(path_, file), &contents)) {
    return -1;
  }
  for (absl::string_view line : absl::StrSplit(contents, '\n')) {
    std::pair<absl::string_view, absl::string_view> kv =
        absl::StrSplit(line, absl::MaxSplits(' ', 1));
    int64_t value = 0;
    if (kv.first == key && absl::SimpleAtoi(kv.second, &value)) return value;
  }
  return -1;
}

bool CgroupLimiter::Setup(const ExecutionOptions& options,
                          std::string* error_msg) {
  static std::atomic<int> counter{0};
  std::string root = Root();
  if (root.empty()) {
    *error_msg = "Unable to find the cgroup root";
    return false;
  }
  std::string path =
      absl::StrCat(root, "/codebox_", getpid(), "_", counter++);
  if (mkdir(path.c_str(), S_IRWXU) == -1) {
    *error_msg = util::ErrnoMessage("mkdir " + path, errno);
    return false;
  }
  path_ = path;
  auto control = [this](const std::string& file) {
    return util::File::JoinPath(path_, file);
  };
  if (options.memory_limit_bytes != 0 &&
      !util::WriteControlFile(control("memory.max"),
                              std::to_string(options.memory_limit_bytes),
                              error_msg)) {
    return false;
  }
  // Without swap accounting, the file does not exist and nothing can be
  // swapped out of the limit anyway.
  if (util::File::Exists(control("memory.swap.max")) &&
      !util::WriteControlFile(control("memory.swap.max"), "0", error_msg)) {
    return false;
  }
  if (!util::WriteControlFile(control("memory.oom.group"), "1", error_msg)) {
    return false;
  }
  if (options.max_procs > 0) {
    if (!util::File::Exists(control("pids.max"))) {
      // No pids controller: the processes are counted at each sample.
      counted_max_procs_ = options.max_procs;
    } else if (!util::WriteControlFile(control("pids.max"),
                                       std::to_string(options.max_procs),
                                       error_msg)) {
      return false;
    }
  }
  return true;
}

bool CgroupLimiter::Attach(pid_t pid, std::string* error_msg) {
  return util::WriteControlFile(util::File::JoinPath(path_, "cgroup.procs"),
                                std::to_string(pid), error_msg);
}

bool CgroupLimiter::MemoryExceeded() {
  std::string current;
  int64_t usage = 0;
  if (ReadControlFile(util::File::JoinPath(path_, "memory.current"),
                      &current) &&
      absl::SimpleAtoi(absl::StripAsciiWhitespace(current), &usage) &&
      usage > peak_memory_bytes_) {
    peak_memory_bytes_ = usage;
  }
  if (counted_max_procs_ != 0) {
    std::string procs;
    if (ReadControlFile(util::File::JoinPath(path_, "cgroup.procs"), &procs)) {
      std::vector<absl::string_view> pids =
          absl::StrSplit(procs, '\n', absl::SkipWhitespace());
      processes_ = pids.size();
    }
  }
  return ReadKey("memory.events", "oom_kill") > 0 ||
         ReadKey("memory.events", "oom_group_kill") > 0;
}

int64_t CgroupLimiter::PeakMemoryBytes() {
  // memory.peak is only available on recent kernels.
  std::string peak;
  int64_t value = 0;
  if (ReadControlFile(util::File::JoinPath(path_, "memory.peak"), &peak) &&
      absl::SimpleAtoi(absl::StripAsciiWhitespace(peak), &value) &&
      value > peak_memory_bytes_) {
    peak_memory_bytes_ = value;
  }
  return peak_memory_bytes_;
}

bool CgroupLimiter::KillAll() {
  if (path_.empty()) return true;
  std::string error_msg;
  std::string kill_file = util::File::JoinPath(path_, "cgroup.kill");
  if (util::File::Exists(kill_file) &&
      util::WriteControlFile(kill_file, "1", &error_msg)) {
    return true;
  }
  std::string procs;
  if (!ReadControlFile(util::File::JoinPath(path_, "cgroup.procs"), &procs)) {
    LOG(WARNING) << "Unable to list the processes of " << path_ << " "
                 << error_msg;
    return false;
  }
  bool ok = true;
  for (absl::string_view line : absl::StrSplit(procs, '\n')) {
    pid_t pid = 0;
    if (!absl::SimpleAtoi(line, &pid)) continue;
    if (kill(pid, SIGKILL) == -1 && errno != ESRCH) {
      PLOG(WARNING) << "kill " << pid;
      ok = false;
    }
  }
  return ok;
}

int CgroupLimiter::Score() {
  std::string root = Root();
  if (root.empty() ||
      !util::File::Exists(util::File::JoinPath(root, "cgroup.controllers"))) {
    LOG(INFO) << "cgroup v2 is not available";
    return -1;
  }
  // The controllers are never enabled here: the root has to be delegated
  // with memory (and possibly pids) already in its cgroup.subtree_control.
  std::string probe = absl::StrCat(root, "/codebox_probe_", getpid());
  if (mkdir(probe.c_str(), S_IRWXU) == -1 && errno != EEXIST) {
    PLOG(INFO) << "cgroup " << root << " is not delegated to us";
    return -1;
  }
  bool usable = util::File::Exists(probe + "/memory.max");
  if (!usable) {
    LOG(INFO) << "The memory controller is not enabled below " << root;
  } else {
    // Check that processes can actually be moved into the cgroup.
    pid_t pid = fork();
    if (pid == -1) {
      PLOG(WARNING) << "fork";
      usable = false;
    } else if (pid == 0) {
      pause();
      _exit(0);
    } else {
      std::string error_msg;
      if (!util::WriteControlFile(probe + "/cgroup.procs",
                                  std::to_string(pid), &error_msg)) {
        LOG(INFO) << "Cannot move processes below " << root << ": "
                  << error_msg;
        usable = false;
      }
      if (kill(pid, SIGKILL) == -1) PLOG(WARNING) << "kill " << pid;
      int status = 0;
      while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
      }
    }
  }
  RemoveCgroup(probe);
  return usable ? 2 : -1;
}

namespace {
Limiter::Register<CgroupLimiter> r;  // NOLINT
}  // namespace

}  // namespace sandbox
