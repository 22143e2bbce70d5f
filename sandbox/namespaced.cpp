#include "sandbox/namespaced.hpp"

#include <ftw.h>
#include <grp.h>
#include <linux/capability.h>
#include <sched.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <string>
#include <system_error>

#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace sandbox {

namespace {

static const constexpr size_t kStackSize = 1024 * 1024;
static const constexpr char* kBoxDir = "/box";
static const constexpr char* kHostname = "codebox";
static const constexpr char* kDevices[] = {"/dev/null", "/dev/zero",
                                           "/dev/random", "/dev/urandom"};
// Kernel interfaces below the jail's /proc that are mounted read-only.
static const constexpr char* kReadonlyProcPaths[] = {"sys", "sysrq-trigger",
                                                     "irq", "bus"};
// The program runs as nobody when the service runs as root.
static const constexpr uid_t kNobodyUid = 65534;
static const constexpr gid_t kNobodyGid = 65534;

// Mount flags of the filesystem containing path that a bind mount inherits
// and that cannot be cleared inside a user namespace.
bool LockedMountFlags(const std::string& path, unsigned long* flags,  // NOLINT
                      std::string* error_msg) {
  struct statvfs st = {};
  if (statvfs(path.c_str(), &st) == -1) {
    *error_msg = util::ErrnoMessage("statvfs " + path, errno);
    return false;
  }
  *flags = 0;
  if (st.f_flag & ST_RDONLY) *flags |= MS_RDONLY;
  if (st.f_flag & ST_NOSUID) *flags |= MS_NOSUID;
  if (st.f_flag & ST_NODEV) *flags |= MS_NODEV;
  if (st.f_flag & ST_NOEXEC) *flags |= MS_NOEXEC;
  if (st.f_flag & ST_NOATIME) *flags |= MS_NOATIME;
  if (st.f_flag & ST_NODIRATIME) *flags |= MS_NODIRATIME;
  if (st.f_flag & ST_RELATIME) *flags |= MS_RELATIME;
  return true;
}

// Creates an empty file or directory in the jail that a host path can be
// mounted on. Symbolic links are copied instead, and need no mount.
// Returns false if path does not exist on the host.
bool CreateMountPoint(const std::string& path, const std::string& target,
                      bool* needs_mount) {
  struct stat st = {};
  if (lstat(path.c_str(), &st) == -1) return false;
  if (S_ISLNK(st.st_mode)) {
    char link[PATH_MAX] = {};
    ssize_t len = readlink(path.c_str(), link, sizeof(link) - 1);
    if (len == -1) {
      throw std::system_error(errno, std::system_category(),
                              "readlink " + path);
    }
    util::File::MakeDirs(util::File::BaseDir(target));
    if (symlink(link, target.c_str()) == -1 && errno != EEXIST) {
      throw std::system_error(errno, std::system_category(),
                              "symlink " + target);
    }
    *needs_mount = false;
    return true;
  }
  if (S_ISDIR(st.st_mode)) {
    util::File::MakeDirs(target);
  } else if (!util::File::Exists(target)) {
    util::File::Write(target, "");
  }
  *needs_mount = true;
  return true;
}

// Gives the whole tree at path to nobody. Returns errno, or 0 on success.
int ChownTree(const std::string& path) {
  if (nftw(path.c_str(),
           [](const char* fpath, const struct stat* /*sb*/, int /*typeflag*/,
              struct FTW* /*ftwbuf*/) {
             return lchown(fpath, kNobodyUid, kNobodyGid);
           },
           64, FTW_PHYS | FTW_MOUNT) == -1) {
    return errno;
  }
  return 0;
}

}  // namespace

bool Namespaced::OnSetup(std::string* error_msg) {
  if (options_->scratch.empty()) {
    *error_msg = "No scratch directory for the jail";
    return false;
  }
  jail_ = util::File::JoinPath(options_->scratch, "jail");
  mounts_.clear();
  try {
    util::File::MakeDirs(jail_);
    for (const std::string& path : options_->readonly_paths) {
      if (path.empty() || path[0] != '/') {
        *error_msg = "Read-only paths must be absolute: " + path;
        return false;
      }
      bool needs_mount = false;
      if (!CreateMountPoint(path, jail_ + path, &needs_mount)) {
        VLOG(1) << "Skipping missing path " << path;
        continue;
      }
      if (!needs_mount) continue;
      unsigned long flags = 0;  // NOLINT
      if (!LockedMountFlags(path, &flags, error_msg)) return false;
      mounts_.push_back({path, jail_ + path, flags | MS_RDONLY | MS_NOSUID,
                         true});
    }
    for (const char* device : kDevices) {
      bool needs_mount = false;
      if (!CreateMountPoint(device, jail_ + device, &needs_mount)) continue;
      mounts_.push_back({device, jail_ + device, 0, false});
    }
    std::string box = jail_ + kBoxDir;
    util::File::MakeDirs(box);
    unsigned long flags = 0;  // NOLINT
    if (!LockedMountFlags(options_->root, &flags, error_msg)) return false;
    mounts_.push_back(
        {options_->root, box, flags | MS_NOSUID | MS_NODEV, true});
    proc_ = jail_ + "/proc";
    util::File::MakeDirs(proc_);
    proc_readonly_.clear();
    for (const char* name : kReadonlyProcPaths) {
      proc_readonly_.push_back(util::File::JoinPath(proc_, name));
    }
  } catch (const std::system_error& e) {
    *error_msg = e.what();
    return false;
  }
  // A program running as root, even without capabilities, could still
  // write to every host file owned by root that is visible in the jail.
  running_as_root_ = geteuid() == 0;
  if (running_as_root_) {
    int err = ChownTree(options_->root);
    if (err != 0) {
      *error_msg = util::ErrnoMessage("chown " + options_->root, err);
      return false;
    }
  }
  stack_.reset(new char[kStackSize]);
  child_cwd_ = kBoxDir;
  return true;
}

int Namespaced::ChildEntry(void* sandbox) {
  static_cast<Namespaced*>(sandbox)->Child();
}

bool Namespaced::DoFork(std::string* error_msg) {
  int flags = CLONE_NEWUSER | CLONE_NEWPID | CLONE_NEWNS | CLONE_NEWIPC |
              CLONE_NEWUTS | SIGCHLD;
  if (!options_->allow_network) flags |= CLONE_NEWNET;
  // The stack grows downwards on every architecture we care about.
  int pid = clone(&Namespaced::ChildEntry, stack_.get() + kStackSize, flags,
                  this);
  if (pid == -1) {
    *error_msg = util::ErrnoMessage("clone", errno);
    return false;
  }
  child_pid_ = pid;
  return true;
}

bool Namespaced::OnForked(std::string* error_msg) {
  // Maps the current user to itself, so that files in the box keep their
  // owner. Root is mapped to nobody instead, and the child switches to it.
  std::string proc = "/proc/" + std::to_string(child_pid_) + "/";
  std::string uid = std::to_string(geteuid());
  std::string gid = std::to_string(getegid());
  if (running_as_root_) {
    uid = std::to_string(kNobodyUid);
    gid = std::to_string(kNobodyGid);
  } else if (!util::WriteControlFile(proc + "setgroups", "deny", error_msg)) {
    return false;
  }
  if (!util::WriteControlFile(proc + "uid_map", uid + " " + uid + " 1",
                              error_msg)) {
    return false;
  }
  return util::WriteControlFile(proc + "gid_map", gid + " " + gid + " 1",
                                error_msg);
}

bool Namespaced::OnChild(char* error_msg, size_t buflen) {
  auto fail = [error_msg, buflen](const char* prefix) {
    char buf[256] = {};
    snprintf(error_msg, buflen, "%s: %s", prefix,  // NOLINT
             util::mystrerror(errno, buf, sizeof(buf)));
    return false;
  };
  // Mounts done from now on must not propagate to the host.
  if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == -1) {
    return fail("mount /");
  }
  for (const BindMount& m : mounts_) {
    if (mount(m.source.c_str(), m.target.c_str(), nullptr, MS_BIND | MS_REC,
              nullptr) == -1) {
      return fail("bind mount");
    }
    if (!m.remount) continue;
    if (mount(nullptr, m.target.c_str(), nullptr,
              MS_BIND | MS_REMOUNT | m.remount_flags, nullptr) == -1) {
      return fail("remount");
    }
  }
  // Some container runtimes forbid mounting a new procfs: the program can
  // do without it.
  const unsigned long proc_flags = MS_NOSUID | MS_NODEV | MS_NOEXEC;  // NOLINT
  if (mount("proc", proc_.c_str(), "proc", proc_flags, nullptr) == 0) {
    for (const std::string& path : proc_readonly_) {
      if (mount(path.c_str(), path.c_str(), nullptr, MS_BIND, nullptr) == -1) {
        if (errno == ENOENT) continue;
        return fail("bind mount proc");
      }
      if (mount(nullptr, path.c_str(), nullptr,
                MS_BIND | MS_REMOUNT | MS_RDONLY | proc_flags,
                nullptr) == -1) {
        return fail("remount proc");
      }
    }
  }
  if (sethostname(kHostname, strlen(kHostname)) == -1) {
    return fail("sethostname");
  }
  if (chroot(jail_.c_str()) == -1) return fail("chroot");
  if (chdir("/") == -1) return fail("chdir");

  // Drop every capability the process has in the new user namespace.
  for (int cap = 0; cap <= CAP_LAST_CAP; cap++) {
    if (prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) == -1 && errno != EINVAL) {
      return fail("prctl PR_CAPBSET_DROP");
    }
  }
  if (prctl(PR_CAP_AMBIENT, PR_CAP_AMBIENT_CLEAR_ALL, 0, 0, 0) == -1 &&
      errno != EINVAL) {
    return fail("prctl PR_CAP_AMBIENT");
  }
  // Done after the mounts: files owned by unmapped users are only reachable
  // with their owner's permissions.
  if (running_as_root_) {
    if (setgroups(0, nullptr) == -1) return fail("setgroups");
    if (setresgid(kNobodyGid, kNobodyGid, kNobodyGid) == -1) {
      return fail("setresgid");
    }
    if (setresuid(kNobodyUid, kNobodyUid, kNobodyUid) == -1) {
      return fail("setresuid");
    }
    // Changing credentials clears the parent death signal.
    if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) return fail("prctl");
  }
  struct __user_cap_header_struct header = {};
  struct __user_cap_data_struct data[_LINUX_CAPABILITY_U32S_3] = {};
  header.version = _LINUX_CAPABILITY_VERSION_3;
  header.pid = 0;
  if (syscall(SYS_capset, &header, data) == -1) return fail("capset");
  return true;
}

void Namespaced::OnFinish(ExecutionInfo* /*info*/) { stack_.reset(); }

int Namespaced::Score() {
  std::string true_path = util::which_in("true", FLAGS_sandbox_path);
  if (true_path.empty()) {
    LOG(WARNING) << "Cannot probe the namespaced sandbox: true not found";
    return -1;
  }
  try {
    util::TempDir tmp(FLAGS_temp_directory);
    std::string box = util::File::JoinPath(tmp.Path(), "box");
    util::File::MakeDirs(box);
    ExecutionOptions options(box, true_path);
    options.scratch = util::File::JoinPath(tmp.Path(), "scratch");
    options.readonly_paths = util::SplitList(FLAGS_readonly_paths);
    options.wall_limit_millis = 10000;
    Namespaced sandbox;
    ExecutionInfo info;
    std::string error_msg;
    if (!sandbox.Execute(options, &info, &error_msg)) {
      LOG(WARNING) << "Namespaced sandbox unavailable: " << error_msg;
      return -1;
    }
    if (info.status_code != 0 || info.signal != 0) {
      LOG(WARNING) << "Namespaced sandbox unavailable: " << true_path
                   << " failed in the jail: " << info.message << " "
                   << info.stderr_data;
      return -1;
    }
  } catch (const std::system_error& e) {
    LOG(WARNING) << "Namespaced sandbox unavailable: " << e.what();
    return -1;
  }
  return 2;
}

namespace {
Sandbox::Register<Namespaced> r;  // NOLINT
}  // namespace

}  // namespace sandbox
