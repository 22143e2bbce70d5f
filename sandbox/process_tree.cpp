#include "sandbox/process_tree.hpp"

#include <sys/wait.h>

#include <cerrno>
#include <csignal>
#include <thread>

#include "glog/logging.h"
#include "util/misc.hpp"

namespace sandbox {

ProcessTree::~ProcessTree() {
  if (!reaped_) {
    KillRemaining();
    std::string error_msg;
    if (!Reap(&error_msg)) {
      LOG(ERROR) << "Cannot reap " << pid_ << ": " << error_msg;
    }
  }
}

bool ProcessTree::Poll(bool* exited, std::string* error_msg) {
  if (!exited_) {
    siginfo_t info = {};
    int ret = 0;
    do {
      ret = waitid(P_PID, pid_, &info, WEXITED | WNOHANG | WNOWAIT);
    } while (ret == -1 && errno == EINTR);
    if (ret == -1) {
      *error_msg = util::ErrnoMessage("waitid", errno);
      return false;
    }
    exited_ = info.si_pid == pid_;
  }
  *exited = exited_;
  return true;
}

void ProcessTree::KillRemaining() {
  if (killpg(pid_, SIGKILL) == -1 && errno != ESRCH) {
    PLOG(WARNING) << "killpg " << pid_;
  }
  if (limiter_ != nullptr && !limiter_->KillAll()) {
    LOG(WARNING) << "The limiter could not kill the processes of " << pid_;
  }
  if (kill(pid_, SIGKILL) == -1 && errno != ESRCH) {
    PLOG(WARNING) << "kill " << pid_;
  }
}

bool ProcessTree::Reap(std::string* error_msg) {
  int ret = 0;
  do {
    ret = wait4(pid_, &status_, 0, &usage_);
  } while (ret == -1 && errno == EINTR);
  // Not retried: the child is gone either way.
  reaped_ = true;
  if (ret != pid_) {
    *error_msg = util::ErrnoMessage("wait4", errno);
    return false;
  }
  return true;
}

bool ProcessTree::TerminateAll(std::chrono::milliseconds grace,
                               std::string* error_msg) {
  if (reaped_) return true;
  // Processes that are still running get a chance to exit cleanly, then the
  // whole tree is killed, including whatever survived its parent.
  bool exited = false;
  if (Poll(&exited, error_msg) && !exited) {
    if (killpg(pid_, SIGTERM) == -1 && errno != ESRCH) {
      PLOG(WARNING) << "killpg " << pid_;
    }
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (Poll(&exited, error_msg) && !exited &&
           std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }
  KillRemaining();
  return Reap(error_msg);
}

}  // namespace sandbox
