#ifndef SANDBOX_PROCESS_TREE_HPP
#define SANDBOX_PROCESS_TREE_HPP
#include <sys/resource.h>
#include <sys/types.h>

#include <chrono>
#include <string>

#include "sandbox/limiter.hpp"

namespace sandbox {

// Owned handle to a spawned child and all of its descendants. The child must
// be the leader of its own process group. The handle guarantees that the
// tree is killed and the child reaped when it goes out of scope.
class ProcessTree {
 public:
  // limiter may be null; if present, it is used to reach descendants that
  // left the process group.
  ProcessTree(pid_t pid, Limiter* limiter) : pid_(pid), limiter_(limiter) {}
  ~ProcessTree();

  ProcessTree(const ProcessTree&) = delete;
  ProcessTree& operator=(const ProcessTree&) = delete;
  ProcessTree(ProcessTree&&) = delete;
  ProcessTree& operator=(ProcessTree&&) = delete;

  pid_t Pid() const { return pid_; }

  // Sets *exited once the child has exited. The child is not reaped, so its
  // pid and process group stay valid until TerminateAll. Returns false if
  // the child cannot be waited for, e.g. because SIGCHLD is ignored.
  bool Poll(bool* exited, std::string* error_msg);

  // Sends SIGTERM to the tree, waits at most grace for the child to exit,
  // then kills everything that is left and reaps the child. Returns false if
  // the exit status of the child could not be collected.
  bool TerminateAll(std::chrono::milliseconds grace, std::string* error_msg);

  // Wait status and resource usage of the child. Valid after TerminateAll.
  int Status() const { return status_; }
  const struct rusage& Usage() const { return usage_; }

 private:
  void KillRemaining();
  bool Reap(std::string* error_msg);

  pid_t pid_;
  Limiter* limiter_;
  bool exited_ = false;
  bool reaped_ = false;
  int status_ = 0;
  struct rusage usage_ = {};
};

}  // namespace sandbox
#endif
