#ifndef SANDBOX_CGROUP_LIMITER_HPP
#define SANDBOX_CGROUP_LIMITER_HPP
#include <cstddef>
#include <string>

#include "sandbox/limiter.hpp"

namespace sandbox {

// Limiter that places each execution in its own cgroup (v2) below a
// delegated root: memory.max is enforced by the kernel, swap is disabled and
// an out-of-memory kill takes down the whole group. The root is
// --cgroup_root, or the cgroup of the current process; the memory controller
// must already be enabled for its children. The process ceiling goes to
// pids.max if the pids controller is enabled too, otherwise the processes are
// counted at each sample.
class CgroupLimiter : public Limiter {
 public:
  ~CgroupLimiter() override;

  bool HardMemoryLimit() const override { return true; }
  bool Setup(const ExecutionOptions& options, std::string* error_msg) override;
  bool Attach(pid_t pid, std::string* error_msg) override;
  bool MemoryExceeded() override;
  bool ProcessLimitExceeded() override {
    return counted_max_procs_ != 0 && processes_ > counted_max_procs_;
  }
  int64_t PeakMemoryBytes() override;
  bool KillAll() override;

  static Limiter* Create() { return new CgroupLimiter(); }
  static int Score();

 private:
  CgroupLimiter() = default;

  // Path of the directory below which execution cgroups are created, or an
  // empty string if it cannot be determined.
  static std::string Root();

  // Reads the value of key from a flat keyed file such as memory.events.
  // Returns -1 if it cannot be read.
  int64_t ReadKey(const std::string& file, const std::string& key) const;

  std::string path_;
  int64_t peak_memory_bytes_ = -1;
  size_t counted_max_procs_ = 0;
  size_t processes_ = 0;
};

}  // namespace sandbox
#endif
