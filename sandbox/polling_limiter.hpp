#ifndef SANDBOX_POLLING_LIMITER_HPP
#define SANDBOX_POLLING_LIMITER_HPP
#include "sandbox/limiter.hpp"

namespace sandbox {

// Best-effort limiter for hosts without a delegated cgroup: the resident
// memory of every process in the session of the child is summed each time
// MemoryExceeded is called, and the processes are counted. Allocations and
// forks that happen between two samples are not seen, so the ceilings are
// only approximate.
class PollingLimiter : public Limiter {
 public:
  bool HardMemoryLimit() const override { return false; }
  bool Setup(const ExecutionOptions& options, std::string* error_msg) override;
  bool Attach(pid_t pid, std::string* error_msg) override;
  bool MemoryExceeded() override;
  bool ProcessLimitExceeded() override {
    return max_procs_ != 0 && processes_ > max_procs_;
  }
  int64_t PeakMemoryBytes() override { return peak_memory_bytes_; }
  bool KillAll() override;

  static Limiter* Create() { return new PollingLimiter(); }
  static int Score();

 private:
  PollingLimiter() = default;

  // Returns the pids of the processes in the session of the child.
  std::vector<pid_t> SessionMembers(int64_t* rss_bytes) const;

  pid_t session_ = 0;
  int64_t memory_limit_bytes_ = 0;
  size_t max_procs_ = 0;
  size_t processes_ = 0;
  int64_t peak_memory_bytes_ = -1;
};

}  // namespace sandbox
#endif
