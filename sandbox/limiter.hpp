#ifndef SANDBOX_LIMITER_HPP
#define SANDBOX_LIMITER_HPP

#include <sys/types.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Enforces the memory and process ceilings of a process tree and measures its usage.
// Implementations register themselves exactly like sandboxes do, by creating
// a global Limiter::Register<LimiterImpl> object; the usable implementation
// with the highest score is selected the first time Create is called.
// An instance controls a single execution.
class Limiter {
 public:
  using create_t = std::function<Limiter*()>;
  using score_t = std::function<int()>;
  static std::unique_ptr<Limiter> Create();

  // Whether the memory ceiling is enforced by the kernel.
  virtual bool HardMemoryLimit() const = 0;

  // Prepares the enforcement of the limits in options. Called in the parent
  // before the child process is created.
  virtual bool Setup(const ExecutionOptions& options,
                     std::string* error_msg) = 0;

  // Places the given process, and all its future descendants, under the
  // limits. Called before the process runs any code of the program.
  virtual bool Attach(pid_t pid, std::string* error_msg) = 0;

  // Samples the usage. Returns true if the memory ceiling was exceeded.
  virtual bool MemoryExceeded() = 0;

  // Returns true if, at the last sample, the tree had more processes than
  // allowed. Limiters that make the kernel refuse the extra processes never
  // report this.
  virtual bool ProcessLimitExceeded() { return false; }

  // Peak memory usage observed so far in bytes, negative if unknown.
  virtual int64_t PeakMemoryBytes() = 0;

  // Kills every process under control of this limiter. Returns false if
  // the limiter is unable to do so.
  virtual bool KillAll() = 0;

  virtual ~Limiter() = default;
  Limiter() = default;
  Limiter(const Limiter&) = delete;
  Limiter(Limiter&&) = delete;
  Limiter& operator=(const Limiter&) = delete;
  Limiter& operator=(Limiter&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Limiter::Register_(&T::Create, &T::Score); }
  };

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Limiters_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
