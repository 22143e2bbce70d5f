#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include <mutex>
#include <stdexcept>
#include <string>

#include "executor/budget.hpp"
#include "executor/executor.hpp"
#include "executor/runtime.hpp"
#include "sandbox/sandbox.hpp"

namespace executor {

class too_many_executions : public std::runtime_error {
 public:
  explicit too_many_executions(const char* msg) : std::runtime_error(msg) {}
};

// Runs requests on this host, each in a fresh working directory below
// temp_directory, using the best available sandbox. Safe to use from
// multiple threads; at most max_executions requests run at the same time
// (--max_concurrent_executions, or the number of cores, if 0).
class LocalExecutor : public Executor {
 public:
  std::string Id() const override { return "LOCAL"; }
  proto::ExecutionResult Execute(const proto::ExecutionRequest& request,
                                 const std::atomic<bool>* cancelled) override;

  LocalExecutor(const LocalExecutor&) = delete;
  LocalExecutor& operator=(const LocalExecutor&) = delete;
  LocalExecutor(LocalExecutor&&) = delete;
  LocalExecutor& operator=(LocalExecutor&&) = delete;
  ~LocalExecutor() override = default;
  explicit LocalExecutor(std::string temp_directory, size_t max_executions = 0);

 private:
  class ThreadGuard {
   public:
    explicit ThreadGuard(LocalExecutor* executor);
    ~ThreadGuard();
    ThreadGuard(const ThreadGuard&) = delete;
    ThreadGuard& operator=(const ThreadGuard&) = delete;
    ThreadGuard(ThreadGuard&&) = delete;
    ThreadGuard& operator=(ThreadGuard&&) = delete;

   private:
    LocalExecutor* executor_;
  };

  static const constexpr char* kBoxDir = "box";

  // Checks that a seed file can be created in the working directory.
  static bool ValidSeedPath(const std::string& path, const Runtime& runtime,
                            std::string* error_msg);

  // Materializes the working directory and runs the program.
  proto::ExecutionResult Run(const proto::ExecutionRequest& request,
                             const Runtime& runtime,
                             const std::string& interpreter,
                             const ExecutionBudget& budget,
                             sandbox::Sandbox* sandbox,
                             const std::atomic<bool>* cancelled);

  std::string temp_directory_;
  size_t max_executions_;
  size_t cur_executions_ = 0;
  std::mutex mutex_;
};

}  // namespace executor

#endif
