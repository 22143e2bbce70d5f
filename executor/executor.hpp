#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP
#include <atomic>
#include <string>

#include "proto/execution.pb.h"

namespace executor {

class Executor {
 public:
  // A string that identifies this executor.
  virtual std::string Id() const = 0;

  // Runs the code of the request and returns its result. Every outcome,
  // including rejections and host failures, is reported in the result. The
  // execution is terminated as soon as *cancelled becomes true, if cancelled
  // is not null.
  virtual proto::ExecutionResult Execute(
      const proto::ExecutionRequest& request,
      const std::atomic<bool>* cancelled) = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
