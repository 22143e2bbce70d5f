#ifndef EXECUTOR_RESULT_ASSEMBLER_HPP
#define EXECUTOR_RESULT_ASSEMBLER_HPP
#include <string>

#include "proto/execution.pb.h"
#include "sandbox/sandbox.hpp"

namespace executor {

// Classifies a finished execution. The first matching classification wins:
// cancelled, timed out, memory exceeded, output truncated, crashed (killed
// by a signal or non-zero exit code), ok.
proto::ExecutionResult AssembleResult(const sandbox::ExecutionInfo& info);

// Result of a request that was refused before starting any process.
proto::ExecutionResult RejectedResult(const std::string& message);

// Result of a request that could not be run safely on this host.
proto::ExecutionResult UnavailableResult(const std::string& message);

// Result of a request that was cancelled before starting any process.
proto::ExecutionResult CancelledResult();

// Replaces every byte that is not part of a valid UTF-8 sequence with '?'.
// The size of the data does not change.
std::string SanitizeOutput(std::string data);

}  // namespace executor

#endif
