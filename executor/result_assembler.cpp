#include "executor/result_assembler.hpp"

#include <csignal>

namespace {

bool InRange(const std::string& data, size_t pos, unsigned char lo,
             unsigned char hi) {
  if (pos >= data.size()) return false;
  unsigned char c = data[pos];
  return c >= lo && c <= hi;
}

// Length of the valid UTF-8 sequence starting at pos, or 0 if there is none.
size_t SequenceLength(const std::string& data, size_t pos) {
  unsigned char c = data[pos];
  if (c < 0x80) return 1;
  if (c >= 0xC2 && c <= 0xDF) {
    return InRange(data, pos + 1, 0x80, 0xBF) ? 2 : 0;
  }
  size_t len = 0;
  unsigned char lo = 0x80;
  unsigned char hi = 0xBF;
  if (c >= 0xE0 && c <= 0xEF) {
    len = 3;
    // Overlong encodings and surrogates.
    if (c == 0xE0) lo = 0xA0;
    if (c == 0xED) hi = 0x9F;
  } else if (c >= 0xF0 && c <= 0xF4) {
    len = 4;
    // Overlong encodings and code points above U+10FFFF.
    if (c == 0xF0) lo = 0x90;
    if (c == 0xF4) hi = 0x8F;
  } else {
    return 0;
  }
  if (!InRange(data, pos + 1, lo, hi)) return 0;
  for (size_t i = 2; i < len; i++) {
    if (!InRange(data, pos + i, 0x80, 0xBF)) return 0;
  }
  return len;
}

}  // namespace

namespace executor {

std::string SanitizeOutput(std::string data) {
  size_t pos = 0;
  while (pos < data.size()) {
    size_t len = SequenceLength(data, pos);
    if (len == 0) {
      data[pos] = '?';
      len = 1;
    }
    pos += len;
  }
  return data;
}

proto::ExecutionResult AssembleResult(const sandbox::ExecutionInfo& info) {
  proto::ExecutionResult result;
  result.set_elapsed_ms(info.wall_time_millis);
  if (info.memory_usage_bytes >= 0) {
    result.set_peak_memory_bytes(info.memory_usage_bytes);
  }
  result.set_approximate_memory(info.memory_approximate);
  result.set_stdout_data(SanitizeOutput(info.stdout_data));
  result.set_stderr_data(SanitizeOutput(info.stderr_data));
  result.set_signal(info.signal);
  if (info.signal == 0) result.set_exit_code(info.status_code);

  sandbox::Termination termination = info.termination;
  // The CPU time rlimit is a backstop for the wall clock timeout.
  if (termination == sandbox::Termination::kNone && info.signal == SIGXCPU) {
    termination = sandbox::Termination::kTimeout;
  }
  switch (termination) {
    case sandbox::Termination::kCancelled:
      result.set_status(proto::Status::CANCELLED);
      result.set_error_message("Execution cancelled");
      break;
    case sandbox::Termination::kTimeout:
      result.set_status(proto::Status::TIMED_OUT);
      result.set_error_message(info.signal == SIGXCPU ? "CPU limit exceeded"
                                                      : "Wall limit exceeded");
      break;
    case sandbox::Termination::kMemory:
      result.set_status(proto::Status::MEMORY_EXCEEDED);
      result.set_error_message("Memory limit exceeded");
      break;
    case sandbox::Termination::kProcesses:
      result.set_status(proto::Status::CRASHED);
      result.set_error_message("Process limit exceeded");
      break;
    case sandbox::Termination::kOutput:
      result.set_status(proto::Status::OUTPUT_TRUNCATED);
      result.set_error_message("Output limit exceeded");
      break;
    case sandbox::Termination::kNone:
      if (info.signal != 0 || info.status_code != 0) {
        result.set_status(proto::Status::CRASHED);
        result.set_error_message(info.message);
      } else {
        result.set_status(proto::Status::OK);
      }
      break;
  }
  return result;
}

proto::ExecutionResult RejectedResult(const std::string& message) {
  proto::ExecutionResult result;
  result.set_status(proto::Status::REJECTED);
  result.set_error_message(message);
  return result;
}

proto::ExecutionResult UnavailableResult(const std::string& message) {
  proto::ExecutionResult result;
  result.set_status(proto::Status::SANDBOX_UNAVAILABLE);
  result.set_error_message(message);
  return result;
}

proto::ExecutionResult CancelledResult() {
  proto::ExecutionResult result;
  result.set_status(proto::Status::CANCELLED);
  result.set_error_message("Execution cancelled");
  return result;
}

}  // namespace executor
