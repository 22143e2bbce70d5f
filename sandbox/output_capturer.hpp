#ifndef SANDBOX_OUTPUT_CAPTURER_HPP
#define SANDBOX_OUTPUT_CAPTURER_HPP
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace sandbox {

// Collects stdout and stderr of a child through two pipes, without ever
// letting the child block on a full pipe. The combined number of captured
// bytes never exceeds the limit; reading stops as soon as more data is
// available than the limit allows.
class OutputCapturer {
 public:
  // A limit of 0 means unbounded.
  explicit OutputCapturer(int64_t limit_bytes) : limit_bytes_(limit_bytes) {}
  ~OutputCapturer();

  OutputCapturer(const OutputCapturer&) = delete;
  OutputCapturer& operator=(const OutputCapturer&) = delete;
  OutputCapturer(OutputCapturer&&) = delete;
  OutputCapturer& operator=(OutputCapturer&&) = delete;

  // Creates the pipes. Returns false and sets error_msg on failure.
  bool Setup(std::string* error_msg);

  // Ends of the pipes that the child should use as stdout and stderr.
  int StdoutWriteFd() const { return stdout_fds_[1]; }
  int StderrWriteFd() const { return stderr_fds_[1]; }

  // Closes the write ends in the parent, after the child has been created.
  void CloseWriteEnds();

  // Waits at most timeout for data and reads everything that is available.
  // Returns false and sets error_msg on a read error.
  bool Drain(std::chrono::milliseconds timeout, std::string* error_msg);

  // True once the child tried to write more than the limit.
  bool LimitExceeded() const { return limit_exceeded_; }

  // True once both streams reached end of file or the limit was exceeded.
  bool Done() const;

  int64_t CapturedBytes() const {
    return static_cast<int64_t>(stdout_.size() + stderr_.size());
  }

  std::string TakeStdout() { return std::move(stdout_); }
  std::string TakeStderr() { return std::move(stderr_); }

 private:
  // Reads everything available from fd into out. Closes fd on end of file.
  bool ReadAvailable(int* fd, std::string* out, std::string* error_msg);

  int64_t limit_bytes_;
  int stdout_fds_[2] = {-1, -1};
  int stderr_fds_[2] = {-1, -1};
  std::string stdout_;
  std::string stderr_;
  bool limit_exceeded_ = false;
};

}  // namespace sandbox
#endif
