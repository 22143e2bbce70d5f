#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include <memory>
#include <string>
#include <vector>

#include "sandbox/limiter.hpp"
#include "sandbox/output_capturer.hpp"
#include "sandbox/process_tree.hpp"
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Base class for sandboxes for UNIX-like systems. The program runs in its own
// session with resource limits applied through setrlimit and the best
// available Limiter, but it is not isolated from the rest of the host.
class Unix : public Sandbox {
 public:
  std::string Name() const override { return "unix"; }
  bool HardMemoryLimit() const override;
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 1; }

 protected:
  Unix() = default;

  bool PrepareForExecution(const std::string& executable,
                           std::string* error_msg) override;
  bool ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) override;

  // Hook that is executed at the end of Setup, before argv and envp are
  // built.
  virtual bool OnSetup(std::string* /*error_msg*/) { return true; }

  // Creates a child process and saves its PID in child_pid_. The child process
  // should execute Child and must not return.
  virtual bool DoFork(std::string* error_msg);

  // Hook that is executed in the parent once the child exists, before it is
  // allowed to start.
  virtual bool OnForked(std::string* /*error_msg*/) { return true; }

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Hook that is executed in the child just before changing directory to
  // child_cwd_. Returns false if something went wrong and exec should not be
  // called. The error_msg string must not be longer then buflen characters.
  // This function must not use dynamic memory allocation.
  virtual bool OnChild(char* /*error_msg*/, size_t /*buflen*/) { return true; }

  // Executed when the child program exits. May change the execution info with
  // "better" values, or perform clean up.
  virtual void OnFinish(ExecutionInfo* /*info*/) {}

  const ExecutionOptions* options_ = nullptr;
  // Directory the program starts in, as seen by the program.
  std::string child_cwd_;
  pid_t child_pid_ = 0;

 private:
  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Starts the child and supervises it until it terminates.
  bool Run(ExecutionInfo* info, std::string* error_msg);

  // Waits for the termination of the child, killing it if it exceeds one of
  // its limits or if the execution is cancelled.
  bool Wait(ProcessTree* tree, ExecutionInfo* info, std::string* error_msg);

  // Releases every resource acquired by Setup.
  void Cleanup();

  std::unique_ptr<Limiter> limiter_;
  std::unique_ptr<OutputCapturer> capturer_;
  int error_fds_[2] = {-1, -1};
  int start_fds_[2] = {-1, -1};
  int stdin_fd_ = -1;

  // Built before forking, since the child cannot allocate memory.
  std::vector<std::string> args_;
  std::vector<std::string> env_;
  std::vector<char*> argv_;
  std::vector<char*> envp_;
};

}  // namespace sandbox
#endif
