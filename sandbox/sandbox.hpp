#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sandbox {

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_bytes = 0;
  int64_t output_limit_bytes = 0;
  int32_t max_procs = 0;
  int32_t max_files = 0;
  int64_t max_file_size_bytes = 0;
  int64_t memory_poll_interval_millis = 100;
  int64_t kill_grace_millis = 200;
  bool allow_network = false;

  // Host paths that isolating sandboxes expose read-only to the program.
  std::vector<std::string> readonly_paths;

  std::string stdin_file = "";
  std::vector<std::string> args;
  // Environment of the program, as NAME=value entries.
  std::vector<std::string> env;

  // When set, the execution is terminated as soon as the flag becomes true.
  const std::atomic<bool>* cancelled = nullptr;

  // Required values
  // Working directory of the program. Relative executables are resolved
  // against it.
  std::string root = "";
  // Private directory of the caller that the sandbox may use for its own
  // bookkeeping. Must not be inside root.
  std::string scratch = "";
  std::string executable = "";
  bool prepare_executable = false;
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Reason why the sandbox terminated the program, if it did.
enum class Termination {
  kNone,
  kTimeout,
  kMemory,
  kOutput,
  kCancelled,
  kProcesses
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  // Peak memory usage of the process tree, negative if unknown.
  int64_t memory_usage_bytes = -1;
  int32_t status_code = 0;
  int32_t signal = 0;
  Termination termination = Termination::kNone;
  // True if the memory ceiling was enforced by sampling the usage.
  bool memory_approximate = false;
  std::string stdout_data;
  std::string stderr_data;
  std::string message;
};

// Sandbox interface. Implementations need to register themselves by creating a
// global object of type Sandbox::Register<SandboxImpl> and should define the
// Create and Score static functions. Create should return a pointer to a newly
// allocated instance of the given implementation, while Score should return a
// value that defines how "good" that sandbox is: negative if the sandbox
// should not/cannot be used in the current configuration, positive otherwise
// (a bigger value means a better sandbox).
// Registering a sandbox is not thread-safe and should be done before any
// threads are created.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;
  // Returns an instance of the best sandbox, or nullptr if none is usable.
  // Scores are computed only once.
  static std::unique_ptr<Sandbox> Create();

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // Implementations of this function may not be thread safe.
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg);

  // Whether the program is confined to its working directory, cannot reach
  // the network and cannot see other processes.
  virtual bool Isolated() const { return false; }

  // Whether the memory ceiling is enforced by the kernel rather than by
  // sampling the memory usage.
  virtual bool HardMemoryLimit() const { return false; }

  // A string that identifies this sandbox in logs.
  virtual std::string Name() const = 0;

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(&T::Create, &T::Score); }
  };

 protected:
  virtual bool ExecuteInternal(const ExecutionOptions& options,
                               ExecutionInfo* info, std::string* error_msg) = 0;

  // Prepares a newly-created file for execution. Returns false on error,
  // and sets error_msg.
  virtual bool PrepareForExecution(const std::string& /*executable*/,
                                   std::string* /*error_msg*/) {
    return true;
  }

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Boxes_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
