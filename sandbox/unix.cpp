#include "sandbox/unix.hpp"

#include <algorithm>
#include <chrono>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "glog/logging.h"
#include "util/misc.hpp"

namespace sandbox {

namespace {

static const constexpr size_t kStrErrorBufSize = 2048;

// Time spent collecting the output that is still buffered in the pipes once
// the process tree is gone. Descendants that escaped the tree may keep the
// pipes open, so this is bounded.
static const constexpr std::chrono::milliseconds kFinalDrainTime{100};
static const constexpr std::chrono::milliseconds kPollTime{10};

void CloseFd(int* fd) {
  if (*fd != -1) {
    close(*fd);
    *fd = -1;
  }
}

int64_t ToMillis(const struct timeval& tv) {
  return static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000;
}

}  // namespace

bool Unix::HardMemoryLimit() const {
  std::unique_ptr<Limiter> limiter = Limiter::Create();
  return limiter != nullptr && limiter->HardMemoryLimit();
}

bool Unix::PrepareForExecution(const std::string& executable,
                               std::string* error_msg) {
  if (chmod(executable.c_str(), S_IRUSR | S_IXUSR) == -1) {
    *error_msg = util::ErrnoMessage("chmod", errno);
    return false;
  }
  return true;
}

bool Unix::ExecuteInternal(const ExecutionOptions& options,
                           ExecutionInfo* info, std::string* error_msg) {
  options_ = &options;
  bool ok = Run(info, error_msg);
  Cleanup();
  return ok;
}

bool Unix::Setup(std::string* error_msg) {
  child_cwd_ = options_->root;
  limiter_ = Limiter::Create();
  if (!limiter_) {
    *error_msg = "No resource limiter is available";
    return false;
  }
  if (!limiter_->Setup(*options_, error_msg)) return false;
  if (pipe2(error_fds_, O_CLOEXEC) == -1 ||
      pipe2(start_fds_, O_CLOEXEC) == -1) {
    *error_msg = util::ErrnoMessage("pipe2", errno);
    return false;
  }
  capturer_.reset(new OutputCapturer(options_->output_limit_bytes));
  if (!capturer_->Setup(error_msg)) return false;
  const std::string& stdin_file =
      options_->stdin_file.empty() ? "/dev/null" : options_->stdin_file;
  stdin_fd_ = open(stdin_file.c_str(), O_RDONLY | O_CLOEXEC);
  if (stdin_fd_ == -1) {
    *error_msg = util::ErrnoMessage("open " + stdin_file, errno);
    return false;
  }
  if (!OnSetup(error_msg)) return false;

  args_.clear();
  args_.push_back(options_->executable);
  args_.insert(args_.end(), options_->args.begin(), options_->args.end());
  env_ = options_->env;
  env_.push_back("HOME=" + child_cwd_);
  env_.push_back("TMPDIR=" + child_cwd_);
  argv_.clear();
  for (std::string& arg : args_) argv_.push_back(&arg[0]);
  argv_.push_back(nullptr);
  envp_.clear();
  for (std::string& var : env_) envp_.push_back(&var[0]);
  envp_.push_back(nullptr);
  return true;
}

void Unix::Cleanup() {
  CloseFd(&error_fds_[0]);
  CloseFd(&error_fds_[1]);
  CloseFd(&start_fds_[0]);
  CloseFd(&start_fds_[1]);
  CloseFd(&stdin_fd_);
  capturer_.reset();
  // Removes the resources of the limiter, such as its cgroup.
  limiter_.reset();
  child_pid_ = 0;
}

bool Unix::DoFork(std::string* error_msg) {
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = util::ErrnoMessage("fork", errno);
    return false;
  }
  if (fork_result) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Unix::Child() {
  close(error_fds_[0]);
  close(start_fds_[1]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(error_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      (void)!write(error_fds_[1], buf, len);
    }
    close(error_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, util::mystrerror(err, buf, kStrErrorBufSize));
  };

  // Do not outlive the supervisor.
  if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) die("prctl", errno);

  // Wait until the parent has placed us under the limits. If the parent is
  // gone, there is nobody to report to.
  char go = 0;
  ssize_t ret = 0;
  do {
    ret = read(start_fds_[0], &go, 1);
  } while (ret == -1 && errno == EINTR);
  if (ret != 1) _Exit(1);
  close(start_fds_[0]);

  // Change process group, so that we do not receive Ctrl-Cs in the terminal
  // and the whole tree can be signaled at once.
  if (setsid() == -1) die("setsid", errno);

  if (dup2(stdin_fd_, STDIN_FILENO) == -1) die("redir stdin", errno);
  if (dup2(capturer_->StdoutWriteFd(), STDOUT_FILENO) == -1) {
    die("redir stdout", errno);
  }
  if (dup2(capturer_->StderrWriteFd(), STDERR_FILENO) == -1) {
    die("redir stderr", errno);
  }

  char buf[kStrErrorBufSize] = {};
  if (!OnChild(buf, kStrErrorBufSize)) {
    die2("OnChild", buf);
  }

  if (chdir(child_cwd_.c_str()) == -1) {
    die("chdir", errno);
  }

  // Set resource limits.
  struct rlimit rlim;
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(FSIZE, options_->max_file_size_bytes);
  SET_RLIM(NOFILE, options_->max_files);
#undef SET_RLIM
  // SIGXCPU at the limit, SIGKILL one second later for programs that ignore
  // it.
  if (options_->cpu_limit_millis != 0) {
    rlim.rlim_cur = (options_->cpu_limit_millis + 999) / 1000;
    rlim.rlim_max = rlim.rlim_cur + 1;
    if (setrlimit(RLIMIT_CPU, &rlim) < 0) die("setrlim CPU", errno);
  }
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);

  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) die("prctl", errno);

  // Ignored signals and the signal mask survive exec.
  if (signal(SIGPIPE, SIG_DFL) == SIG_ERR) die("signal", errno);
  sigset_t no_signals;
  sigemptyset(&no_signals);
  if (sigprocmask(SIG_SETMASK, &no_signals, nullptr) == -1) {
    die("sigprocmask", errno);
  }

  int count = 0;
  do {
    execve(argv_[0], argv_.data(), envp_.data());
    usleep(100);
    // A freshly written executable may still be open for writing in a child
    // of another thread that did not exec yet.
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Run(ExecutionInfo* info, std::string* error_msg) {
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  // From now on, the child is killed and reaped on every path.
  ProcessTree tree(child_pid_, limiter_.get());
  CloseFd(&error_fds_[1]);
  CloseFd(&start_fds_[0]);
  CloseFd(&stdin_fd_);
  capturer_->CloseWriteEnds();

  if (!OnForked(error_msg)) return false;
  if (!limiter_->Attach(child_pid_, error_msg)) return false;
  char go = 1;
  if (write(start_fds_[1], &go, 1) != 1) {
    *error_msg = util::ErrnoMessage("write", errno);
    return false;
  }
  CloseFd(&start_fds_[1]);

  // The error pipe is closed on exec, and it only receives data if the child
  // could not get there.
  int error_len = 0;
  ssize_t ret = 0;
  do {
    ret = read(error_fds_[0], &error_len, sizeof(error_len));
  } while (ret == -1 && errno == EINTR);
  if (ret == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    error_len = std::min<int>(error_len, PIPE_BUF - 1);
    if (read(error_fds_[0], error, error_len) <= 0) {
      *error_msg = "The child failed without a reason";
    } else {
      *error_msg = error;
    }
    return false;
  }
  return Wait(&tree, info, error_msg);
}

bool Unix::Wait(ProcessTree* tree, ExecutionInfo* info,
                std::string* error_msg) {
  using std::chrono::steady_clock;
  auto program_start = steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               steady_clock::now() - program_start)
        .count();
  };
  const std::chrono::milliseconds poll_interval(
      std::max<int64_t>(options_->memory_poll_interval_millis, 1));
  auto next_sample = program_start;

  Termination termination = Termination::kNone;
  while (true) {
    if (!capturer_->Drain(kPollTime, error_msg)) return false;
    bool exited = false;
    if (!tree->Poll(&exited, error_msg)) return false;
    if (exited) break;
    if (capturer_->LimitExceeded()) {
      termination = Termination::kOutput;
      break;
    }
    if (options_->cancelled != nullptr && options_->cancelled->load()) {
      termination = Termination::kCancelled;
      break;
    }
    if (options_->wall_limit_millis != 0 &&
        elapsed_millis() >= options_->wall_limit_millis) {
      termination = Termination::kTimeout;
      break;
    }
    if (steady_clock::now() >= next_sample) {
      next_sample = steady_clock::now() + poll_interval;
      if (limiter_->MemoryExceeded()) {
        termination = Termination::kMemory;
        break;
      }
      if (limiter_->ProcessLimitExceeded()) {
        termination = Termination::kProcesses;
        break;
      }
    }
  }
  if (termination != Termination::kNone) {
    VLOG(1) << "Terminating " << tree->Pid() << " after " << elapsed_millis()
            << "ms";
  }
  if (!tree->TerminateAll(
          std::chrono::milliseconds(options_->kill_grace_millis), error_msg)) {
    return false;
  }
  info->wall_time_millis = elapsed_millis();

  auto drain_deadline = steady_clock::now() + kFinalDrainTime;
  while (!capturer_->Done() && steady_clock::now() < drain_deadline) {
    if (!capturer_->Drain(kPollTime, error_msg)) return false;
  }
  if (termination == Termination::kNone && capturer_->LimitExceeded()) {
    termination = Termination::kOutput;
  }
  // The kernel may have killed the tree on its own for exceeding the memory
  // ceiling.
  if (termination == Termination::kNone && limiter_->MemoryExceeded()) {
    termination = Termination::kMemory;
  }

  int child_status = tree->Status();
  const struct rusage& rusage = tree->Usage();
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->cpu_time_millis = ToMillis(rusage.ru_utime);
  info->sys_time_millis = ToMillis(rusage.ru_stime);
  info->memory_usage_bytes =
      std::max<int64_t>(limiter_->PeakMemoryBytes(),
                        static_cast<int64_t>(rusage.ru_maxrss) * 1024);
  info->memory_approximate = !limiter_->HardMemoryLimit();
  info->termination = termination;
  info->stdout_data = capturer_->TakeStdout();
  info->stderr_data = capturer_->TakeStderr();
  if (info->signal != 0) {
    info->message = strsignal(info->signal);
  } else if (info->status_code != 0) {
    info->message = "Non-zero return code";
  }

  OnFinish(info);
  return true;
}

namespace {
Sandbox::Register<Unix> r;  // NOLINT
}  // namespace

}  // namespace sandbox
