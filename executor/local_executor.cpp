#include "executor/local_executor.hpp"

#include <ctype.h>
#include <limits.h>
#include <stdlib.h>

#include <algorithm>
#include <memory>
#include <system_error>
#include <thread>
#include <vector>

#include "executor/result_assembler.hpp"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace {

static const constexpr char* kLang = "LANG=C.UTF-8";

bool IsIllegalChar(char c) {
  return !isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-' &&
         c != '_' && c != '/';
}

bool IsBelow(const std::string& path, const std::string& dir) {
  if (dir.empty()) return false;
  if (dir == "/") return true;
  return path == dir || (path.size() > dir.size() &&
                         path.compare(0, dir.size(), dir) == 0 &&
                         path[dir.size()] == '/');
}

// Both the path and its target have to be visible inside the jail.
bool VisibleInJail(const std::string& path,
                   const std::vector<std::string>& readonly_paths) {
  char resolved[PATH_MAX];
  if (realpath(path.c_str(), resolved) == nullptr) return false;
  bool path_ok = false;
  bool resolved_ok = false;
  for (const std::string& dir : readonly_paths) {
    if (IsBelow(path, dir)) path_ok = true;
    if (IsBelow(resolved, dir)) resolved_ok = true;
  }
  return path_ok && resolved_ok;
}

}  // namespace

namespace executor {

bool LocalExecutor::ValidSeedPath(const std::string& path,
                                  const Runtime& runtime,
                                  std::string* error_msg) {
  *error_msg = "Invalid seed file name: " + path;
  if (path.empty() || path[0] == '/') return false;
  if (std::find_if(path.begin(), path.end(), IsIllegalChar) != path.end()) {
    return false;
  }
  size_t begin = 0;
  while (begin <= path.size()) {
    size_t end = std::min(path.find('/', begin), path.size());
    std::string component = path.substr(begin, end - begin);
    if (component.empty() || component == "." || component == "..") {
      return false;
    }
    begin = end + 1;
  }
  if (path == runtime.source_file) {
    *error_msg = "Seed file " + path + " would overwrite the code";
    return false;
  }
  error_msg->clear();
  return true;
}

proto::ExecutionResult LocalExecutor::Execute(
    const proto::ExecutionRequest& request,
    const std::atomic<bool>* cancelled) {
  std::string error_msg;
  if (request.code().empty()) return RejectedResult("No code to execute");
  absl::optional<Runtime> runtime = FindRuntime(request.runtime());
  if (!runtime) {
    return RejectedResult("Unsupported runtime: " + request.runtime());
  }
  ExecutionBudget budget;
  if (!MakeBudget(request.budget(), &budget, &error_msg)) {
    return RejectedResult(error_msg);
  }
  if (request.allow_network() && !FLAGS_allow_network) {
    return RejectedResult("Network access is disabled on this host");
  }
  for (const auto& seed : request.seed_files()) {
    if (!ValidSeedPath(seed.first, *runtime, &error_msg)) {
      return RejectedResult(error_msg);
    }
  }
  // The interpreter is looked up in the PATH the program will see.
  std::string interpreter =
      util::which_in(runtime->interpreter, FLAGS_sandbox_path);
  if (interpreter.empty()) {
    return RejectedResult("Runtime " + runtime->id + " is not installed: " +
                          runtime->interpreter + " not found");
  }

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) return UnavailableResult("No sandbox is available on this host");
  if (FLAGS_require_isolation && !sb->Isolated()) {
    return UnavailableResult("The " + sb->Name() +
                             " sandbox does not isolate the program");
  }
  if (FLAGS_require_hard_memory_limit && !sb->HardMemoryLimit()) {
    return UnavailableResult("No hard memory limit can be enforced");
  }
  if (sb->Isolated() &&
      !VisibleInJail(interpreter, util::SplitList(FLAGS_readonly_paths))) {
    return RejectedResult("Runtime " + runtime->id + " is not installed: " +
                          interpreter + " is outside of the sandbox");
  }

  try {
    ThreadGuard guard(this);
    if (cancelled != nullptr && cancelled->load()) return CancelledResult();
    return Run(request, *runtime, interpreter, budget, sb.get(), cancelled);
  } catch (const too_many_executions& e) {
    return RejectedResult(e.what());
  } catch (const std::system_error& e) {
    LOG(ERROR) << "Execution failed: " << e.what();
    return UnavailableResult(e.what());
  }
}

proto::ExecutionResult LocalExecutor::Run(
    const proto::ExecutionRequest& request, const Runtime& runtime,
    const std::string& interpreter, const ExecutionBudget& budget,
    sandbox::Sandbox* sandbox, const std::atomic<bool>* cancelled) {
  util::TempDir tmp(temp_directory_);
  std::string box = util::File::JoinPath(tmp.Path(), kBoxDir);
  util::File::MakeDirs(box);
  util::File::Write(util::File::JoinPath(box, runtime.source_file),
                    request.code());
  for (const auto& seed : request.seed_files()) {
    try {
      util::File::Write(util::File::JoinPath(box, seed.first), seed.second);
    } catch (const std::system_error& e) {
      return RejectedResult("Cannot create seed file " + seed.first + ": " +
                            e.code().message());
    }
  }

  // Folder and arguments.
  sandbox::ExecutionOptions exec_options(box, interpreter);
  exec_options.scratch = util::File::JoinPath(tmp.Path(), "scratch");
  exec_options.args = runtime.args;
  exec_options.args.push_back(runtime.source_file);
  exec_options.env = {"PATH=" + FLAGS_sandbox_path, kLang};
  if (request.has_input()) {
    exec_options.stdin_file = util::File::JoinPath(tmp.Path(), "stdin");
    util::File::Write(exec_options.stdin_file, request.input());
  }

  // Limits.
  exec_options.wall_limit_millis = budget.wall_limit_millis;
  exec_options.cpu_limit_millis = budget.cpu_limit_millis;
  exec_options.memory_limit_bytes = budget.memory_limit_bytes;
  exec_options.output_limit_bytes = budget.output_limit_bytes;
  exec_options.max_procs = budget.max_procs;
  exec_options.max_files = budget.max_files;
  exec_options.max_file_size_bytes = budget.max_file_size_bytes;
  exec_options.memory_poll_interval_millis = FLAGS_memory_poll_interval_millis;
  exec_options.kill_grace_millis = FLAGS_kill_grace_millis;

  // Isolation.
  exec_options.allow_network = request.allow_network();
  exec_options.readonly_paths = util::SplitList(FLAGS_readonly_paths);
  exec_options.cancelled = cancelled;

  LOG(INFO) << Id() << ": running " << runtime.id << " code in " << tmp.Path()
            << " with the " << sandbox->Name() << " sandbox";
  sandbox::ExecutionInfo info;
  std::string error_msg;
  if (!sandbox->Execute(exec_options, &info, &error_msg)) {
    LOG(ERROR) << "The " << sandbox->Name()
               << " sandbox failed: " << error_msg;
    return UnavailableResult(error_msg);
  }
  // Removal failures are reported, instead of being only logged when tmp is
  // destroyed.
  tmp.Remove();

  proto::ExecutionResult result = AssembleResult(info);
  LOG(INFO) << "Execution finished in " << result.elapsed_ms()
            << "ms: " << proto::Status_Name(result.status());
  return result;
}

LocalExecutor::LocalExecutor(std::string temp_directory, size_t max_executions)
    : temp_directory_(std::move(temp_directory)),
      max_executions_(max_executions) {
  util::File::MakeDirs(temp_directory_);
  if (max_executions_ == 0) {
    max_executions_ = FLAGS_max_concurrent_executions > 0
                          ? FLAGS_max_concurrent_executions
                          : std::thread::hardware_concurrency();
  }
  if (max_executions_ == 0) max_executions_ = 1;
}

LocalExecutor::ThreadGuard::ThreadGuard(LocalExecutor* executor)
    : executor_(executor) {
  std::lock_guard<std::mutex> lck(executor_->mutex_);
  if (executor_->cur_executions_ == executor_->max_executions_) {
    throw too_many_executions("Execution failed: executor busy");
  }
  executor_->cur_executions_++;
}

LocalExecutor::ThreadGuard::~ThreadGuard() {
  std::lock_guard<std::mutex> lck(executor_->mutex_);
  executor_->cur_executions_--;
}

}  // namespace executor
