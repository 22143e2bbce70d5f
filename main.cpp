#include <signal.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>

#include "executor/local_executor.hpp"
#include "executor/request_codec.hpp"
#include "executor/result_assembler.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"

DEFINE_string(request_file, "",
              "File containing the JSON request. If unset, read from stdin");
DEFINE_bool(tool_definition, false,
            "Print the definition of the tool for the agent and exit");

namespace {

static const constexpr int kExitRejected = 2;
static const constexpr int kExitUnavailable = 3;

std::atomic<bool> cancelled{false};

void Cancel(int /*signum*/) { cancelled = true; }

int ExitCode(const proto::ExecutionResult& result) {
  switch (result.status()) {
    case proto::Status::REJECTED:
      return kExitRejected;
    case proto::Status::SANDBOX_UNAVAILABLE:
      return kExitUnavailable;
    default:
      return 0;
  }
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Runs a code execution request in a sandbox.\n"
      "The JSON request is read from stdin (or --request_file) and the JSON "
      "result is written to stdout.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  if (FLAGS_tool_definition) {
    std::cout << executor::ToolDefinitionJson() << std::endl;
    return 0;
  }

  // A caller that stops reading must not kill us before the cleanup.
  CHECK(signal(SIGPIPE, SIG_IGN) != SIG_ERR) << strerror(errno);
  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = Cancel;
  sigemptyset(&action.sa_mask);
  CHECK_NE(sigaction(SIGINT, &action, nullptr), -1) << strerror(errno);
  CHECK_NE(sigaction(SIGTERM, &action, nullptr), -1) << strerror(errno);

  std::string json;
  if (!FLAGS_request_file.empty()) {
    try {
      json = util::File::Read(FLAGS_request_file);
    } catch (const std::system_error& e) {
      LOG(ERROR) << e.what();
      std::cout << executor::ResultToJson(executor::RejectedResult(
                       std::string("Cannot read the request: ") + e.what()))
                << std::endl;
      return kExitRejected;
    }
  } else {
    json.assign(std::istreambuf_iterator<char>(std::cin),
                std::istreambuf_iterator<char>());
  }

  proto::ExecutionRequest request;
  proto::ExecutionResult result;
  std::string error_msg;
  if (!executor::RequestFromJson(json, &request, &error_msg)) {
    result = executor::RejectedResult(error_msg);
  } else {
    if (request.runtime().empty()) request.set_runtime("python");
    executor::ApplyDefaultBudget(request.mutable_budget());
    try {
      executor::LocalExecutor local_executor(FLAGS_temp_directory);
      result = local_executor.Execute(request, &cancelled);
    } catch (const std::system_error& e) {
      LOG(ERROR) << e.what();
      result = executor::UnavailableResult(e.what());
    }
  }
  std::cout << executor::ResultToJson(result) << std::endl;
  return ExitCode(result);
}
