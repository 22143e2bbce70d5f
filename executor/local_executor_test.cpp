#include "executor/local_executor.hpp"
#include <dirent.h>
#include <sys/stat.h>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <thread>
#include "gflags/gflags.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/codebox_testdir";

int countEntries(const std::string& path) {
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) return -1;
  int count = 0;
  while (struct dirent* ent = readdir(dir)) {
    std::string name = ent->d_name;
    if (name != "." && name != "..") count++;
  }
  closedir(dir);
  return count;
}

class LocalExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    FLAGS_require_isolation = false;
    tmp_.reset(new util::TempDir(test_tmpdir));
    executor_.reset(new executor::LocalExecutor(tmp_->Path()));
  }

  proto::ExecutionRequest Request(const std::string& runtime,
                                  const std::string& code) {
    proto::ExecutionRequest request;
    request.set_runtime(runtime);
    request.set_code(code);
    request.mutable_budget()->set_timeout_seconds(5);
    request.mutable_budget()->set_max_memory_bytes(256 << 20);
    request.mutable_budget()->set_max_output_bytes(64 << 10);
    return request;
  }

  proto::ExecutionResult Run(const proto::ExecutionRequest& request) {
    return executor_->Execute(request, nullptr);
  }

  gflags::FlagSaver flag_saver_;
  std::unique_ptr<util::TempDir> tmp_;
  std::unique_ptr<executor::LocalExecutor> executor_;
};

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, Ok) {
  proto::ExecutionResult result = Run(Request("sh", "echo hello"));
  EXPECT_EQ(result.status(), proto::Status::OK);
  EXPECT_EQ(result.exit_code(), 0);
  EXPECT_EQ(result.stdout_data(), "hello\n");
  EXPECT_EQ(result.stderr_data(), "");
  EXPECT_TRUE(result.has_peak_memory_bytes());
  EXPECT_EQ(countEntries(tmp_->Path()), 0);
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, Input) {
  proto::ExecutionRequest request = Request("sh", "read x; echo got $x");
  request.set_input("42\n");
  proto::ExecutionResult result = Run(request);
  EXPECT_EQ(result.status(), proto::Status::OK);
  EXPECT_EQ(result.stdout_data(), "got 42\n");
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, SeedFiles) {
  proto::ExecutionRequest request = Request("sh", "cat data/in.txt");
  (*request.mutable_seed_files())["data/in.txt"] = "seeded";
  proto::ExecutionResult result = Run(request);
  EXPECT_EQ(result.status(), proto::Status::OK);
  EXPECT_EQ(result.stdout_data(), "seeded");
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, Crashed) {
  proto::ExecutionResult result = Run(Request("sh", "echo bad >&2; exit 4"));
  EXPECT_EQ(result.status(), proto::Status::CRASHED);
  EXPECT_EQ(result.exit_code(), 4);
  EXPECT_EQ(result.stderr_data(), "bad\n");
  EXPECT_EQ(countEntries(tmp_->Path()), 0);
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, TimedOut) {
  proto::ExecutionRequest request = Request("sh", "echo before; sleep 10");
  request.mutable_budget()->set_timeout_seconds(0.5);
  proto::ExecutionResult result = Run(request);
  EXPECT_EQ(result.status(), proto::Status::TIMED_OUT);
  EXPECT_EQ(result.stdout_data(), "before\n");
  EXPECT_GE(result.elapsed_ms(), 500);
  EXPECT_LE(result.elapsed_ms(), 3000);
  EXPECT_EQ(countEntries(tmp_->Path()), 0);
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, OutputTruncated) {
  proto::ExecutionRequest request = Request("sh", "while :; do echo y; done");
  request.mutable_budget()->set_max_output_bytes(100);
  proto::ExecutionResult result = Run(request);
  EXPECT_EQ(result.status(), proto::Status::OUTPUT_TRUNCATED);
  EXPECT_EQ(result.stdout_data().size(), 100);
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, Cancelled) {
  std::atomic<bool> cancelled{false};
  std::thread canceller([&cancelled]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    cancelled = true;
  });
  proto::ExecutionResult result =
      executor_->Execute(Request("sh", "sleep 10"), &cancelled);
  canceller.join();
  EXPECT_EQ(result.status(), proto::Status::CANCELLED);
  EXPECT_EQ(countEntries(tmp_->Path()), 0);
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, CancelledBeforeStart) {
  std::atomic<bool> cancelled{true};
  proto::ExecutionResult result =
      executor_->Execute(Request("sh", "echo never"), &cancelled);
  EXPECT_EQ(result.status(), proto::Status::CANCELLED);
  EXPECT_EQ(result.stdout_data(), "");
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, Python) {
  if (util::which("python3").empty()) GTEST_SKIP() << "python3 is missing";
  proto::ExecutionResult result =
      Run(Request("python", "import sys\nprint(sum(range(10)))\n"
                            "print('warn', file=sys.stderr)\n"));
  EXPECT_EQ(result.status(), proto::Status::OK);
  EXPECT_EQ(result.stdout_data(), "45\n");
  EXPECT_EQ(result.stderr_data(), "warn\n");
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, PythonException) {
  if (util::which("python3").empty()) GTEST_SKIP() << "python3 is missing";
  proto::ExecutionResult result =
      Run(Request("python", "print('partial')\nraise ValueError('boom')\n"));
  EXPECT_EQ(result.status(), proto::Status::CRASHED);
  EXPECT_EQ(result.exit_code(), 1);
  EXPECT_EQ(result.stdout_data(), "partial\n");
  EXPECT_THAT(result.stderr_data(), HasSubstr("ValueError: boom"));
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, RejectsEmptyCode) {
  proto::ExecutionResult result = Run(Request("sh", ""));
  EXPECT_EQ(result.status(), proto::Status::REJECTED);
  EXPECT_EQ(result.error_message(), "No code to execute");
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, RejectsUnknownRuntime) {
  proto::ExecutionResult result = Run(Request("cobol", "DISPLAY 'HI'."));
  EXPECT_EQ(result.status(), proto::Status::REJECTED);
  EXPECT_EQ(result.error_message(), "Unsupported runtime: cobol");
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, RejectsBadBudget) {
  proto::ExecutionRequest request = Request("sh", "true");
  request.mutable_budget()->set_timeout_seconds(-1);
  proto::ExecutionResult result = Run(request);
  EXPECT_EQ(result.status(), proto::Status::REJECTED);
  EXPECT_EQ(result.error_message(), "timeoutSeconds must be positive");
  EXPECT_FALSE(result.has_exit_code());
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, RejectsNetwork) {
  FLAGS_allow_network = false;
  proto::ExecutionRequest request = Request("sh", "true");
  request.set_allow_network(true);
  EXPECT_EQ(Run(request).status(), proto::Status::REJECTED);
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, RejectsBadSeedFiles) {
  for (const std::string& path :
       {"../escape", "/etc/passwd", "a//b", "a/./b", "bad name", "main.sh",
        "caf\xc3\xa9.txt", "\xff", ""}) {
    proto::ExecutionRequest request = Request("sh", "true");
    (*request.mutable_seed_files())[path] = "x";
    proto::ExecutionResult result = Run(request);
    EXPECT_EQ(result.status(), proto::Status::REJECTED) << path;
  }
  EXPECT_EQ(countEntries(tmp_->Path()), 0);
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, RejectsMissingInterpreter) {
  FLAGS_sandbox_path = tmp_->Path();
  proto::ExecutionResult result = Run(Request("ruby", "puts 1"));
  EXPECT_EQ(result.status(), proto::Status::REJECTED);
  EXPECT_THAT(result.error_message(), StartsWith("Runtime ruby"));
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, InterpreterFromSandboxPath) {
  util::TempDir fake(test_tmpdir);
  std::string fake_sh = util::File::JoinPath(fake.Path(), "sh");
  util::File::Write(fake_sh, "#!/bin/sh\necho fake\n");
  ASSERT_EQ(chmod(fake_sh.c_str(), 0755), 0);
  const char* env_path = getenv("PATH");
  std::string old_path = env_path != nullptr ? env_path : "";
  setenv("PATH", (fake.Path() + ":" + old_path).c_str(), 1);
  proto::ExecutionResult result = Run(Request("sh", "echo real"));
  setenv("PATH", old_path.c_str(), 1);
  EXPECT_EQ(result.status(), proto::Status::OK);
  EXPECT_EQ(result.stdout_data(), "real\n");
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, RejectsInterpreterOutsideSandbox) {
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  ASSERT_TRUE(sb);
  if (!sb->Isolated()) GTEST_SKIP() << "no isolating sandbox is available";
  util::TempDir outside(test_tmpdir);
  std::string sh = util::File::JoinPath(outside.Path(), "sh");
  util::File::Write(sh, util::File::Read(util::which("sh")));
  ASSERT_EQ(chmod(sh.c_str(), 0755), 0);
  FLAGS_sandbox_path = outside.Path() + ":/usr/bin:/bin";
  proto::ExecutionResult result = Run(Request("sh", "echo hi"));
  EXPECT_EQ(result.status(), proto::Status::REJECTED);
  EXPECT_THAT(result.error_message(), HasSubstr("outside of the sandbox"));
  EXPECT_EQ(result.stdout_data(), "");
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, UnavailableWithoutIsolation) {
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  ASSERT_TRUE(sb);
  if (sb->Isolated()) GTEST_SKIP() << "an isolating sandbox is available";
  FLAGS_require_isolation = true;
  proto::ExecutionResult result = Run(Request("sh", "echo hi"));
  EXPECT_EQ(result.status(), proto::Status::SANDBOX_UNAVAILABLE);
  EXPECT_EQ(result.stdout_data(), "");
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, ConcurrentExecutionsIsolated) {
  executor::LocalExecutor executor(tmp_->Path(), 2);
  proto::ExecutionRequest first = Request("sh", "echo a > mine; sleep 0.5; "
                                                "cat mine; ls");
  (*first.mutable_seed_files())["only_a.txt"] = "a";
  proto::ExecutionRequest second = Request("sh", "echo b > mine; sleep 0.5; "
                                                 "cat mine; ls");
  proto::ExecutionResult first_result;
  std::thread runner(
      [&]() { first_result = executor.Execute(first, nullptr); });
  proto::ExecutionResult second_result = executor.Execute(second, nullptr);
  runner.join();
  EXPECT_EQ(first_result.status(), proto::Status::OK);
  EXPECT_EQ(first_result.stdout_data(), "a\nmain.sh\nmine\nonly_a.txt\n");
  EXPECT_EQ(second_result.status(), proto::Status::OK);
  EXPECT_EQ(second_result.stdout_data(), "b\nmain.sh\nmine\n");
  EXPECT_EQ(countEntries(tmp_->Path()), 0);
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, Deterministic) {
  proto::ExecutionRequest request =
      Request("sh", "echo $((6 * 7)); echo warn >&2; ls; exit 3");
  (*request.mutable_seed_files())["data.txt"] = "x";
  proto::ExecutionResult first = Run(request);
  proto::ExecutionResult second = Run(request);
  EXPECT_EQ(first.status(), proto::Status::CRASHED);
  EXPECT_EQ(first.status(), second.status());
  EXPECT_EQ(first.exit_code(), 3);
  EXPECT_EQ(first.exit_code(), second.exit_code());
  EXPECT_EQ(first.stdout_data(), "42\ndata.txt\nmain.sh\n");
  EXPECT_EQ(first.stdout_data(), second.stdout_data());
  EXPECT_EQ(first.stderr_data(), second.stderr_data());
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, MemoryExceeded) {
  if (util::which("python3").empty()) GTEST_SKIP() << "python3 is missing";
  proto::ExecutionRequest request =
      Request("python", "import time\nblocks = []\nfor i in range(512):\n"
                        "    blocks.append(b'x' * (1 << 20))\n"
                        "    time.sleep(0.005)\n"
                        "time.sleep(1)\nprint('survived')\n");
  request.mutable_budget()->set_timeout_seconds(20);
  request.mutable_budget()->set_max_memory_bytes(64 << 20);
  proto::ExecutionResult result = Run(request);
  EXPECT_EQ(result.status(), proto::Status::MEMORY_EXCEEDED);
  EXPECT_EQ(result.error_message(), "Memory limit exceeded");
  EXPECT_EQ(result.stdout_data(), "");
  EXPECT_EQ(countEntries(tmp_->Path()), 0);
}

// NOLINTNEXTLINE
TEST_F(LocalExecutorTest, Busy) {
  executor::LocalExecutor executor(tmp_->Path(), 1);
  std::atomic<bool> cancelled{false};
  proto::ExecutionResult first;
  std::thread runner([&]() {
    first = executor.Execute(Request("sh", "sleep 10"), &cancelled);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  proto::ExecutionResult second =
      executor.Execute(Request("sh", "echo hi"), nullptr);
  cancelled = true;
  runner.join();
  EXPECT_EQ(second.status(), proto::Status::REJECTED);
  EXPECT_EQ(second.error_message(), "Execution failed: executor busy");
  EXPECT_EQ(first.status(), proto::Status::CANCELLED);
}

}  // namespace
