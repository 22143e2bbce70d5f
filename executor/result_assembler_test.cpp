#include "executor/result_assembler.hpp"
#include <csignal>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using executor::AssembleResult;
using executor::SanitizeOutput;
using sandbox::ExecutionInfo;
using sandbox::Termination;

ExecutionInfo makeInfo() {
  ExecutionInfo info;
  info.wall_time_millis = 42;
  info.memory_usage_bytes = 1 << 20;
  info.stdout_data = "out";
  info.stderr_data = "err";
  return info;
}

// NOLINTNEXTLINE
TEST(ResultAssembler, Ok) {
  proto::ExecutionResult result = AssembleResult(makeInfo());
  EXPECT_EQ(result.status(), proto::Status::OK);
  EXPECT_TRUE(result.has_exit_code());
  EXPECT_EQ(result.exit_code(), 0);
  EXPECT_EQ(result.signal(), 0);
  EXPECT_EQ(result.stdout_data(), "out");
  EXPECT_EQ(result.stderr_data(), "err");
  EXPECT_EQ(result.elapsed_ms(), 42);
  EXPECT_EQ(result.peak_memory_bytes(), 1 << 20);
  EXPECT_EQ(result.error_message(), "");
}

// NOLINTNEXTLINE
TEST(ResultAssembler, UnknownMemory) {
  ExecutionInfo info = makeInfo();
  info.memory_usage_bytes = -1;
  EXPECT_FALSE(AssembleResult(info).has_peak_memory_bytes());
}

// NOLINTNEXTLINE
TEST(ResultAssembler, NonZeroExit) {
  ExecutionInfo info = makeInfo();
  info.status_code = 3;
  info.message = "Non-zero return code";
  proto::ExecutionResult result = AssembleResult(info);
  EXPECT_EQ(result.status(), proto::Status::CRASHED);
  EXPECT_EQ(result.exit_code(), 3);
  EXPECT_EQ(result.error_message(), "Non-zero return code");
}

// NOLINTNEXTLINE
TEST(ResultAssembler, Signal) {
  ExecutionInfo info = makeInfo();
  info.signal = SIGSEGV;
  info.message = "Segmentation fault";
  proto::ExecutionResult result = AssembleResult(info);
  EXPECT_EQ(result.status(), proto::Status::CRASHED);
  EXPECT_FALSE(result.has_exit_code());
  EXPECT_EQ(result.signal(), SIGSEGV);
}

// NOLINTNEXTLINE
TEST(ResultAssembler, CpuLimitIsTimeout) {
  ExecutionInfo info = makeInfo();
  info.signal = SIGXCPU;
  proto::ExecutionResult result = AssembleResult(info);
  EXPECT_EQ(result.status(), proto::Status::TIMED_OUT);
  EXPECT_EQ(result.error_message(), "CPU limit exceeded");
}

// NOLINTNEXTLINE
TEST(ResultAssembler, TerminationWinsOverSignal) {
  ExecutionInfo info = makeInfo();
  info.signal = SIGKILL;
  info.termination = Termination::kTimeout;
  EXPECT_EQ(AssembleResult(info).status(), proto::Status::TIMED_OUT);
  EXPECT_EQ(AssembleResult(info).error_message(), "Wall limit exceeded");
  info.termination = Termination::kMemory;
  EXPECT_EQ(AssembleResult(info).status(), proto::Status::MEMORY_EXCEEDED);
  info.termination = Termination::kOutput;
  EXPECT_EQ(AssembleResult(info).status(), proto::Status::OUTPUT_TRUNCATED);
  EXPECT_EQ(AssembleResult(info).stdout_data(), "out");
  info.termination = Termination::kCancelled;
  EXPECT_EQ(AssembleResult(info).status(), proto::Status::CANCELLED);
  info.termination = Termination::kProcesses;
  EXPECT_EQ(AssembleResult(info).status(), proto::Status::CRASHED);
  EXPECT_EQ(AssembleResult(info).error_message(), "Process limit exceeded");
  EXPECT_EQ(AssembleResult(info).signal(), SIGKILL);
}

// NOLINTNEXTLINE
TEST(ResultAssembler, ApproximateMemory) {
  ExecutionInfo info = makeInfo();
  info.memory_approximate = true;
  EXPECT_TRUE(AssembleResult(info).approximate_memory());
}

// NOLINTNEXTLINE
TEST(ResultAssembler, FixedResults) {
  EXPECT_EQ(executor::RejectedResult("bad").status(), proto::Status::REJECTED);
  EXPECT_EQ(executor::RejectedResult("bad").error_message(), "bad");
  EXPECT_EQ(executor::UnavailableResult("no").status(),
            proto::Status::SANDBOX_UNAVAILABLE);
  EXPECT_EQ(executor::CancelledResult().status(), proto::Status::CANCELLED);
  EXPECT_FALSE(executor::CancelledResult().has_exit_code());
}

// NOLINTNEXTLINE
TEST(SanitizeOutput, ValidUtf8) {
  EXPECT_EQ(SanitizeOutput("plain ascii\n"), "plain ascii\n");
  EXPECT_EQ(SanitizeOutput("caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80"),
            "caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80");
}

// NOLINTNEXTLINE
TEST(SanitizeOutput, InvalidBytes) {
  EXPECT_EQ(SanitizeOutput("a\xff" "b"), "a?b");
  // Truncated sequence at the end, as left by the output limit.
  EXPECT_EQ(SanitizeOutput("x\xe2\x82"), "x??");
  // Overlong encoding of '/'.
  EXPECT_EQ(SanitizeOutput("\xc0\xaf"), "??");
  // Surrogate.
  EXPECT_EQ(SanitizeOutput("\xed\xa0\x80"), "???");
  EXPECT_EQ(SanitizeOutput(std::string("a\0b", 3)), std::string("a\0b", 3));
}

}  // namespace
