#include "sandbox/output_capturer.hpp"
#include <unistd.h>
#include <chrono>
#include <string>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using sandbox::OutputCapturer;

void writeAll(int fd, const std::string& data) {
  ASSERT_EQ(write(fd, data.data(), data.size()),
            static_cast<ssize_t>(data.size()));
}

void drainUntilDone(OutputCapturer* capturer) {
  std::string error_msg;
  for (int i = 0; i < 100 && !capturer->Done(); i++) {
    ASSERT_TRUE(capturer->Drain(std::chrono::milliseconds(10), &error_msg))
        << error_msg;
  }
}

// NOLINTNEXTLINE
TEST(OutputCapturer, CapturesBothStreams) {
  OutputCapturer capturer(0);
  std::string error_msg;
  ASSERT_TRUE(capturer.Setup(&error_msg)) << error_msg;
  writeAll(capturer.StdoutWriteFd(), "hello ");
  writeAll(capturer.StderrWriteFd(), "oops");
  writeAll(capturer.StdoutWriteFd(), "world");
  EXPECT_FALSE(capturer.Done());
  capturer.CloseWriteEnds();
  drainUntilDone(&capturer);
  EXPECT_TRUE(capturer.Done());
  EXPECT_FALSE(capturer.LimitExceeded());
  EXPECT_EQ(capturer.CapturedBytes(), 15);
  EXPECT_EQ(capturer.TakeStdout(), "hello world");
  EXPECT_EQ(capturer.TakeStderr(), "oops");
}

// NOLINTNEXTLINE
TEST(OutputCapturer, ExactlyAtLimit) {
  OutputCapturer capturer(8);
  std::string error_msg;
  ASSERT_TRUE(capturer.Setup(&error_msg)) << error_msg;
  writeAll(capturer.StdoutWriteFd(), "1234");
  writeAll(capturer.StderrWriteFd(), "5678");
  capturer.CloseWriteEnds();
  drainUntilDone(&capturer);
  EXPECT_FALSE(capturer.LimitExceeded());
  EXPECT_EQ(capturer.CapturedBytes(), 8);
}

// NOLINTNEXTLINE
TEST(OutputCapturer, LimitExceeded) {
  OutputCapturer capturer(10);
  std::string error_msg;
  ASSERT_TRUE(capturer.Setup(&error_msg)) << error_msg;
  writeAll(capturer.StdoutWriteFd(), std::string(64, 'x'));
  drainUntilDone(&capturer);
  // The write end is still open: the capturer stops reading anyway.
  EXPECT_TRUE(capturer.Done());
  EXPECT_TRUE(capturer.LimitExceeded());
  EXPECT_EQ(capturer.CapturedBytes(), 10);
  EXPECT_EQ(capturer.TakeStdout(), std::string(10, 'x'));
}

// NOLINTNEXTLINE
TEST(OutputCapturer, DrainTimesOutWithoutData) {
  OutputCapturer capturer(0);
  std::string error_msg;
  ASSERT_TRUE(capturer.Setup(&error_msg)) << error_msg;
  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(capturer.Drain(std::chrono::milliseconds(50), &error_msg));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_GE(elapsed, std::chrono::milliseconds(40));
  EXPECT_FALSE(capturer.Done());
  EXPECT_EQ(capturer.CapturedBytes(), 0);
}

}  // namespace
