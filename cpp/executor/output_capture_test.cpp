#include <fcntl.h>
#include <unistd.h>
#include <string>

#include "executor/output_capture.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using executor::OutputCapture;
using executor::OutputPump;

// NOLINTNEXTLINE
TEST(OutputCaptureTest, TestUnderLimit) {
  OutputCapture capture(10);
  capture.Append("hello", 5);
  EXPECT_EQ(capture.Data(), "hello");
  EXPECT_FALSE(capture.Truncated());
}

// NOLINTNEXTLINE
TEST(OutputCaptureTest, TestExactlyAtLimit) {
  OutputCapture capture(5);
  capture.Append("hel", 3);
  capture.Append("lo", 2);
  EXPECT_EQ(capture.Data(), "hello");
  EXPECT_FALSE(capture.Truncated());
}

// NOLINTNEXTLINE
TEST(OutputCaptureTest, TestOverLimit) {
  OutputCapture capture(4);
  capture.Append("hel", 3);
  capture.Append("lo world", 8);
  EXPECT_EQ(capture.Data(), "hell");
  EXPECT_TRUE(capture.Truncated());
  capture.Append("!", 1);
  EXPECT_EQ(capture.Data(), "hell");
  EXPECT_TRUE(capture.Truncated());
}

// NOLINTNEXTLINE
TEST(OutputCaptureTest, TestZeroLimit) {
  OutputCapture capture(0);
  capture.Append("", 0);
  EXPECT_FALSE(capture.Truncated());
  capture.Append("x", 1);
  EXPECT_EQ(capture.Data(), "");
  EXPECT_TRUE(capture.Truncated());
}

// NOLINTNEXTLINE
TEST(OutputCaptureTest, TestBinaryData) {
  OutputCapture capture(16);
  std::string data("a\0b\xff", 4);
  capture.Append(data.data(), data.size());
  EXPECT_EQ(capture.Data(), data);
}

// NOLINTNEXTLINE
TEST(OutputCaptureTest, TestReadFromPipe) {
  int fds[2];
  ASSERT_EQ(pipe2(fds, O_NONBLOCK | O_CLOEXEC), 0);
  OutputCapture capture(8);
  EXPECT_TRUE(capture.ReadFrom(fds[0]));
  EXPECT_EQ(capture.Data(), "");
  ASSERT_EQ(write(fds[1], "0123456789", 10), 10);
  EXPECT_TRUE(capture.ReadFrom(fds[0]));
  close(fds[1]);
  EXPECT_FALSE(capture.ReadFrom(fds[0]));
  close(fds[0]);
  EXPECT_EQ(capture.Data(), "01234567");
  EXPECT_TRUE(capture.Truncated());
  EXPECT_EQ(capture.Take(), "01234567");
}

// NOLINTNEXTLINE
TEST(OutputPumpTest, TestReadsBothStreams) {
  int out_fds[2];
  int err_fds[2];
  ASSERT_EQ(pipe2(out_fds, O_NONBLOCK | O_CLOEXEC), 0);
  ASSERT_EQ(pipe2(err_fds, O_NONBLOCK | O_CLOEXEC), 0);
  OutputCapture out(16);
  OutputCapture err(16);
  OutputPump pump(out_fds[0], &out, err_fds[0], &err);
  ASSERT_EQ(write(out_fds[1], "out", 3), 3);
  ASSERT_EQ(write(err_fds[1], "err", 3), 3);
  close(out_fds[1]);
  for (int i = 0; i < 100 && !pump.Done(); i++) {
    pump.Pump(10);
    if (i == 10) close(err_fds[1]);
  }
  EXPECT_TRUE(pump.Done());
  EXPECT_EQ(out.Data(), "out");
  EXPECT_EQ(err.Data(), "err");
  close(out_fds[0]);
  close(err_fds[0]);
}

}  // namespace
