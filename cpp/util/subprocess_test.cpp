#include "util/subprocess.hpp"
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;

// NOLINTNEXTLINE
TEST(Subprocess, RunCommandOutput) {
  std::string output, error_msg;
  int exit_code = -1;
  ASSERT_TRUE(util::RunCommand({"sh", "-c", "echo hello; echo world >&2"},
                               &output, &exit_code, &error_msg))
      << error_msg;
  EXPECT_EQ(exit_code, 0);
  EXPECT_THAT(output, HasSubstr("hello\n"));
  EXPECT_THAT(output, HasSubstr("world\n"));
}

// NOLINTNEXTLINE
TEST(Subprocess, RunCommandExitCode) {
  std::string output, error_msg;
  int exit_code = -1;
  ASSERT_TRUE(
      util::RunCommand({"sh", "-c", "exit 3"}, &output, &exit_code, &error_msg))
      << error_msg;
  EXPECT_EQ(exit_code, 3);
}

// NOLINTNEXTLINE
TEST(Subprocess, RunCommandSignal) {
  std::string output, error_msg;
  int exit_code = 0;
  ASSERT_TRUE(util::RunCommand({"sh", "-c", "kill -9 $$"}, &output, &exit_code,
                               &error_msg))
      << error_msg;
  EXPECT_EQ(exit_code, -SIGKILL);
}

// NOLINTNEXTLINE
TEST(Subprocess, RunCommandTimeout) {
  std::string output, error_msg;
  int exit_code = 0;
  EXPECT_FALSE(util::RunCommand({"sleep", "10"}, &output, &exit_code,
                                &error_msg, /*timeout_millis=*/200));
  EXPECT_THAT(error_msg, HasSubstr("timed out"));
}

// NOLINTNEXTLINE
TEST(Subprocess, RunCommandOutputLimit) {
  std::string output, error_msg;
  int exit_code = -1;
  ASSERT_TRUE(util::RunCommand({"sh", "-c", "yes | head -c 100000"}, &output,
                               &exit_code, &error_msg, 30000, 1000))
      << error_msg;
  EXPECT_EQ(exit_code, 0);
  EXPECT_EQ(output.size(), 1000u);
}

// NOLINTNEXTLINE
TEST(Subprocess, RunCommandNotFound) {
  std::string output, error_msg;
  int exit_code = 0;
  EXPECT_FALSE(util::RunCommand({"definitely-not-a-command-fusional"}, &output,
                                &exit_code, &error_msg));
  EXPECT_THAT(error_msg, HasSubstr("definitely-not-a-command-fusional"));
}

// NOLINTNEXTLINE
TEST(Subprocess, SpawnProcessOwnGroup) {
  std::string error_msg;
  pid_t pid;
  ASSERT_TRUE(util::SpawnProcess({"sleep", "10"}, -1, -1, &pid, &error_msg))
      << error_msg;
  EXPECT_EQ(getpgid(pid), pid);
  kill(-pid, SIGKILL);
  int status;
  ASSERT_EQ(waitpid(pid, &status, 0), pid);
  EXPECT_TRUE(WIFSIGNALED(status));
}

}  // namespace
