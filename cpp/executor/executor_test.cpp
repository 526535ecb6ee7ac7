#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <kj/debug.h>

#include "execution/validator.hpp"
#include "executor/executor.hpp"
#include "executor/main.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace {

using ::testing::HasSubstr;

using execution::ExecutionRequest;
using execution::IsolationMode;
using executor::Canceler;
using executor::Executor;
using executor::ExecutorOptions;

// What the fake sandbox does, and what happened to it. Shared with the test
// because the executor owns the sandbox.
struct Script {
  bool provision_ok = true;
  bool run_ok = true;
  bool destroy_ok = true;
  bool throw_on_run = false;
  // Number of polls before the program exits, -1 to run until terminated.
  int polls_before_exit = 0;
  sandbox::ExitInfo exit_info;
  std::string stdout_data;
  std::string stderr_data;

  std::atomic<bool> started{false};
  std::atomic<bool> terminated{false};
  std::atomic<bool> destroyed{false};
  sandbox::Limits limits;
  sandbox::Program program;
};

class FakeSandbox : public sandbox::Sandbox {
 public:
  explicit FakeSandbox(std::shared_ptr<Script> script)
      : script_(std::move(script)) {}

  bool Provision(const sandbox::Limits& limits,
                 std::string* error_msg) override {
    script_->limits = limits;
    if (!script_->provision_ok) *error_msg = "no more cgroups";
    return script_->provision_ok;
  }

  bool Run(const sandbox::Program& program, std::string* error_msg) override {
    script_->program = program;
    if (script_->throw_on_run) KJ_FAIL_ASSERT("broken runtime");
    if (!script_->run_ok) {
      *error_msg = "exec: No such file or directory";
      return false;
    }
    stdout_ = Feed(script_->stdout_data);
    stderr_ = Feed(script_->stderr_data);
    script_->started = true;
    return true;
  }

  bool Poll(sandbox::ExitInfo* info) override {
    if (script_->terminated) {
      *info = sandbox::ExitInfo();
      info->signal = SIGKILL;
      return true;
    }
    if (script_->polls_before_exit < 0) return false;
    if (polls_++ < script_->polls_before_exit) return false;
    *info = script_->exit_info;
    return true;
  }

  void Terminate() override { script_->terminated = true; }

  bool Destroy(std::string* error_msg) override {
    script_->destroyed = true;
    stdout_ = nullptr;
    stderr_ = nullptr;
    if (!script_->destroy_ok) *error_msg = "rmdir: Device or resource busy";
    return script_->destroy_ok;
  }

  const char* Name() const override { return "fake"; }

 private:
  // A non-blocking pipe already holding data, with the write end closed.
  static kj::AutoCloseFd Feed(const std::string& data) {
    int fds[2];
    KJ_SYSCALL(pipe2(fds, O_NONBLOCK | O_CLOEXEC));
    KJ_SYSCALL(write(fds[1], data.data(), data.size()));
    close(fds[1]);
    return kj::AutoCloseFd(fds[0]);
  }

  std::shared_ptr<Script> script_;
  int polls_ = 0;
};

ExecutionRequest MakeRequest(const std::string& source, int64_t timeout = 5,
                             const std::string& mode = "sandboxed") {
  execution::ValidatorConfig config;
  config.allow_direct = true;
  execution::RawRequest raw;
  raw.source = source;
  raw.timeout_seconds = timeout;
  raw.isolation_mode = mode;
  auto validated = execution::Validator(config).Validate(raw);
  KJ_ASSERT(validated.is<ExecutionRequest>());
  return validated.get<ExecutionRequest>();
}

class ExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    script_ = std::make_shared<Script>();
    options_.grace_period_millis = 200;
  }

  std::unique_ptr<Executor> MakeExecutor() {
    std::shared_ptr<Script> script = script_;
    return std::make_unique<Executor>(
        options_, [script](IsolationMode, std::string*) {
          return std::unique_ptr<sandbox::Sandbox>(new FakeSandbox(script));
        });
  }

  std::shared_ptr<Script> script_;
  ExecutorOptions options_;
};

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestCompleted) {
  script_->stdout_data = "4\n";
  script_->stderr_data = "warning\n";
  script_->polls_before_exit = 3;
  auto result = MakeExecutor()->Execute(MakeRequest("print(2 + 2)"));
  ASSERT_TRUE(result.Status().is<execution::Completed>());
  EXPECT_EQ(result.Status().get<execution::Completed>().code, 0);
  EXPECT_EQ(result.Stdout(), "4\n");
  EXPECT_EQ(result.Stderr(), "warning\n");
  EXPECT_FALSE(result.StdoutTruncated());
  EXPECT_FALSE(result.StderrTruncated());
  EXPECT_EQ(result.IsolationModeUsed(), IsolationMode::SANDBOXED);
  EXPECT_GE(result.ElapsedMillis(), 0);
  EXPECT_TRUE(script_->destroyed);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestProgramAndLimits) {
  options_.max_processes = 12;
  options_.scratch_size_mb = 16;
  options_.sandbox_uid = 1234;
  MakeExecutor()->Execute(MakeRequest("print(1)"));
  EXPECT_EQ(script_->program.source, "print(1)");
  EXPECT_EQ(script_->program.source_name, "main.py");
  EXPECT_THAT(script_->program.interpreter_flags,
              ::testing::ElementsAre("-I", "-B"));
  EXPECT_EQ(script_->limits.memory_limit_kb, 128 * 1024);
  EXPECT_EQ(script_->limits.max_procs, 12);
  EXPECT_EQ(script_->limits.scratch_size_kb, 16 * 1024);
  EXPECT_EQ(script_->limits.uid, 1234);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestNonZeroExitIsCompleted) {
  script_->exit_info.status_code = 3;
  auto result = MakeExecutor()->Execute(MakeRequest("raise SystemExit(3)"));
  ASSERT_TRUE(result.Status().is<execution::Completed>());
  EXPECT_EQ(result.Status().get<execution::Completed>().code, 3);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestKilledBySignal) {
  script_->exit_info.signal = SIGSEGV;
  auto result = MakeExecutor()->Execute(MakeRequest("crash()"));
  ASSERT_TRUE(result.Status().is<execution::Completed>());
  EXPECT_EQ(result.Status().get<execution::Completed>().code, -SIGSEGV);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestTimedOut) {
  script_->polls_before_exit = -1;
  auto start = std::chrono::steady_clock::now();
  auto result = MakeExecutor()->Execute(MakeRequest("while True: pass", 1));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_TRUE(result.Status().is<execution::TimedOut>());
  EXPECT_TRUE(script_->terminated);
  EXPECT_TRUE(script_->destroyed);
  EXPECT_GE(elapsed, std::chrono::seconds(1));
  EXPECT_LT(elapsed, std::chrono::seconds(3));
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestMemoryExceeded) {
  script_->exit_info.signal = SIGKILL;
  script_->exit_info.memory_exceeded = true;
  auto result = MakeExecutor()->Execute(MakeRequest("x = ' ' * 10**10"));
  ASSERT_TRUE(result.Status().is<execution::ResourceExceeded>());
  EXPECT_EQ(result.Status().get<execution::ResourceExceeded>().kind,
            execution::ResourceKind::MEMORY);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestProcessCountExceeded) {
  script_->exit_info.status_code = 1;
  script_->exit_info.procs_exceeded = true;
  auto result = MakeExecutor()->Execute(MakeRequest("fork_bomb()"));
  ASSERT_TRUE(result.Status().is<execution::ResourceExceeded>());
  EXPECT_EQ(result.Status().get<execution::ResourceExceeded>().kind,
            execution::ResourceKind::PROCESS_COUNT);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestProvisionFailure) {
  script_->provision_ok = false;
  auto result = MakeExecutor()->Execute(MakeRequest("print(1)"));
  ASSERT_TRUE(result.Status().is<execution::SetupFailed>());
  EXPECT_EQ(result.Status().get<execution::SetupFailed>().reason,
            "no more cgroups");
  EXPECT_FALSE(script_->started);
  EXPECT_TRUE(script_->destroyed);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestRunFailure) {
  script_->run_ok = false;
  auto result = MakeExecutor()->Execute(MakeRequest("print(1)"));
  ASSERT_TRUE(result.Status().is<execution::SetupFailed>());
  EXPECT_THAT(result.Status().get<execution::SetupFailed>().reason,
              HasSubstr("exec"));
  EXPECT_TRUE(script_->destroyed);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestRuntimeExceptionIsSetupFailed) {
  script_->throw_on_run = true;
  auto result = MakeExecutor()->Execute(MakeRequest("print(1)"));
  ASSERT_TRUE(result.Status().is<execution::SetupFailed>());
  EXPECT_THAT(result.Status().get<execution::SetupFailed>().reason,
              HasSubstr("broken runtime"));
  EXPECT_TRUE(script_->destroyed);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestNoRuntime) {
  Executor executor(options_, [](IsolationMode, std::string* error_msg) {
    *error_msg = "No isolation runtime available for sandboxed executions";
    return std::unique_ptr<sandbox::Sandbox>();
  });
  auto result = executor.Execute(MakeRequest("print(1)"));
  ASSERT_TRUE(result.Status().is<execution::SetupFailed>());
  EXPECT_THAT(result.Status().get<execution::SetupFailed>().reason,
              HasSubstr("No isolation runtime"));
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestTeardownFailureIsCounted) {
  script_->stdout_data = "ok\n";
  auto executor = MakeExecutor();
  auto result = executor->Execute(MakeRequest("print('ok')"));
  EXPECT_TRUE(result.Status().is<execution::Completed>());
  EXPECT_EQ(executor->TeardownFailures(), 0u);

  script_->destroy_ok = false;
  result = executor->Execute(MakeRequest("print('ok')"));
  EXPECT_TRUE(result.Status().is<execution::Completed>());
  EXPECT_EQ(result.Stdout(), "ok\n");
  EXPECT_EQ(executor->TeardownFailures(), 1u);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestOutputTruncated) {
  options_.output_limit_bytes = 4;
  script_->stdout_data = "0123456789";
  script_->stderr_data = "abc";
  auto result = MakeExecutor()->Execute(MakeRequest("print('0123456789')"));
  EXPECT_EQ(result.Stdout(), "0123");
  EXPECT_TRUE(result.StdoutTruncated());
  EXPECT_EQ(result.Stderr(), "abc");
  EXPECT_FALSE(result.StderrTruncated());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestCancelled) {
  script_->polls_before_exit = -1;
  auto executor = MakeExecutor();
  Canceler canceler;
  std::thread cancel([this, canceler]() {
    while (!script_->started) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    canceler.Cancel();
  });
  auto result = executor->Execute(MakeRequest("while True: pass", 60), canceler);
  cancel.join();
  EXPECT_TRUE(result.Status().is<execution::Cancelled>());
  EXPECT_TRUE(script_->terminated);
  EXPECT_TRUE(script_->destroyed);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestSignalCancels) {
  script_->polls_before_exit = -1;
  auto executor = MakeExecutor();
  Canceler canceler;
  executor::CancelOnSignals(&canceler);
  std::thread signal([this]() {
    while (!script_->started) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    kill(getpid(), SIGTERM);
  });
  auto result = executor->Execute(MakeRequest("while True: pass", 60), canceler);
  signal.join();
  executor::CancelOnSignals(nullptr);
  EXPECT_TRUE(result.Status().is<execution::Cancelled>());
  EXPECT_TRUE(script_->destroyed);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestShutdown) {
  script_->polls_before_exit = -1;
  auto executor = MakeExecutor();
  std::thread shutdown([this, &executor]() {
    while (!script_->started) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    executor->Shutdown();
  });
  auto result = executor->Execute(MakeRequest("while True: pass", 60));
  shutdown.join();
  EXPECT_TRUE(result.Status().is<execution::Cancelled>());
  EXPECT_TRUE(script_->destroyed);

  // New executions are refused.
  script_ = std::make_shared<Script>();
  result = executor->Execute(MakeRequest("print(1)"));
  EXPECT_TRUE(result.Status().is<execution::Cancelled>());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestTooManyInFlight) {
  options_.max_executions = 1;
  script_->polls_before_exit = -1;
  auto executor = MakeExecutor();
  EXPECT_EQ(executor->MaxInFlight(), 1u);
  Canceler canceler;
  std::thread first([&executor, canceler]() {
    executor->Execute(MakeRequest("while True: pass", 60), canceler);
  });
  while (!script_->started) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  EXPECT_EQ(executor->InFlight(), 1u);
  auto result = executor->Execute(MakeRequest("print(1)"));
  ASSERT_TRUE(result.Status().is<execution::SetupFailed>());
  EXPECT_EQ(result.Status().get<execution::SetupFailed>().reason,
            "too many executions in flight");
  canceler.Cancel();
  first.join();
  EXPECT_EQ(executor->InFlight(), 0u);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, TestDefaultMaxInFlight) {
  EXPECT_GE(MakeExecutor()->MaxInFlight(), 4u);
}

// Runs real programs with the direct runtime.
class DirectExecutionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (util::whichInPath(Flags::python_interpreter,
                          "/usr/local/bin:/usr/bin:/bin")
            .empty()) {
      GTEST_SKIP() << "python3 not available";
    }
    Flags::temp_directory = "/tmp/fusional_testdir";
    options_.grace_period_millis = 1000;
    options_.output_limit_bytes = 1024;
  }

  execution::ExecutionResult Run(const std::string& source,
                                 int64_t timeout = 10) {
    Executor executor(options_);
    return executor.Execute(MakeRequest(source, timeout, "direct"));
  }

  ExecutorOptions options_;
};

// NOLINTNEXTLINE
TEST_F(DirectExecutionTest, TestPrint) {
  auto result = Run("print(2 + 2)\n");
  ASSERT_TRUE(result.Status().is<execution::Completed>())
      << execution::DescribeStatus(result.Status());
  EXPECT_EQ(result.Status().get<execution::Completed>().code, 0);
  EXPECT_EQ(result.Stdout(), "4\n");
  EXPECT_EQ(result.Stderr(), "");
  EXPECT_EQ(result.IsolationModeUsed(), IsolationMode::DIRECT);
}

// NOLINTNEXTLINE
TEST_F(DirectExecutionTest, TestExitCodeAndStderr) {
  auto result =
      Run("import sys\nprint('bad', file=sys.stderr)\nsys.exit(3)\n");
  ASSERT_TRUE(result.Status().is<execution::Completed>());
  EXPECT_EQ(result.Status().get<execution::Completed>().code, 3);
  EXPECT_EQ(result.Stderr(), "bad\n");
}

// NOLINTNEXTLINE
TEST_F(DirectExecutionTest, TestUncaughtException) {
  auto result = Run("raise ValueError('boom')\n");
  ASSERT_TRUE(result.Status().is<execution::Completed>());
  EXPECT_EQ(result.Status().get<execution::Completed>().code, 1);
  EXPECT_THAT(result.Stderr(), HasSubstr("ValueError: boom"));
}

// NOLINTNEXTLINE
TEST_F(DirectExecutionTest, TestInfiniteLoopTimesOut) {
  auto result = Run(
      "import os\n"
      "print(os.getpid(), flush=True)\n"
      "while True:\n"
      "    pass\n",
      1);
  EXPECT_TRUE(result.Status().is<execution::TimedOut>());
  EXPECT_GE(result.ElapsedMillis(), 1000);
  EXPECT_LT(result.ElapsedMillis(), 5000);
  // Nothing is left running once the result is returned.
  ASSERT_THAT(result.Stdout(), testing::EndsWith("\n"));
  pid_t pid = std::stoi(result.Stdout());
  EXPECT_EQ(kill(pid, 0), -1);
  EXPECT_EQ(errno, ESRCH);
}

// NOLINTNEXTLINE
TEST_F(DirectExecutionTest, TestLargeOutputIsTruncated) {
  auto result = Run("print('x' * 100000)\n");
  ASSERT_TRUE(result.Status().is<execution::Completed>());
  EXPECT_EQ(result.Stdout(), std::string(1024, 'x'));
  EXPECT_TRUE(result.StdoutTruncated());
  EXPECT_FALSE(result.StderrTruncated());
}

// NOLINTNEXTLINE
TEST_F(DirectExecutionTest, TestMemoryLimit) {
  execution::ValidatorConfig config;
  config.allow_direct = true;
  execution::RawRequest raw;
  raw.source =
      "import time\n"
      "blocks = []\n"
      "while True:\n"
      "    blocks.append(b'x' * (8 << 20))\n"
      "    time.sleep(0.005)\n";
  raw.memory_limit_mb = 64;
  raw.isolation_mode = "direct";
  auto validated = execution::Validator(config).Validate(raw);
  ASSERT_TRUE(validated.is<ExecutionRequest>());
  Executor executor(options_);
  auto result = executor.Execute(validated.get<ExecutionRequest>());
  ASSERT_TRUE(result.Status().is<execution::ResourceExceeded>())
      << execution::DescribeStatus(result.Status());
  EXPECT_EQ(result.Status().get<execution::ResourceExceeded>().kind,
            execution::ResourceKind::MEMORY);
}

// NOLINTNEXTLINE
TEST_F(DirectExecutionTest, TestBackgroundProcessDoesNotHang) {
  // The child keeps stdout open after the program exited.
  auto result = Run(
      "import subprocess\n"
      "subprocess.Popen(['sleep', '100'])\n"
      "print('done')\n");
  ASSERT_TRUE(result.Status().is<execution::Completed>());
  EXPECT_EQ(result.Stdout(), "done\n");
  EXPECT_LT(result.ElapsedMillis(), 5000);
}

// NOLINTNEXTLINE
TEST_F(DirectExecutionTest, TestConcurrentExecutions) {
  const constexpr int kExecutions = 8;
  options_.max_executions = kExecutions;
  Executor executor(options_);
  std::vector<std::string> outputs(kExecutions);
  std::vector<std::thread> threads;
  auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < kExecutions; i++) {
    threads.emplace_back([&executor, &outputs, i]() {
      auto result = executor.Execute(MakeRequest(
          "import time\ntime.sleep(1)\nprint(" + std::to_string(i) + ")\n",
          10, "direct"));
      outputs[i] = result.Stdout();
    });
  }
  for (std::thread& thread : threads) thread.join();
  auto elapsed = std::chrono::steady_clock::now() - start;
  for (int i = 0; i < kExecutions; i++) {
    EXPECT_EQ(outputs[i], std::to_string(i) + "\n");
  }
  // Not serialized.
  EXPECT_LT(elapsed, std::chrono::seconds(kExecutions / 2));
  EXPECT_EQ(executor.InFlight(), 0u);
}

}  // namespace
