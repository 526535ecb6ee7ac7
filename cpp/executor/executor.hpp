#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "execution/request.hpp"
#include "execution/result.hpp"
#include "executor/cancellation.hpp"
#include "executor/output_capture.hpp"
#include "sandbox/sandbox.hpp"

namespace executor {

struct ExecutorOptions {
  // Per stream.
  size_t output_limit_bytes = 1024 * 1024;
  // How long to wait for the program to die and its output to be drained
  // after it was killed.
  int32_t grace_period_millis = 2000;
  int32_t max_processes = 64;
  int32_t max_files = 256;
  // Size of /tmp, and largest file the program can write.
  int64_t scratch_size_mb = 64;
  int32_t sandbox_uid = 1000;
  int32_t sandbox_gid = 1000;
  // 0 means four per CPU core.
  uint32_t max_executions = 0;

  static ExecutorOptions FromFlags();
};

using SandboxFactory = std::function<std::unique_ptr<sandbox::Sandbox>(
    execution::IsolationMode, std::string*)>;

// Runs validated requests, each in its own sandbox. Thread-safe: Execute may
// be called concurrently, and executions do not share any state besides the
// counters below.
class Executor {
 public:
  explicit Executor(ExecutorOptions options,
                    SandboxFactory factory = &sandbox::Sandbox::Create);

  // Never throws. Blocks until the program terminated and the sandbox was
  // destroyed.
  execution::ExecutionResult Execute(const execution::ExecutionRequest& request,
                                     const Canceler& canceler = Canceler());

  // Cancels every execution in flight, and refuses new ones.
  void Shutdown() { shutdown_ = true; }

  uint64_t TeardownFailures() const { return teardown_failures_; }
  uint32_t InFlight() const { return in_flight_; }
  uint32_t MaxInFlight() const { return max_in_flight_; }

 private:
  enum class WaitOutcome { kCompleted, kTimedOut, kCancelled };
  using Clock = std::chrono::steady_clock;

  execution::ExitStatus RunInSandbox(const execution::ExecutionRequest& request,
                                     const Canceler& canceler,
                                     OutputCapture* out, OutputCapture* err,
                                     int64_t* elapsed_millis);

  execution::ExitStatus Supervise(sandbox::Sandbox* box,
                                  const execution::ExecutionRequest& request,
                                  const Canceler& canceler, OutputCapture* out,
                                  OutputCapture* err);

  // Polls the program and reads its output until it exits, the deadline
  // expires or the execution is cancelled.
  WaitOutcome Wait(sandbox::Sandbox* box, Clock::time_point deadline,
                   const Canceler& canceler, OutputPump* pump,
                   sandbox::ExitInfo* info);

  void Teardown(sandbox::Sandbox* box);

  sandbox::Limits MakeLimits(const execution::ExecutionRequest& request) const;

  ExecutorOptions options_;
  SandboxFactory factory_;
  uint32_t max_in_flight_;
  std::atomic<uint32_t> in_flight_{0};
  std::atomic<uint64_t> teardown_failures_{0};
  std::atomic<bool> shutdown_{false};
};

}  // namespace executor

#endif
