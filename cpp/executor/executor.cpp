#include "executor/executor.hpp"

#include <algorithm>
#include <thread>

#include <kj/common.h>
#include <kj/debug.h>

#include "execution/language.hpp"
#include "util/flags.hpp"

namespace executor {

namespace {

const constexpr int kPollIntervalMillis = 10;

int64_t MillisSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

sandbox::Program MakeProgram(const execution::ExecutionRequest& request) {
  execution::LanguageSpec spec = execution::GetLanguageSpec(request.GetLanguage());
  sandbox::Program program;
  program.source_name = spec.source_name;
  program.source = request.Source();
  program.interpreter = spec.interpreter;
  program.interpreter_flags = spec.interpreter_flags;
  program.container_image = spec.container_image;
  program.container_interpreter = spec.container_interpreter;
  return program;
}

}  // namespace

ExecutorOptions ExecutorOptions::FromFlags() {
  ExecutorOptions options;
  options.output_limit_bytes = Flags::output_limit_bytes;
  options.grace_period_millis = Flags::grace_period_millis;
  options.max_processes = Flags::max_processes;
  options.scratch_size_mb = Flags::scratch_size_mb;
  options.sandbox_uid = Flags::sandbox_uid;
  options.sandbox_gid = Flags::sandbox_gid;
  options.max_executions = Flags::max_executions;
  return options;
}

Executor::Executor(ExecutorOptions options, SandboxFactory factory)
    : options_(options), factory_(std::move(factory)) {
  max_in_flight_ = options_.max_executions;
  if (max_in_flight_ == 0) {
    max_in_flight_ = 4 * std::max(1u, std::thread::hardware_concurrency());
  }
}

sandbox::Limits Executor::MakeLimits(
    const execution::ExecutionRequest& request) const {
  sandbox::Limits limits;
  limits.memory_limit_kb = request.MemoryLimitMb() * 1024;
  limits.max_procs = options_.max_processes;
  limits.max_files = options_.max_files;
  limits.max_file_size_kb = options_.scratch_size_mb * 1024;
  limits.scratch_size_kb = options_.scratch_size_mb * 1024;
  limits.uid = options_.sandbox_uid;
  limits.gid = options_.sandbox_gid;
  return limits;
}

execution::ExecutionResult Executor::Execute(
    const execution::ExecutionRequest& request, const Canceler& canceler) {
  OutputCapture out(options_.output_limit_bytes);
  OutputCapture err(options_.output_limit_bytes);
  int64_t elapsed_millis = 0;
  execution::IsolationMode mode = request.GetIsolationMode();

  execution::ExitStatus status = execution::MakeCancelled();
  if (!shutdown_) {
    if (in_flight_.fetch_add(1) >= max_in_flight_) {
      in_flight_--;
      KJ_LOG(WARNING, "Execution refused", in_flight_.load(), max_in_flight_);
      status = execution::MakeSetupFailed("too many executions in flight");
    } else {
      KJ_DEFER(in_flight_--);
      status = RunInSandbox(request, canceler, &out, &err, &elapsed_millis);
    }
  }
  KJ_LOG(INFO, "Execution finished", execution::IsolationModeName(mode),
         execution::DescribeStatus(status), elapsed_millis);
  bool stdout_truncated = out.Truncated();
  bool stderr_truncated = err.Truncated();
  return execution::ExecutionResult(out.Take(), stdout_truncated, err.Take(),
                                    stderr_truncated, std::move(status),
                                    elapsed_millis, mode);
}

execution::ExitStatus Executor::RunInSandbox(
    const execution::ExecutionRequest& request, const Canceler& canceler,
    OutputCapture* out, OutputCapture* err, int64_t* elapsed_millis) {
  auto start = Clock::now();
  try {
    std::string error_msg;
    std::unique_ptr<sandbox::Sandbox> box =
        factory_(request.GetIsolationMode(), &error_msg);
    if (!box) {
      *elapsed_millis = MillisSince(start);
      KJ_LOG(WARNING, "No sandbox", error_msg);
      return execution::MakeSetupFailed(error_msg);
    }
    // Whatever happens from now on, the sandbox is destroyed.
    KJ_DEFER({
      *elapsed_millis = MillisSince(start);
      Teardown(box.get());
    });
    return Supervise(box.get(), request, canceler, out, err);
  } catch (const kj::Exception& e) {
    KJ_LOG(ERROR, "Execution failed", e);
    return execution::MakeSetupFailed(e.getDescription().cStr());
  } catch (const std::exception& e) {
    KJ_LOG(ERROR, "Execution failed", e.what());
    return execution::MakeSetupFailed(e.what());
  }
}

execution::ExitStatus Executor::Supervise(
    sandbox::Sandbox* box, const execution::ExecutionRequest& request,
    const Canceler& canceler, OutputCapture* out, OutputCapture* err) {
  std::string error_msg;
  if (!box->Provision(MakeLimits(request), &error_msg)) {
    KJ_LOG(WARNING, "Provisioning failed", box->Name(), error_msg);
    return execution::MakeSetupFailed(error_msg);
  }
  if (canceler.IsCancelled() || shutdown_) return execution::MakeCancelled();
  if (!box->Run(MakeProgram(request), &error_msg)) {
    KJ_LOG(WARNING, "Cannot start the program", box->Name(), error_msg);
    return execution::MakeSetupFailed(error_msg);
  }

  // The timer starts once the program is running.
  Clock::time_point deadline =
      Clock::now() + std::chrono::seconds(request.TimeoutSeconds());
  OutputPump pump(box->StdoutFd(), out, box->StderrFd(), err);
  sandbox::ExitInfo info;
  WaitOutcome outcome = Wait(box, deadline, canceler, &pump, &info);

  Clock::time_point grace_deadline =
      Clock::now() + std::chrono::milliseconds(options_.grace_period_millis);
  if (outcome != WaitOutcome::kCompleted) {
    box->Terminate();
    while (!box->Poll(&info)) {
      if (Clock::now() > grace_deadline) {
        KJ_LOG(WARNING, "The program survived being killed", box->Name());
        break;
      }
      pump.Pump(kPollIntervalMillis);
    }
  }
  // Processes left behind by the program may still hold the pipes open.
  box->Terminate();
  while (!pump.Done() && Clock::now() < grace_deadline) {
    pump.Pump(kPollIntervalMillis);
  }
  if (!pump.Done()) KJ_LOG(WARNING, "Output streams still open", box->Name());

  switch (outcome) {
    case WaitOutcome::kCancelled:
      return execution::MakeCancelled();
    case WaitOutcome::kTimedOut:
      return execution::MakeTimedOut();
    case WaitOutcome::kCompleted:
      break;
  }
  if (info.memory_exceeded) {
    return execution::MakeResourceExceeded(execution::ResourceKind::MEMORY);
  }
  if (info.procs_exceeded) {
    return execution::MakeResourceExceeded(
        execution::ResourceKind::PROCESS_COUNT);
  }
  return execution::MakeCompleted(info.signal != 0 ? -info.signal
                                                   : info.status_code);
}

Executor::WaitOutcome Executor::Wait(sandbox::Sandbox* box,
                                     Clock::time_point deadline,
                                     const Canceler& canceler,
                                     OutputPump* pump,
                                     sandbox::ExitInfo* info) {
  while (true) {
    if (box->Poll(info)) return WaitOutcome::kCompleted;
    if (canceler.IsCancelled() || shutdown_) return WaitOutcome::kCancelled;
    if (Clock::now() >= deadline) return WaitOutcome::kTimedOut;
    pump->Pump(kPollIntervalMillis);
  }
}

void Executor::Teardown(sandbox::Sandbox* box) {
  std::string error_msg;
  bool destroyed = false;
  try {
    destroyed = box->Destroy(&error_msg);
  } catch (const kj::Exception& e) {
    error_msg = e.getDescription().cStr();
  } catch (const std::exception& e) {
    error_msg = e.what();
  }
  if (!destroyed) {
    teardown_failures_++;
    KJ_LOG(ERROR, "Sandbox teardown failed", box->Name(), error_msg);
  }
}

}  // namespace executor
