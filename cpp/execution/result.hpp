#ifndef EXECUTION_RESULT_HPP
#define EXECUTION_RESULT_HPP

#include <cstdint>
#include <string>

#include <kj/one-of.h>

#include "execution/request.hpp"

namespace execution {

enum class ResourceKind { MEMORY, PROCESS_COUNT };

const char* ResourceKindName(ResourceKind kind);

// The program exited on its own. code is the exit status, or -signal if the
// program was killed by a signal the executor did not send.
struct Completed {
  explicit Completed(int32_t code) : code(code) {}
  int32_t code;
};

// The program ran past its timeout and was killed.
struct TimedOut {};

// The isolation runtime enforced a hard limit.
struct ResourceExceeded {
  explicit ResourceExceeded(ResourceKind kind) : kind(kind) {}
  ResourceKind kind;
};

// The sandbox could not be provisioned or the program could not be started.
struct SetupFailed {
  explicit SetupFailed(std::string reason) : reason(std::move(reason)) {}
  std::string reason;
};

// The execution was cancelled by the caller or by a shutdown.
struct Cancelled {};

using ExitStatus =
    kj::OneOf<Completed, TimedOut, ResourceExceeded, SetupFailed, Cancelled>;

ExitStatus MakeCompleted(int32_t code);
ExitStatus MakeTimedOut();
ExitStatus MakeResourceExceeded(ResourceKind kind);
ExitStatus MakeSetupFailed(std::string reason);
ExitStatus MakeCancelled();

// One line, human readable: "completed with code 0", "timed out", ...
std::string DescribeStatus(const ExitStatus& status);

// Outcome of one execution. Immutable.
class ExecutionResult {
 public:
  ExecutionResult(std::string stdout_data, bool stdout_truncated,
                  std::string stderr_data, bool stderr_truncated,
                  ExitStatus status, int64_t elapsed_millis,
                  IsolationMode isolation_mode)
      : stdout_(std::move(stdout_data)),
        stderr_(std::move(stderr_data)),
        stdout_truncated_(stdout_truncated),
        stderr_truncated_(stderr_truncated),
        status_(std::move(status)),
        elapsed_millis_(elapsed_millis),
        isolation_mode_(isolation_mode) {}

  const std::string& Stdout() const { return stdout_; }
  const std::string& Stderr() const { return stderr_; }
  bool StdoutTruncated() const { return stdout_truncated_; }
  bool StderrTruncated() const { return stderr_truncated_; }
  const ExitStatus& Status() const { return status_; }
  int64_t ElapsedMillis() const { return elapsed_millis_; }
  IsolationMode IsolationModeUsed() const { return isolation_mode_; }

 private:
  std::string stdout_;
  std::string stderr_;
  bool stdout_truncated_;
  bool stderr_truncated_;
  ExitStatus status_;
  int64_t elapsed_millis_;
  IsolationMode isolation_mode_;
};

// "[sandboxed] completed with code 0 in 31 ms", plus the truncated streams.
std::string Summary(const ExecutionResult& result);

}  // namespace execution

#endif
