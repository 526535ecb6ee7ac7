#include "execution/result.hpp"

#include <kj/debug.h>

namespace execution {

const char* ResourceKindName(ResourceKind kind) {
  switch (kind) {
    case ResourceKind::MEMORY:
      return "memory";
    case ResourceKind::PROCESS_COUNT:
      return "processCount";
  }
  KJ_UNREACHABLE;
}

ExitStatus MakeCompleted(int32_t code) {
  ExitStatus status;
  status.init<Completed>(code);
  return status;
}

ExitStatus MakeTimedOut() {
  ExitStatus status;
  status.init<TimedOut>();
  return status;
}

ExitStatus MakeResourceExceeded(ResourceKind kind) {
  ExitStatus status;
  status.init<ResourceExceeded>(kind);
  return status;
}

ExitStatus MakeSetupFailed(std::string reason) {
  ExitStatus status;
  status.init<SetupFailed>(std::move(reason));
  return status;
}

ExitStatus MakeCancelled() {
  ExitStatus status;
  status.init<Cancelled>();
  return status;
}

std::string DescribeStatus(const ExitStatus& status) {
  if (status.is<Completed>()) {
    return "completed with code " +
           std::to_string(status.get<Completed>().code);
  }
  if (status.is<TimedOut>()) return "timed out";
  if (status.is<ResourceExceeded>()) {
    return std::string("resource exceeded: ") +
           ResourceKindName(status.get<ResourceExceeded>().kind);
  }
  if (status.is<SetupFailed>()) {
    return "setup failed: " + status.get<SetupFailed>().reason;
  }
  if (status.is<Cancelled>()) return "cancelled";
  KJ_FAIL_ASSERT("Exit status not initialized");
}

std::string Summary(const ExecutionResult& result) {
  std::string summary = std::string("[") +
                        IsolationModeName(result.IsolationModeUsed()) + "] " +
                        DescribeStatus(result.Status()) + " in " +
                        std::to_string(result.ElapsedMillis()) + " ms";
  if (result.StdoutTruncated()) summary += ", stdout truncated";
  if (result.StderrTruncated()) summary += ", stderr truncated";
  return summary;
}

}  // namespace execution
