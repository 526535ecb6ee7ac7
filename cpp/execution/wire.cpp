#include "execution/wire.hpp"

#include <kj/debug.h>

namespace execution {
namespace {

using Kind = ValidationError::Kind;
using CapnpKind = capnproto::ValidationError::Kind;

struct KindMapping {
  Kind kind;
  CapnpKind capnp_kind;
};

const KindMapping kKinds[] = {
    {Kind::EMPTY_SOURCE, CapnpKind::EMPTY_SOURCE},
    {Kind::SOURCE_TOO_LARGE, CapnpKind::SOURCE_TOO_LARGE},
    {Kind::UNSUPPORTED_LANGUAGE, CapnpKind::UNSUPPORTED_LANGUAGE},
    {Kind::TIMEOUT_OUT_OF_BOUNDS, CapnpKind::TIMEOUT_OUT_OF_BOUNDS},
    {Kind::MEMORY_OUT_OF_BOUNDS, CapnpKind::MEMORY_OUT_OF_BOUNDS},
    {Kind::UNKNOWN_ISOLATION_MODE, CapnpKind::UNKNOWN_ISOLATION_MODE},
    {Kind::ISOLATION_MODE_DISALLOWED, CapnpKind::ISOLATION_MODE_DISALLOWED},
};

std::string ToString(capnp::Data::Reader data) {
  return std::string(data.asChars().begin(), data.size());
}

capnp::Data::Reader ToData(const std::string& s) {
  return capnp::Data::Reader(reinterpret_cast<const kj::byte*>(s.data()),
                             s.size());
}

}  // namespace

RawRequest RequestFromCapnp(capnproto::ExecutionRequest::Reader reader) {
  RawRequest request;
  request.language = reader.getLanguage();
  request.source = reader.getSource();
  request.timeout_seconds = reader.getTimeoutSeconds();
  request.memory_limit_mb = reader.getMemoryLimitMb();
  request.isolation_mode = reader.getIsolationMode();
  return request;
}

void RequestToCapnp(const RawRequest& request,
                    capnproto::ExecutionRequest::Builder builder) {
  KJ_REQUIRE(request.timeout_seconds >= INT32_MIN &&
                 request.timeout_seconds <= INT32_MAX,
             "Timeout does not fit the wire format", request.timeout_seconds);
  KJ_REQUIRE(request.memory_limit_mb >= INT32_MIN &&
                 request.memory_limit_mb <= INT32_MAX,
             "Memory limit does not fit the wire format",
             request.memory_limit_mb);
  builder.setLanguage(request.language);
  builder.setSource(request.source);
  builder.setTimeoutSeconds(request.timeout_seconds);
  builder.setMemoryLimitMb(request.memory_limit_mb);
  builder.setIsolationMode(request.isolation_mode);
}

ValidationError ErrorFromCapnp(capnproto::ValidationError::Reader reader) {
  for (const KindMapping& mapping : kKinds) {
    if (mapping.capnp_kind == reader.getKind()) {
      return ValidationError(mapping.kind, reader.getMessage());
    }
  }
  KJ_FAIL_REQUIRE("Unknown validation error kind",
                  static_cast<uint16_t>(reader.getKind()));
}

void ErrorToCapnp(const ValidationError& error,
                  capnproto::ValidationError::Builder builder) {
  for (const KindMapping& mapping : kKinds) {
    if (mapping.kind == error.kind) {
      builder.setKind(mapping.capnp_kind);
      builder.setMessage(error.message);
      return;
    }
  }
  KJ_UNREACHABLE;
}

ExecutionResult ResultFromCapnp(capnproto::ExecutionResult::Reader reader) {
  ExitStatus status;
  auto status_reader = reader.getStatus();
  switch (status_reader.which()) {
    case capnproto::ExitStatus::COMPLETED:
      status = MakeCompleted(status_reader.getCompleted());
      break;
    case capnproto::ExitStatus::TIMED_OUT:
      status = MakeTimedOut();
      break;
    case capnproto::ExitStatus::RESOURCE_EXCEEDED:
      status = MakeResourceExceeded(
          status_reader.getResourceExceeded() ==
                  capnproto::ResourceKind::PROCESS_COUNT
              ? ResourceKind::PROCESS_COUNT
              : ResourceKind::MEMORY);
      break;
    case capnproto::ExitStatus::SETUP_FAILED:
      status = MakeSetupFailed(status_reader.getSetupFailed());
      break;
    case capnproto::ExitStatus::CANCELLED:
      status = MakeCancelled();
      break;
    default:
      KJ_FAIL_REQUIRE("Unknown exit status",
                      static_cast<uint16_t>(status_reader.which()));
  }
  IsolationMode mode =
      reader.getIsolationMode() == capnproto::IsolationMode::DIRECT
          ? IsolationMode::DIRECT
          : IsolationMode::SANDBOXED;
  return ExecutionResult(ToString(reader.getStdout()),
                         reader.getStdoutTruncated(),
                         ToString(reader.getStderr()),
                         reader.getStderrTruncated(), kj::mv(status),
                         reader.getElapsedMillis(), mode);
}

void ResultToCapnp(const ExecutionResult& result,
                   capnproto::ExecutionResult::Builder builder) {
  builder.setStdout(ToData(result.Stdout()));
  builder.setStderr(ToData(result.Stderr()));
  builder.setStdoutTruncated(result.StdoutTruncated());
  builder.setStderrTruncated(result.StderrTruncated());
  builder.setElapsedMillis(result.ElapsedMillis());
  builder.setIsolationMode(result.IsolationModeUsed() == IsolationMode::DIRECT
                               ? capnproto::IsolationMode::DIRECT
                               : capnproto::IsolationMode::SANDBOXED);
  auto status = builder.initStatus();
  const ExitStatus& exit_status = result.Status();
  if (exit_status.is<Completed>()) {
    status.setCompleted(exit_status.get<Completed>().code);
  } else if (exit_status.is<TimedOut>()) {
    status.setTimedOut();
  } else if (exit_status.is<ResourceExceeded>()) {
    status.setResourceExceeded(
        exit_status.get<ResourceExceeded>().kind == ResourceKind::PROCESS_COUNT
            ? capnproto::ResourceKind::PROCESS_COUNT
            : capnproto::ResourceKind::MEMORY);
  } else if (exit_status.is<SetupFailed>()) {
    status.setSetupFailed(exit_status.get<SetupFailed>().reason);
  } else if (exit_status.is<Cancelled>()) {
    status.setCancelled();
  } else {
    KJ_FAIL_ASSERT("Exit status not initialized");
  }
}

}  // namespace execution
