#include "execution/validator.hpp"

#include <string>

#include "util/flags.hpp"
#include "util/misc.hpp"

namespace execution {
namespace {
kj::OneOf<ExecutionRequest, ValidationError> Reject(ValidationError::Kind kind,
                                                    std::string message) {
  kj::OneOf<ExecutionRequest, ValidationError> result;
  result.init<ValidationError>(kind, std::move(message));
  return result;
}
}  // namespace

ValidatorConfig ValidatorConfig::FromFlags() {
  ValidatorConfig config;
  config.allow_direct = Flags::allow_direct;
  config.max_timeout_seconds = Flags::max_timeout_seconds;
  config.max_memory_mb = Flags::max_memory_mb;
  config.max_source_bytes = Flags::max_source_bytes;
  return config;
}

kj::OneOf<ExecutionRequest, ValidationError> Validator::Validate(
    const RawRequest& raw) const {
  using Kind = ValidationError::Kind;
  if (util::trim(raw.source).empty()) {
    return Reject(Kind::EMPTY_SOURCE, "Source is empty");
  }
  if (raw.source.size() > config_.max_source_bytes) {
    return Reject(Kind::SOURCE_TOO_LARGE,
                  "Source is " + std::to_string(raw.source.size()) +
                      " bytes, the limit is " +
                      std::to_string(config_.max_source_bytes));
  }
  Language language;
  if (!ParseLanguage(raw.language, &language)) {
    return Reject(Kind::UNSUPPORTED_LANGUAGE,
                  "Unsupported language: '" + raw.language + "'");
  }
  if (raw.timeout_seconds <= 0 ||
      raw.timeout_seconds > config_.max_timeout_seconds) {
    return Reject(Kind::TIMEOUT_OUT_OF_BOUNDS,
                  "Timeout must be between 1 and " +
                      std::to_string(config_.max_timeout_seconds) +
                      " seconds, got " + std::to_string(raw.timeout_seconds));
  }
  if (raw.memory_limit_mb <= 0 ||
      raw.memory_limit_mb > config_.max_memory_mb) {
    return Reject(Kind::MEMORY_OUT_OF_BOUNDS,
                  "Memory limit must be between 1 and " +
                      std::to_string(config_.max_memory_mb) + " MB, got " +
                      std::to_string(raw.memory_limit_mb));
  }
  IsolationMode mode;
  if (!ParseIsolationMode(raw.isolation_mode, &mode)) {
    return Reject(Kind::UNKNOWN_ISOLATION_MODE,
                  "Unknown isolation mode: '" + raw.isolation_mode + "'");
  }
  if (mode == IsolationMode::DIRECT && !config_.allow_direct) {
    return Reject(Kind::ISOLATION_MODE_DISALLOWED,
                  "Direct execution is disabled on this server");
  }

  kj::OneOf<ExecutionRequest, ValidationError> result;
  result.init<ExecutionRequest>(ExecutionRequest(language, raw.source,
                                                 raw.timeout_seconds,
                                                 raw.memory_limit_mb, mode));
  return result;
}

}  // namespace execution
