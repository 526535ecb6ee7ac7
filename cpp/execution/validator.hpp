#ifndef EXECUTION_VALIDATOR_HPP
#define EXECUTION_VALIDATOR_HPP

#include <cstddef>
#include <cstdint>

#include <kj/one-of.h>

#include "execution/request.hpp"

namespace execution {

// Static bounds applied to every request.
struct ValidatorConfig {
  bool allow_direct = false;
  int64_t max_timeout_seconds = 300;
  int64_t max_memory_mb = 2048;
  size_t max_source_bytes = 1024 * 1024;

  static ValidatorConfig FromFlags();
};

// Turns untrusted RawRequests into ExecutionRequests. Checks are run in this
// order, and the first failing one is reported:
//   1. source empty or only whitespace   -> EMPTY_SOURCE
//   2. source over max_source_bytes      -> SOURCE_TOO_LARGE
//   3. language not supported            -> UNSUPPORTED_LANGUAGE
//   4. timeout not in 1..max             -> TIMEOUT_OUT_OF_BOUNDS
//   5. memory not in 1..max              -> MEMORY_OUT_OF_BOUNDS
//   6. unknown isolation mode            -> UNKNOWN_ISOLATION_MODE
//   7. direct mode while not allowed     -> ISOLATION_MODE_DISALLOWED
// Out of bounds values are rejected, never clamped, and a disallowed direct
// request is never downgraded to sandboxed.
class Validator {
 public:
  explicit Validator(ValidatorConfig config) : config_(config) {}

  kj::OneOf<ExecutionRequest, ValidationError> Validate(
      const RawRequest& raw) const;

  const ValidatorConfig& Config() const { return config_; }

 private:
  ValidatorConfig config_;
};

}  // namespace execution

#endif
