#ifndef EXECUTION_REQUEST_HPP
#define EXECUTION_REQUEST_HPP

#include <cstdint>
#include <string>

namespace execution {

// Languages that can be executed. Adding a language means adding a value here
// and a case in GetLanguageSpec.
enum class Language { PYTHON };

enum class IsolationMode { SANDBOXED, DIRECT };

// Exact, case-sensitive lookups. Return false for unknown names.
bool ParseLanguage(const std::string& name, Language* language);
bool ParseIsolationMode(const std::string& name, IsolationMode* mode);

const char* LanguageName(Language language);
const char* IsolationModeName(IsolationMode mode);

// A request as received from a caller, before validation.
struct RawRequest {
  std::string language = "python";
  std::string source;
  int64_t timeout_seconds = 5;
  int64_t memory_limit_mb = 128;
  std::string isolation_mode = "sandboxed";
};

// A validated request. Only the Validator can create one, and it cannot be
// changed afterwards.
class ExecutionRequest {
 public:
  Language GetLanguage() const { return language_; }
  const std::string& Source() const { return source_; }
  int64_t TimeoutSeconds() const { return timeout_seconds_; }
  int64_t MemoryLimitMb() const { return memory_limit_mb_; }
  IsolationMode GetIsolationMode() const { return isolation_mode_; }

  bool operator==(const ExecutionRequest& other) const {
    return language_ == other.language_ && source_ == other.source_ &&
           timeout_seconds_ == other.timeout_seconds_ &&
           memory_limit_mb_ == other.memory_limit_mb_ &&
           isolation_mode_ == other.isolation_mode_;
  }
  bool operator!=(const ExecutionRequest& other) const {
    return !(*this == other);
  }

 private:
  friend class Validator;
  ExecutionRequest(Language language, std::string source,
                   int64_t timeout_seconds, int64_t memory_limit_mb,
                   IsolationMode isolation_mode)
      : language_(language),
        source_(std::move(source)),
        timeout_seconds_(timeout_seconds),
        memory_limit_mb_(memory_limit_mb),
        isolation_mode_(isolation_mode) {}

  Language language_;
  std::string source_;
  int64_t timeout_seconds_;
  int64_t memory_limit_mb_;
  IsolationMode isolation_mode_;
};

// Why a request was rejected.
struct ValidationError {
  enum class Kind {
    EMPTY_SOURCE,
    SOURCE_TOO_LARGE,
    UNSUPPORTED_LANGUAGE,
    TIMEOUT_OUT_OF_BOUNDS,
    MEMORY_OUT_OF_BOUNDS,
    UNKNOWN_ISOLATION_MODE,
    ISOLATION_MODE_DISALLOWED
  };
  ValidationError(Kind kind, std::string message)
      : kind(kind), message(std::move(message)) {}

  bool operator==(const ValidationError& other) const {
    return kind == other.kind && message == other.message;
  }

  static const char* KindName(Kind kind);

  Kind kind;
  std::string message;
};

}  // namespace execution

#endif
