#include "execution/request.hpp"

#include <kj/debug.h>

namespace execution {

bool ParseLanguage(const std::string& name, Language* language) {
  if (name == "python") {
    *language = Language::PYTHON;
    return true;
  }
  return false;
}

bool ParseIsolationMode(const std::string& name, IsolationMode* mode) {
  if (name == "sandboxed") {
    *mode = IsolationMode::SANDBOXED;
    return true;
  }
  if (name == "direct") {
    *mode = IsolationMode::DIRECT;
    return true;
  }
  return false;
}

const char* LanguageName(Language language) {
  switch (language) {
    case Language::PYTHON:
      return "python";
  }
  KJ_UNREACHABLE;
}

const char* IsolationModeName(IsolationMode mode) {
  switch (mode) {
    case IsolationMode::SANDBOXED:
      return "sandboxed";
    case IsolationMode::DIRECT:
      return "direct";
  }
  KJ_UNREACHABLE;
}

const char* ValidationError::KindName(Kind kind) {
  switch (kind) {
    case Kind::EMPTY_SOURCE:
      return "emptySource";
    case Kind::SOURCE_TOO_LARGE:
      return "sourceTooLarge";
    case Kind::UNSUPPORTED_LANGUAGE:
      return "unsupportedLanguage";
    case Kind::TIMEOUT_OUT_OF_BOUNDS:
      return "timeoutOutOfBounds";
    case Kind::MEMORY_OUT_OF_BOUNDS:
      return "memoryOutOfBounds";
    case Kind::UNKNOWN_ISOLATION_MODE:
      return "unknownIsolationMode";
    case Kind::ISOLATION_MODE_DISALLOWED:
      return "isolationModeDisallowed";
  }
  KJ_UNREACHABLE;
}

}  // namespace execution
