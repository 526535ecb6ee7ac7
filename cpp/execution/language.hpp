#ifndef EXECUTION_LANGUAGE_HPP
#define EXECUTION_LANGUAGE_HPP

#include <string>
#include <vector>

#include "execution/request.hpp"

namespace execution {

// How programs written in a language are started.
struct LanguageSpec {
  // Name of the file the source is written to, inside the scratch directory.
  std::string source_name;
  // Interpreter on the host, as a path or a name looked up in $PATH.
  std::string interpreter;
  // Arguments passed before the source file.
  std::vector<std::string> interpreter_flags;
  // Image and interpreter used by the docker runtime.
  std::string container_image;
  std::string container_interpreter;
};

LanguageSpec GetLanguageSpec(Language language);

}  // namespace execution

#endif
