#include "execution/language.hpp"

#include <kj/debug.h>

#include "util/flags.hpp"

namespace execution {

LanguageSpec GetLanguageSpec(Language language) {
  LanguageSpec spec;
  switch (language) {
    case Language::PYTHON:
      spec.source_name = "main.py";
      spec.interpreter = Flags::python_interpreter;
      // -I: ignore PYTHON* variables and the user site directory.
      // -B: do not write .pyc files.
      spec.interpreter_flags = {"-I", "-B"};
      spec.container_image = Flags::docker_image;
      spec.container_interpreter = "python";
      return spec;
  }
  KJ_UNREACHABLE;
}

}  // namespace execution
