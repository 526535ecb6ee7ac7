#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <sys/types.h>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <kj/io.h>

#include "execution/request.hpp"

namespace sandbox {

// Resource limits of one sandbox. Zero means "no limit".
struct Limits {
  int64_t memory_limit_kb = 0;
  int32_t max_procs = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;
  // Size of the writable /tmp.
  int64_t scratch_size_kb = 0;
  // Identity of the program inside the sandbox.
  int32_t uid = 0;
  int32_t gid = 0;
};

// What to run: the source is written to source_name in the scratch directory
// and passed to the interpreter.
struct Program {
  std::string source_name;
  std::string source;
  std::string interpreter;
  std::vector<std::string> interpreter_flags;
  std::string container_image;
  std::string container_interpreter;
};

// Settings to start a process. Only fixed-size fields, as this is read in the
// child process after fork where allocating is not allowed.
struct ExecutionOptions {
  static const constexpr size_t str_len = 1024;
  static const constexpr size_t narg = 16;
  static const constexpr size_t nenv = 16;

  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;

  // Working directory of the program.
  char root[str_len] = {};
  char executable[str_len] = {};
  char args[narg][str_len] = {};
  char env[nenv][str_len] = {};

  ExecutionOptions(const std::string& root_, const std::string& executable_) {
    memset(this, 0, sizeof(*this));
    stringcpy(root, root_);
    stringcpy(executable, executable_);
    strncpy(&args[0][0], executable, str_len);
  }
  template <typename T>
  void SetArgs(const T& a_) {
    size_t i = 1;
    for (const std::string& s : a_) {
      if (i >= narg) throw std::runtime_error("Too many arguments");
      stringcpy(&args[i++][0], s);
    }
  }
  template <typename T>
  void SetEnv(const T& e_) {
    size_t i = 0;
    for (const std::string& s : e_) {
      if (i >= nenv) throw std::runtime_error("Too many variables");
      stringcpy(&env[i++][0], s);
    }
  }

  static void stringcpy(char* dst, const std::string& s) {
    if (s.size() >= str_len) throw std::runtime_error("string too long");
    strncpy(dst, s.c_str(), str_len - 1);
  }
};

// How the program terminated.
struct ExitInfo {
  int32_t status_code = 0;
  int32_t signal = 0;
  bool memory_exceeded = false;
  bool procs_exceeded = false;
  int64_t memory_usage_kb = 0;
};

// One isolation context, serving exactly one execution. The lifecycle is
// Provision, Run, Poll until it returns true (optionally Terminate), then
// Destroy, which must be called whatever happened before.
//
// Implementations need to register themselves by creating a global object of
// type Sandbox::Register<SandboxImpl>, and should define the static functions
// Create, Score, Mode and RuntimeName. Score returns how "good" the runtime
// is: negative if it cannot be used on this host, positive otherwise (a bigger
// value means a better runtime). Registering is not thread-safe and is done
// during static initialization.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;

  // Returns a new instance of the runtime to use for the given mode, or
  // nullptr and sets error_msg if none is available. For sandboxed executions
  // Flags::runtime selects the runtime ("auto" picks the best one).
  static std::unique_ptr<Sandbox> Create(execution::IsolationMode mode,
                                         std::string* error_msg);

  // Allocates the isolation context. Returns false and sets error_msg on
  // failure; Destroy must still be called.
  virtual bool Provision(const Limits& limits, std::string* error_msg) = 0;

  // Starts the program. Returns false and sets error_msg if the program could
  // not be started.
  virtual bool Run(const Program& program, std::string* error_msg) = 0;

  // Does not block. Returns true and fills info once the program has exited.
  virtual bool Poll(ExitInfo* info) = 0;

  // Kills the program and everything it started.
  virtual void Terminate() = 0;

  // Kills anything left, and releases all the resources. Returns false and
  // sets error_msg if something could not be released.
  virtual bool Destroy(std::string* error_msg) = 0;

  virtual const char* Name() const = 0;

  // Read ends of the program's stdout and stderr, in non-blocking mode. -1
  // before Run.
  int StdoutFd() const { return stdout_.get(); }
  int StderrFd() const { return stderr_.get(); }

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() {
      Sandbox::Register_(T::Mode(), T::RuntimeName(), &T::Create, &T::Score);
    }
  };

 protected:
  kj::AutoCloseFd stdout_;
  kj::AutoCloseFd stderr_;

 private:
  struct Entry {
    execution::IsolationMode mode;
    std::string name;
    create_t create;
    score_t score;
    bool scored;
    int cached_score;
  };
  using store_t = std::vector<Entry>;
  static store_t* Boxes_();
  static void Register_(execution::IsolationMode mode, const char* name,
                        create_t create, score_t score);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
