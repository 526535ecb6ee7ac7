#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <memory>

#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

namespace sandbox {

// Runs the program as a plain child process in its own process group, inside
// a fresh scratch directory. This is the runtime of direct executions, and
// the base class of the other runtimes, which customize it through the hooks
// below.
class Unix : public Sandbox {
 public:
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 1; }
  static execution::IsolationMode Mode() {
    return execution::IsolationMode::DIRECT;
  }
  static const char* RuntimeName() { return "direct"; }

  bool Provision(const Limits& limits, std::string* error_msg) override;
  bool Run(const Program& program, std::string* error_msg) override;
  bool Poll(ExitInfo* info) override;
  void Terminate() override;
  bool Destroy(std::string* error_msg) override;
  const char* Name() const override { return RuntimeName(); }

  ~Unix() override;

 protected:
  Unix() = default;

  // Writes the source in the scratch directory, and fills options_ with the
  // command to run. Returns false and sets error_msg on failure.
  virtual bool Prepare(const Program& program, std::string* error_msg);

  // Creates the pipes. Returns false and sets error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // should execute Child and must not return.
  virtual bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Hook that is executed in the child before changing directory and
  // redirecting I/O. Returns false if something went wrong and exec should
  // not be called. The error_msg string must not be longer then buflen
  // characters. This function must not use dynamic memory allocation.
  virtual bool OnChild(char* error_msg, size_t buflen) { return true; }

  // Waits for the child to either exec or report a setup error.
  bool AwaitExec(std::string* error_msg);

  // Executed when the child program exits. May change the exit info with
  // "better" values.
  virtual void OnExit(ExitInfo* info) {}

  // Kills the process group of the child.
  void KillChild();

  // Blocks until the child is reaped.
  bool Reap(std::string* error_msg);

  // Environment and search path of the programs started by the runtimes.
  static const char* const kSearchPath;

  // Samples the resident set size of the child on every Poll, killing it
  // over the memory limit.
  bool sample_memory_ = true;
  Limits limits_;
  std::unique_ptr<util::TempDir> workdir_;
  std::string scratch_;
  std::unique_ptr<ExecutionOptions> options_;
  int pipe_fds_[2] = {-1, -1};
  int stdout_fds_[2] = {-1, -1};
  int stderr_fds_[2] = {-1, -1};
  pid_t child_pid_ = 0;
  bool reaped_ = false;
  bool destroyed_ = false;
  ExitInfo exit_info_;
};

}  // namespace sandbox
#endif
