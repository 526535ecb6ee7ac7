#ifndef SANDBOX_DOCKER_HPP
#define SANDBOX_DOCKER_HPP

#include <string>
#include <vector>

#include "sandbox/unix.hpp"

namespace sandbox {

// Runs the program in a disposable, hardened container: no network, memory
// and process limits, no capabilities, read-only filesystem apart from a
// tmpfs /tmp, and an unprivileged user. The source directory is mounted
// read-only at /workdir. The container is created before Run returns, and
// the child process is the attached `docker start` client.
//
// Exhausting the process limit is not detected: a failed fork is reported
// by the program itself, as a normal exit.
class Docker : public Unix {
 public:
  static Sandbox* Create() { return new Docker(); }
  static int Score();
  static execution::IsolationMode Mode() {
    return execution::IsolationMode::SANDBOXED;
  }
  static const char* RuntimeName() { return "docker"; }

  bool Provision(const Limits& limits, std::string* error_msg) override;
  void Terminate() override;
  bool Destroy(std::string* error_msg) override;
  const char* Name() const override { return RuntimeName(); }

  ~Docker() override;

 protected:
  bool Prepare(const Program& program, std::string* error_msg) override;
  void OnExit(ExitInfo* info) override;

 private:
  Docker() { sample_memory_ = false; }

  // Runs a docker subcommand, returning its trimmed output. Fails if the
  // command exits with a non-zero status.
  bool RunDocker(const std::vector<std::string>& args, std::string* output,
                 std::string* error_msg, int timeout_millis);

  std::string docker_;
  std::string container_;
};

}  // namespace sandbox
#endif
