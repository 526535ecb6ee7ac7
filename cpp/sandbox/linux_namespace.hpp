#ifndef SANDBOX_LINUX_NAMESPACE_HPP
#define SANDBOX_LINUX_NAMESPACE_HPP

#include <sys/types.h>
#include <string>
#include <vector>

#include "sandbox/cgroup.hpp"
#include "sandbox/unix.hpp"

namespace sandbox {

// Runs the program in new user, PID, network, mount, IPC and UTS namespaces,
// inside a cgroup enforcing the memory and process limits. The filesystem is
// a read-only view of the system directories plus the scratch directory
// (mounted at /sandbox) and a size bounded /tmp. The program runs as
// Limits::uid with no capabilities.
class LinuxNamespace : public Unix {
 public:
  static Sandbox* Create() { return new LinuxNamespace(); }
  static int Score();
  static execution::IsolationMode Mode() {
    return execution::IsolationMode::SANDBOXED;
  }
  static const char* RuntimeName() { return "namespace"; }

  bool Provision(const Limits& limits, std::string* error_msg) override;
  void Terminate() override;
  bool Destroy(std::string* error_msg) override;
  const char* Name() const override { return RuntimeName(); }

  ~LinuxNamespace() override;

 protected:
  bool Prepare(const Program& program, std::string* error_msg) override;
  bool DoFork(std::string* error_msg) override;
  bool OnChild(char* error_msg, size_t buflen) override;
  void OnExit(ExitInfo* info) override;

 private:
  LinuxNamespace() { sample_memory_ = false; }

  // Entry point of the cloned child.
  static int CloneEntry(void* self);

  // Maps Limits::uid/gid inside the namespace to an unprivileged identity
  // outside of it.
  bool WriteIdMaps(std::string* error_msg);

  struct Mount {
    std::string source;
    std::string target;
    // Non-empty if source is a symlink, which is recreated instead.
    std::string link_target;
    // Flags of the filesystem of source that a bind mount must keep.
    unsigned long locked_flags;  // NOLINT
  };

  Cgroup cgroup_;
  std::string new_root_;
  std::vector<Mount> mounts_;
  Mount scratch_mount_;
  std::string tmp_options_;
  std::vector<char> clone_stack_;
  int sync_fds_[2] = {-1, -1};
  uid_t outside_uid_ = 0;
  gid_t outside_gid_ = 0;
};

}  // namespace sandbox
#endif
