#ifndef SANDBOX_CGROUP_HPP
#define SANDBOX_CGROUP_HPP

#include <sys/types.h>
#include <cstdint>
#include <string>

namespace sandbox {

// A cgroup v2 group, created as a child of a delegated root group, holding
// the processes of one sandbox.
class Cgroup {
 public:
  // Returns true if groups with memory and pids limits can be created under
  // root. Enables the two controllers for the children of root if needed.
  static bool Usable(const std::string& root, std::string* error_msg);

  // Creates a new group called name under root.
  bool Create(const std::string& root, const std::string& name,
              std::string* error_msg);

  // Hard memory limit with swap disabled, and maximum number of processes.
  // Zero means no limit.
  bool SetLimits(int64_t memory_limit_kb, int32_t max_procs,
                 std::string* error_msg);

  bool AddProcess(pid_t pid, std::string* error_msg);

  // True if the OOM killer killed a process of the group.
  bool MemoryExceeded() const;
  // True if a fork failed because of the process limit.
  bool ProcsExceeded() const;
  // Peak memory usage, 0 if unknown.
  int64_t PeakMemoryKb() const;

  // Kills every process of the group.
  void Kill();

  // Removes the group, waiting a little for killed processes to go away.
  bool Remove(std::string* error_msg);

  const std::string& Path() const { return path_; }

  Cgroup() = default;
  ~Cgroup();
  Cgroup(const Cgroup&) = delete;
  Cgroup& operator=(const Cgroup&) = delete;

 private:
  int64_t ReadKey(const std::string& file, const std::string& key) const;

  std::string path_;
};

}  // namespace sandbox
#endif
