#include "sandbox/cgroup.hpp"

#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

#include <kj/debug.h>

#include "util/file.hpp"
#include "util/misc.hpp"

namespace sandbox {

namespace {

const constexpr int kRemoveAttempts = 50;

bool WriteFile(const std::string& path, const std::string& value,
               std::string* error_msg) {
  std::ofstream out(path);
  if (out) out << value;
  if (out) out.flush();
  if (!out) {
    *error_msg = "Cannot write '" + value + "' to " + path + ": " +
                 strerror(errno);
    return false;
  }
  return true;
}

bool ReadFile(const std::string& path, std::string* contents) {
  std::ifstream in(path);
  if (!in) return false;
  std::stringstream buffer;
  buffer << in.rdbuf();
  *contents = buffer.str();
  return true;
}

bool HasControllers(const std::string& file) {
  std::string contents;
  if (!ReadFile(file, &contents)) return false;
  bool memory = false;
  bool pids = false;
  for (const std::string& controller : util::split(util::trim(contents), ' ')) {
    if (controller == "memory") memory = true;
    if (controller == "pids") pids = true;
  }
  return memory && pids;
}

}  // namespace

bool Cgroup::Usable(const std::string& root, std::string* error_msg) {
  std::string controllers = util::File::JoinPath(root, "cgroup.controllers");
  if (!HasControllers(controllers)) {
    *error_msg = "memory and pids controllers are not available in " + root;
    return false;
  }
  if (access(root.c_str(), W_OK) != 0) {
    *error_msg = root + " is not writable";
    return false;
  }
  std::string subtree = util::File::JoinPath(root, "cgroup.subtree_control");
  if (!HasControllers(subtree) &&
      !WriteFile(subtree, "+memory +pids", error_msg)) {
    return false;
  }
  return true;
}

Cgroup::~Cgroup() {
  if (path_.empty()) return;
  std::string error_msg;
  if (!Remove(&error_msg)) KJ_LOG(ERROR, error_msg);
}

bool Cgroup::Create(const std::string& root, const std::string& name,
                    std::string* error_msg) {
  KJ_REQUIRE(path_.empty(), "Cgroup already created", path_);
  std::string path = util::File::JoinPath(root, name);
  if (mkdir(path.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH) ==
      -1) {
    *error_msg = "mkdir " + path + ": " + strerror(errno);
    return false;
  }
  path_ = path;
  return true;
}

bool Cgroup::SetLimits(int64_t memory_limit_kb, int32_t max_procs,
                       std::string* error_msg) {
  if (memory_limit_kb != 0) {
    if (!WriteFile(util::File::JoinPath(path_, "memory.max"),
                   std::to_string(memory_limit_kb * 1024), error_msg)) {
      return false;
    }
    // memory.swap.max is missing when the kernel has no swap accounting.
    std::string swap = util::File::JoinPath(path_, "memory.swap.max");
    if (util::File::Exists(swap) && !WriteFile(swap, "0", error_msg)) {
      return false;
    }
  }
  if (max_procs != 0 &&
      !WriteFile(util::File::JoinPath(path_, "pids.max"),
                 std::to_string(max_procs), error_msg)) {
    return false;
  }
  return true;
}

bool Cgroup::AddProcess(pid_t pid, std::string* error_msg) {
  return WriteFile(util::File::JoinPath(path_, "cgroup.procs"),
                   std::to_string(pid), error_msg);
}

int64_t Cgroup::ReadKey(const std::string& file, const std::string& key) const {
  std::string contents;
  if (!ReadFile(util::File::JoinPath(path_, file), &contents)) return 0;
  std::istringstream lines(contents);
  std::string name;
  int64_t value;
  while (lines >> name >> value) {
    if (name == key) return value;
  }
  return 0;
}

bool Cgroup::MemoryExceeded() const {
  return ReadKey("memory.events", "oom_kill") > 0;
}

bool Cgroup::ProcsExceeded() const { return ReadKey("pids.events", "max") > 0; }

int64_t Cgroup::PeakMemoryKb() const {
  std::string contents;
  if (!ReadFile(util::File::JoinPath(path_, "memory.peak"), &contents)) {
    return 0;
  }
  try {
    return std::stoll(contents) / 1024;
  } catch (const std::exception&) {
    return 0;
  }
}

void Cgroup::Kill() {
  if (path_.empty()) return;
  std::string kill_file = util::File::JoinPath(path_, "cgroup.kill");
  std::string error_msg;
  if (util::File::Exists(kill_file) && WriteFile(kill_file, "1", &error_msg)) {
    return;
  }
  // Kernels older than 5.14 have no cgroup.kill.
  std::string procs;
  if (!ReadFile(util::File::JoinPath(path_, "cgroup.procs"), &procs)) return;
  for (const std::string& pid : util::split(procs, '\n')) {
    kill(std::stoi(pid), SIGKILL);
  }
}

bool Cgroup::Remove(std::string* error_msg) {
  if (path_.empty()) return true;
  int err = 0;
  for (int attempt = 0; attempt < kRemoveAttempts; attempt++) {
    if (rmdir(path_.c_str()) == 0 || errno == ENOENT) {
      path_.clear();
      return true;
    }
    err = errno;
    if (err != EBUSY) break;
    Kill();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  *error_msg = "rmdir " + path_ + ": " + strerror(err);
  return false;
}

}  // namespace sandbox
