#include "sandbox/linux_namespace.hpp"

#include <fcntl.h>
#include <linux/capability.h>
#include <sched.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <system_error>

#include <kj/debug.h>

#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

const constexpr size_t kCloneStackSize = 256 * 1024;
const constexpr char kSandboxDir[] = "/sandbox";

// System directories visible (read-only) inside the sandbox.
const char* const kSystemDirs[] = {"/usr",   "/bin",    "/sbin", "/lib",
                                   "/lib32", "/lib64", "/libx32", "/etc",
                                   "/opt"};

const char* const kDevices[] = {"null", "zero", "full", "random", "urandom"};

// Writes the message of errno in buf, prefixed by what failed. Does not
// allocate.
bool Fail(char* buf, size_t buflen, const char* what, const char* path) {
  int err = errno;
  char errbuf[256] = {};
  const char* msg = strerror_r(err, errbuf, sizeof(errbuf));
  snprintf(buf, buflen, "%s %s: %s", what, path, msg);  // NOLINT
  return false;
}

// Mount flags that an unprivileged bind mount is not allowed to drop.
unsigned long LockedFlags(const std::string& path) {  // NOLINT
  struct statvfs st {};
  if (statvfs(path.c_str(), &st) != 0) return 0;
  unsigned long flags = 0;  // NOLINT
  if (st.f_flag & ST_NOSUID) flags |= MS_NOSUID;
  if (st.f_flag & ST_NODEV) flags |= MS_NODEV;
  if (st.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
  if (st.f_flag & ST_NOATIME) flags |= MS_NOATIME;
  if (st.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
  if (st.f_flag & ST_RELATIME) flags |= MS_RELATIME;
  return flags;
}

bool WriteProcFile(const std::string& path, const std::string& value,
                   std::string* error_msg) {
  int fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd == -1) {
    *error_msg = "open " + path + ": " + strerror(errno);
    return false;
  }
  // Id maps must be written with a single write.
  ssize_t written = write(fd, value.data(), value.size());
  int err = errno;
  close(fd);
  if (written != static_cast<ssize_t>(value.size())) {
    *error_msg = "write " + path + ": " + strerror(err);
    return false;
  }
  return true;
}

}  // namespace

namespace sandbox {

int LinuxNamespace::Score() {
  if (!util::File::Exists("/proc/self/ns/user")) return -1;
  std::string error_msg;
  if (!util::File::Exists(Flags::cgroup_root) &&
      mkdir(Flags::cgroup_root.c_str(), 0755) != 0) {
    KJ_LOG(INFO, "Cannot create the cgroup root", Flags::cgroup_root,
           strerror(errno));
    return -1;
  }
  if (!Cgroup::Usable(Flags::cgroup_root, &error_msg)) {
    KJ_LOG(INFO, "cgroups are not usable", error_msg);
    return -1;
  }
  // User namespaces may be disabled by a sysctl or by a seccomp filter.
  pid_t pid = fork();
  if (pid == -1) return -1;
  if (pid == 0) _Exit(unshare(CLONE_NEWUSER) == 0 ? 0 : 1);
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) return -1;
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    KJ_LOG(INFO, "Cannot create user namespaces");
    return -1;
  }
  return 4;
}

LinuxNamespace::~LinuxNamespace() {
  if (!destroyed_) {
    std::string error_msg;
    if (!LinuxNamespace::Destroy(&error_msg)) {
      KJ_LOG(ERROR, "Sandbox teardown failed", error_msg);
    }
  }
  for (int fd : sync_fds_) {
    if (fd != -1) close(fd);
  }
}

bool LinuxNamespace::Provision(const Limits& limits, std::string* error_msg) {
  if (!Unix::Provision(limits, error_msg)) return false;
  bool root = geteuid() == 0;
  outside_uid_ = root ? limits.uid : geteuid();
  outside_gid_ = root ? limits.gid : getegid();
  new_root_ = util::File::JoinPath(workdir_->Path(), "root");
  try {
    util::File::MakeDirs(new_root_);
  } catch (const std::system_error& e) {
    *error_msg = std::string("Cannot create the sandbox root: ") + e.what();
    return false;
  }
  if (root && chown(scratch_.c_str(), limits.uid, limits.gid) != 0) {
    *error_msg = "chown " + scratch_ + ": " + strerror(errno);
    return false;
  }
  if (!cgroup_.Create(Flags::cgroup_root, util::File::BaseName(workdir_->Path()),
                      error_msg)) {
    return false;
  }
  return cgroup_.SetLimits(limits.memory_limit_kb, limits.max_procs,
                           error_msg);
}

bool LinuxNamespace::Prepare(const Program& program, std::string* error_msg) {
  if (!Unix::Prepare(program, error_msg)) return false;

  char resolved[PATH_MAX] = {};
  if (realpath(options_->executable, resolved) == nullptr) {
    *error_msg = std::string("realpath ") + options_->executable + ": " +
                 strerror(errno);
    return false;
  }
  bool visible = false;
  for (const char* dir : kSystemDirs) {
    size_t len = strlen(dir);
    if (strncmp(resolved, dir, len) == 0 && resolved[len] == '/') {
      visible = true;
    }
  }
  if (!visible) {
    *error_msg = std::string("Interpreter ") + resolved +
                 " is not visible inside the sandbox";
    return false;
  }

  std::string source = util::File::JoinPath(scratch_, program.source_name);
  if (geteuid() == 0 &&
      chown(source.c_str(), limits_.uid, limits_.gid) != 0) {
    *error_msg = "chown " + source + ": " + strerror(errno);
    return false;
  }

  ExecutionOptions::stringcpy(options_->root, kSandboxDir);
  memset(options_->env, 0, sizeof(options_->env));
  options_->SetEnv(std::vector<std::string>{
      std::string("PATH=") + kSearchPath, std::string("HOME=") + kSandboxDir,
      "TMPDIR=/tmp", "LANG=C.UTF-8"});

  mounts_.clear();
  for (const char* dir : kSystemDirs) {
    struct stat st {};
    if (lstat(dir, &st) != 0) continue;
    Mount mount;
    mount.source = dir;
    mount.target = new_root_ + dir;
    mount.locked_flags = 0;
    if (S_ISLNK(st.st_mode)) {
      char target[PATH_MAX] = {};
      ssize_t len = readlink(dir, target, sizeof(target) - 1);
      if (len <= 0) continue;
      mount.link_target.assign(target, len);
    } else if (S_ISDIR(st.st_mode)) {
      mount.locked_flags = LockedFlags(dir);
    } else {
      continue;
    }
    mounts_.push_back(mount);
  }
  scratch_mount_.source = scratch_;
  scratch_mount_.target = new_root_ + kSandboxDir;
  scratch_mount_.locked_flags = LockedFlags(scratch_);

  int64_t tmp_kb = limits_.scratch_size_kb != 0 ? limits_.scratch_size_kb
                                                : 64 * 1024;
  tmp_options_ = "size=" + std::to_string(tmp_kb) + "k,mode=1777";
  return true;
}

bool LinuxNamespace::DoFork(std::string* error_msg) {
  if (pipe2(sync_fds_, O_CLOEXEC) == -1) {  // NOLINT
    *error_msg = std::string("pipe2: ") + strerror(errno);
    return false;
  }
  clone_stack_.resize(kCloneStackSize);
  uintptr_t top = reinterpret_cast<uintptr_t>(clone_stack_.data()) +
                  clone_stack_.size();
  top &= ~static_cast<uintptr_t>(15);
  int flags = CLONE_NEWUSER | CLONE_NEWPID | CLONE_NEWNET | CLONE_NEWNS |
              CLONE_NEWIPC | CLONE_NEWUTS | SIGCHLD;
  pid_t pid = clone(&LinuxNamespace::CloneEntry,
                    reinterpret_cast<void*>(top), flags, this);
  if (pid == -1) {
    *error_msg = std::string("clone: ") + strerror(errno);
    return false;
  }
  child_pid_ = pid;
  close(sync_fds_[0]);
  sync_fds_[0] = -1;

  bool ok = WriteIdMaps(error_msg) && cgroup_.AddProcess(pid, error_msg);
  if (ok) {
    char go = 1;
    if (write(sync_fds_[1], &go, 1) != 1) {
      *error_msg = std::string("write: ") + strerror(errno);
      ok = false;
    }
  }
  // Closing the pipe without writing makes the child give up.
  close(sync_fds_[1]);
  sync_fds_[1] = -1;
  if (!ok) {
    KillChild();
    std::string reap_error;
    if (!Reap(&reap_error)) KJ_LOG(ERROR, reap_error);
  }
  return ok;
}

int LinuxNamespace::CloneEntry(void* self) {
  static_cast<LinuxNamespace*>(self)->Child();
}

bool LinuxNamespace::WriteIdMaps(std::string* error_msg) {
  std::string proc = "/proc/" + std::to_string(child_pid_);
  // Older kernels have no setgroups file, and do not need it.
  if (util::File::Exists(proc + "/setgroups") &&
      !WriteProcFile(proc + "/setgroups", "deny", error_msg)) {
    return false;
  }
  if (!WriteProcFile(proc + "/uid_map",
                     std::to_string(limits_.uid) + " " +
                         std::to_string(outside_uid_) + " 1",
                     error_msg)) {
    return false;
  }
  return WriteProcFile(proc + "/gid_map",
                       std::to_string(limits_.gid) + " " +
                           std::to_string(outside_gid_) + " 1",
                       error_msg);
}

bool LinuxNamespace::OnChild(char* error_msg, size_t buflen) {
  // The parent must hold the only write end, so that the read below sees EOF
  // when the parent gives up.
  close(sync_fds_[1]);
  char go = 0;
  ssize_t got;
  do {
    got = read(sync_fds_[0], &go, 1);
  } while (got == -1 && errno == EINTR);
  if (got != 1) {
    snprintf(error_msg, buflen, "sandbox setup aborted by the parent");
    return false;
  }
  close(sync_fds_[0]);

  const char* new_root = new_root_.c_str();
  if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
    return Fail(error_msg, buflen, "mount private", "/");
  }
  if (mount("tmpfs", new_root, "tmpfs", MS_NOSUID | MS_NODEV,
            "size=1m,mode=755") != 0) {
    return Fail(error_msg, buflen, "mount tmpfs", new_root);
  }

  for (const Mount& m : mounts_) {
    const char* target = m.target.c_str();
    if (!m.link_target.empty()) {
      if (symlink(m.link_target.c_str(), target) != 0) {
        return Fail(error_msg, buflen, "symlink", target);
      }
      continue;
    }
    if (mkdir(target, 0755) != 0) return Fail(error_msg, buflen, "mkdir", target);
    if (mount(m.source.c_str(), target, nullptr, MS_BIND | MS_REC, nullptr) !=
        0) {
      return Fail(error_msg, buflen, "bind", target);
    }
    if (mount(nullptr, target, nullptr,
              MS_REMOUNT | MS_BIND | MS_RDONLY | m.locked_flags,
              nullptr) != 0) {
      return Fail(error_msg, buflen, "remount", target);
    }
  }

  const char* sandbox_dir = scratch_mount_.target.c_str();
  if (mkdir(sandbox_dir, 0755) != 0) {
    return Fail(error_msg, buflen, "mkdir", sandbox_dir);
  }
  if (mount(scratch_mount_.source.c_str(), sandbox_dir, nullptr, MS_BIND,
            nullptr) != 0) {
    return Fail(error_msg, buflen, "bind", sandbox_dir);
  }
  if (mount(nullptr, sandbox_dir, nullptr,
            MS_REMOUNT | MS_BIND | MS_NOSUID | MS_NODEV |
                scratch_mount_.locked_flags,
            nullptr) != 0) {
    return Fail(error_msg, buflen, "remount", sandbox_dir);
  }

  char path[PATH_MAX] = {};
  snprintf(path, sizeof(path), "%s/tmp", new_root);  // NOLINT
  if (mkdir(path, 01777) != 0) return Fail(error_msg, buflen, "mkdir", path);
  if (mount("tmpfs", path, "tmpfs", MS_NOSUID | MS_NODEV,
            tmp_options_.c_str()) != 0) {
    return Fail(error_msg, buflen, "mount tmpfs", path);
  }

  snprintf(path, sizeof(path), "%s/proc", new_root);  // NOLINT
  if (mkdir(path, 0555) != 0) return Fail(error_msg, buflen, "mkdir", path);
  if (mount("proc", path, "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC,
            nullptr) != 0) {
    return Fail(error_msg, buflen, "mount proc", path);
  }

  snprintf(path, sizeof(path), "%s/dev", new_root);  // NOLINT
  if (mkdir(path, 0755) != 0) return Fail(error_msg, buflen, "mkdir", path);
  if (mount("tmpfs", path, "tmpfs", MS_NOSUID | MS_NOEXEC,
            "size=64k,mode=755") != 0) {
    return Fail(error_msg, buflen, "mount tmpfs", path);
  }
  for (const char* device : kDevices) {
    char source[64] = {};
    snprintf(source, sizeof(source), "/dev/%s", device);        // NOLINT
    snprintf(path, sizeof(path), "%s/dev/%s", new_root, device);  // NOLINT
    int fd = open(path, O_CREAT | O_WRONLY | O_CLOEXEC, 0666);
    if (fd == -1) return Fail(error_msg, buflen, "create", path);
    close(fd);
    if (mount(source, path, nullptr, MS_BIND, nullptr) != 0) {
      return Fail(error_msg, buflen, "bind", path);
    }
  }

  if (chdir(new_root) != 0) return Fail(error_msg, buflen, "chdir", new_root);
  if (syscall(SYS_pivot_root, ".", ".") != 0) {
    return Fail(error_msg, buflen, "pivot_root", new_root);
  }
  if (umount2(".", MNT_DETACH) != 0) {
    return Fail(error_msg, buflen, "umount", "old root");
  }
  if (chdir("/") != 0) return Fail(error_msg, buflen, "chdir", "/");
  if (mount(nullptr, "/", nullptr,
            MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV, nullptr) != 0) {
    return Fail(error_msg, buflen, "remount", "/");
  }
  if (sethostname("sandbox", 7) != 0) {
    return Fail(error_msg, buflen, "sethostname", "sandbox");
  }

  // Drop every privilege the namespace gave us.
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
    return Fail(error_msg, buflen, "prctl", "no_new_privs");
  }
  for (int cap = 0; cap < 64; cap++) {
    if (prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) != 0) {
      if (errno == EINVAL) break;
      return Fail(error_msg, buflen, "prctl", "capbset_drop");
    }
  }
  gid_t gid = limits_.gid;
  uid_t uid = limits_.uid;
  if (setresgid(gid, gid, gid) != 0) {
    return Fail(error_msg, buflen, "setresgid", "");
  }
  if (setresuid(uid, uid, uid) != 0) {
    return Fail(error_msg, buflen, "setresuid", "");
  }
  if (prctl(PR_CAP_AMBIENT, PR_CAP_AMBIENT_CLEAR_ALL, 0, 0, 0) != 0) {
    return Fail(error_msg, buflen, "prctl", "ambient");
  }
  struct __user_cap_header_struct header {};
  header.version = _LINUX_CAPABILITY_VERSION_3;
  header.pid = 0;
  struct __user_cap_data_struct data[2] = {};
  if (syscall(SYS_capset, &header, data) != 0) {
    return Fail(error_msg, buflen, "capset", "");
  }
  return true;
}

void LinuxNamespace::OnExit(ExitInfo* info) {
  if (cgroup_.MemoryExceeded()) info->memory_exceeded = true;
  if (cgroup_.ProcsExceeded()) info->procs_exceeded = true;
  info->memory_usage_kb = std::max(info->memory_usage_kb,
                                   cgroup_.PeakMemoryKb());
}

void LinuxNamespace::Terminate() {
  cgroup_.Kill();
  KillChild();
}

bool LinuxNamespace::Destroy(std::string* error_msg) {
  cgroup_.Kill();
  bool ok = Unix::Destroy(error_msg);
  std::string cgroup_error;
  if (!cgroup_.Path().empty() && !cgroup_.Remove(&cgroup_error)) {
    if (!error_msg->empty()) *error_msg += "; ";
    *error_msg += cgroup_error;
    ok = false;
  }
  return ok;
}

namespace {
Sandbox::Register<LinuxNamespace> r;  // NOLINT
}  // namespace

}  // namespace sandbox
