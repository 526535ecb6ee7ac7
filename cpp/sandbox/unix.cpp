#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include <kj/debug.h>

#include "util/flags.hpp"
#include "util/which.hpp"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

int64_t ReadRssKb(pid_t pid) {
  char path[64] = {};
  snprintf(path, sizeof(path), "/proc/%d/statm", pid);  // NOLINT
  FILE* statm = fopen(path, "re");
  if (statm == nullptr) return 0;
  long long size = 0;      // NOLINT
  long long resident = 0;  // NOLINT
  int matched = fscanf(statm, "%lld %lld", &size, &resident);  // NOLINT
  fclose(statm);
  if (matched != 2) return 0;
  return resident * (sysconf(_SC_PAGESIZE) / 1024);
}

void AppendError(std::string* error_msg, const std::string& error) {
  if (!error_msg->empty()) *error_msg += "; ";
  *error_msg += error;
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

const char* const Unix::kSearchPath = "/usr/local/bin:/usr/bin:/bin";

Unix::~Unix() {
  if (!destroyed_) {
    std::string error_msg;
    if (!Unix::Destroy(&error_msg)) {
      KJ_LOG(ERROR, "Sandbox teardown failed", error_msg);
    }
  }
  for (int fd : {pipe_fds_[0], pipe_fds_[1], stdout_fds_[0], stdout_fds_[1],
                 stderr_fds_[0], stderr_fds_[1]}) {
    if (fd != -1) close(fd);
  }
}

bool Unix::Provision(const Limits& limits, std::string* error_msg) {
  limits_ = limits;
  try {
    workdir_ = std::make_unique<util::TempDir>(Flags::temp_directory);
    scratch_ = util::File::JoinPath(workdir_->Path(), "box");
    util::File::MakeDirs(scratch_);
  } catch (const std::system_error& e) {
    *error_msg = std::string("Cannot create the scratch directory: ") +
                 e.what();
    return false;
  }
  return true;
}

bool Unix::Run(const Program& program, std::string* error_msg) {
  KJ_REQUIRE(workdir_ != nullptr, "Run called before Provision");
  KJ_REQUIRE(child_pid_ == 0, "A sandbox runs a single program");
  try {
    if (!Prepare(program, error_msg)) return false;
  } catch (const std::exception& e) {
    *error_msg = e.what();
    return false;
  }
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  return AwaitExec(error_msg);
}

bool Unix::Prepare(const Program& program, std::string* error_msg) {
  // Interpreters are looked up in a fixed path, never in the caller's $PATH.
  std::string interpreter = util::whichInPath(program.interpreter, kSearchPath);
  if (interpreter.empty()) {
    *error_msg = "Interpreter not found: " + program.interpreter;
    return false;
  }
  util::File::Write(util::File::JoinPath(scratch_, program.source_name),
                    program.source, 0644);

  options_ = std::make_unique<ExecutionOptions>(scratch_, interpreter);
  std::vector<std::string> args = program.interpreter_flags;
  args.push_back(program.source_name);
  options_->SetArgs(args);
  options_->SetEnv(std::vector<std::string>{
      std::string("PATH=") + kSearchPath, "HOME=" + scratch_,
      "TMPDIR=" + scratch_, "LANG=C.UTF-8"});
  options_->max_files = limits_.max_files;
  options_->max_file_size_kb = limits_.max_file_size_kb;
  return true;
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  // Other executions fork concurrently: every fd must be close-on-exec from
  // the start, or their children would inherit our pipes.
  for (int* fds : {pipe_fds_, stdout_fds_, stderr_fds_}) {
    if (pipe2(fds, O_CLOEXEC) == -1) {  // NOLINT
      *error_msg = "pipe2: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
      return false;
    }
  }
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    char buf[kStrErrorBufSize] = {};
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    return false;
  }
  if (fork_result != 0) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Unix::Child() {
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(buf, prefix, 64);             // NOLINT
    strncat(buf, ": ", 3);                // NOLINT
    strncat(buf, err, kStrErrorBufSize);  // NOLINT
    ssize_t len = strlen(buf);            // NOLINT
    KJ_SYSCALL(write(pipe_fds_[1], &len, sizeof(len)), "Failed to write to fd");
    KJ_SYSCALL(write(pipe_fds_[1], buf, len), "Failed to write to fd");
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));  // NOLINT
  };

  // New session and process group, so that we do not receive Ctrl-Cs in the
  // terminal and the whole group can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  char buf[kStrErrorBufSize] = {};
  if (!OnChild(buf, kStrErrorBufSize)) {  // NOLINT
    die2("OnChild", buf);                 // NOLINT
  }

  if (chdir(options_->root) == -1) {
    die("chdir", errno);
  }

  char args[ExecutionOptions::narg][ExecutionOptions::str_len] = {};
  memcpy(args, options_->args, sizeof(args));
  char* argsp[ExecutionOptions::narg + 1] = {};
  size_t narg = 0;
  // NOLINTNEXTLINE
  for (size_t i = 0; i < ExecutionOptions::narg; i++) {
    if (!args[i][0]) break;
    argsp[narg++] = &args[i][0];
  }
  char env[ExecutionOptions::nenv][ExecutionOptions::str_len] = {};
  memcpy(env, options_->env, sizeof(env));
  char* envp[ExecutionOptions::nenv + 1] = {};
  size_t nenv = 0;
  // NOLINTNEXTLINE
  for (size_t i = 0; i < ExecutionOptions::nenv; i++) {
    if (!env[i][0]) break;
    envp[nenv++] = &env[i][0];
  }

  // Handle I/O redirection.
  int stdin_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (stdin_fd == -1) die("open /dev/null", errno);
#define DUP(from, fd)                         \
  if (dup2(from, fd) == -1) {                 \
    die("redir " #fd, errno);                 \
  }
  DUP(stdin_fd, STDIN_FILENO);
  DUP(stdout_fds_[1], STDOUT_FILENO);
  DUP(stderr_fds_[1], STDERR_FILENO);
#undef DUP

  // Set resource limits.
  struct rlimit rlim {};
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = value;                    \
      rlim.rlim_max = value;                    \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files);
#undef SET_RLIM
  // No core dumps.
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);

  execve(options_->executable, argsp, envp);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::AwaitExec(std::string* error_msg) {
  close(pipe_fds_[1]);
  pipe_fds_[1] = -1;
  close(stdout_fds_[1]);
  stdout_fds_[1] = -1;
  close(stderr_fds_[1]);
  stderr_fds_[1] = -1;
  stdout_ = kj::AutoCloseFd(stdout_fds_[0]);
  stdout_fds_[0] = -1;
  stderr_ = kj::AutoCloseFd(stderr_fds_[0]);
  stderr_fds_[0] = -1;
  for (int fd : {stdout_.get(), stderr_.get()}) {
    int flags;
    KJ_SYSCALL(flags = fcntl(fd, F_GETFL));
    KJ_SYSCALL(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
  }

  // The pipe is closed on exec, so reading returns 0 bytes if the program
  // started, or an error message if it did not.
  ssize_t error_len = 0;
  ssize_t got;
  do {
    got = read(pipe_fds_[0], &error_len, sizeof(error_len));
  } while (got == -1 && errno == EINTR);
  if (got == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    size_t to_read = std::min<size_t>(error_len, PIPE_BUF - 1);
    KJ_SYSCALL(read(pipe_fds_[0], error, to_read), "Failed to read from fd");
    *error_msg = error;
    close(pipe_fds_[0]);
    pipe_fds_[0] = -1;
    std::string reap_error;
    if (!Reap(&reap_error)) KJ_LOG(ERROR, reap_error);
    return false;
  }
  close(pipe_fds_[0]);
  pipe_fds_[0] = -1;
  return true;
}

bool Unix::Poll(ExitInfo* info) {
  if (reaped_) {
    *info = exit_info_;
    return true;
  }
  KJ_REQUIRE(child_pid_ > 0, "Poll called before Run");
  bool check_memory = sample_memory_ && limits_.memory_limit_kb != 0;
  if (check_memory && !exit_info_.memory_exceeded) {
    int64_t rss_kb = ReadRssKb(child_pid_);
    exit_info_.memory_usage_kb = std::max(exit_info_.memory_usage_kb, rss_kb);
    if (rss_kb > limits_.memory_limit_kb) {
      exit_info_.memory_exceeded = true;
      KillChild();
    }
  }

  int child_status = 0;
  struct rusage rusage {};
  pid_t ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
  if (ret == -1 && errno == EINTR) return false;
  if (ret == -1) KJ_FAIL_SYSCALL("wait4", errno, child_pid_);
  if (ret == 0) return false;

  reaped_ = true;
  exit_info_.status_code =
      WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  exit_info_.signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  exit_info_.memory_usage_kb =
      std::max<int64_t>(exit_info_.memory_usage_kb, rusage.ru_maxrss);
  // Catches short spikes that happened between two samples.
  if (check_memory && rusage.ru_maxrss > limits_.memory_limit_kb) {
    exit_info_.memory_exceeded = true;
  }
  OnExit(&exit_info_);
  *info = exit_info_;
  return true;
}

void Unix::KillChild() {
  if (child_pid_ <= 0) return;
  // The group outlives the child if it started other processes.
  kill(-child_pid_, SIGKILL);
  // The child may not have called setsid yet.
  if (!reaped_) kill(child_pid_, SIGKILL);
}

void Unix::Terminate() { KillChild(); }

bool Unix::Reap(std::string* error_msg) {
  if (child_pid_ <= 0 || reaped_) return true;
  int child_status = 0;
  while (waitpid(child_pid_, &child_status, 0) == -1) {
    if (errno == EINTR) continue;
    char buf[kStrErrorBufSize] = {};
    *error_msg = "waitpid: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    return false;
  }
  reaped_ = true;
  return true;
}

bool Unix::Destroy(std::string* error_msg) {
  destroyed_ = true;
  bool ok = true;
  KillChild();
  std::string reap_error;
  if (!Reap(&reap_error)) {
    AppendError(error_msg, reap_error);
    ok = false;
  } else {
    // The PID may be reused from now on.
    child_pid_ = 0;
  }
  stdout_ = nullptr;
  stderr_ = nullptr;
  if (workdir_ != nullptr) {
    std::string path = workdir_->Path();
    workdir_->Keep();
    workdir_.reset();
    try {
      util::File::RemoveTree(path);
    } catch (const std::system_error& e) {
      AppendError(error_msg, "Cannot remove " + path + ": " + e.what());
      ok = false;
    }
  }
  return ok;
}

namespace {
Sandbox::Register<Unix> r;  // NOLINT
}  // namespace

}  // namespace sandbox
