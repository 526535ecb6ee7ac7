#include "util/daemon.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <system_error>

#include <kj/debug.h>

#include "util/file.hpp"
#include "util/flags.hpp"

namespace util {

void daemonize(const std::string& scope, std::string pidfile) {
  if (pidfile.empty()) {
    pidfile = File::JoinPath(Flags::temp_directory, scope + ".pid");
  }
  File::MakeDirs(File::BaseDir(pidfile));

  int pid;
  KJ_SYSCALL(pid = fork());
  if (pid > 0) _Exit(0);
  KJ_SYSCALL(setsid());
  // Fork again so the daemon can never reacquire a controlling terminal.
  KJ_SYSCALL(pid = fork());
  if (pid > 0) _Exit(0);

  umask(022);
  KJ_SYSCALL(chdir("/"));

  int devnull;
  KJ_SYSCALL(devnull = open("/dev/null", O_RDWR | O_CLOEXEC));
  KJ_SYSCALL(dup2(devnull, STDIN_FILENO));
  KJ_SYSCALL(dup2(devnull, STDOUT_FILENO));
  // Keep stderr when it is the only log destination.
  if (!Flags::log_file.empty()) {
    KJ_SYSCALL(dup2(devnull, STDERR_FILENO));
  }
  KJ_SYSCALL(close(devnull));

  File::Write(pidfile, std::to_string(getpid()) + "\n");
  KJ_LOG(INFO, "Daemon started", scope, getpid(), pidfile);
}

}  // namespace util
