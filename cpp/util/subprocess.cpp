#include "util/subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <algorithm>
#include <chrono>
#include <cstring>

#include <kj/debug.h>
#include <kj/io.h>

extern char** environ;

namespace util {

bool SpawnProcess(const std::vector<std::string>& args, int stdout_fd,
                  int stderr_fd, pid_t* pid, std::string* error_msg) {
  KJ_REQUIRE(!args.empty(), "Empty command line");
  std::vector<std::vector<char>> args_mut;
  for (const std::string& arg : args) {
    args_mut.emplace_back(arg.c_str(), arg.c_str() + arg.size() + 1);
  }
  std::vector<char*> argv;
  for (auto& arg : args_mut) argv.push_back(arg.data());
  argv.push_back(nullptr);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  if (stdout_fd >= 0) {
    posix_spawn_file_actions_adddup2(&actions, stdout_fd, STDOUT_FILENO);
  } else {
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null",
                                     O_WRONLY, 0);
  }
  if (stderr_fd >= 0) {
    posix_spawn_file_actions_adddup2(&actions, stderr_fd, STDERR_FILENO);
  } else {
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null",
                                     O_WRONLY, 0);
  }
  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
  posix_spawnattr_setpgroup(&attr, 0);

  int ret = posix_spawnp(pid, argv[0], &actions, &attr, argv.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  posix_spawnattr_destroy(&attr);
  if (ret != 0) {
    *error_msg = "Cannot run " + args[0] + ": " + strerror(ret);
    return false;
  }
  return true;
}

bool RunCommand(const std::vector<std::string>& args, std::string* output,
                int* exit_code, std::string* error_msg, int timeout_millis,
                size_t output_limit) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1) {
    *error_msg = "pipe: " + std::string(strerror(errno));
    return false;
  }
  kj::AutoCloseFd read_end(fds[0]);
  pid_t pid;
  {
    kj::AutoCloseFd write_end(fds[1]);
    if (!SpawnProcess(args, write_end, write_end, &pid, error_msg)) {
      return false;
    }
  }

  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(timeout_millis);
  output->clear();
  char buf[4096];
  bool timed_out = false;
  while (true) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now())
                    .count();
    if (left <= 0) {
      timed_out = true;
      break;
    }
    struct pollfd pfd = {read_end.get(), POLLIN, 0};
    int ready = poll(&pfd, 1, static_cast<int>(left));
    if (ready == -1 && errno == EINTR) continue;
    if (ready == -1) {
      *error_msg = "poll: " + std::string(strerror(errno));
      timed_out = true;
      break;
    }
    if (ready == 0) continue;
    ssize_t amount = read(read_end, buf, sizeof(buf));
    if (amount == -1 && errno == EINTR) continue;
    if (amount <= 0) break;
    size_t keep = std::min(static_cast<size_t>(amount),
                           output_limit - std::min(output_limit, output->size()));
    output->append(buf, keep);
  }
  if (timed_out) {
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      *error_msg = "waitpid: " + std::string(strerror(errno));
      return false;
    }
  }
  if (timed_out) {
    if (error_msg->empty()) *error_msg = args[0] + " timed out";
    return false;
  }
  if (WIFEXITED(status)) {
    *exit_code = WEXITSTATUS(status);
  } else {
    *exit_code = -WTERMSIG(status);
  }
  return true;
}

}  // namespace util
