#include "sandbox/docker.hpp"

#include <sys/stat.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <kj/debug.h>

#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"
#include "util/subprocess.hpp"
#include "util/which.hpp"

namespace sandbox {

namespace {

const constexpr int kDockerTimeoutMillis = 30 * 1000;
// Creating a container may need to pull the image first.
const constexpr int kCreateTimeoutMillis = 5 * 60 * 1000;
const constexpr char kWorkdir[] = "/workdir";

// Variables the docker client needs to reach the daemon.
const char* const kClientEnv[] = {"PATH",          "HOME",
                                  "DOCKER_HOST",   "DOCKER_CONFIG",
                                  "DOCKER_CONTEXT", "XDG_RUNTIME_DIR"};

}  // namespace

int Docker::Score() {
  std::string docker = util::which("docker");
  if (docker.empty()) return -1;
  std::string output;
  std::string error_msg;
  int exit_code = 0;
  if (!util::RunCommand({docker, "info", "--format", "{{.ServerVersion}}"},
                        &output, &exit_code, &error_msg,
                        kDockerTimeoutMillis)) {
    KJ_LOG(INFO, "Cannot run docker", error_msg);
    return -1;
  }
  if (exit_code != 0) {
    KJ_LOG(INFO, "The docker daemon is not reachable", util::trim(output));
    return -1;
  }
  return 3;
}

Docker::~Docker() {
  if (!destroyed_) {
    std::string error_msg;
    if (!Docker::Destroy(&error_msg)) {
      KJ_LOG(ERROR, "Sandbox teardown failed", error_msg);
    }
  }
}

bool Docker::RunDocker(const std::vector<std::string>& args,
                       std::string* output, std::string* error_msg,
                       int timeout_millis) {
  std::vector<std::string> command{docker_};
  command.insert(command.end(), args.begin(), args.end());
  int exit_code = 0;
  std::string raw;
  if (!util::RunCommand(command, &raw, &exit_code, error_msg,
                        timeout_millis)) {
    return false;
  }
  *output = util::trim(raw);
  if (exit_code != 0) {
    *error_msg = "docker " + args[0] + " failed with code " +
                 std::to_string(exit_code) + ": " + *output;
    return false;
  }
  return true;
}

bool Docker::Provision(const Limits& limits, std::string* error_msg) {
  docker_ = util::which("docker");
  if (docker_.empty()) {
    *error_msg = "docker not found";
    return false;
  }
  if (!Unix::Provision(limits, error_msg)) return false;
  // The program runs as another user.
  if (chmod(scratch_.c_str(), 0755) != 0) {
    *error_msg = "chmod " + scratch_ + ": " + strerror(errno);
    return false;
  }
  return true;
}

bool Docker::Prepare(const Program& program, std::string* error_msg) {
  util::File::Write(util::File::JoinPath(scratch_, program.source_name),
                    program.source, 0644);

  std::string name = "fusional-" + util::File::BaseName(workdir_->Path());
  std::vector<std::string> args{"create", "--name", name, "--network", "none"};
  if (limits_.memory_limit_kb != 0) {
    std::string memory = std::to_string(limits_.memory_limit_kb) + "k";
    args.push_back("--memory=" + memory);
    // Same value as --memory: no swap.
    args.push_back("--memory-swap=" + memory);
  }
  if (limits_.max_procs != 0) {
    args.push_back("--pids-limit");
    args.push_back(std::to_string(limits_.max_procs));
  }
  if (limits_.max_files != 0) {
    args.push_back("--ulimit");
    args.push_back("nofile=" + std::to_string(limits_.max_files) + ":" +
                   std::to_string(limits_.max_files));
  }
  int64_t tmp_kb = limits_.scratch_size_kb != 0 ? limits_.scratch_size_kb
                                                : 64 * 1024;
  for (const char* arg :
       {"--security-opt", "no-new-privileges", "--cap-drop", "ALL",
        "--read-only", "--tmpfs"}) {
    args.push_back(arg);
  }
  args.push_back("/tmp:rw,exec,nosuid,size=" + std::to_string(tmp_kb) + "k");
  args.push_back("-v");
  args.push_back(scratch_ + ":" + kWorkdir + ":ro");
  args.push_back("-w");
  args.push_back(kWorkdir);
  args.push_back("-e");
  args.push_back("HOME=/tmp");
  args.push_back("--user");
  args.push_back(std::to_string(limits_.uid) + ":" +
                 std::to_string(limits_.gid));
  args.push_back(program.container_image);
  args.push_back(program.container_interpreter);
  args.insert(args.end(), program.interpreter_flags.begin(),
              program.interpreter_flags.end());
  args.push_back(program.source_name);

  // Set before creating, so that Destroy removes a half-created container.
  container_ = name;
  std::string output;
  if (!RunDocker(args, &output, error_msg, kCreateTimeoutMillis)) {
    return false;
  }
  KJ_LOG(INFO, "Container created", name);

  options_ = std::make_unique<ExecutionOptions>(scratch_, docker_);
  options_->SetArgs(std::vector<std::string>{"start", "-a", container_});
  std::vector<std::string> env;
  for (const char* var : kClientEnv) {
    const char* value = getenv(var);
    if (value != nullptr) env.push_back(std::string(var) + "=" + value);
  }
  options_->SetEnv(env);
  return true;
}

void Docker::OnExit(ExitInfo* info) {
  std::string output;
  std::string error_msg;
  if (!RunDocker({"inspect", "--format",
                  "{{.State.OOMKilled}} {{.State.ExitCode}}", container_},
                 &output, &error_msg, kDockerTimeoutMillis)) {
    KJ_LOG(WARNING, "Cannot inspect the container", error_msg);
    return;
  }
  std::istringstream state(output);
  std::string oom_killed;
  int exit_code = 0;
  if (!(state >> oom_killed >> exit_code)) {
    KJ_LOG(WARNING, "Unexpected container state", output);
    return;
  }
  if (oom_killed == "true") info->memory_exceeded = true;
  // The client itself was killed: its status says nothing about the program.
  if (info->signal != 0) return;
  // Docker reports a program killed by a signal as 128 + signal.
  if (exit_code > 128 && exit_code <= 128 + 64) {
    info->signal = exit_code - 128;
    info->status_code = 0;
  } else {
    info->status_code = exit_code;
  }
}

void Docker::Terminate() {
  // Once the client is reaped the container has stopped too.
  if (!container_.empty() && !reaped_) {
    std::string output;
    std::string error_msg;
    if (!RunDocker({"kill", container_}, &output, &error_msg,
                   kDockerTimeoutMillis)) {
      KJ_LOG(WARNING, error_msg);
    }
  }
  KillChild();
}

bool Docker::Destroy(std::string* error_msg) {
  bool ok = true;
  if (!container_.empty()) {
    std::string output;
    std::string rm_error;
    if (!RunDocker({"rm", "-f", container_}, &output, &rm_error,
                   kDockerTimeoutMillis) &&
        output.find("No such container") == std::string::npos) {
      *error_msg = rm_error;
      ok = false;
    }
    container_.clear();
  }
  std::string unix_error;
  if (!Unix::Destroy(&unix_error)) {
    if (!error_msg->empty()) *error_msg += "; ";
    *error_msg += unix_error;
    ok = false;
  }
  return ok;
}

namespace {
Sandbox::Register<Docker> r;  // NOLINT
}  // namespace

}  // namespace sandbox
