#include "server/server.hpp"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#include <capnp/serialize.h>
#include <kj/debug.h>

#include "execution/result.hpp"
#include "execution/wire.hpp"
#include "util/version.hpp"

extern char** environ;

namespace server {

namespace {

void WriteStatus(execution::ExitStatus status, execution::IsolationMode mode,
                 capnproto::ExecutionResponse::Builder response) {
  execution::ResultToCapnp(
      execution::ExecutionResult("", false, "", false, std::move(status), 0,
                                 mode),
      response.initResult());
}

// Returns false, with a description in error_msg, if the helper did not exit
// cleanly.
bool WaitHelper(pid_t pid, std::string* error_msg) {
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno == EINTR) continue;
    *error_msg = std::string("waitpid: ") + strerror(errno);
    return false;
  }
  if (WIFSIGNALED(status)) {
    *error_msg = std::string("killed by ") + strsignal(WTERMSIG(status));
    return false;
  }
  if (WEXITSTATUS(status) != 0) {
    *error_msg = "exited with code " + std::to_string(WEXITSTATUS(status));
    return false;
  }
  return true;
}

// Parses what a helper wrote on its stdout. The response is copied into
// results unless it is null.
bool ReadResponse(kj::ArrayPtr<const kj::byte> data,
                  capnproto::ExecutionService::ExecuteResults::Builder* results,
                  bool* teardown_failed, std::string* error_msg) {
  *teardown_failed = false;
  if (data.size() == 0) {
    *error_msg = "empty response";
    return false;
  }
  if (data.size() % sizeof(capnp::word) != 0) {
    *error_msg = "truncated response";
    return false;
  }
  // The message has to be word-aligned.
  auto words = kj::heapArray<capnp::word>(data.size() / sizeof(capnp::word));
  memcpy(words.begin(), data.begin(), data.size());
  try {
    capnp::FlatArrayMessageReader reader(words);
    auto response = reader.getRoot<capnproto::ExecutionResponse>();
    if (response.isResult()) {
      *teardown_failed = response.getResult().getTeardownFailed();
    }
    if (results != nullptr) results->setResponse(response);
  } catch (const kj::Exception& e) {
    *error_msg =
        std::string("malformed response: ") + e.getDescription().cStr();
    return false;
  }
  return true;
}

}  // namespace

// A running helper process. Owned by the promise of its call: if the call is
// dropped before the helper answered, the helper is asked to cancel the
// execution and is reaped in the background.
class Server::Helper {
 public:
  Helper(Server* server, pid_t pid, kj::Own<kj::AsyncOutputStream> input,
         kj::Own<kj::AsyncInputStream> output)
      : server_(*server),
        pid_(pid),
        input_(kj::mv(input)),
        output_(kj::mv(output)) {}

  ~Helper() {
    if (finished_) return;
    KJ_LOG(INFO, "Call dropped, cancelling the execution", pid_);
    if (kill(pid_, SIGTERM) == -1) {
      KJ_LOG(WARNING, "Cannot signal the helper", pid_, strerror(errno));
    }
    input_ = nullptr;
    server_.Reap(pid_, kj::mv(output_));
  }

  pid_t Pid() const { return pid_; }

  // Writes the request, then closes the helper's stdin. A helper that exits
  // without reading it is reported once it is waited for.
  kj::Promise<void> Send(kj::Array<capnp::word> request) {
    auto bytes = request.asBytes();
    return input_->write(bytes.begin(), bytes.size())
        .attach(kj::mv(request))
        .catch_([this](kj::Exception&& e) {
          KJ_LOG(WARNING, "Cannot send the request to the helper", pid_, e);
        })
        .then([this]() { input_ = nullptr; });
  }

  kj::Promise<kj::Array<kj::byte>> Receive() {
    return output_->readAllBytes().catch_(
        [this](kj::Exception&& e) -> kj::Array<kj::byte> {
          KJ_LOG(WARNING, "Cannot read the helper response", pid_, e);
          return nullptr;
        });
  }

  // The helper closed its stdout: it is exiting.
  bool Finish(std::string* error_msg) {
    finished_ = true;
    bool ok = WaitHelper(pid_, error_msg);
    server_.Release(pid_);
    return ok;
  }

 private:
  Server& server_;
  pid_t pid_;
  bool finished_ = false;
  kj::Own<kj::AsyncOutputStream> input_;
  kj::Own<kj::AsyncInputStream> output_;
};

void Server::ErrorHandler::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, "Background task failed", exception);
}

Server::Server(kj::LowLevelAsyncIoProvider* io,
               std::vector<std::string> helper_command,
               execution::ValidatorConfig config, uint32_t max_in_flight)
    : io_(*io),
      helper_command_(std::move(helper_command)),
      validator_(config),
      max_in_flight_(max_in_flight),
      reapers_(error_handler_) {
  KJ_REQUIRE(!helper_command_.empty(), "Missing helper command");
}

Server::~Server() {
  if (helpers_.empty()) return;
  KJ_LOG(WARNING, "Server stopped with running executions", helpers_.size());
  for (pid_t pid : helpers_) {
    if (kill(pid, SIGTERM) == -1) {
      KJ_LOG(WARNING, "Cannot signal the helper", pid, strerror(errno));
    }
  }
}

kj::Own<Server::Helper> Server::Spawn() {
  int to_helper[2];
  int from_helper[2];
  KJ_SYSCALL(pipe2(to_helper, O_CLOEXEC));
  kj::AutoCloseFd child_input(to_helper[0]);
  kj::AutoCloseFd input(to_helper[1]);
  KJ_SYSCALL(pipe2(from_helper, O_CLOEXEC));
  kj::AutoCloseFd output(from_helper[0]);
  kj::AutoCloseFd child_output(from_helper[1]);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  KJ_DEFER(posix_spawn_file_actions_destroy(&actions));
  posix_spawn_file_actions_adddup2(&actions, child_input.get(),
                                   STDIN_FILENO);
  posix_spawn_file_actions_adddup2(&actions, child_output.get(),
                                   STDOUT_FILENO);

  // The event loop blocks the signals it captures and ignores SIGPIPE: the
  // helper must not inherit either.
  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  KJ_DEFER(posix_spawnattr_destroy(&attr));
  sigset_t mask;
  sigemptyset(&mask);
  posix_spawnattr_setsigmask(&attr, &mask);
  sigset_t defaults;
  sigemptyset(&defaults);
  sigaddset(&defaults, SIGTERM);
  sigaddset(&defaults, SIGINT);
  sigaddset(&defaults, SIGPIPE);
  posix_spawnattr_setsigdefault(&attr, &defaults);
  posix_spawnattr_setflags(&attr,
                           POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

  std::vector<std::vector<char>> args_mut;
  for (const std::string& arg : helper_command_) {
    args_mut.emplace_back(arg.c_str(), arg.c_str() + arg.size() + 1);
  }
  std::vector<char*> args;
  for (auto& arg : args_mut) args.push_back(arg.data());
  args.push_back(nullptr);

  pid_t pid;
  int err = posix_spawn(&pid, args[0], &actions, &attr, args.data(), environ);
  if (err != 0) {
    KJ_FAIL_SYSCALL("posix_spawn", err, helper_command_[0]);
  }
  child_input = nullptr;
  child_output = nullptr;
  KJ_ON_SCOPE_FAILURE({
    kill(pid, SIGKILL);
    std::string error_msg;
    WaitHelper(pid, &error_msg);
    KJ_LOG(WARNING, "Helper killed", pid, error_msg);
  });

  auto flags = kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
               kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC;
  auto helper_input = io_.wrapOutputFd(input.release(), flags);
  auto helper_output = io_.wrapInputFd(output.release(), flags);
  helpers_.insert(pid);
  KJ_LOG(INFO, "Helper started", pid, helpers_.size());
  return kj::heap<Helper>(this, pid, kj::mv(helper_input),
                          kj::mv(helper_output));
}

kj::Promise<void> Server::execute(ExecuteContext context) {
  auto request = context.getParams().getRequest();
  auto validated = validator_.Validate(execution::RequestFromCapnp(request));
  auto response = context.getResults().initResponse();
  if (validated.is<execution::ValidationError>()) {
    const auto& error = validated.get<execution::ValidationError>();
    KJ_LOG(INFO, "Request rejected",
           execution::ValidationError::KindName(error.kind), error.message);
    execution::ErrorToCapnp(error, response.initRejected());
    return kj::READY_NOW;
  }
  execution::IsolationMode mode =
      validated.get<execution::ExecutionRequest>().GetIsolationMode();
  if (shutting_down_) {
    WriteStatus(execution::MakeCancelled(), mode, response);
    return kj::READY_NOW;
  }
  if (helpers_.size() >= max_in_flight_) {
    KJ_LOG(WARNING, "Execution refused", helpers_.size(), max_in_flight_);
    WriteStatus(execution::MakeSetupFailed("too many executions in flight"),
                mode, response);
    return kj::READY_NOW;
  }

  capnp::MallocMessageBuilder message;
  message.setRoot(request);
  kj::Own<Helper> helper;
  try {
    helper = Spawn();
  } catch (const kj::Exception& e) {
    KJ_LOG(ERROR, "Cannot start the execution helper", e);
    WriteStatus(execution::MakeSetupFailed(
                    std::string("cannot start the execution helper: ") +
                    e.getDescription().cStr()),
                mode, response);
    return kj::READY_NOW;
  }
  Helper* ptr = helper.get();
  return ptr->Send(capnp::messageToFlatArray(message))
      .then([ptr]() { return ptr->Receive(); })
      .then([this, context, mode, helper = kj::mv(helper)](
                kj::Array<kj::byte> data) mutable {
        pid_t pid = helper->Pid();
        std::string error_msg;
        bool teardown_failed = false;
        auto results = context.getResults();
        bool ok = helper->Finish(&error_msg) &&
                  ReadResponse(data, &results, &teardown_failed, &error_msg);
        if (teardown_failed) CountTeardownFailure(pid);
        if (!ok) {
          KJ_LOG(ERROR, "Execution helper failed", pid, error_msg);
          WriteStatus(execution::MakeSetupFailed("execution helper failed: " +
                                                 error_msg),
                      mode, results.initResponse());
        }
      });
}

kj::Promise<void> Server::health(HealthContext context) {
  auto results = context.getResults();
  results.setStatus(shutting_down_ ? "shutting down" : "ok");
  results.setVersion(util::version.c_str());
  results.setInFlight(helpers_.size());
  results.setMaxInFlight(max_in_flight_);
  results.setTeardownFailures(teardown_failures_);
  return kj::READY_NOW;
}

kj::Promise<void> Server::Shutdown() {
  KJ_REQUIRE(!shutting_down_, "Shutdown already requested");
  shutting_down_ = true;
  KJ_LOG(INFO, "Shutting down", helpers_.size());
  if (helpers_.empty()) return kj::READY_NOW;
  for (pid_t pid : helpers_) {
    if (kill(pid, SIGTERM) == -1) {
      KJ_LOG(WARNING, "Cannot signal the helper", pid, strerror(errno));
    }
  }
  auto paf = kj::newPromiseAndFulfiller<void>();
  drained_ = kj::mv(paf.fulfiller);
  return kj::mv(paf.promise);
}

void Server::Reap(pid_t pid, kj::Own<kj::AsyncInputStream> output) {
  auto drained = output->readAllBytes().attach(kj::mv(output));
  reapers_.add(drained.then(
      [this, pid](kj::Array<kj::byte> data) {
        std::string error_msg;
        bool teardown_failed = false;
        ReadResponse(data, nullptr, &teardown_failed, &error_msg);
        if (teardown_failed) CountTeardownFailure(pid);
        if (!WaitHelper(pid, &error_msg)) {
          KJ_LOG(INFO, "Cancelled helper", pid, error_msg);
        }
        Release(pid);
      },
      [this, pid](kj::Exception&& e) {
        KJ_LOG(WARNING, "Cannot drain the helper output", pid, e);
        std::string error_msg;
        if (!WaitHelper(pid, &error_msg)) {
          KJ_LOG(INFO, "Cancelled helper", pid, error_msg);
        }
        Release(pid);
      }));
}

void Server::Release(pid_t pid) {
  helpers_.erase(pid);
  if (helpers_.empty() && drained_.get() != nullptr) {
    drained_->fulfill();
    drained_ = nullptr;
  }
}

void Server::CountTeardownFailure(pid_t pid) {
  teardown_failures_++;
  KJ_LOG(ERROR, "The helper could not tear its sandbox down", pid,
         teardown_failures_);
}

}  // namespace server
