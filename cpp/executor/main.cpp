#include "executor/main.hpp"

#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <iostream>
#include <iterator>
#include <system_error>

#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/debug.h>
#include <kj/io.h>

#include "capnp/execution.capnp.h"
#include "execution/validator.hpp"
#include "execution/wire.hpp"
#include "executor/executor.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace executor {

namespace {

// Canceler of the execution running in this process, if any. Read by the
// signal handler.
std::atomic<const Canceler*> active_canceler{nullptr};
static_assert(ATOMIC_POINTER_LOCK_FREE == 2,
              "active_canceler must be usable from a signal handler");

void CancelOnSignal(int) {
  const Canceler* canceler = active_canceler.load();
  if (canceler != nullptr) canceler->Cancel();
}

ExecutorOptions OptionsFromFlags() {
  ExecutorOptions options = ExecutorOptions::FromFlags();
  if (Flags::max_executions < 0) options.max_executions = 0;
  return options;
}

}  // namespace

void CancelOnSignals(const Canceler* canceler) {
  active_canceler = canceler;
  struct sigaction action {};
  action.sa_handler = canceler != nullptr ? CancelOnSignal : SIG_DFL;
  sigemptyset(&action.sa_mask);
  KJ_SYSCALL(sigaction(SIGINT, &action, nullptr));
  KJ_SYSCALL(sigaction(SIGTERM, &action, nullptr));
}

void AddExecutionOptions(kj::MainBuilder& builder) {  // NOLINT
  builder
      .addOptionWithArg({'T', "temp-dir"},
                        util::setString(Flags::temp_directory), "<DIR>",
                        "Path where the sandboxes should be created")
      .addOption({"allow-direct"}, util::setBool(Flags::allow_direct),
                 "Accept requests for direct (unsandboxed) executions")
      .addOptionWithArg({"max-timeout"}, util::setInt(Flags::max_timeout_seconds),
                        "<SECONDS>", "Largest timeout a request can ask for")
      .addOptionWithArg({"max-memory"}, util::setInt(Flags::max_memory_mb),
                        "<MB>", "Largest memory limit a request can ask for")
      .addOptionWithArg({"max-source-size"},
                        util::setUint(Flags::max_source_bytes), "<BYTES>",
                        "Largest accepted source")
      .addOptionWithArg({"output-limit"},
                        util::setUint(Flags::output_limit_bytes), "<BYTES>",
                        "Bytes of stdout and of stderr kept per execution")
      .addOptionWithArg({"grace-period"},
                        util::setInt(Flags::grace_period_millis), "<MS>",
                        "Time given to a killed program to go away")
      .addOptionWithArg({"max-processes"}, util::setInt(Flags::max_processes),
                        "<N>", "Maximum number of processes of a program")
      .addOptionWithArg({"scratch-size"}, util::setInt(Flags::scratch_size_mb),
                        "<MB>", "Size of the writable /tmp of a sandbox")
      .addOptionWithArg({"runtime"}, util::setString(Flags::runtime),
                        "<auto|namespace|docker>",
                        "Isolation runtime of sandboxed executions")
      .addOptionWithArg({"cgroup-root"}, util::setString(Flags::cgroup_root),
                        "<DIR>", "Delegated cgroup where sandboxes are created")
      .addOptionWithArg({"sandbox-uid"}, util::setInt(Flags::sandbox_uid),
                        "<UID>", "User the programs run as")
      .addOptionWithArg({"sandbox-gid"}, util::setInt(Flags::sandbox_gid),
                        "<GID>", "Group the programs run as")
      .addOptionWithArg({"docker-image"}, util::setString(Flags::docker_image),
                        "<IMAGE>", "Image of the docker runtime")
      .addOptionWithArg({"python"}, util::setString(Flags::python_interpreter),
                        "<PATH>", "Python interpreter on this host");
}

std::vector<std::string> ExecutionArguments() {
  std::vector<std::string> args{
      "--temp-dir=" + Flags::temp_directory,
      "--max-timeout=" + std::to_string(Flags::max_timeout_seconds),
      "--max-memory=" + std::to_string(Flags::max_memory_mb),
      "--max-source-size=" + std::to_string(Flags::max_source_bytes),
      "--output-limit=" + std::to_string(Flags::output_limit_bytes),
      "--grace-period=" + std::to_string(Flags::grace_period_millis),
      "--max-processes=" + std::to_string(Flags::max_processes),
      "--scratch-size=" + std::to_string(Flags::scratch_size_mb),
      "--runtime=" + Flags::runtime,
      "--cgroup-root=" + Flags::cgroup_root,
      "--sandbox-uid=" + std::to_string(Flags::sandbox_uid),
      "--sandbox-gid=" + std::to_string(Flags::sandbox_gid),
      "--docker-image=" + Flags::docker_image,
      "--python=" + Flags::python_interpreter};
  if (Flags::allow_direct) args.push_back("--allow-direct");
  if (!Flags::log_file.empty()) args.push_back("--logfile=" + Flags::log_file);
  return args;
}

kj::MainBuilder::Validity Main::SetSource(kj::StringPtr path) {
  if (path == "-") {
    request_.source.assign(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    return true;
  }
  try {
    request_.source = util::File::Read(path.cStr(), Flags::max_source_bytes + 1);
  } catch (const std::system_error& e) {
    return kj::str("Cannot read ", path, ": ", e.what());
  }
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context);
  request_.timeout_seconds = timeout_seconds_;
  request_.memory_limit_mb = memory_limit_mb_;
  auto validated =
      execution::Validator(execution::ValidatorConfig::FromFlags())
          .Validate(request_);
  if (validated.is<execution::ValidationError>()) {
    const auto& error = validated.get<execution::ValidationError>();
    context.exitError(kj::str("rejected: ",
                              execution::ValidationError::KindName(error.kind),
                              ": ", error.message));
  }

  Canceler canceler;
  CancelOnSignals(&canceler);
  Executor executor(OptionsFromFlags());
  execution::ExecutionResult result =
      executor.Execute(validated.get<execution::ExecutionRequest>(), canceler);
  CancelOnSignals(nullptr);

  kj::FdOutputStream(STDOUT_FILENO)
      .write(result.Stdout().data(), result.Stdout().size());
  kj::FdOutputStream(STDERR_FILENO)
      .write(result.Stderr().data(), result.Stderr().size());
  std::string summary = execution::Summary(result);
  if (!result.Status().is<execution::Completed>() ||
      result.Status().get<execution::Completed>().code != 0) {
    context.exitError(kj::StringPtr(summary.c_str()));
  }
  context.warning(kj::StringPtr(summary.c_str()));
  return true;
}

kj::MainFunc Main::getMain() {
  // MainBuilder keeps a pointer to the title.
  static const std::string title = "Fusional (" + util::version + ")";
  kj::MainBuilder builder(context, title,
                          "Executes a program and prints its output");
  AddExecutionOptions(builder);
  return builder
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOptionWithArg({'l', "language"}, util::setString(request_.language),
                        "<LANGUAGE>", "Language of the program")
      .addOptionWithArg({'t', "timeout"}, util::setInt(timeout_seconds_),
                        "<SECONDS>", "Time limit")
      .addOptionWithArg({'m', "memory"}, util::setInt(memory_limit_mb_),
                        "<MB>", "Memory limit")
      .addOptionWithArg({'i', "isolation"},
                        util::setString(request_.isolation_mode),
                        "<sandboxed|direct>", "How to isolate the program")
      .expectArg("<file>", KJ_BIND_METHOD(*this, SetSource))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}

kj::MainBuilder::Validity HelperMain::Run() {
  if (!read_binary) return kj::str("Only --bin is supported");
  util::LogManager log_manager(context);
  // The server sends SIGTERM to cancel: from now on it never kills the
  // helper before the response is written.
  Canceler canceler;
  CancelOnSignals(&canceler);
  KJ_DEFER(CancelOnSignals(nullptr));
  capnp::StreamFdMessageReader reader(STDIN_FILENO);
  execution::RawRequest raw = execution::RequestFromCapnp(
      reader.getRoot<capnproto::ExecutionRequest>());

  capnp::MallocMessageBuilder message;
  auto response = message.initRoot<capnproto::ExecutionResponse>();
  auto validated =
      execution::Validator(execution::ValidatorConfig::FromFlags())
          .Validate(raw);
  if (validated.is<execution::ValidationError>()) {
    execution::ErrorToCapnp(validated.get<execution::ValidationError>(),
                            response.initRejected());
  } else {
    Executor executor(OptionsFromFlags());
    execution::ExecutionResult result = executor.Execute(
        validated.get<execution::ExecutionRequest>(), canceler);
    auto result_builder = response.initResult();
    execution::ResultToCapnp(result, result_builder);
    result_builder.setTeardownFailed(executor.TeardownFailures() != 0);
  }
  capnp::writeMessageToFd(STDOUT_FILENO, message);
  return true;
}

kj::MainFunc HelperMain::getMain() {
  static const std::string title = "Fusional Helper (" + util::version + ")";
  kj::MainBuilder builder(context, title,
                          "Executes one request for the server");
  AddExecutionOptions(builder);
  return builder
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'b', "bin"}, util::setBool(read_binary),
                 "Read the request and write the response in binary.")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}

}  // namespace executor
