#include "server/main.hpp"

#include <signal.h>
#include <algorithm>
#include <cstring>
#include <thread>

#include <capnp/rpc-twoparty.h>
#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/debug.h>

#include "executor/main.hpp"
#include "server/server.hpp"
#include "util/daemon.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"
#include "whereami++.h"

namespace server {

namespace {

std::vector<std::string> HelperCommand() {
  std::vector<std::string> command{whereami::getExecutablePath(), "execute",
                                   "--bin"};
  for (std::string& arg : executor::ExecutionArguments()) {
    command.push_back(std::move(arg));
  }
  return command;
}

}  // namespace

kj::MainBuilder::Validity Main::Run() {
  if (Flags::daemon) {
    util::daemonize("server", Flags::pidfile);
  }
  util::LogManager log_manager(context);
  uint32_t max_in_flight = Flags::max_executions;
  if (Flags::max_executions <= 0) {
    max_in_flight = 4 * std::max(1u, std::thread::hardware_concurrency());
  }

  // Captured before the event loop starts, so that no thread sees them.
  kj::UnixEventPort::captureSignal(SIGTERM);
  kj::UnixEventPort::captureSignal(SIGINT);
  auto io = kj::setupAsyncIo();

  auto service = kj::heap<Server>(io.lowLevelProvider.get(), HelperCommand(),
                                  execution::ValidatorConfig::FromFlags(),
                                  max_in_flight);
  Server* service_ptr = service.get();
  capnp::TwoPartyServer server(kj::mv(service));
  auto address = io.provider->getNetwork()
                     .parseAddress(Flags::listen_address.c_str(), Flags::port)
                     .wait(io.waitScope);
  auto listener = address->listen();
  KJ_LOG(INFO, "Server listening", Flags::listen_address, listener->getPort(),
         max_in_flight);
  auto serving = server.listen(*listener).eagerlyEvaluate(
      [](kj::Exception&& e) { KJ_LOG(ERROR, "Listener failed", e); });

  siginfo_t signal = io.unixEventPort.onSignal(SIGTERM)
                         .exclusiveJoin(io.unixEventPort.onSignal(SIGINT))
                         .wait(io.waitScope);
  KJ_LOG(INFO, "Stopping", strsignal(signal.si_signo));
  service_ptr->Shutdown().wait(io.waitScope);
  KJ_LOG(INFO, "All executions stopped");
  return true;
}

kj::MainFunc Main::getMain() {
  // MainBuilder keeps a pointer to the title.
  static const std::string title = "Fusional Server (" + util::version + ")";
  kj::MainBuilder builder(context, title,
                          "Receives execution requests and runs them");
  executor::AddExecutionOptions(builder);
  return builder
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'d', "daemon"}, util::setBool(Flags::daemon),
                 "Become a daemon")
      .addOptionWithArg({'P', "pidfile"}, util::setString(Flags::pidfile),
                        "<PIDFILE>", "Path where the pidfile should be stored")
      .addOptionWithArg({'l', "address"},
                        util::setString(Flags::listen_address), "<ADDRESS>",
                        "Address to listen on")
      .addOptionWithArg({'p', "port"}, util::setInt(Flags::port), "<PORT>",
                        "Port to listen on")
      .addOptionWithArg({"max-executions"},
                        util::setInt(Flags::max_executions), "<N>",
                        "Executions run at the same time. 0 means 4 per core")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace server
