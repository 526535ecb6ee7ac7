#include "client/main.hpp"

#include <unistd.h>
#include <iostream>
#include <iterator>
#include <system_error>

#include <capnp/ez-rpc.h>
#include <kj/debug.h>
#include <kj/io.h>

#include "capnp/execution.capnp.h"
#include "execution/result.hpp"
#include "execution/wire.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace client {

kj::MainBuilder::Validity Main::SetSource(kj::StringPtr path) {
  source_given_ = true;
  if (path == "-") {
    request_.source.assign(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    return true;
  }
  try {
    // The server has the last word on the size.
    request_.source = util::File::Read(path.cStr(), Flags::max_source_bytes + 1);
  } catch (const std::system_error& e) {
    return kj::str("Cannot read ", path, ": ", e.what());
  }
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context);
  capnp::EzRpcClient client(Flags::server, Flags::port);
  auto& wait_scope = client.getWaitScope();
  auto service = client.getMain<capnproto::ExecutionService>();

  if (health_) {
    auto health = service.healthRequest().send().wait(wait_scope);
    std::cout << health.getStatus().cStr() << " " << health.getVersion().cStr()
              << " " << health.getInFlight() << "/" << health.getMaxInFlight()
              << std::endl;
    return true;
  }
  if (!source_given_) {
    return kj::str("A file is required");
  }

  request_.timeout_seconds = timeout_seconds_;
  request_.memory_limit_mb = memory_limit_mb_;
  auto request = service.executeRequest();
  execution::RequestToCapnp(request_, request.initRequest());
  auto response = request.send().wait(wait_scope).getResponse();
  if (response.isRejected()) {
    execution::ValidationError error =
        execution::ErrorFromCapnp(response.getRejected());
    context.exitError(kj::str("rejected: ",
                              execution::ValidationError::KindName(error.kind),
                              ": ", error.message));
  }

  execution::ExecutionResult result =
      execution::ResultFromCapnp(response.getResult());
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
  static const std::string title = "Fusional Client (" + util::version + ")";
  return kj::MainBuilder(context, title,
                         "Sends a program to a server and prints its output")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOptionWithArg({'s', "server"}, util::setString(Flags::server),
                        "<ADDRESS>", "Address of the server")
      .addOptionWithArg({'p', "port"}, util::setInt(Flags::port), "<PORT>",
                        "Port of the server")
      .addOptionWithArg({'l', "language"}, util::setString(request_.language),
                        "<LANGUAGE>", "Language of the program")
      .addOptionWithArg({'t', "timeout"}, util::setInt(timeout_seconds_),
                        "<SECONDS>", "Time limit")
      .addOptionWithArg({'m', "memory"}, util::setInt(memory_limit_mb_),
                        "<MB>", "Memory limit")
      .addOptionWithArg({'i', "isolation"},
                        util::setString(request_.isolation_mode),
                        "<sandboxed|direct>", "How to isolate the program")
      .addOption({"health"}, util::setBool(health_),
                 "Print the status of the server instead")
      .expectOptionalArg("<file>", KJ_BIND_METHOD(*this, SetSource))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}

}  // namespace client
