#ifndef SERVER_SERVER_HPP
#define SERVER_SERVER_HPP

#include <sys/types.h>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include <capnp/message.h>
#include <kj/async-io.h>

#include "capnp/execution.capnp.h"
#include "execution/validator.hpp"

namespace server {

// The RPC service. Requests are validated here, then each one is executed by
// its own helper process (`fusional execute --bin`), awaited on the event
// loop. A crash while executing only loses that request.
class Server : public capnproto::ExecutionService::Server {
 public:
  // helper_command is the command line of the helper, which reads a request
  // on stdin and writes the response on stdout. io is the provider of the
  // event loop the server runs on.
  Server(kj::LowLevelAsyncIoProvider* io,
         std::vector<std::string> helper_command,
         execution::ValidatorConfig config, uint32_t max_in_flight);
  ~Server();

  kj::Promise<void> execute(ExecuteContext context) override;
  kj::Promise<void> health(HealthContext context) override;

  // Cancels the running executions and refuses new ones. Resolves once every
  // helper exited.
  kj::Promise<void> Shutdown();

  uint32_t InFlight() const { return helpers_.size(); }
  uint64_t TeardownFailures() const { return teardown_failures_; }

 private:
  class Helper;

  class ErrorHandler : public kj::TaskSet::ErrorHandler {
   public:
    void taskFailed(kj::Exception&& exception) override;
  };

  // Throws if the helper cannot be started.
  kj::Own<Helper> Spawn();

  // Waits in the background for a helper whose call was dropped.
  void Reap(pid_t pid, kj::Own<kj::AsyncInputStream> output);

  // The helper was waited for.
  void Release(pid_t pid);

  void CountTeardownFailure(pid_t pid);

  kj::LowLevelAsyncIoProvider& io_;
  std::vector<std::string> helper_command_;
  execution::Validator validator_;
  uint32_t max_in_flight_;
  uint64_t teardown_failures_ = 0;
  bool shutting_down_ = false;
  std::set<pid_t> helpers_;
  kj::Own<kj::PromiseFulfiller<void>> drained_;
  ErrorHandler error_handler_;
  kj::TaskSet reapers_;
};

}  // namespace server

#endif
