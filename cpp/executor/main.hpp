#ifndef EXECUTOR_MAIN_HPP
#define EXECUTOR_MAIN_HPP

#include <string>
#include <vector>

#include <kj/main.h>

#include "execution/request.hpp"
#include "executor/cancellation.hpp"

namespace executor {

// While a canceler is installed, SIGINT and SIGTERM cancel its execution
// instead of killing the process, so that the sandbox is always torn down.
// nullptr restores the default handlers.
void CancelOnSignals(const Canceler* canceler);

// Adds the options that configure validation, executions and the isolation
// runtimes.
void AddExecutionOptions(kj::MainBuilder& builder);  // NOLINT

// The options added by AddExecutionOptions, with their current values.
std::vector<std::string> ExecutionArguments();

// Executes a local file, printing its output and a one-line summary.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::MainBuilder::Validity SetSource(kj::StringPtr path);

  kj::ProcessContext& context;
  execution::RawRequest request_;
  int timeout_seconds_ = 5;
  int memory_limit_mb_ = 128;
};

// Executes one request read from stdin and writes the response to stdout.
// The server runs one of these per request.
class HelperMain {
 public:
  explicit HelperMain(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  bool read_binary = false;
};

}  // namespace executor
#endif
