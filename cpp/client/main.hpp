#ifndef CLIENT_MAIN_HPP
#define CLIENT_MAIN_HPP

#include <kj/main.h>

#include "execution/request.hpp"

namespace client {

// Sends a file to a running server and prints the outcome like `run` does.
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
  bool health_ = false;
  bool source_given_ = false;
};

}  // namespace client
#endif
