#include "client/main.hpp"
#include "executor/main.hpp"
#include "server/main.hpp"
#include "util/version.hpp"

class FusionalMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit FusionalMain(kj::ProcessContext& context)
      : context(context), rm(&context), hm(&context), sm(&context),
        cm(&context) {}
  kj::MainFunc getMain() {
    static const std::string title = "Fusional (" + util::version + ")";
    return kj::MainBuilder(context, title,
                           "Runs untrusted code in a sandbox")
        .addSubCommand("run", KJ_BIND_METHOD(rm, getMain),
                       "execute a local file")
        .addSubCommand("server", KJ_BIND_METHOD(sm, getMain), "run the server")
        .addSubCommand("submit", KJ_BIND_METHOD(cm, getMain),
                       "send a file to a server")
        .addSubCommand("execute", KJ_BIND_METHOD(hm, getMain),
                       "execute one request for the server")
        .build();
  }

 private:
  kj::ProcessContext& context;
  executor::Main rm;
  executor::HelperMain hm;
  server::Main sm;
  client::Main cm;
};

KJ_MAIN(FusionalMain);
