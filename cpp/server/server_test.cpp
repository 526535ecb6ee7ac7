#include <chrono>
#include <string>
#include <vector>

#include <capnp/capability.h>
#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/async-io.h>

#include "execution/wire.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "server/server.hpp"
#include "util/file.hpp"
#include "util/version.hpp"
#include "util/which.hpp"

namespace {

using ::testing::HasSubstr;

execution::ValidatorConfig TestConfig() {
  execution::ValidatorConfig config;
  config.allow_direct = true;
  return config;
}

class ServerTest : public ::testing::Test {
 protected:
  ServerTest() : io_(kj::setupAsyncIo()) {}

  void Start(std::vector<std::string> helper_command, uint32_t max_in_flight) {
    auto server =
        kj::heap<server::Server>(io_.lowLevelProvider.get(),
                                 std::move(helper_command), TestConfig(),
                                 max_in_flight);
    server_ = server.get();
    client_ = kj::heap<capnproto::ExecutionService::Client>(kj::mv(server));
  }

  capnp::Request<capnproto::ExecutionService::ExecuteParams,
                 capnproto::ExecutionService::ExecuteResults>
  MakeRequest(const std::string& source) {
    auto request = client_->executeRequest();
    execution::RawRequest raw;
    raw.source = source;
    raw.isolation_mode = "direct";
    execution::RequestToCapnp(raw, request.initRequest());
    return request;
  }

  static execution::ExecutionResult ResultOf(
      const capnproto::ExecutionService::ExecuteResults::Reader& response) {
    EXPECT_TRUE(response.getResponse().isResult());
    return execution::ResultFromCapnp(response.getResponse().getResult());
  }

  void Sleep(int millis) {
    io_.provider->getTimer()
        .afterDelay(millis * kj::MILLISECONDS)
        .wait(io_.waitScope);
  }

  kj::AsyncIoContext io_;
  server::Server* server_ = nullptr;
  kj::Own<capnproto::ExecutionService::Client> client_;
};

// NOLINTNEXTLINE
TEST_F(ServerTest, TestHealth) {
  Start({"/bin/true"}, 7);
  auto response = client_->healthRequest().send().wait(io_.waitScope);
  EXPECT_EQ(std::string(response.getStatus().cStr()), "ok");
  EXPECT_EQ(std::string(response.getVersion().cStr()), util::version);
  EXPECT_EQ(response.getInFlight(), 0u);
  EXPECT_EQ(response.getMaxInFlight(), 7u);
  EXPECT_EQ(response.getTeardownFailures(), 0u);
}

// NOLINTNEXTLINE
TEST_F(ServerTest, TestRejectedWithoutHelper) {
  // The helper would fail: a rejection never reaches it.
  Start({"/no/such/helper"}, 1);
  auto response = MakeRequest("   ").send().wait(io_.waitScope);
  ASSERT_TRUE(response.getResponse().isRejected());
  execution::ValidationError error =
      execution::ErrorFromCapnp(response.getResponse().getRejected());
  EXPECT_EQ(error.kind, execution::ValidationError::Kind::EMPTY_SOURCE);
}

// NOLINTNEXTLINE
TEST_F(ServerTest, TestTooManyInFlight) {
  Start({"/no/such/helper"}, 0);
  auto response = MakeRequest("print(1)").send().wait(io_.waitScope);
  ASSERT_TRUE(response.getResponse().isResult());
  execution::ExecutionResult result =
      execution::ResultFromCapnp(response.getResponse().getResult());
  ASSERT_TRUE(result.Status().is<execution::SetupFailed>());
  EXPECT_EQ(result.Status().get<execution::SetupFailed>().reason,
            "too many executions in flight");
  EXPECT_EQ(result.IsolationModeUsed(), execution::IsolationMode::DIRECT);
}

// NOLINTNEXTLINE
TEST_F(ServerTest, TestHelperFailure) {
  Start({"/bin/sh", "-c", "cat > /dev/null; exit 3"}, 2);
  auto response = MakeRequest("print(1)").send().wait(io_.waitScope);
  ASSERT_TRUE(response.getResponse().isResult());
  execution::ExecutionResult result =
      execution::ResultFromCapnp(response.getResponse().getResult());
  ASSERT_TRUE(result.Status().is<execution::SetupFailed>());
  EXPECT_THAT(result.Status().get<execution::SetupFailed>().reason,
              HasSubstr("exited with code 3"));
  EXPECT_EQ(server_->InFlight(), 0u);
}

// NOLINTNEXTLINE
TEST_F(ServerTest, TestDroppedCallReapsHelper) {
  Start({"/bin/sleep", "100"}, 2);
  {
    auto promise = MakeRequest("print(1)").send();
    Sleep(100);
    EXPECT_EQ(server_->InFlight(), 1u);
  }
  for (int i = 0; i < 500 && server_->InFlight() != 0; i++) Sleep(10);
  EXPECT_EQ(server_->InFlight(), 0u);
}

// NOLINTNEXTLINE
TEST_F(ServerTest, TestHelperCannotStart) {
  Start({"/no/such/helper"}, 2);
  auto response = MakeRequest("print(1)").send().wait(io_.waitScope);
  execution::ExecutionResult result = ResultOf(response);
  ASSERT_TRUE(result.Status().is<execution::SetupFailed>());
  EXPECT_THAT(result.Status().get<execution::SetupFailed>().reason,
              HasSubstr("cannot start the execution helper"));
  EXPECT_EQ(server_->InFlight(), 0u);
}

// NOLINTNEXTLINE
TEST_F(ServerTest, TestHelperExitsWithoutReading) {
  Start({"/bin/true"}, 2);
  // Larger than a pipe buffer: the write fails once the helper is gone.
  std::string source = "print(1)\n" + std::string(512 * 1024, '#');
  auto response = MakeRequest(source).send().wait(io_.waitScope);
  execution::ExecutionResult result = ResultOf(response);
  ASSERT_TRUE(result.Status().is<execution::SetupFailed>());
  EXPECT_THAT(result.Status().get<execution::SetupFailed>().reason,
              HasSubstr("execution helper failed: empty response"));
  EXPECT_EQ(server_->InFlight(), 0u);

  // The server keeps answering.
  auto health = client_->healthRequest().send().wait(io_.waitScope);
  EXPECT_EQ(std::string(health.getStatus().cStr()), "ok");
}

// NOLINTNEXTLINE
TEST_F(ServerTest, TestTeardownFailuresAreCounted) {
  // A helper that answers with a canned response whose sandbox could not be
  // torn down.
  capnp::MallocMessageBuilder message;
  auto canned = message.initRoot<capnproto::ExecutionResponse>();
  auto result_builder = canned.initResult();
  execution::ResultToCapnp(
      execution::ExecutionResult("hi\n", false, "", false,
                                 execution::MakeCompleted(0), 12,
                                 execution::IsolationMode::DIRECT),
      result_builder);
  result_builder.setTeardownFailed(true);
  auto bytes = capnp::messageToFlatArray(message);
  util::TempDir tmp("/tmp");
  std::string path = util::File::JoinPath(tmp.Path(), "response");
  util::File::Write(path, std::string(bytes.asChars().begin(),
                                      bytes.asChars().size()));
  Start({"/bin/sh", "-c", "cat > /dev/null; cat " + path}, 2);

  auto response = MakeRequest("print(1)").send().wait(io_.waitScope);
  execution::ExecutionResult result = ResultOf(response);
  ASSERT_TRUE(result.Status().is<execution::Completed>());
  EXPECT_EQ(result.Stdout(), "hi\n");
  EXPECT_TRUE(response.getResponse().getResult().getTeardownFailed());
  auto health = client_->healthRequest().send().wait(io_.waitScope);
  EXPECT_EQ(health.getTeardownFailures(), 1u);

  MakeRequest("print(2)").send().wait(io_.waitScope);
  EXPECT_EQ(server_->TeardownFailures(), 2u);
  health = client_->healthRequest().send().wait(io_.waitScope);
  EXPECT_EQ(health.getTeardownFailures(), 2u);
}

// NOLINTNEXTLINE
TEST_F(ServerTest, TestShutdownStopsHelpers) {
  Start({"/bin/sleep", "100"}, 2);
  auto pending = MakeRequest("print(1)").send();
  Sleep(100);
  EXPECT_EQ(server_->InFlight(), 1u);

  server_->Shutdown().wait(io_.waitScope);
  EXPECT_EQ(server_->InFlight(), 0u);
  execution::ExecutionResult result = ResultOf(pending.wait(io_.waitScope));
  ASSERT_TRUE(result.Status().is<execution::SetupFailed>());
  EXPECT_THAT(result.Status().get<execution::SetupFailed>().reason,
              HasSubstr("killed by"));

  // New executions are refused, validation still runs.
  result = ResultOf(MakeRequest("print(1)").send().wait(io_.waitScope));
  EXPECT_TRUE(result.Status().is<execution::Cancelled>());
  auto health = client_->healthRequest().send().wait(io_.waitScope);
  EXPECT_EQ(std::string(health.getStatus().cStr()), "shutting down");
}

// NOLINTNEXTLINE
TEST_F(ServerTest, TestShutdownWithoutHelpers) {
  Start({"/bin/true"}, 2);
  server_->Shutdown().wait(io_.waitScope);
  EXPECT_EQ(server_->InFlight(), 0u);
}

#ifdef FUSIONAL_BINARY
// NOLINTNEXTLINE
TEST_F(ServerTest, TestExecuteThroughHelper) {
  if (util::whichInPath("python3", "/usr/local/bin:/usr/bin:/bin").empty()) {
    GTEST_SKIP() << "python3 not available";
  }
  Start({FUSIONAL_BINARY, "execute", "--bin", "--allow-direct",
         "--temp-dir=/tmp/fusional_testdir"},
        2);
  auto response =
      MakeRequest("import sys\nprint(6 * 7)\nsys.exit(4)\n").send().wait(
          io_.waitScope);
  ASSERT_TRUE(response.getResponse().isResult());
  execution::ExecutionResult result =
      execution::ResultFromCapnp(response.getResponse().getResult());
  ASSERT_TRUE(result.Status().is<execution::Completed>())
      << execution::DescribeStatus(result.Status());
  EXPECT_EQ(result.Status().get<execution::Completed>().code, 4);
  EXPECT_EQ(result.Stdout(), "42\n");
  EXPECT_EQ(server_->InFlight(), 0u);
}

// NOLINTNEXTLINE
TEST_F(ServerTest, TestShutdownCancelsExecution) {
  if (util::whichInPath("python3", "/usr/local/bin:/usr/bin:/bin").empty()) {
    GTEST_SKIP() << "python3 not available";
  }
  Start({FUSIONAL_BINARY, "execute", "--bin", "--allow-direct",
         "--temp-dir=/tmp/fusional_testdir"},
        2);
  auto pending =
      MakeRequest("import time\nprint('up', flush=True)\ntime.sleep(30)\n")
          .send();
  Sleep(1000);
  EXPECT_EQ(server_->InFlight(), 1u);
  auto start = std::chrono::steady_clock::now();
  server_->Shutdown().wait(io_.waitScope);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
  execution::ExecutionResult result = ResultOf(pending.wait(io_.waitScope));
  EXPECT_TRUE(result.Status().is<execution::Cancelled>())
      << execution::DescribeStatus(result.Status());
  EXPECT_EQ(server_->TeardownFailures(), 0u);
}
#endif

}  // namespace
