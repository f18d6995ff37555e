// devbroker headers
#include "core/CommandCache.hpp"
#include "core/ConnectionManager.hpp"
#include "core/Dispatcher.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "protocols/Request.hpp"
#include "protocols/Response.hpp"

// devbroker fakes
#include "FakeDeviceSession.hpp"
#include "FakeSessionFactory.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <chrono>
#include <future>
#include <thread>

namespace devbroker::test {

  using core::Dispatcher;
  using core::ExecutionError;
  using protocols::Request;
  using protocols::Response;
  using ::testing::HasSubstr;
  using namespace std::chrono_literals;

  class DispatcherTest : public ::testing::Test {
  protected:
    void SetUp() override {
      errorMonitor = std::make_shared<::testing::NiceMock<MockErrorMonitor>>();
      connections = std::make_unique<core::ConnectionManager>(inventory, factory, cache,
                                                              errorMonitor, logger, 4);
      dispatcher = std::make_unique<Dispatcher>(cache, *connections, logger, "/tmp/broker-test.sock",
                                                [] { return std::size_t{ 3 }; });
    }

    Response call(const std::string& payload) {
      auto reply = Response::fromWire(dispatcher->handlePayload(payload));
      EXPECT_TRUE(reply.has_value());
      return reply ? *reply : Response{};
    }

    core::Logger logger{ core::LogLevel::Error };
    core::DeviceInventory inventory = fakeInventory({ "d1", "d2", "d3" });
    FakeSessionFactory factory;
    core::CommandCache cache;
    std::shared_ptr<::testing::NiceMock<MockErrorMonitor>> errorMonitor;
    std::unique_ptr<core::ConnectionManager> connections;
    std::unique_ptr<Dispatcher> dispatcher;
  };

  TEST_F(DispatcherTest, execute_SecondIdenticalCallIsServedFromCache) {
    const auto first = dispatcher->execute("d1", "show version");
    auto session = factory.sessionFor("d1");
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->runCalls.load(), 1);

    const auto second = dispatcher->execute("d1", "show version");
    EXPECT_EQ(session->runCalls.load(), 1);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, "d1: show version");
  }

  TEST_F(DispatcherTest, execute_CacheHitNeedsNoSession) {
    cache.set("d2", "show clock", "12:00");

    EXPECT_EQ(dispatcher->execute("d2", "show clock"), "12:00");
    EXPECT_EQ(factory.createCalls.load(), 0);
  }

  TEST_F(DispatcherTest, execute_TransportFailureReleasesDeviceAndClearsCache) {
    dispatcher->execute("d1", "show version");
    auto broken = factory.sessionFor("d1");
    broken->transportFailure = true;

    EXPECT_THROW(dispatcher->execute("d1", "show interfaces"), ExecutionError);

    EXPECT_FALSE(connections->isConnected("d1"));
    EXPECT_FALSE(cache.get("d1", "show version"));
    EXPECT_EQ(broken->state(), protocols::DeviceSession::State::Closed);

    // the next call opens a fresh session
    EXPECT_EQ(dispatcher->execute("d1", "show interfaces"), "d1: show interfaces");
    EXPECT_EQ(factory.createCalls.load(), 2);
    EXPECT_NE(factory.sessionFor("d1"), broken);
  }

  TEST_F(DispatcherTest, execute_LateTransportFailureKeepsTheReplacementSession) {
    dispatcher->execute("d1", "show version");
    auto stale = factory.sessionFor("d1");
    stale->runDelay = 300ms;
    stale->transportFailure = true;

    auto slow = std::async(std::launch::async,
                           [this] { return dispatcher->execute("d1", "show interfaces"); });
    std::this_thread::sleep_for(50ms);

    // another caller finds the session unhealthy and replaces it
    stale->healthy = false;
    EXPECT_EQ(dispatcher->execute("d1", "show clock"), "d1: show clock");
    auto replacement = factory.sessionFor("d1");
    ASSERT_NE(replacement, stale);

    EXPECT_THROW(slow.get(), ExecutionError);
    EXPECT_TRUE(connections->isConnected("d1"));
    EXPECT_EQ(replacement->state(), protocols::DeviceSession::State::Connected);
    EXPECT_TRUE(cache.get("d1", "show clock"));
  }

  TEST_F(DispatcherTest, execute_OutputOfAReleasedSessionIsNotCached) {
    dispatcher->execute("d1", "show version");
    auto session = factory.sessionFor("d1");
    session->afterRun = [this] { connections->release("d1"); };

    EXPECT_EQ(dispatcher->execute("d1", "show clock"), "d1: show clock");
    EXPECT_FALSE(cache.get("d1", "show clock"));
    EXPECT_EQ(cache.totalEntries(), 0u);
  }

  TEST_F(DispatcherTest, tryHandlePayload_DefersInsteadOfWaitingForASlot) {
    connections = std::make_unique<core::ConnectionManager>(inventory, factory, cache, errorMonitor,
                                                            logger, 1);
    dispatcher = std::make_unique<Dispatcher>(cache, *connections, logger, "/tmp/broker-test.sock");
    ASSERT_TRUE(dispatcher->connect("d1"));

    EXPECT_FALSE(dispatcher->tryHandlePayload(
        R"({"command":"execute","hostname":"d2","cmd":"show version"})"));
    EXPECT_FALSE(dispatcher->tryHandlePayload(R"({"command":"connect","hostname":"d2"})"));

    // requests that need no new slot are answered right away
    EXPECT_TRUE(dispatcher->tryHandlePayload(R"({"command":"ping"})"));
    EXPECT_TRUE(dispatcher->tryHandlePayload(
        R"({"command":"execute","hostname":"d1","cmd":"show version"})"));
    EXPECT_TRUE(dispatcher->tryHandlePayload(R"({"command":"disconnect","hostname":"d1"})"));

    auto reply = dispatcher->tryHandlePayload(
        R"({"command":"execute","hostname":"d2","cmd":"show version"})");
    ASSERT_TRUE(reply);
    EXPECT_EQ(Response::fromWire(*reply)->body["result"], "d2: show version");
  }

  TEST_F(DispatcherTest, execute_CommandErrorOnHealthySessionKeepsIt) {
    dispatcher->execute("d1", "show version");
    auto session = factory.sessionFor("d1");
    session->commandFailure = true;

    try {
      dispatcher->execute("d1", "show bogus");
      FAIL() << "expected ExecutionError";
    } catch (const ExecutionError& e) {
      EXPECT_THAT(e.what(), HasSubstr("Invalid input"));
    }

    EXPECT_TRUE(connections->isConnected("d1"));
    EXPECT_GE(session->healthChecks.load(), 1);
    EXPECT_FALSE(cache.get("d1", "show bogus"));
    EXPECT_TRUE(cache.get("d1", "show version"));
  }

  TEST_F(DispatcherTest, execute_CommandErrorOnUnhealthySessionReleasesIt) {
    dispatcher->execute("d1", "show version");
    auto session = factory.sessionFor("d1");
    session->commandFailure = true;
    session->healthy = false;

    EXPECT_THROW(dispatcher->execute("d1", "show bogus"), ExecutionError);
    EXPECT_FALSE(connections->isConnected("d1"));
  }

  TEST_F(DispatcherTest, execute_UnknownDeviceRaisesConnectionError) {
    EXPECT_THROW(dispatcher->execute("ghost", "show version"), core::ConnectionError);
  }

  TEST_F(DispatcherTest, connect_ReportsSuccessAsBool) {
    EXPECT_TRUE(dispatcher->connect("d1"));
    EXPECT_TRUE(connections->isConnected("d1"));

    factory.failConnect("d2");
    EXPECT_FALSE(dispatcher->connect("d2"));
    EXPECT_FALSE(dispatcher->connect("ghost"));
  }

  TEST_F(DispatcherTest, disconnect_AlwaysTrueAndInvalidatesCache) {
    dispatcher->execute("d1", "show version");

    EXPECT_TRUE(dispatcher->disconnect("d1"));
    EXPECT_TRUE(dispatcher->disconnect("d3")); // never connected
    EXPECT_FALSE(cache.get("d1", "show version"));
    EXPECT_FALSE(connections->isConnected("d1"));
  }

  TEST_F(DispatcherTest, status_ReportsCacheAndConnectionState) {
    dispatcher->execute("d1", "show version");
    dispatcher->execute("d1", "show clock");
    dispatcher->execute("d2", "show version");

    const auto doc = dispatcher->status();
    EXPECT_EQ(doc["socket_path"], "/tmp/broker-test.sock");
    EXPECT_EQ(doc["max_connections"], 4);
    EXPECT_EQ(doc["connected_devices"], nlohmann::json::array({ "d1", "d2" }));
    EXPECT_EQ(doc["active_clients"], 3);

    const auto& cacheStats = doc["command_cache_stats"];
    EXPECT_EQ(cacheStats["devices_with_cache"], nlohmann::json::array({ "d1", "d2" }));
    EXPECT_EQ(cacheStats["total_cached_commands"], 3);
    EXPECT_EQ(cacheStats["per_device_stats"]["d1"]["total"], 2);
    EXPECT_EQ(cacheStats["per_device_stats"]["d1"]["valid"], 2);
    EXPECT_EQ(cacheStats["per_device_stats"]["d1"]["expired"], 0);

    const auto& connStats = doc["connection_stats"];
    EXPECT_EQ(connStats["active_connections"], 2);
    EXPECT_EQ(connStats["healthy_connections"], 2);
    EXPECT_EQ(connStats["available_slots"], 2);
  }

  TEST_F(DispatcherTest, handle_CoversEveryRequestKind) {
    EXPECT_EQ(dispatcher->handle(Request{ protocols::PingRequest{} }), "pong");
    EXPECT_EQ(dispatcher->handle(Request{ protocols::ConnectRequest{ "d3" } }), true);

    const auto executed = dispatcher->handle(Request{ protocols::ExecuteRequest{ "d3", "show ip" } });
    EXPECT_EQ(executed["status"], "success");
    EXPECT_EQ(executed["result"], "d3: show ip");

    EXPECT_EQ(dispatcher->handle(Request{ protocols::DisconnectRequest{ "d3" } }), true);
    EXPECT_TRUE(dispatcher->handle(Request{ protocols::StatusRequest{} }).is_object());
  }

  TEST_F(DispatcherTest, handle_ExecuteFailureBecomesErrorBody) {
    factory.failConnect("d1");
    Response reply{ dispatcher->handle(Request{ protocols::ExecuteRequest{ "d1", "show version" } }) };

    EXPECT_TRUE(reply.isError());
    EXPECT_EQ(reply.errorType(), "ConnectionError");
    EXPECT_THAT(reply.errorMessage(), HasSubstr("Connection failure for device 'd1'"));
  }

  TEST_F(DispatcherTest, handlePayload_MalformedJsonIsAProtocolError) {
    const auto reply = call("{not json");
    EXPECT_TRUE(reply.isError());
    EXPECT_EQ(reply.errorType(), "ProtocolError");
  }

  TEST_F(DispatcherTest, handlePayload_UnknownTagIsReported) {
    const auto reply = call(R"({"command":"reboot"})");
    EXPECT_TRUE(reply.isError());
    EXPECT_EQ(reply.errorType(), "UnknownCommandError");
    EXPECT_EQ(reply.errorMessage(), "Unknown command: reboot");
  }

  TEST_F(DispatcherTest, handlePayload_MissingFieldIsAProtocolError) {
    const auto reply = call(R"({"command":"execute","hostname":"d1"})");
    EXPECT_EQ(reply.errorType(), "ProtocolError");
    EXPECT_THAT(reply.errorMessage(), HasSubstr("cmd"));
  }

  TEST_F(DispatcherTest, handlePayload_ExecuteRoundTrip) {
    const auto reply = call(R"({"command":"execute","hostname":"d2","cmd":"show version"})");
    EXPECT_FALSE(reply.isError());
    EXPECT_EQ(reply.body["result"], "d2: show version");

    EXPECT_EQ(call(R"({"command":"ping"})").body, "pong");
  }

} // namespace devbroker::test
