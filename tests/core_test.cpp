// devbroker headers
#include "core/BrokerConfig.hpp"
#include "core/ConfigLoader.hpp"
#include "core/DeviceInventory.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include "core/WorkerPool.hpp"

// devbroker fakes
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// third-party
#include <nlohmann/json.hpp>

// STL headers
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

// Linux headers
#include <unistd.h>

namespace devbroker::test {

  using namespace devbroker::core;
  using namespace std::chrono_literals;
  using ::testing::HasSubstr;
  using json = nlohmann::json;

  namespace {

    std::string writeTempFile(const std::string& stem, const std::string& contents) {
      const auto path = ::testing::TempDir() + stem + "-" + std::to_string(::getpid());
      std::ofstream(path) << contents;
      return path;
    }

    std::string readFile(const std::string& path) {
      std::ifstream in(path);
      std::stringstream out;
      out << in.rdbuf();
      return out.str();
    }

    /// Sets an environment variable for the lifetime of the guard.
    class ScopedEnv {
    public:
      ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name))
          previous_ = old;
        if (value)
          ::setenv(name, value, 1);
        else
          ::unsetenv(name);
      }
      ~ScopedEnv() {
        if (previous_)
          ::setenv(name_, previous_->c_str(), 1);
        else
          ::unsetenv(name_);
      }

    private:
      const char* name_;
      std::optional<std::string> previous_;
    };

  } // namespace

  // ---- BrokerConfig -------------------------------------------------------

  TEST(BrokerConfigTest, defaultsWhenKeysAreAbsent) {
    const auto cfg = BrokerConfig::fromJson(json::object());
    EXPECT_EQ(cfg.maxConnections, 0u);
    EXPECT_EQ(cfg.cacheTtl, 3600s);
    EXPECT_EQ(cfg.shutdownTimeout, 5000ms);
    EXPECT_EQ(cfg.commandTimeout, 60000ms);
    EXPECT_EQ(cfg.maxFrameBytes, 16u * 1024u * 1024u);
    EXPECT_EQ(cfg.logLevel, LogLevel::Info);
    EXPECT_TRUE(cfg.logPath.empty());
  }

  TEST(BrokerConfigTest, readsEveryKey) {
    const auto cfg = BrokerConfig::fromJson(json{
        { "socket_path", "/run/devbroker.sock" },
        { "inventory_path", "/etc/devbroker/devices.json" },
        { "max_connections", 7 },
        { "cache_ttl_seconds", 120 },
        { "worker_threads", 3 },
        { "max_frame_bytes", 4096 },
        { "shutdown_timeout_ms", 250 },
        { "command_timeout_ms", 1500 },
        { "log_path", "/var/log/devbroker.log" },
        { "log_level", "DEBUG" },
    });
    EXPECT_EQ(cfg.socketPath, "/run/devbroker.sock");
    EXPECT_EQ(cfg.inventoryPath, "/etc/devbroker/devices.json");
    EXPECT_EQ(cfg.maxConnections, 7u);
    EXPECT_EQ(cfg.cacheTtl, 120s);
    EXPECT_EQ(cfg.workerThreads, 3u);
    EXPECT_EQ(cfg.maxFrameBytes, 4096u);
    EXPECT_EQ(cfg.shutdownTimeout, 250ms);
    EXPECT_EQ(cfg.commandTimeout, 1500ms);
    EXPECT_EQ(cfg.logPath, "/var/log/devbroker.log");
    EXPECT_EQ(cfg.logLevel, LogLevel::Debug);
  }

  TEST(BrokerConfigTest, rejectsBadValues) {
    EXPECT_THROW(BrokerConfig::fromJson(json::array()), std::runtime_error);
    EXPECT_THROW(BrokerConfig::fromJson(json{ { "max_connections", -1 } }), std::runtime_error);
    EXPECT_THROW(BrokerConfig::fromJson(json{ { "max_connections", "ten" } }), std::runtime_error);
    EXPECT_THROW(BrokerConfig::fromJson(json{ { "socket_path", 5 } }), std::runtime_error);
    EXPECT_THROW(BrokerConfig::fromJson(json{ { "log_level", "verbose" } }), std::runtime_error);
    EXPECT_THROW(BrokerConfig::fromJson(json{ { "max_frame_bytes", 4 } }), std::runtime_error);
  }

  TEST(BrokerConfigTest, derivesConnectionLimitFromInventorySize) {
    BrokerConfig cfg;
    EXPECT_EQ(cfg.effectiveMaxConnections(0), 1u);
    EXPECT_EQ(cfg.effectiveMaxConnections(3), 6u);
    EXPECT_EQ(cfg.effectiveMaxConnections(25), 50u);
    EXPECT_EQ(cfg.effectiveMaxConnections(400), 50u);
    EXPECT_EQ(cfg.effectiveWorkerThreads(6), 10u);

    cfg.maxConnections = 2;
    cfg.workerThreads = 1;
    EXPECT_EQ(cfg.effectiveMaxConnections(400), 2u);
    EXPECT_EQ(cfg.effectiveWorkerThreads(2), 1u);
  }

  TEST(BrokerConfigTest, defaultSocketPathPrefersEnvironment) {
    {
      ScopedEnv socket(kSocketEnvVar, "/tmp/explicit.sock");
      EXPECT_EQ(defaultSocketPath(), "/tmp/explicit.sock");
    }
    ScopedEnv socket(kSocketEnvVar, nullptr);
    ScopedEnv tmp("TMPDIR", "/var/tmp/");
    EXPECT_EQ(defaultSocketPath(), "/var/tmp/devbroker-" + std::to_string(::getpid()) + ".sock");
  }

  // ---- ConfigLoader -------------------------------------------------------

  TEST(ConfigLoaderTest, loadsJsonAndReportsBadFiles) {
    const auto good = writeTempFile("config-good.json", R"({"max_connections": 4})");
    EXPECT_EQ(ConfigLoader(good).load()["max_connections"], 4);

    const auto bad = writeTempFile("config-bad.json", "{ max_connections: ");
    try {
      ConfigLoader(bad).load();
      FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
      EXPECT_THAT(e.what(), HasSubstr("not valid JSON"));
    }

    EXPECT_THROW(ConfigLoader("/nonexistent/devbroker.json").load(), std::runtime_error);
    ::unlink(good.c_str());
    ::unlink(bad.c_str());
  }

  // ---- DeviceInventory ----------------------------------------------------

  TEST(DeviceInventoryTest, parsesArrayForm) {
    const auto inv = DeviceInventory::fromJson(json::parse(R"({
      "devices": [
        {"hostname": "core1", "host": "192.0.2.1", "port": 830, "username": "admin",
         "password": "secret", "platform": "iosxe", "timeout": 30},
        {"hostname": "sim1", "command": "python3 mock_device.py", "os": "nxos", "prompt": "sim1>"}
      ]})"));

    ASSERT_EQ(inv.size(), 2u);
    const auto* core1 = inv.find("core1");
    ASSERT_NE(core1, nullptr);
    EXPECT_EQ(core1->host, "192.0.2.1");
    EXPECT_EQ(core1->port, 830);
    EXPECT_EQ(core1->password, "secret");
    EXPECT_EQ(core1->platform, "iosxe");
    EXPECT_EQ(core1->connectTimeout, 30s);
    EXPECT_EQ(core1->effectivePrompt(), "core1#");

    const auto* sim1 = inv.find("sim1");
    ASSERT_NE(sim1, nullptr);
    EXPECT_EQ(sim1->command, "python3 mock_device.py");
    EXPECT_EQ(sim1->platform, "nxos");
    EXPECT_EQ(sim1->port, 22);
    EXPECT_EQ(sim1->effectivePrompt(), "sim1>");

    EXPECT_EQ(inv.find("nope"), nullptr);
    EXPECT_EQ(inv.hostnames(), (std::vector<std::string>{ "core1", "sim1" }));
  }

  TEST(DeviceInventoryTest, parsesKeyedFormAndResolvesEnvCredentials) {
    ScopedEnv user("DEVBROKER_TEST_USER", "netops");
    ScopedEnv pass("DEVBROKER_TEST_PASS", "hunter2");

    const auto inv = DeviceInventory::fromJson(json::parse(R"({
      "devices": {
        "edge1": {"host": "198.51.100.4",
                  "username": {"env": "DEVBROKER_TEST_USER"},
                  "password": {"env": "DEVBROKER_TEST_PASS"}}
      }})"));

    const auto* edge1 = inv.find("edge1");
    ASSERT_NE(edge1, nullptr);
    EXPECT_EQ(edge1->username, "netops");
    EXPECT_EQ(edge1->password, "hunter2");
  }

  TEST(DeviceInventoryTest, rejectsInvalidDocuments) {
    ScopedEnv unset("DEVBROKER_TEST_UNSET", nullptr);

    EXPECT_THROW(DeviceInventory::fromJson(json::object()), std::runtime_error);
    EXPECT_THROW(DeviceInventory::fromJson(json{ { "devices", 3 } }), std::runtime_error);
    EXPECT_THROW(DeviceInventory::fromJson(json::parse(R"({"devices": [{"host": "10.0.0.1"}]})")),
                 std::runtime_error);
    EXPECT_THROW(DeviceInventory::fromJson(json::parse(R"({"devices": [{"hostname": "a"}]})")),
                 std::runtime_error);
    EXPECT_THROW(DeviceInventory::fromJson(json::parse(
                     R"({"devices": [{"hostname": "a", "host": "x"}, {"hostname": "a", "host": "y"}]})")),
                 std::runtime_error);
    EXPECT_THROW(DeviceInventory::fromJson(json::parse(
                     R"({"devices": [{"hostname": "a", "host": "x", "port": 70000}]})")),
                 std::runtime_error);
    EXPECT_THROW(DeviceInventory::fromJson(json::parse(
                     R"({"devices": [{"hostname": "a", "host": "x", "password": {"env": "DEVBROKER_TEST_UNSET"}}]})")),
                 std::runtime_error);
  }

  TEST(DeviceInventoryTest, oversizedIntegersAreRejectedNotWrapped) {
    // 2^32 + 1 narrows to 1 as a 32-bit int
    EXPECT_THROW(DeviceInventory::fromJson(json::parse(
                     R"({"devices": [{"hostname": "a", "host": "x", "port": 4294967297}]})")),
                 std::runtime_error);
    EXPECT_THROW(DeviceInventory::fromJson(json::parse(
                     R"({"devices": [{"hostname": "a", "host": "x", "timeout": 4294967297}]})")),
                 std::runtime_error);
    EXPECT_THROW(DeviceInventory::fromJson(json::parse(
                     R"({"devices": [{"hostname": "a", "host": "x", "port": 18446744073709551615}]})")),
                 std::runtime_error);
    EXPECT_THROW(DeviceInventory::fromJson(json::parse(
                     R"({"devices": [{"hostname": "a", "host": "x", "timeout": -5}]})")),
                 std::runtime_error);

    const auto inv = DeviceInventory::fromJson(json::parse(
        R"({"devices": [{"hostname": "a", "host": "x", "port": 65535, "timeout": 86400}]})"));
    EXPECT_EQ(inv.find("a")->port, 65535);
    EXPECT_EQ(inv.find("a")->connectTimeout, std::chrono::seconds(86400));
  }

  TEST(DeviceInventoryTest, constructorRejectsDuplicates) {
    DeviceDescriptor a;
    a.hostname = "dup";
    DeviceDescriptor b = a;
    EXPECT_THROW(DeviceInventory({ a, b }), std::invalid_argument);
  }

  TEST(DeviceInventoryTest, loadReadsFromDisk) {
    const auto path = writeTempFile("inventory.json",
                                    R"({"devices": [{"hostname": "d1", "host": "10.1.1.1"}]})");
    const auto inv = DeviceInventory::load(path);
    EXPECT_EQ(inv.size(), 1u);
    EXPECT_NE(inv.find("d1"), nullptr);
    ::unlink(path.c_str());
  }

  // ---- ErrorMonitor -------------------------------------------------------

  TEST(ErrorMonitorTest, escalatesEachUniqueFailureOnce) {
    ErrorMonitor monitor;
    std::vector<std::string> escalated;
    monitor.registerEscalation([&](const std::string& msg) { escalated.push_back(msg); });

    monitor.notifyFailure("d1 refused");
    monitor.notifyFailure("d1 refused");
    monitor.notifyFailure("d2 timed out");

    EXPECT_EQ(escalated, (std::vector<std::string>{ "d1 refused", "d2 timed out" }));
    EXPECT_EQ(monitor.failureCount(), 3u);
    EXPECT_EQ(monitor.uniqueFailures().size(), 2u);
  }

  TEST(ErrorMonitorTest, forgetsOldestFailureBeyondCapacity) {
    ErrorMonitor monitor(2);
    int escalations = 0;
    monitor.registerEscalation([&](const std::string&) { ++escalations; });

    monitor.notifyFailure("a");
    monitor.notifyFailure("b");
    monitor.notifyFailure("c"); // evicts "a"
    EXPECT_EQ(monitor.uniqueFailures(), (std::vector<std::string>{ "b", "c" }));

    monitor.notifyFailure("c");
    EXPECT_EQ(escalations, 3);
    monitor.notifyFailure("a");
    EXPECT_EQ(escalations, 4);
    EXPECT_EQ(monitor.uniqueFailures().size(), 2u);
  }

  TEST(ErrorMonitorTest, mockCapturesNotifications) {
    MockErrorMonitor monitor;
    EXPECT_CALL(monitor, notifyFailure("boom")).Times(1);

    ErrorMonitor& base = monitor;
    base.notifyFailure("boom");
  }

  // ---- Logger -------------------------------------------------------------

  TEST(LoggerTest, writesFormattedLinesAboveMinimumLevel) {
    const auto path = ::testing::TempDir() + "logger-" + std::to_string(::getpid()) + ".log";
    ::unlink(path.c_str());

    Logger logger(LogLevel::Info);
    logger.start(path);
    logger.debug("Dispatcher", "Broker cache hit for d1: show version");
    logger.info("ConnectionManager", "connected to d1");
    logger.error("ErrorMonitor", "Connection failure for device 'd2'");
    logger.finish();
    logger.finish(); // idempotent

    const auto contents = readFile(path);
    EXPECT_THAT(contents, HasSubstr("[INFO] [ConnectionManager] connected to d1\n"));
    EXPECT_THAT(contents, HasSubstr("[ERROR] [ErrorMonitor] Connection failure for device 'd2'\n"));
    EXPECT_THAT(contents, ::testing::Not(HasSubstr("cache hit")));
    ::unlink(path.c_str());
  }

  TEST(LoggerTest, formatUsesUtcTimestamp) {
    LogEvent event;
    event.time = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
    event.level = LogLevel::Warning;
    event.component = "WorkerPool";
    event.message = "job failed";

    EXPECT_EQ(Logger::format(event), "2023-11-14T22:13:20.123Z [WARNING] [WorkerPool] job failed");
  }

  TEST(LoggerTest, countsDropsWhenBufferIsFull) {
    Logger logger(LogLevel::Debug, 2);
    logger.info("t", "1");
    logger.info("t", "2");
    logger.info("t", "3");
    EXPECT_EQ(logger.dropped(), 1u);
  }

  TEST(LoggerTest, parsesLevelNames) {
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("Error"), LogLevel::Error);
    EXPECT_FALSE(parseLogLevel("loud"));
  }

  TEST(LoggerTest, startThrowsOnUnwritablePath) {
    Logger logger;
    EXPECT_THROW(logger.start("/nonexistent-dir/devbroker.log"), std::runtime_error);
  }

  // ---- RingBuffer ---------------------------------------------------------

  TEST(RingBufferTest, fifoWithinCapacity) {
    RingBuffer<int> rb(2);
    EXPECT_TRUE(rb.tryPush(1));
    EXPECT_TRUE(rb.tryPush(2));
    EXPECT_FALSE(rb.tryPush(3));
    EXPECT_EQ(rb.popFor(0ms), 1);
    EXPECT_EQ(rb.popFor(0ms), 2);
    EXPECT_FALSE(rb.popFor(10ms));
  }

  // ---- WorkerPool ---------------------------------------------------------

  TEST(WorkerPoolTest, runsEveryJobAndDrainsOnShutdown) {
    Logger logger(LogLevel::Error);
    WorkerPool pool(4, 8, logger);
    std::atomic<int> done{ 0 };

    for (int i = 0; i < 100; ++i)
      ASSERT_TRUE(pool.submit([&done] {
        std::this_thread::sleep_for(1ms);
        ++done;
      }));
    pool.shutdown();

    EXPECT_EQ(done.load(), 100);
    EXPECT_EQ(pool.threadCount(), 4u);
    EXPECT_FALSE(pool.submit([] {}));
    pool.shutdown(); // idempotent
  }

  TEST(WorkerPoolTest, submitForGivesUpWhileTheQueueStaysFull) {
    Logger logger(LogLevel::Error);
    WorkerPool pool(1, 1, logger);
    std::atomic<bool> release{ false };

    ASSERT_TRUE(pool.submit([&release] {
      while (!release)
        std::this_thread::sleep_for(1ms);
    }));
    // wait for the worker to take the blocker so the queue slot is free again
    while (pool.queued() != 0)
      std::this_thread::sleep_for(1ms);
    ASSERT_TRUE(pool.submit([] {}));

    EXPECT_EQ(pool.submitFor([] {}, 50ms), WorkerPool::SubmitResult::QueueFull);

    release = true;
    EXPECT_EQ(pool.submitFor([] {}, 2s), WorkerPool::SubmitResult::Accepted);
    pool.shutdown();
    EXPECT_EQ(pool.submitFor([] {}, 50ms), WorkerPool::SubmitResult::Stopped);
  }

  TEST(WorkerPoolTest, throwingJobDoesNotKillTheWorker) {
    Logger logger(LogLevel::Error);
    WorkerPool pool(1, 4, logger);
    std::atomic<bool> ranAfter{ false };

    ASSERT_TRUE(pool.submit([] { throw std::runtime_error("device exploded"); }));
    ASSERT_TRUE(pool.submit([&ranAfter] { ranAfter = true; }));
    pool.shutdown();

    EXPECT_TRUE(ranAfter.load());
  }

} // namespace devbroker::test
