/* @file BrokerService.cpp
 * @brief broker lifecycle: wiring, start, run, bounded idempotent shutdown
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <stdexcept>

// devbroker headers
#include "core/BrokerService.hpp"
#include "core/CommandCache.hpp"
#include "core/ConnectionManager.hpp"
#include "core/Dispatcher.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/IpcListener.hpp"
#include "core/Logger.hpp"
#include "core/SessionFactory.hpp"
#include "core/WorkerPool.hpp"
#include "io/ProcessSession.hpp"

namespace devbroker {
  namespace core {

    namespace {
      constexpr const char* kComponent = "BrokerService";
      constexpr std::size_t kJobsPerWorker = 16;
    } // namespace

    const char* toString(BrokerService::State s) {
      switch (s) {
      case BrokerService::State::Stopped:
        return "Stopped";
      case BrokerService::State::Starting:
        return "Starting";
      case BrokerService::State::Running:
        return "Running";
      case BrokerService::State::Stopping:
        return "Stopping";
      default:
        return "Unknown";
      }
    }

    BrokerService::BrokerService(BrokerConfig config, Logger& logger)
        : config_(std::move(config)), logger_(logger),
          errorMonitor_(std::make_shared<ErrorMonitor>()) {}

    BrokerService::BrokerService(BrokerConfig config, DeviceInventory inventory,
                                 std::shared_ptr<SessionFactory> factory, Logger& logger)
        : config_(std::move(config)), logger_(logger), inventory_(std::move(inventory)),
          factory_(std::move(factory)), errorMonitor_(std::make_shared<ErrorMonitor>()) {}

    BrokerService::~BrokerService() { shutdown(); }

    void BrokerService::start() {
      std::lock_guard<std::mutex> lifecycle(lifecycleMtx_);
      if (state() != State::Stopped)
        throw std::logic_error("[BrokerService] start() while " + std::string(toString(state())));

      {
        std::lock_guard<std::mutex> lock(stateMtx_);
        stopRequested_ = false;
      }
      transitionTo(State::Starting);

      try {
        if (!inventory_) {
          if (config_.inventoryPath.empty())
            throw std::runtime_error("[BrokerService] no inventory_path configured");
          inventory_ = DeviceInventory::load(config_.inventoryPath);
          logger_.info(kComponent, "loaded " + std::to_string(inventory_->size()) +
                                       " devices from " + config_.inventoryPath);
        }
        if (config_.socketPath.empty())
          config_.socketPath = defaultSocketPath();
        if (!factory_) {
          factory_ = std::make_shared<SessionFactory>();
          io::registerProcessSessions(*factory_, config_.commandTimeout);
        }
        errorMonitor_->registerEscalation(
            [this](const std::string& message) { logger_.error("ErrorMonitor", message); });

        const std::size_t maxConn = config_.effectiveMaxConnections(inventory_->size());
        const std::size_t workers = config_.effectiveWorkerThreads(maxConn);

        cache_ = std::make_unique<CommandCache>(config_.cacheTtl);
        connections_ = std::make_unique<ConnectionManager>(*inventory_, *factory_, *cache_,
                                                           errorMonitor_, logger_, maxConn);
        pool_ = std::make_unique<WorkerPool>(workers, workers * kJobsPerWorker, logger_);
        dispatcher_ = std::make_unique<Dispatcher>(
            *cache_, *connections_, logger_, config_.socketPath,
            [this]() -> std::size_t { return listener_ ? listener_->activeClients() : 0; });
        listener_ = std::make_unique<IpcListener>(
            config_.socketPath, *pool_,
            [this](const std::string& payload) { return dispatcher_->tryHandlePayload(payload); },
            logger_, config_.maxFrameBytes);
        // a request parked on the connection limit is retried whenever a slot frees up
        connections_->setSlotReleasedHook([this] { listener_->resumeDeferred(); });

        listener_->bind();
        listener_->start();

        logger_.info(kComponent, "broker running at " + config_.socketPath +
                                     " (max_connections=" + std::to_string(maxConn) +
                                     ", workers=" + std::to_string(workers) +
                                     ", cache_ttl=" + std::to_string(config_.cacheTtl.count()) + "s)");
      } catch (const std::exception& e) {
        logger_.error(kComponent, std::string("startup failed: ") + e.what());
        teardown();
        transitionTo(State::Stopped);
        throw;
      }
      transitionTo(State::Running);
    }

    void BrokerService::run() {
      if (state() == State::Stopped)
        start();
      {
        std::unique_lock<std::mutex> lock(stateMtx_);
        stateCv_.wait(lock, [this] { return stopRequested_; });
      }
      shutdown();
    }

    void BrokerService::requestStop() {
      {
        std::lock_guard<std::mutex> lock(stateMtx_);
        stopRequested_ = true;
      }
      stateCv_.notify_all();
    }

    void BrokerService::shutdown() {
      std::lock_guard<std::mutex> lifecycle(lifecycleMtx_);
      if (state() != State::Running)
        return;

      transitionTo(State::Stopping);
      logger_.info(kComponent, "shutting down");
      teardown();
      transitionTo(State::Stopped);
      logger_.info(kComponent, "stopped");
    }

    BrokerService::State BrokerService::state() const {
      std::lock_guard<std::mutex> lock(stateMtx_);
      return currentState_;
    }

    nlohmann::json BrokerService::status() const {
      if (!dispatcher_)
        return { { "socket_path", config_.socketPath }, { "state", toString(state()) } };
      return dispatcher_->status();
    }

    std::size_t BrokerService::maxConnections() const {
      if (connections_)
        return connections_->maxConnections();
      return config_.effectiveMaxConnections(inventory_ ? inventory_->size() : 0);
    }

    CommandCache& BrokerService::cache() {
      if (!cache_)
        throw std::logic_error("[BrokerService] not running");
      return *cache_;
    }

    ConnectionManager& BrokerService::connections() {
      if (!connections_)
        throw std::logic_error("[BrokerService] not running");
      return *connections_;
    }

    Dispatcher& BrokerService::dispatcher() {
      if (!dispatcher_)
        throw std::logic_error("[BrokerService] not running");
      return *dispatcher_;
    }

    void BrokerService::transitionTo(State next) {
      {
        std::lock_guard<std::mutex> lock(stateMtx_);
        currentState_ = next;
      }
      stateCv_.notify_all();
      logger_.debug(kComponent, std::string("state -> ") + toString(next));
    }

    // Order: stop accepting + close clients, close sessions and cancel connects
    // in progress (wakes blocked acquirers), drain the pool, remove the socket file.
    void BrokerService::teardown() {
      const auto started = std::chrono::steady_clock::now();

      if (listener_)
        listener_->stop();
      if (connections_)
        connections_->shutdownAll();
      if (pool_)
        pool_->shutdown();
      if (connections_)
        connections_->setSlotReleasedHook({});
      if (listener_)
        listener_->close();

      pool_.reset();
      listener_.reset();
      dispatcher_.reset();
      connections_.reset();
      cache_.reset();

      const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);
      if (took > config_.shutdownTimeout)
        logger_.warning(kComponent, "shutdown took " + std::to_string(took.count()) +
                                        " ms (limit " +
                                        std::to_string(config_.shutdownTimeout.count()) + " ms)");
    }

  } // namespace core
} // namespace devbroker
