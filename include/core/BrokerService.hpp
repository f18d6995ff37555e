#pragma once

/** @file  BrokerService.hpp
 *  @brief Public API for devbroker::core::BrokerService.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/BrokerConfig.hpp"
#include "core/DeviceInventory.hpp"

namespace devbroker {
  namespace core {

    class CommandCache;
    class ConnectionManager;
    class Dispatcher;
    class ErrorMonitor;
    class IpcListener;
    class Logger;
    class SessionFactory;
    class WorkerPool;

    /**
 * @class BrokerService
 * @brief Owns every broker component; nothing is process-global, so several
 *        brokers can live in one process (tests do this).
 *
 *  Stopped → Starting → Running → Stopping → Stopped.
 */
    class BrokerService {

    public:
      enum class State { Stopped, Starting, Running, Stopping };

      /// Inventory is read from `config.inventoryPath` at start().
      BrokerService(BrokerConfig config, Logger& logger);

      /// Inventory and session factory supplied by the caller (null factory = built-in backends).
      BrokerService(BrokerConfig config, DeviceInventory inventory,
                    std::shared_ptr<SessionFactory> factory, Logger& logger);

      ~BrokerService(); ///< shutdown()

      BrokerService(const BrokerService&) = delete;
      BrokerService& operator=(const BrokerService&) = delete;

      // ---- lifecycle --------------------------------------------------------
      void start();       ///< load inventory, bind listener, spawn loop; throws on failure
      void run();         ///< start() if needed, block until requestStop(), then shutdown()
      void requestStop(); ///< thread-safe; wakes run()
      void shutdown();    ///< stop accepting, close clients, close sessions, remove socket; idempotent

      State state() const;
      nlohmann::json status() const;
      const std::string& socketPath() const { return config_.socketPath; }
      std::size_t maxConnections() const;

      // ---- component access (valid while running) ---------------------------
      CommandCache& cache();
      ConnectionManager& connections();
      Dispatcher& dispatcher();
      const ErrorMonitor& errorMonitor() const { return *errorMonitor_; }

    private:
      void transitionTo(State next);
      void teardown();

      BrokerConfig config_;
      Logger& logger_;
      std::optional<DeviceInventory> inventory_;
      std::shared_ptr<SessionFactory> factory_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;

      // declaration order = reverse teardown order; the pool must die first
      std::unique_ptr<CommandCache> cache_;
      std::unique_ptr<ConnectionManager> connections_;
      std::unique_ptr<Dispatcher> dispatcher_;
      std::unique_ptr<IpcListener> listener_;
      std::unique_ptr<WorkerPool> pool_;

      std::mutex lifecycleMtx_;
      mutable std::mutex stateMtx_;
      std::condition_variable stateCv_;
      State currentState_{ State::Stopped };
      bool stopRequested_{ false };
    };

    const char* toString(BrokerService::State s);

  } // namespace core
} // namespace devbroker
