#pragma once
/** @file  ConnectionManager.hpp
 *  @brief Bounded pool of live device sessions.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// devbroker headers
#include "core/Errors.hpp"
#include "core/ErrorMonitor.hpp" // ConnectionManager reports failed connects to the error monitor

namespace devbroker {
  namespace protocols {
    class DeviceSession;
  }

  namespace core {

    class CommandCache;
    class ConnectAttempt;
    class DeviceInventory;
    class Logger;
    class SessionFactory;
    struct DeviceDescriptor;

    /// Multi-line, categorized explanation of a failed connect (host, platform, hints).
    std::string describeConnectionFailure(const DeviceDescriptor& device,
                                          ConnectionError::Reason reason,
                                          const std::string& detail);

    /**
 * @class ConnectionManager
 * @brief Sole owner of the session table.
 *
 *  * At most one session per hostname; creation is serialized per hostname.
 *  * A global counter caps live sessions at `maxConnections()`; `acquire()`
 *    blocks (backpressure) while it is saturated, `tryAcquire()` returns
 *    nullptr instead so the caller can retry after the slot-released hook.
 *  * `shutdownAll()` also cancels session creations still in progress.
 *  * Tearing a session down also clears that device's cached output.
 *  * Never retries: failures surface to the caller.
 */
    class ConnectionManager {
    public:
      struct Stats {
        std::size_t maxConnections{ 0 };
        std::size_t activeConnections{ 0 };
        std::size_t healthyConnections{ 0 };
        std::size_t availableSlots{ 0 };
      };

      ConnectionManager(const DeviceInventory& inventory, const SessionFactory& factory,
                        CommandCache& cache, std::shared_ptr<ErrorMonitor> errorMonitor,
                        Logger& logger, std::size_t maxConnections);
      ~ConnectionManager(); ///< shutdownAll()

      ConnectionManager(const ConnectionManager&) = delete;
      ConnectionManager& operator=(const ConnectionManager&) = delete;

      //---public APIs------------------------------------------------------
      /**
       * @brief Healthy session for \p hostname, creating one if needed.
       *
       * May block on the global bound. Throws `ConnectionError` when the
       * device is unknown, the factory fails, or the manager is shutting down.
       */
      std::shared_ptr<protocols::DeviceSession> acquire(const std::string& hostname);

      /// As acquire(), but returns nullptr instead of waiting for a free slot.
      std::shared_ptr<protocols::DeviceSession> tryAcquire(const std::string& hostname);

      /// Liveness check; a throwing check counts as unhealthy.
      bool healthCheck(protocols::DeviceSession& session) const;

      /// Tear down \p hostname's session (if any), free its slot, clear its cache.
      void release(const std::string& hostname);

      /// release() only while \p session is still the one stored for \p hostname.
      /// Returns false when it was already replaced or released.
      bool release(const std::string& hostname,
                   const std::shared_ptr<protocols::DeviceSession>& session);

      /// Cache \p output unless \p session was released since it ran the command.
      bool cacheOutput(const std::string& hostname,
                       const std::shared_ptr<protocols::DeviceSession>& session,
                       const std::string& command, const std::string& output);

      /// Called (outside any lock) whenever a slot is given back. Set before use.
      void setSlotReleasedHook(std::function<void()> hook) { slotReleasedHook_ = std::move(hook); }

      /// Tear down everything and refuse further acquisitions. Idempotent.
      void shutdownAll();

      bool isConnected(const std::string& hostname) const;
      std::vector<std::string> connectedDevices() const; ///< sorted
      std::size_t liveSessions() const;
      std::size_t maxConnections() const { return maxConnections_; }
      Stats stats() const;

    private:
      std::shared_ptr<protocols::DeviceSession> findSession(const std::string& hostname) const;
      std::shared_ptr<protocols::DeviceSession> acquireSession(const std::string& hostname,
                                                               bool wait);
      std::shared_ptr<protocols::DeviceSession> createSession(const DeviceDescriptor& device);
      std::mutex& creationLock(const std::string& hostname);
      bool acquireSlot(const std::string& hostname, bool wait);
      void releaseSlot();
      void dropSession(const std::string& hostname,
                       std::shared_ptr<protocols::DeviceSession> session);
      void closeQuietly(const std::string& hostname, protocols::DeviceSession& session) const;
      [[noreturn]] void failConnect(const DeviceDescriptor& device, ConnectionError::Reason reason,
                                    const std::string& detail);

      const DeviceInventory& inventory_;
      const SessionFactory& factory_;
      CommandCache& cache_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      Logger& logger_;
      const std::size_t maxConnections_;

      mutable std::mutex tableMtx_; ///< guards sessions_, creationLocks_ and attempts_
      std::unordered_map<std::string, std::shared_ptr<protocols::DeviceSession>> sessions_;
      std::unordered_map<std::string, std::unique_ptr<std::mutex>> creationLocks_;
      std::vector<std::shared_ptr<ConnectAttempt>> attempts_; ///< creations in progress
      std::function<void()> slotReleasedHook_;

      mutable std::mutex slotMtx_;
      std::condition_variable slotCv_;
      std::size_t slotsInUse_{ 0 };
      std::atomic<bool> shuttingDown_{ false };
    };

  } // namespace core
} // namespace devbroker
