#pragma once
/** @file  ConnectAttempt.hpp
 *  @brief Cancellation handle for one session creation in progress.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace devbroker {
  namespace protocols {
    class DeviceSession;
  }

  namespace core {

    /**
 * @class ConnectAttempt
 * @brief Handed to session creators so shutdown can abort a slow connect.
 *
 *  * A creator either hands its half-open session to `track()` before it
 *    starts waiting on the device, or waits through `waitFor()`.
 *  * `cancel()` closes the tracked session and wakes `waitFor()`.
 */
    class ConnectAttempt {
    public:
      explicit ConnectAttempt(std::string hostname) : hostname_(std::move(hostname)) {}

      ConnectAttempt(const ConnectAttempt&) = delete;
      ConnectAttempt& operator=(const ConnectAttempt&) = delete;

      const std::string& hostname() const { return hostname_; }
      bool cancelled() const;

      /// Sleep up to \p duration; returns false if cancelled first.
      bool waitFor(std::chrono::milliseconds duration);

      /// Close \p session on cancel (at once if already cancelled).
      void track(std::shared_ptr<protocols::DeviceSession> session);

      /// Idempotent.
      void cancel();

    private:
      const std::string hostname_;
      mutable std::mutex mtx_;
      std::condition_variable cv_;
      bool cancelled_{ false };
      std::shared_ptr<protocols::DeviceSession> tracked_;
    };

  } // namespace core
} // namespace devbroker
