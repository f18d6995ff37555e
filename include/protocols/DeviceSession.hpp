#pragma once
/** @file  DeviceSession.hpp
 *  @brief Abstract base class for every live device connection.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <string>

namespace devbroker::protocols {

  /**
 * @class DeviceSession
 * @brief Opaque handle to one connected device. The broker never assumes the
 *        wire protocol underneath; it only runs commands and checks liveness.
 *
 *  * Owned exclusively by ConnectionManager (shared with in-flight commands).
 *  * `close()` may be called from another thread while `run()` is blocked and
 *    must make that `run()` return promptly.
 */
  class DeviceSession {
  public:
    enum class State : std::uint8_t { Connecting, Connected, Unhealthy, Closed };

    virtual ~DeviceSession() = default;

    /**
     * @brief Execute one CLI command and return its raw output.
     *
     * @throws core::ExecutionError when the transport fails mid-command.
     */
    virtual std::string run(const std::string& command) = 0;

    /// Cheap liveness check; must not run a device command.
    virtual bool isHealthy() = 0;

    /// Tear the connection down. Idempotent.
    virtual void close() = 0;

    virtual State state() const = 0;
  };

  inline const char* toString(DeviceSession::State s) {
    switch (s) {
    case DeviceSession::State::Connecting:
      return "Connecting";
    case DeviceSession::State::Connected:
      return "Connected";
    case DeviceSession::State::Unhealthy:
      return "Unhealthy";
    case DeviceSession::State::Closed:
      return "Closed";
    default:
      return "Unknown";
    }
  }

} // namespace devbroker::protocols
