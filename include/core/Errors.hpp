#pragma once
/** @file  Errors.hpp
 *  @brief Exception taxonomy shared by the broker, its components and clients.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <stdexcept>
#include <string>

namespace devbroker {
  namespace core {

    /**
 * @class BrokerError
 * @brief Root of every error the broker turns into a structured IPC reply.
 *
 *  * `kind()` is the stable tag written to the wire as `error_type`.
 */
    class BrokerError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
      virtual const char* kind() const noexcept { return "BrokerError"; }
    };

    /// Malformed or undecodable message; the offending connection stays open.
    class ProtocolError : public BrokerError {
    public:
      using BrokerError::BrokerError;
      const char* kind() const noexcept override { return "ProtocolError"; }
    };

    /// Well-formed message carrying a `command` tag we do not know.
    class UnknownCommandError : public BrokerError {
    public:
      using BrokerError::BrokerError;
      const char* kind() const noexcept override { return "UnknownCommandError"; }
    };

    /// A device session could not be established.
    class ConnectionError : public BrokerError {
    public:
      enum class Reason : std::uint8_t { Authentication, Timeout, Refused, UnknownDevice, Unexpected };

      explicit ConnectionError(const std::string& message, Reason reason = Reason::Unexpected)
          : BrokerError(message), reason_(reason) {}

      const char* kind() const noexcept override { return "ConnectionError"; }
      Reason reason() const noexcept { return reason_; }

    private:
      Reason reason_;
    };

    /// The session died (transport failure) while a command was running.
    class ExecutionError : public BrokerError {
    public:
      using BrokerError::BrokerError;
      const char* kind() const noexcept override { return "ExecutionError"; }
    };

    inline const char* toString(ConnectionError::Reason r) {
      switch (r) {
      case ConnectionError::Reason::Authentication:
        return "Authentication failure";
      case ConnectionError::Reason::Timeout:
        return "Connection timeout";
      case ConnectionError::Reason::Refused:
        return "Connection failure";
      case ConnectionError::Reason::UnknownDevice:
        return "Unknown device";
      case ConnectionError::Reason::Unexpected:
      default:
        return "Unexpected error";
      }
    }

  } // namespace core
} // namespace devbroker
