#pragma once
/** @file  Request.hpp
 *  @brief Closed set of client requests with JSON wire codec.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>
#include <variant>

namespace devbroker {
  namespace protocols {

    /// Visitor helper: `std::visit(overloaded{ [](const PingRequest&) {...}, ... }, req.body)`.
    template <class... Ts> struct overloaded : Ts... {
      using Ts::operator()...;
    };
    template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    struct PingRequest {};

    struct ConnectRequest {
      std::string hostname;
    };

    struct ExecuteRequest {
      std::string hostname;
      std::string command;
    };

    struct DisconnectRequest {
      std::string hostname;
    };

    struct StatusRequest {};

    /**
 * @struct Request
 * @brief One decoded client message.
 *
 *  Wire payload: `{"command": "<tag>", ...fields}` with tags ping, connect,
 *  execute (`hostname`, `cmd`), disconnect and status.
 */
    struct Request {
      using Body = std::variant<PingRequest, ConnectRequest, ExecuteRequest, DisconnectRequest,
                                StatusRequest>;
      Body body;

      /// Wire tag of the held alternative.
      const char* name() const;

      std::string toWire() const;

      /**
       * Throws `core::ProtocolError` for undecodable JSON or missing/ill-typed
       * fields and `core::UnknownCommandError` for an unrecognized tag.
       */
      static Request fromWire(const std::string& payload);
    };

  } // namespace protocols
} // namespace devbroker
