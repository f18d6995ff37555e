#pragma once
/** @file  Response.hpp
 *  @brief Broker reply payloads and their JSON wire codec.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>

// third-party
#include <nlohmann/json.hpp>

namespace devbroker {
  namespace protocols {

    /**
 * @struct Response
 * @brief Any JSON value the broker sends back.
 *
 *  Shapes: ping → "pong", connect → bool, disconnect → true, status → object,
 *  execute → {"status":"success","result":...}; any failure →
 *  {"status":"error","error_type":...,"message":...}.
 */
    struct Response {
      nlohmann::json body;

      static Response success(std::string output);
      static Response error(const std::string& errorType, const std::string& message);

      bool isError() const;
      /// `message` of an error reply, empty otherwise.
      std::string errorMessage() const;
      /// `error_type` of an error reply, empty otherwise.
      std::string errorType() const;

      std::string toWire() const { return body.dump(); }
      static std::optional<Response> fromWire(const std::string& payload);
    };

  } // namespace protocols
} // namespace devbroker
