#pragma once
/** @file  BrokerClient.hpp
 *  @brief Synchronous client for the broker's local socket.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "protocols/Framing.hpp"

namespace devbroker {
  namespace io {
    class StreamSocket;
  }
  namespace protocols {
    struct Request;
  }

  namespace client {

    /**
 * @class BrokerClient
 * @brief One persistent connection, one request in flight at a time.
 *
 *  * Connects lazily on the first call; a broken connection is dropped and
 *    re-established on the next call.
 *  * Broker-side failures come back as `core::BrokerError` subclasses
 *    (ExecutionError, ConnectionError, ...); transport failures as
 *    `std::runtime_error`.
 */
    class BrokerClient {
    public:
      /// Empty \p socketPath = `$DEVBROKER_SOCKET`; throws `std::runtime_error` if neither is set.
      explicit BrokerClient(std::string socketPath = {},
                            std::chrono::milliseconds timeout = std::chrono::minutes(5),
                            std::size_t maxFrameBytes = protocols::kDefaultMaxFrameBytes);
      ~BrokerClient();

      BrokerClient(const BrokerClient&) = delete;
      BrokerClient& operator=(const BrokerClient&) = delete;

      bool ping();
      bool connect(const std::string& hostname);
      std::string execute(const std::string& hostname, const std::string& command);
      bool disconnect(const std::string& hostname);
      nlohmann::json status();

      /// Send one request and return the raw reply body (error bodies included).
      nlohmann::json call(const protocols::Request& request);

      void close();
      const std::string& socketPath() const { return socketPath_; }

    private:
      nlohmann::json roundTrip(const std::string& payload);
      nlohmann::json checked(const protocols::Request& request);

      std::string socketPath_;
      std::chrono::milliseconds timeout_;
      std::size_t maxFrameBytes_;
      std::unique_ptr<io::StreamSocket> socket_;
      std::mutex mtx_;
    };

  } // namespace client
} // namespace devbroker
