#pragma once
/** @file  Dispatcher.hpp
 *  @brief Broker operations composed from the cache and the session pool.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace devbroker {
  namespace protocols {
    struct Request;
  }

  namespace core {

    class CommandCache;
    class ConnectionManager;
    class Logger;

    /**
 * @class Dispatcher
 * @brief Stateless glue; every call may run concurrently on worker threads.
 *
 *  * `execute()` serves from cache when fresh, otherwise runs on the device
 *    and caches the output. Concurrent misses on the same command are not
 *    coalesced: both run, the last write wins.
 *  * A transport failure releases the device and is rethrown; nothing retries.
 *  * The `try*` entry points never wait for a connection slot: they return
 *    nullopt and the caller retries once a slot is released.
 */
    class Dispatcher {
    public:
      using ClientCountFn = std::function<std::size_t()>;

      Dispatcher(CommandCache& cache, ConnectionManager& connections, Logger& logger,
                 std::string socketPath, ClientCountFn activeClients = {});

      std::string ping() const { return "pong"; }

      /// True once a healthy session exists; a failed connect is logged and reported as false.
      bool connect(const std::string& hostname);

      /// Throws `ConnectionError` or `ExecutionError`.
      std::string execute(const std::string& hostname, const std::string& command);

      bool disconnect(const std::string& hostname);

      nlohmann::json status() const;

      /// Route one decoded request; broker errors become error replies.
      nlohmann::json handle(const protocols::Request& request);

      /// Decode → handle → encode. Never throws for bad input.
      std::string handlePayload(const std::string& payload);

      /// handlePayload() that returns nullopt instead of waiting for a slot.
      std::optional<std::string> tryHandlePayload(const std::string& payload);

    private:
      std::optional<bool> connect(const std::string& hostname, bool wait);
      std::optional<std::string> execute(const std::string& hostname, const std::string& command,
                                         bool wait);
      std::optional<nlohmann::json> route(const protocols::Request& request, bool wait);
      std::optional<std::string> respond(const std::string& payload, bool wait);

      CommandCache& cache_;
      ConnectionManager& connections_;
      Logger& logger_;
      const std::string socketPath_;
      ClientCountFn activeClients_;
    };

  } // namespace core
} // namespace devbroker
