/* @file Dispatcher.cpp
 * @brief execute / connect / disconnect / status / ping
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/CommandCache.hpp"
#include "core/ConnectionManager.hpp"
#include "core/Dispatcher.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "protocols/DeviceSession.hpp"
#include "protocols/Request.hpp"
#include "protocols/Response.hpp"

using namespace devbroker::core;
using devbroker::protocols::Request;
using devbroker::protocols::Response;

namespace {
  constexpr const char* kComponent = "Dispatcher";
}

Dispatcher::Dispatcher(CommandCache& cache, ConnectionManager& connections, Logger& logger,
                       std::string socketPath, ClientCountFn activeClients)
    : cache_(cache), connections_(connections), logger_(logger), socketPath_(std::move(socketPath)),
      activeClients_(std::move(activeClients)) {}

bool Dispatcher::connect(const std::string& hostname) { return *connect(hostname, true); }

std::optional<bool> Dispatcher::connect(const std::string& hostname, bool wait) {
  try {
    if (!(wait ? connections_.acquire(hostname) : connections_.tryAcquire(hostname)))
      return std::nullopt;
    return true;
  } catch (const ConnectionError& e) {
    logger_.warning(kComponent, "connect " + hostname + " failed: " + e.what());
    return false;
  }
}

std::string Dispatcher::execute(const std::string& hostname, const std::string& command) {
  return *execute(hostname, command, true);
}

std::optional<std::string> Dispatcher::execute(const std::string& hostname,
                                               const std::string& command, bool wait) {
  if (auto cached = cache_.get(hostname, command)) {
    logger_.debug(kComponent, "Broker cache hit for " + hostname + ": " + command);
    return *cached;
  }

  auto session = wait ? connections_.acquire(hostname) : connections_.tryAcquire(hostname);
  if (!session)
    return std::nullopt;
  logger_.debug(kComponent, "Broker cache miss for " + hostname + ": " + command);

  std::string output;
  try {
    output = session->run(command);
  } catch (const ExecutionError& e) {
    logger_.warning(kComponent, "transport failure on " + hostname + ", releasing: " + e.what());
    connections_.release(hostname, session);
    throw;
  } catch (const std::exception& e) {
    if (!connections_.healthCheck(*session)) {
      logger_.warning(kComponent, hostname + " unhealthy after failed command, releasing");
      connections_.release(hostname, session);
    }
    throw ExecutionError("[Dispatcher] '" + command + "' failed on " + hostname + ": " + e.what());
  }

  if (!connections_.cacheOutput(hostname, session, command, output))
    logger_.debug(kComponent, hostname + " released while '" + command + "' ran, not cached");
  return output;
}

bool Dispatcher::disconnect(const std::string& hostname) {
  connections_.release(hostname);
  return true;
}

nlohmann::json Dispatcher::status() const {
  nlohmann::json perDevice = nlohmann::json::object();
  const auto cachedDevices = cache_.devicesWithCache();
  for (const auto& hostname : cachedDevices) {
    const auto s = cache_.stats(hostname);
    perDevice[hostname] = { { "total", s.total }, { "valid", s.valid }, { "expired", s.expired } };
  }

  const auto conn = connections_.stats();
  nlohmann::json doc;
  doc["socket_path"] = socketPath_;
  doc["max_connections"] = connections_.maxConnections();
  doc["connected_devices"] = connections_.connectedDevices();
  doc["active_clients"] = activeClients_ ? activeClients_() : 0;
  doc["command_cache_stats"] = {
    { "devices_with_cache", cachedDevices },
    { "total_cached_commands", cache_.totalEntries() },
    { "per_device_stats", perDevice },
  };
  doc["connection_stats"] = {
    { "active_connections", conn.activeConnections },
    { "healthy_connections", conn.healthyConnections },
    { "available_slots", conn.availableSlots },
  };
  return doc;
}

nlohmann::json Dispatcher::handle(const Request& request) { return *route(request, true); }

std::optional<nlohmann::json> Dispatcher::route(const Request& request, bool wait) {
  using namespace devbroker::protocols;
  return std::visit(
      overloaded{
          [this](const PingRequest&) -> std::optional<nlohmann::json> { return ping(); },
          [this, wait](const ConnectRequest& r) -> std::optional<nlohmann::json> {
            if (auto ok = connect(r.hostname, wait))
              return *ok;
            return std::nullopt;
          },
          [this, wait](const ExecuteRequest& r) -> std::optional<nlohmann::json> {
            try {
              if (auto output = execute(r.hostname, r.command, wait))
                return Response::success(*output).body;
              return std::nullopt;
            } catch (const BrokerError& e) {
              return Response::error(e.kind(), e.what()).body;
            }
          },
          [this](const DisconnectRequest& r) -> std::optional<nlohmann::json> {
            return disconnect(r.hostname);
          },
          [this](const StatusRequest&) -> std::optional<nlohmann::json> { return status(); },
      },
      request.body);
}

std::string Dispatcher::handlePayload(const std::string& payload) {
  return *respond(payload, true);
}

std::optional<std::string> Dispatcher::tryHandlePayload(const std::string& payload) {
  return respond(payload, false);
}

std::optional<std::string> Dispatcher::respond(const std::string& payload, bool wait) {
  try {
    auto body = route(Request::fromWire(payload), wait);
    if (!body)
      return std::nullopt;
    return Response{ std::move(*body) }.toWire();
  } catch (const BrokerError& e) {
    logger_.warning(kComponent, std::string(e.kind()) + ": " + e.what());
    return Response::error(e.kind(), e.what()).toWire();
  } catch (const std::exception& e) {
    logger_.error(kComponent, std::string("request failed: ") + e.what());
    return Response::error("BrokerError", e.what()).toWire();
  }
}
