/* @file BrokerConfig.cpp
 * @brief schema checks for the broker config document
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

// Linux headers
#include <unistd.h>

// third-party
#include <nlohmann/json.hpp>

// devbroker headers
#include "core/BrokerConfig.hpp"

namespace devbroker::core {

  namespace {

    std::size_t readCount(const nlohmann::json& doc, const char* key, std::size_t fallback) {
      if (!doc.contains(key))
        return fallback;
      const auto& value = doc.at(key);
      if (!value.is_number_integer() || value.get<long long>() < 0)
        throw std::runtime_error(std::string("[BrokerConfig] '") + key +
                                 "' must be a non-negative integer");
      return value.get<std::size_t>();
    }

    std::string readString(const nlohmann::json& doc, const char* key) {
      if (!doc.contains(key) || doc.at(key).is_null())
        return {};
      if (!doc.at(key).is_string())
        throw std::runtime_error(std::string("[BrokerConfig] '") + key + "' must be a string");
      return doc.at(key).get<std::string>();
    }

  } // namespace

  BrokerConfig BrokerConfig::fromJson(const nlohmann::json& doc) {
    if (!doc.is_object())
      throw std::runtime_error("[BrokerConfig] config root must be a JSON object");

    BrokerConfig cfg;
    cfg.socketPath = readString(doc, "socket_path");
    cfg.inventoryPath = readString(doc, "inventory_path");
    cfg.maxConnections = readCount(doc, "max_connections", cfg.maxConnections);
    cfg.cacheTtl = std::chrono::seconds(
        readCount(doc, "cache_ttl_seconds", static_cast<std::size_t>(cfg.cacheTtl.count())));
    cfg.workerThreads = readCount(doc, "worker_threads", cfg.workerThreads);
    cfg.maxFrameBytes = readCount(doc, "max_frame_bytes", cfg.maxFrameBytes);
    cfg.shutdownTimeout = std::chrono::milliseconds(readCount(
        doc, "shutdown_timeout_ms", static_cast<std::size_t>(cfg.shutdownTimeout.count())));
    cfg.commandTimeout = std::chrono::milliseconds(readCount(
        doc, "command_timeout_ms", static_cast<std::size_t>(cfg.commandTimeout.count())));
    cfg.logPath = readString(doc, "log_path");

    if (const auto level = readString(doc, "log_level"); !level.empty()) {
      const auto parsed = parseLogLevel(level);
      if (!parsed)
        throw std::runtime_error("[BrokerConfig] unknown log_level: " + level);
      cfg.logLevel = *parsed;
    }

    if (cfg.maxFrameBytes < 16)
      throw std::runtime_error("[BrokerConfig] 'max_frame_bytes' is too small");
    return cfg;
  }

  std::size_t BrokerConfig::effectiveMaxConnections(std::size_t deviceCount) const {
    if (maxConnections > 0)
      return maxConnections;
    return std::max<std::size_t>(1, std::min(kMaxDerivedConnections, 2 * deviceCount));
  }

  std::size_t BrokerConfig::effectiveWorkerThreads(std::size_t maxConnections) const {
    if (workerThreads > 0)
      return workerThreads;
    return maxConnections + 4;
  }

  std::string defaultSocketPath() {
    if (const char* env = std::getenv(kSocketEnvVar); env != nullptr && *env != '\0')
      return env;
    const char* tmp = std::getenv("TMPDIR");
    std::string dir = (tmp != nullptr && *tmp != '\0') ? tmp : "/tmp";
    if (dir.back() == '/')
      dir.pop_back();
    return dir + "/devbroker-" + std::to_string(::getpid()) + ".sock";
  }

} // namespace devbroker::core
