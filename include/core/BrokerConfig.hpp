#pragma once
/** @file  BrokerConfig.hpp
 *  @brief Validated broker settings built from the JSON config document.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/Logger.hpp"

namespace devbroker::core {

  /// Environment variable clients read to find the broker socket.
  inline constexpr const char* kSocketEnvVar = "DEVBROKER_SOCKET";

  /// Upper bound for the derived connection limit.
  inline constexpr std::size_t kMaxDerivedConnections = 50;

  /**
 * @struct BrokerConfig
 * @brief Every tunable of one broker instance.
 *
 *  Zero for `maxConnections` / `workerThreads` means "derive from the inventory".
 */
  struct BrokerConfig {
    std::string socketPath;
    std::string inventoryPath;
    std::size_t maxConnections{ 0 };
    std::chrono::seconds cacheTtl{ 3600 };
    std::size_t workerThreads{ 0 };
    std::size_t maxFrameBytes{ 16u * 1024u * 1024u };
    std::chrono::milliseconds shutdownTimeout{ 5000 };
    std::chrono::milliseconds commandTimeout{ 60000 };
    std::string logPath;
    LogLevel logLevel{ LogLevel::Info };

    /// Validate \p doc (unknown keys are ignored); throws `std::runtime_error`.
    static BrokerConfig fromJson(const nlohmann::json& doc);

    /// `min(50, 2 x deviceCount)` unless configured, never below 1.
    std::size_t effectiveMaxConnections(std::size_t deviceCount) const;

    /// Enough workers for every session slot to be busy while control requests still run.
    std::size_t effectiveWorkerThreads(std::size_t maxConnections) const;
  };

  /// `$DEVBROKER_SOCKET` if set, else `$TMPDIR/devbroker-<pid>.sock` (TMPDIR defaults to /tmp).
  std::string defaultSocketPath();

} // namespace devbroker::core
