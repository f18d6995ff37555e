#pragma once
/** @file  CommandCache.hpp
 *  @brief Per-device command output cache with TTL freshness.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace devbroker::core {

  /**
 * @class CommandCache
 * @brief Lock-protected map of <hostname → <command → (output, createdAt)>>.
 *
 *  * Keys are exact strings; "show version" and "show  version" differ.
 *  * Expiry is lazy: a stale entry is only dropped when `get()` touches it,
 *    so `stats()` keeps counting it in `total` until then.
 *  * The clock is injectable so tests can move time by hand.
 */
  class CommandCache {
  public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    struct Stats {
      std::size_t total{ 0 };
      std::size_t valid{ 0 };
      std::size_t expired{ 0 };
    };

    static constexpr std::chrono::seconds kDefaultTtl{ 3600 };

    explicit CommandCache(std::chrono::seconds ttl = kDefaultTtl, NowFn now = &Clock::now);

    /// Cached output if present and younger than the TTL; a stale entry is removed.
    std::optional<std::string> get(const std::string& hostname, const std::string& command);

    /// Insert or overwrite with the current timestamp.
    void set(const std::string& hostname, const std::string& command, std::string output);

    /// Drop every entry of \p hostname.
    void clear(const std::string& hostname);

    Stats stats(const std::string& hostname) const;

    /// Hostnames holding at least one entry (fresh or not), sorted.
    std::vector<std::string> devicesWithCache() const;

    /// Entries across all devices, stale-but-unread ones included.
    std::size_t totalEntries() const;

    std::chrono::seconds ttl() const { return ttl_; }

  private:
    struct Entry {
      std::string output;
      Clock::time_point createdAt;
    };

    bool isFresh(const Entry& e, Clock::time_point now) const { return now - e.createdAt < ttl_; }

    const std::chrono::seconds ttl_;
    NowFn now_;
    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::unordered_map<std::string, Entry>> entries_;
  };

} // namespace devbroker::core
