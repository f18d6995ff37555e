#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace devbroker {
  namespace core {

    /**
 * @class ErrorMonitor
 * @brief Worker threads call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected set).
 * * Debounces duplicate failures so a flapping device doesn't flood the log.
 * * Remembers at most `capacity` unique failures; the oldest is forgotten first
 *   and would escalate again if it recurs.
 */
    class ErrorMonitor {
    public:
      static constexpr std::size_t kDefaultCapacity = 1024;

      explicit ErrorMonitor(std::size_t capacity = kDefaultCapacity);
      virtual ~ErrorMonitor() = default;

      /// Register a lambda that escalates a fault (the broker routes it to its Logger).
      void registerEscalation(std::function<void(const std::string&)> cb);

      /// Called by subsystems on fault; will forward to the escalation callback.
      virtual void notifyFailure(const std::string& message);

      /// Number of times `notifyFailure()` was called, duplicates included.
      std::size_t failureCount() const;

      /// Unique failures still remembered, oldest first.
      std::vector<std::string> uniqueFailures() const;

    private:
      bool rememberIfNew(const std::string& message);

      std::function<void(const std::string&)> escalation_{};
      const std::size_t capacity_;
      std::unordered_set<std::string> seen_; ///< de-dupe lookup
      std::deque<std::string> order_;        ///< eviction order, oldest first
      std::size_t total_{ 0 };
      mutable std::mutex mtx_;
    };

  } // namespace core
} // namespace devbroker
