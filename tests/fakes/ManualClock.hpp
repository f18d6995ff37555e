#pragma once
/** @file  ManualClock.hpp
 *  @brief Hand-driven time source for CommandCache tests.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <mutex>

#include "core/CommandCache.hpp"

namespace devbroker {
  namespace test {

    class ManualClock {
    public:
      using TimePoint = core::CommandCache::Clock::time_point;

      TimePoint now() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return now_;
      }

      void advance(std::chrono::seconds by) {
        std::lock_guard<std::mutex> lock(mtx_);
        now_ += by;
      }

      core::CommandCache::NowFn fn() {
        return [this] { return now(); };
      }

    private:
      mutable std::mutex mtx_;
      TimePoint now_{ std::chrono::hours(1000) };
    };

  } // namespace test
} // namespace devbroker
