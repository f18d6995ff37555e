#pragma once
/** @file  RingBuffer.hpp
 *  @brief Fixed-capacity FIFO shared between log producers and the log worker.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace devbroker {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Bounded queue; producers never block, the consumer waits with a timeout.
 *
 *  * `tryPush()` refuses new items once full (caller counts the drop).
 *  * Storage is allocated once at construction.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(std::max<std::size_t>(capacity, 1)) {}

      bool tryPush(T item) {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (count_ == slots_.size())
            return false;
          slots_[(head_ + count_) % slots_.size()] = std::move(item);
          ++count_;
        }
        cv_.notify_one();
        return true;
      }

      std::optional<T> popFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return count_ > 0 || woken_; });
        woken_ = false;
        if (count_ == 0)
          return std::nullopt;
        T item = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return item;
      }

      /// Unblocks a consumer sitting in `popFor()`.
      void wake() {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          woken_ = true;
        }
        cv_.notify_all();
      }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return count_;
      }

      std::size_t capacity() const { return slots_.size(); }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t count_{ 0 };
      bool woken_{ false };
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace devbroker
