/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault aggregator
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>

#include "core/ErrorMonitor.hpp"

namespace devbroker {
  namespace core {

    ErrorMonitor::ErrorMonitor(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      std::function<void(const std::string&)> escalate;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        ++total_;
        if (!rememberIfNew(message))
          return;
        escalate = escalation_;
      }
      // callback runs unlocked so it may log or call back into us
      if (escalate)
        escalate(message);
    }

    std::size_t ErrorMonitor::failureCount() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return total_;
    }

    std::vector<std::string> ErrorMonitor::uniqueFailures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return { order_.begin(), order_.end() };
    }

    bool ErrorMonitor::rememberIfNew(const std::string& message) {
      if (!seen_.insert(message).second)
        return false;
      order_.push_back(message);
      if (order_.size() > capacity_) {
        seen_.erase(order_.front());
        order_.pop_front();
      }
      return true;
    }

  } // namespace core
} // namespace devbroker
