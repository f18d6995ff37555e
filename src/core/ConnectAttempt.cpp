/* @file ConnectAttempt.cpp
 * @brief cancellation of an in-flight session creation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/ConnectAttempt.hpp"
#include "protocols/DeviceSession.hpp"

using namespace devbroker::core;

bool ConnectAttempt::cancelled() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return cancelled_;
}

bool ConnectAttempt::waitFor(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(mtx_);
  return !cv_.wait_for(lock, duration, [this] { return cancelled_; });
}

void ConnectAttempt::track(std::shared_ptr<protocols::DeviceSession> session) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!cancelled_) {
      tracked_ = std::move(session);
      return;
    }
  }
  if (session)
    session->close();
}

void ConnectAttempt::cancel() {
  std::shared_ptr<protocols::DeviceSession> session;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (cancelled_)
      return;
    cancelled_ = true;
    session = std::move(tracked_);
  }
  cv_.notify_all();
  // close() wakes a creator blocked on the device
  if (session)
    session->close();
}
