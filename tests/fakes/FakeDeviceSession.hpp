#pragma once
/** @file  FakeDeviceSession.hpp
 *  @brief DeviceSession derivative with scripted outputs and failure injection.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>

#include "core/Errors.hpp"
#include "protocols/DeviceSession.hpp"

namespace devbroker {
  namespace test {

    /**
 * @class FakeDeviceSession
 * @brief Returns "<hostname>: <command>" unless a response is scripted.
 *
 *  `openSessions` (optional) is shared with the factory so tests can see
 *  how many sessions are open at once.
 */
    class FakeDeviceSession : public protocols::DeviceSession {
    public:
      explicit FakeDeviceSession(std::string hostname,
                                 std::shared_ptr<std::atomic<int>> openSessions = nullptr)
          : hostname_(std::move(hostname)), openSessions_(std::move(openSessions)) {
        if (openSessions_)
          ++*openSessions_;
      }

      ~FakeDeviceSession() override { close(); }

      std::string run(const std::string& command) override {
        ++runCalls;
        if (runDelay.count() > 0)
          std::this_thread::sleep_for(runDelay);
        if (state_ != State::Connected)
          throw core::ExecutionError("fake session " + hostname_ + " is not connected");
        if (transportFailure) {
          state_ = State::Unhealthy;
          throw core::ExecutionError("fake transport failure on " + hostname_);
        }
        if (commandFailure)
          throw std::runtime_error("% Invalid input detected");

        std::string output;
        {
          std::lock_guard<std::mutex> lock(mtx_);
          lastCommand_ = command;
          auto it = responses_.find(command);
          output = it != responses_.end() ? it->second : hostname_ + ": " + command;
        }
        if (afterRun)
          afterRun();
        return output;
      }

      bool isHealthy() override {
        ++healthChecks;
        if (healthCheckThrows)
          throw std::runtime_error("health check failed");
        return healthy && state_ == State::Connected;
      }

      void close() override {
        if (state_.exchange(State::Closed) == State::Closed)
          return;
        ++closeCalls;
        if (openSessions_)
          --*openSessions_;
      }

      State state() const override { return state_.load(); }

      void respond(const std::string& command, std::string output) {
        std::lock_guard<std::mutex> lock(mtx_);
        responses_[command] = std::move(output);
      }

      std::string lastCommand() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return lastCommand_;
      }

      const std::string& hostname() const { return hostname_; }

      std::atomic<int> runCalls{ 0 };
      std::atomic<int> healthChecks{ 0 };
      std::atomic<int> closeCalls{ 0 };
      std::atomic<bool> healthy{ true };
      std::atomic<bool> transportFailure{ false };
      std::atomic<bool> commandFailure{ false };
      std::atomic<bool> healthCheckThrows{ false };
      std::chrono::milliseconds runDelay{ 0 };
      std::function<void()> afterRun; ///< runs once the output is ready, before run() returns

    private:
      const std::string hostname_;
      std::shared_ptr<std::atomic<int>> openSessions_;
      std::atomic<State> state_{ State::Connected };
      mutable std::mutex mtx_;
      std::unordered_map<std::string, std::string> responses_;
      std::string lastCommand_;
    };

  } // namespace test
} // namespace devbroker
