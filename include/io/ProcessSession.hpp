#pragma once
/** @file  ProcessSession.hpp
 *  @brief Device session backed by a local child process speaking the device CLI.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

// Linux header
#include <sys/types.h> // pid_t

#include "protocols/DeviceSession.hpp"

namespace devbroker {
  namespace core {
    class ConnectAttempt;
    class SessionFactory;
    struct DeviceDescriptor;
  } // namespace core

  namespace io {

    /**
 * @class ProcessSession
 * @brief Runs `/bin/sh -c <command>` with its stdio on a socketpair and talks
 *        to it line by line, the way a terminal talks to a device CLI.
 *
 *  * A command is written as one line; its reply is everything up to the
 *    next prompt (`<hostname>#` unless the descriptor overrides it).
 *  * The echoed command line, if the child echoes, is stripped from output.
 *  * Commands on one session are serialized; that is the CLI's constraint.
 */
    class ProcessSession : public protocols::DeviceSession {
    public:
      /// Spawn + wait for the first prompt; throws `core::ConnectionError`.
      /// Cancelling \p attempt kills the child and aborts the wait.
      static std::shared_ptr<ProcessSession> spawn(const core::DeviceDescriptor& device,
                                                   std::chrono::milliseconds commandTimeout,
                                                   core::ConnectAttempt* attempt = nullptr);

      ~ProcessSession() override;

      std::string run(const std::string& command) override;
      bool isHealthy() override;
      void close() override;
      State state() const override { return state_.load(); }

      pid_t pid() const { return pid_; }

      ProcessSession(const ProcessSession&) = delete;
      ProcessSession& operator=(const ProcessSession&) = delete;

    private:
      ProcessSession(pid_t pid, int fd, std::string hostname, std::string prompt,
                     std::chrono::milliseconds commandTimeout);

      bool sendLine(const std::string& line);
      std::string readUntilPrompt(std::chrono::milliseconds timeout);
      bool childAlive();
      void reap();

      const pid_t pid_;
      int fd_;
      const std::string hostname_;
      const std::string prompt_;
      const std::chrono::milliseconds commandTimeout_;
      std::atomic<State> state_{ State::Connecting };

      std::mutex runMtx_;  ///< one command in flight
      std::mutex procMtx_; ///< waitpid bookkeeping
      bool reaped_{ false };
      std::string rx_buffer_{};
    };

    /// Register `ProcessSession` under the "process" platform key.
    void registerProcessSessions(core::SessionFactory& factory,
                                 std::chrono::milliseconds commandTimeout);

  } // namespace io
} // namespace devbroker
