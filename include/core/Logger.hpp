#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous line logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "io/FileLogger.hpp"

namespace devbroker {
  namespace core {

    enum class LogLevel : std::uint8_t { Debug, Info, Warning, Error };

    const char* toString(LogLevel level);

    /// Accepts "debug", "info", "warning"/"warn", "error" (case-insensitive).
    std::optional<LogLevel> parseLogLevel(const std::string& text);

    struct LogEvent {
      std::chrono::system_clock::time_point time;
      LogLevel level{ LogLevel::Info };
      std::string component;
      std::string message;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Producers enqueue `LogEvent`s; a worker thread formats and writes them.
 *
 *  * One instance per broker, handed around by reference.
 *  * `log()` never blocks. Events that arrive while the buffer is full are
 *    counted in `dropped()` instead of stalling a device call.
 *  * Events logged before `start()` are kept until the worker drains them.
 */
    class Logger {

    public:
      explicit Logger(LogLevel minLevel = LogLevel::Info, std::size_t capacity = 4096);
      ~Logger(); ///< finishRun()

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

      // --- public API ---
      /// Open \p path for appending (empty = stderr) and launch the worker thread.
      void start(const std::string& path = {});
      void log(LogLevel level, std::string component, std::string message); ///< enqueue event (non-blocking)
      void finish();                                                       ///< flush + join worker thread

      void debug(std::string component, std::string message);
      void info(std::string component, std::string message);
      void warning(std::string component, std::string message);
      void error(std::string component, std::string message);

      bool enabled(LogLevel level) const { return level >= minLevel_.load(); }
      void setMinLevel(LogLevel level) { minLevel_.store(level); }
      std::size_t dropped() const { return dropped_.load(); }

      /// Renders one event the way it lands in the sink (no trailing newline).
      static std::string format(const LogEvent& event);

    private:
      void drain();
      void writeEvent(const LogEvent& event);

      std::atomic<LogLevel> minLevel_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      io::FileLogger sink_;
      std::mutex startMtx_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<std::size_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace devbroker
