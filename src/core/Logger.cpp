/* @file Logger.cpp
 * @brief async logger: producers enqueue, one worker thread formats and writes
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

// devbroker headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

using namespace devbroker::core;

namespace {
  constexpr std::chrono::milliseconds kPollInterval{ 50 };
}

const char* devbroker::core::toString(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

std::optional<LogLevel> devbroker::core::parseLogLevel(const std::string& text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "debug")
    return LogLevel::Debug;
  if (lower == "info")
    return LogLevel::Info;
  if (lower == "warning" || lower == "warn")
    return LogLevel::Warning;
  if (lower == "error")
    return LogLevel::Error;
  return std::nullopt;
}

Logger::Logger(LogLevel minLevel, std::size_t capacity)
    : minLevel_(minLevel), buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)) {}

Logger::~Logger() { finish(); }

void Logger::start(const std::string& path) {
  std::lock_guard<std::mutex> lock(startMtx_);
  if (running_)
    return;

  if (path.empty()) {
    sink_.attach(stderr);
  } else if (!sink_.open(path)) {
    throw std::runtime_error("[Logger] cannot open log file: " + path);
  }

  running_ = true;
  worker_ = std::thread(&Logger::drain, this);
}

void Logger::log(LogLevel level, std::string component, std::string message) {
  if (!enabled(level))
    return;
  LogEvent event{ std::chrono::system_clock::now(), level, std::move(component), std::move(message) };
  if (!buffer_->tryPush(std::move(event)))
    ++dropped_;
}

void Logger::debug(std::string component, std::string message) {
  log(LogLevel::Debug, std::move(component), std::move(message));
}

void Logger::info(std::string component, std::string message) {
  log(LogLevel::Info, std::move(component), std::move(message));
}

void Logger::warning(std::string component, std::string message) {
  log(LogLevel::Warning, std::move(component), std::move(message));
}

void Logger::error(std::string component, std::string message) {
  log(LogLevel::Error, std::move(component), std::move(message));
}

void Logger::finish() {
  std::lock_guard<std::mutex> lock(startMtx_);
  if (!running_.exchange(false))
    return;

  buffer_->wake();
  if (worker_.joinable())
    worker_.join();

  // worker is gone; anything that raced in after its last pop is written here
  while (auto event = buffer_->popFor(std::chrono::milliseconds{ 0 }))
    writeEvent(*event);
  sink_.close();
}

std::string Logger::format(const LogEvent& event) {
  const auto secs = std::chrono::system_clock::to_time_t(event.time);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          event.time.time_since_epoch()) %
                      1000;
  std::tm utc{};
  gmtime_r(&secs, &utc);

  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &utc);
  char millisText[8];
  std::snprintf(millisText, sizeof(millisText), ".%03dZ", static_cast<int>(millis.count()));

  std::string line;
  line.reserve(64 + event.component.size() + event.message.size());
  line.append(stamp).append(millisText);
  line.append(" [").append(toString(event.level)).append("] ");
  line.append("[").append(event.component).append("] ");
  line.append(event.message);
  return line;
}

void Logger::drain() {
  while (running_) {
    auto event = buffer_->popFor(kPollInterval);
    if (!event) {
      sink_.flush();
      continue;
    }
    writeEvent(*event);
  }
}

void Logger::writeEvent(const LogEvent& event) {
  sink_.write(format(event) + "\n");
  if (event.level >= LogLevel::Warning)
    sink_.flush();
}
