/* @file FileLogger.cpp
 * @brief buffered append-only writer used as the Logger sink
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "io/FileLogger.hpp"

#include <utility>

using namespace devbroker::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), owned_(std::exchange(other.owned_, false)),
      buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    owned_ = std::exchange(other.owned_, false);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  if (fp_ == nullptr)
    return false;
  owned_ = true;
  buffer_.reserve(kFlushThreshold * 2);
  return true;
}

void FileLogger::attach(FILE* stream) {
  close();
  fp_ = stream;
  owned_ = false;
}

void FileLogger::write(const std::string& line) {
  if (fp_ == nullptr)
    return;
  buffer_.insert(buffer_.end(), line.begin(), line.end());
  if (buffer_.size() >= kFlushThreshold)
    flush();
}

bool FileLogger::flush() {
  if (fp_ == nullptr)
    return false;
  bool ok = true;
  if (!buffer_.empty()) {
    ok = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_) == buffer_.size();
    buffer_.clear();
  }
  return std::fflush(fp_) == 0 && ok;
}

void FileLogger::close() {
  if (fp_ == nullptr)
    return;
  flush();
  if (owned_)
    std::fclose(fp_);
  fp_ = nullptr;
  owned_ = false;
}
