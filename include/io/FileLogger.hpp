#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered line writer for log files or an already open stream.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace devbroker {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Writes are collected in a 4 kB buffer and handed to `std::fwrite` in one go.
 *  * `attach()` borrows a stream (e.g. stderr); borrowed streams are never closed.
 */
    class FileLogger {
    public:
      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened for appending. */
      bool open(const std::string& path);

      /** Borrow an open stream; flushes go there, close() leaves it open. */
      void attach(FILE* stream);

      /** Queues one line (caller includes trailing '\n'). */
      void write(const std::string& line);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      static constexpr std::size_t kFlushThreshold = 4096;

      FILE* fp_{ nullptr };
      bool owned_{ false };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace devbroker
