#pragma once
/** @file  StreamSocket.hpp
 *  @brief Unix-domain stream socket wrappers (poll/send/recv under the hood).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "protocols/Framing.hpp"

namespace devbroker {
  namespace io {

    /**
 * @class StreamSocket
 * @brief RAII wrapper around a single connected stream socket descriptor.
 *
 *  * Frames I/O with the 4-byte length prefix from protocols/Framing.
 *  * `shutdown()` wakes a blocked reader on another thread without releasing
 *    the descriptor; only the destructor / `close()` releases it.
 *  * *Non-copyable*, but move-constructible.
 */
    class StreamSocket {

    public:
      enum class ReadStatus { Data, WouldBlock, Eof, Error };

      //---ctr / dtr--------------------------------------------
      StreamSocket() = default;
      explicit StreamSocket(int fd, std::size_t maxFrameBytes = protocols::kDefaultMaxFrameBytes);
      virtual ~StreamSocket(); // close the fd at destruction

      /// Connect to a filesystem socket path; throws `std::runtime_error`.
      static StreamSocket connectTo(const std::string& path,
                                    std::size_t maxFrameBytes = protocols::kDefaultMaxFrameBytes);

      //---public API-------------------------------------------
      virtual bool writeAll(std::string_view bytes); // returns false on EPIPE/EIO
      bool writeFrame(std::string_view payload) { return writeAll(protocols::encodeFrame(payload)); }

      /// Blocking read of one frame; nullopt on timeout, EOF or error.
      virtual std::optional<std::string> readFrame(std::chrono::milliseconds timeout);

      /// Drain whatever the kernel holds right now (socket must be non-blocking).
      ReadStatus readAvailable(std::string& into);

      bool setNonBlocking();
      void shutdown();
      void close();

      int fd() const { return fd_; }
      bool isOpen() const { return fd_ >= 0; }

      /// Write-side stall limit used when the peer stops draining its socket.
      void setWriteTimeout(std::chrono::milliseconds timeout) { writeTimeout_ = timeout; }

      //---non-copyable-----------------------------------------
      StreamSocket(const StreamSocket&) = delete;
      StreamSocket& operator=(const StreamSocket&) = delete;

      //---mv and mv assign-------------------------------------
      StreamSocket(StreamSocket&& other) noexcept;
      StreamSocket& operator=(StreamSocket&& other) noexcept;

    private:
      int fd_{ -1 }; ///< POSIX fd (-1==closed)
      protocols::FrameDecoder decoder_{};
      std::chrono::milliseconds writeTimeout_{ 30000 };
    };

    /**
 * @class UnixListener
 * @brief Listening socket bound to a filesystem path; removes the path on close.
 */
    class UnixListener {
    public:
      UnixListener() = default;
      ~UnixListener();

      /// Bind + listen; a stale socket file at \p path is replaced. Throws `std::runtime_error`.
      void bind(const std::string& path, int backlog = 128);

      /// Accept one pending connection (listener is non-blocking); nullopt if none.
      std::optional<int> acceptFd();

      void close();

      int fd() const { return fd_; }
      const std::string& path() const { return path_; }

      UnixListener(const UnixListener&) = delete;
      UnixListener& operator=(const UnixListener&) = delete;

    private:
      int fd_{ -1 };
      std::string path_{};
    };

  } // namespace io
} // namespace devbroker
