#pragma once
/** @file  Framing.hpp
 *  @brief 4-byte big-endian length prefix + payload stream framing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace devbroker {
  namespace protocols {

    inline constexpr std::size_t kFrameHeaderBytes = 4;
    inline constexpr std::size_t kDefaultMaxFrameBytes = 16u * 1024u * 1024u;

    /// A length prefix announced more bytes than the peer is allowed to send.
    class FrameTooLarge : public std::length_error {
    public:
      using std::length_error::length_error;
    };

    /// Prefix \p payload with its length (network byte order).
    std::string encodeFrame(std::string_view payload);

    /**
 * @class FrameDecoder
 * @brief Accumulates raw stream bytes and yields complete payloads in order.
 *
 *  * Feed whatever `read()` returned; partial headers and payloads are kept.
 *  * `next()` throws `FrameTooLarge`; the stream cannot be resynchronized after that.
 */
    class FrameDecoder {
    public:
      explicit FrameDecoder(std::size_t maxFrameBytes = kDefaultMaxFrameBytes)
          : maxFrameBytes_(maxFrameBytes) {}

      void feed(const char* data, std::size_t size) { buffer_.append(data, size); }
      void feed(std::string_view data) { buffer_.append(data); }

      std::optional<std::string> next();

      std::size_t buffered() const { return buffer_.size(); }

    private:
      std::string buffer_{};
      std::size_t maxFrameBytes_;
    };

  } // namespace protocols
} // namespace devbroker
