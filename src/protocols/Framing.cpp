/* @file Framing.cpp
 * @brief length-prefixed framing helpers
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <limits>

#include "protocols/Framing.hpp"

using namespace devbroker::protocols;

std::string devbroker::protocols::encodeFrame(std::string_view payload) {
  if (payload.size() > std::numeric_limits<std::uint32_t>::max())
    throw FrameTooLarge("[Framing] payload does not fit a 32-bit length prefix");

  const auto len = static_cast<std::uint32_t>(payload.size());
  std::string frame;
  frame.reserve(kFrameHeaderBytes + payload.size());
  frame.push_back(static_cast<char>((len >> 24) & 0xFF));
  frame.push_back(static_cast<char>((len >> 16) & 0xFF));
  frame.push_back(static_cast<char>((len >> 8) & 0xFF));
  frame.push_back(static_cast<char>(len & 0xFF));
  frame.append(payload);
  return frame;
}

std::optional<std::string> FrameDecoder::next() {
  if (buffer_.size() < kFrameHeaderBytes)
    return std::nullopt;

  const auto byte = [this](std::size_t i) {
    return static_cast<std::uint32_t>(static_cast<unsigned char>(buffer_[i]));
  };
  const std::size_t len = (byte(0) << 24) | (byte(1) << 16) | (byte(2) << 8) | byte(3);
  if (len > maxFrameBytes_)
    throw FrameTooLarge("[Framing] frame of " + std::to_string(len) + " bytes exceeds limit of " +
                        std::to_string(maxFrameBytes_));

  if (buffer_.size() < kFrameHeaderBytes + len)
    return std::nullopt;

  std::string payload = buffer_.substr(kFrameHeaderBytes, len);
  buffer_.erase(0, kFrameHeaderBytes + len);
  return payload;
}
