/* @file StreamSocket.cpp
 * @brief IO abstraction layer over AF_UNIX stream sockets - fd RAII, framing, poll-based timeouts - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring> // for strerror
#include <stdexcept>
#include <utility>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

// devbroker headers
#include "io/StreamSocket.hpp"

using namespace devbroker::io;

namespace {

  sockaddr_un makeAddress(const std::string& path) {
    sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path))
      throw std::runtime_error("[StreamSocket] socket path too long: " + path);
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return addr;
  }

  std::string errnoText(const char* what) { return std::string(what) + ": " + std::strerror(errno); }

} // namespace

StreamSocket::StreamSocket(int fd, std::size_t maxFrameBytes) : fd_(fd), decoder_(maxFrameBytes) {}

StreamSocket::~StreamSocket() { close(); }

StreamSocket::StreamSocket(StreamSocket&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), decoder_(std::move(other.decoder_)),
      writeTimeout_(other.writeTimeout_) {}

StreamSocket& StreamSocket::operator=(StreamSocket&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    decoder_ = std::move(other.decoder_);
    writeTimeout_ = other.writeTimeout_;
  }
  return *this;
}

StreamSocket StreamSocket::connectTo(const std::string& path, std::size_t maxFrameBytes) {
  const sockaddr_un addr = makeAddress(path);
  int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0)
    throw std::runtime_error("[StreamSocket] " + errnoText("socket"));

  StreamSocket sock(fd, maxFrameBytes);
  int rc;
  do {
    rc = ::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
  } while (rc == -1 && errno == EINTR);
  if (rc == -1)
    throw std::runtime_error("[StreamSocket] cannot connect to " + path + ": " + std::strerror(errno));
  return sock;
}

bool StreamSocket::writeAll(std::string_view bytes) {
  if (fd_ < 0)
    return false;

  std::size_t total = 0;
  while (total < bytes.size()) {
    ssize_t written = ::send(fd_, bytes.data() + total, bytes.size() - total, MSG_NOSIGNAL);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      // peer is slow: wait until the socket drains instead of spinning
      pollfd pfd{ fd_, POLLOUT, 0 };
      int rc = ::poll(&pfd, 1, static_cast<int>(writeTimeout_.count()));
      if (rc == 0 || (rc == -1 && errno != EINTR))
        return false;
      if (rc > 0 && (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)))
        return false;
    } else {
      return false;
    }
  }
  return true;
}

// -------------------------------------------------------------------
// StreamSocket::readFrame
// Blocking frame reader with timeout and internal buffer.
// Returns std::nullopt on timeout, disconnect, or error.
// -------------------------------------------------------------------
std::optional<std::string> StreamSocket::readFrame(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return std::nullopt;

  if (auto frame = decoder_.next())
    return frame;

  char temp[4096];
  pollfd pfd{ fd_, POLLIN, 0 };
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {
    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int rc = ::poll(&pfd, 1, static_cast<int>(ms_left.count()));
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    ssize_t n = ::recv(fd_, temp, sizeof(temp), 0);
    if (n > 0) {
      decoder_.feed(temp, static_cast<std::size_t>(n));
      if (auto frame = decoder_.next())
        return frame;
    } else if (n == 0) { // EOF / disconnect
      return std::nullopt;
    } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
      return std::nullopt;
    }
  }
  return std::nullopt; // timeout/partial
}

StreamSocket::ReadStatus StreamSocket::readAvailable(std::string& into) {
  if (fd_ < 0)
    return ReadStatus::Error;

  char temp[4096];
  bool gotData = false;
  while (true) {
    ssize_t n = ::recv(fd_, temp, sizeof(temp), 0);
    if (n > 0) {
      into.append(temp, static_cast<std::size_t>(n));
      gotData = true;
      continue;
    }
    if (n == 0)
      return gotData ? ReadStatus::Data : ReadStatus::Eof;
    if (errno == EINTR)
      continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK)
      return gotData ? ReadStatus::Data : ReadStatus::WouldBlock;
    return gotData ? ReadStatus::Data : ReadStatus::Error;
  }
}

bool StreamSocket::setNonBlocking() {
  if (fd_ < 0)
    return false;
  int flags = ::fcntl(fd_, F_GETFL, 0);
  return flags != -1 && ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) == 0;
}

void StreamSocket::shutdown() {
  if (fd_ >= 0)
    ::shutdown(fd_, SHUT_RDWR);
}

void StreamSocket::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}

UnixListener::~UnixListener() { close(); }

void UnixListener::bind(const std::string& path, int backlog) {
  close();
  const sockaddr_un addr = makeAddress(path);

  struct stat st {};
  if (::lstat(path.c_str(), &st) == 0) {
    if (!S_ISSOCK(st.st_mode))
      throw std::runtime_error("[UnixListener] " + path + " exists and is not a socket");
    ::unlink(path.c_str()); // stale socket from a previous run
  }

  int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (fd < 0)
    throw std::runtime_error("[UnixListener] " + errnoText("socket"));

  if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == -1) {
    std::string err = errnoText("bind");
    ::close(fd);
    throw std::runtime_error("[UnixListener] cannot bind " + path + ": " + err);
  }
  if (::listen(fd, backlog) == -1) {
    std::string err = errnoText("listen");
    ::close(fd);
    ::unlink(path.c_str());
    throw std::runtime_error("[UnixListener] " + err);
  }
  fd_ = fd;
  path_ = path;
}

std::optional<int> UnixListener::acceptFd() {
  if (fd_ < 0)
    return std::nullopt;
  while (true) {
    int client = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC | SOCK_NONBLOCK);
    if (client >= 0)
      return client;
    if (errno == EINTR || errno == ECONNABORTED)
      continue;
    return std::nullopt; // EAGAIN or a real error; caller polls again
  }
}

void UnixListener::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  if (!path_.empty()) {
    ::unlink(path_.c_str());
    path_.clear();
  }
}
