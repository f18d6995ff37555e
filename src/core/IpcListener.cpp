/* @file IpcListener.cpp
 * @brief poll()-driven accept/read loop, per-connection ordered dispatch onto the worker pool
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <vector>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

// devbroker headers
#include "core/IpcListener.hpp"
#include "core/Logger.hpp"
#include "core/WorkerPool.hpp"

using namespace devbroker::core;

namespace {
  constexpr const char* kComponent = "IpcListener";
  constexpr int kPollTimeoutMs = 250; // upper bound on noticing a stop request
  constexpr std::chrono::milliseconds kSubmitWait{ kPollTimeoutMs };
} // namespace

IpcListener::IpcListener(std::string socketPath, WorkerPool& pool, Handler handler, Logger& logger,
                         std::size_t maxFrameBytes)
    : socketPath_(std::move(socketPath)), pool_(pool), handler_(std::move(handler)), logger_(logger),
      maxFrameBytes_(maxFrameBytes) {}

IpcListener::~IpcListener() {
  stop();
  close();
}

void IpcListener::bind() {
  listener_.bind(socketPath_);
  if (wakePipe_[0] < 0 && ::pipe2(wakePipe_, O_CLOEXEC | O_NONBLOCK) == -1) {
    const std::string err = std::strerror(errno);
    listener_.close();
    throw std::runtime_error("[IpcListener] pipe2: " + err);
  }
  logger_.info(kComponent, "listening on " + socketPath_);
}

void IpcListener::start() {
  if (listener_.fd() < 0)
    throw std::runtime_error("[IpcListener] start() before bind()");
  if (running_.exchange(true))
    return;
  stopRequested_ = false;
  loopThread_ = std::thread(&IpcListener::loop, this);
}

void IpcListener::stop() {
  std::lock_guard<std::mutex> lock(stopMtx_);
  stopRequested_ = true;
  wakeLoop();
  if (loopThread_.joinable())
    loopThread_.join();
  running_ = false;

  {
    std::lock_guard<std::mutex> deferLock(deferMtx_);
    parked_.clear();
  }

  std::vector<ConnectionPtr> clients;
  {
    std::lock_guard<std::mutex> connLock(connMtx_);
    for (const auto& [id, conn] : connections_)
      clients.push_back(conn);
  }
  if (!clients.empty())
    logger_.info(kComponent, "closing " + std::to_string(clients.size()) + " client connections");
  for (const auto& conn : clients)
    dropConnection(conn, "broker shutting down");
}

void IpcListener::close() {
  std::lock_guard<std::mutex> lock(stopMtx_);
  listener_.close(); // also removes the socket file
  for (int& fd : wakePipe_) {
    if (fd >= 0)
      ::close(fd);
    fd = -1;
  }
}

std::size_t IpcListener::activeClients() const {
  std::lock_guard<std::mutex> lock(connMtx_);
  return connections_.size();
}

void IpcListener::resumeDeferred() {
  bool anyParked = false;
  {
    std::lock_guard<std::mutex> lock(deferMtx_);
    ++resumeGeneration_;
    anyParked = !parked_.empty();
  }
  // only the loop thread resubmits
  if (anyParked)
    wakeLoop();
}

void IpcListener::loop() {
  std::vector<pollfd> fds;
  std::vector<ConnectionPtr> polled;

  while (!stopRequested_) {
    fds.clear();
    polled.clear();
    fds.push_back({ listener_.fd(), POLLIN, 0 });
    fds.push_back({ wakePipe_[0], POLLIN, 0 });
    {
      std::lock_guard<std::mutex> lock(connMtx_);
      for (const auto& [id, conn] : connections_) {
        fds.push_back({ conn->socket.fd(), POLLIN, 0 });
        polled.push_back(conn);
      }
    }

    int rc = ::poll(fds.data(), fds.size(), kPollTimeoutMs);
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      logger_.error(kComponent, std::string("poll: ") + std::strerror(errno));
      continue;
    }
    if (rc == 0)
      continue;

    const bool woken = fds[1].revents & POLLIN;
    if (woken) {
      char sink[64];
      while (::read(wakePipe_[0], sink, sizeof(sink)) > 0) {
      }
    }
    if (stopRequested_)
      break;
    if (woken)
      resubmitParked();

    if (fds[0].revents & POLLIN)
      acceptPending();

    for (std::size_t i = 2; i < fds.size(); ++i) {
      if (fds[i].revents & (POLLIN | POLLHUP | POLLERR))
        readFrom(polled[i - 2]);
    }
  }
}

void IpcListener::acceptPending() {
  while (auto fd = listener_.acceptFd()) {
    auto conn = std::make_shared<ClientConnection>(nextId_++, *fd, maxFrameBytes_);
    std::size_t active = 0;
    {
      std::lock_guard<std::mutex> lock(connMtx_);
      connections_.emplace(conn->id, conn);
      active = connections_.size();
    }
    logger_.debug(kComponent, "client #" + std::to_string(conn->id) + " connected (" +
                                  std::to_string(active) + " active)");
  }
}

void IpcListener::readFrom(const ConnectionPtr& conn) {
  std::string bytes;
  const auto status = conn->socket.readAvailable(bytes);

  if (!bytes.empty()) {
    conn->decoder.feed(bytes);
    try {
      while (auto frame = conn->decoder.next())
        enqueue(conn, std::move(*frame));
    } catch (const protocols::FrameTooLarge& e) {
      logger_.warning(kComponent, "client #" + std::to_string(conn->id) + ": " + e.what());
      dropConnection(conn, "oversized frame");
      return;
    }
  }

  if (status == io::StreamSocket::ReadStatus::Eof)
    dropConnection(conn, "client disconnected");
  else if (status == io::StreamSocket::ReadStatus::Error)
    dropConnection(conn, "read error");
}

void IpcListener::enqueue(const ConnectionPtr& conn, std::string payload) {
  {
    std::lock_guard<std::mutex> lock(conn->mtx);
    if (conn->closed)
      return;
    conn->pending.push_back(std::move(payload));
    if (conn->busy)
      return; // the running drain job will pick it up
    conn->busy = true;
  }

  if (!schedule(conn))
    dropConnection(conn, "worker pool stopped");
}

// Loop thread only. Waits out a full queue, but never past a stop request.
bool IpcListener::schedule(const ConnectionPtr& conn) {
  bool warned = false;
  while (!stopRequested_) {
    switch (pool_.submitFor([this, conn] { drain(conn); }, kSubmitWait)) {
    case WorkerPool::SubmitResult::Accepted:
      return true;
    case WorkerPool::SubmitResult::Stopped:
      return false;
    case WorkerPool::SubmitResult::QueueFull:
      if (!warned)
        logger_.warning(kComponent, "worker queue full, client #" + std::to_string(conn->id) +
                                        " waits");
      warned = true;
      break;
    }
  }
  return false;
}

void IpcListener::drain(const ConnectionPtr& conn) {
  while (true) {
    std::string payload;
    {
      std::lock_guard<std::mutex> lock(conn->mtx);
      if (conn->closed || conn->pending.empty()) {
        conn->pending.clear();
        conn->busy = false;
        return;
      }
      payload = conn->pending.front(); // popped once answered
    }
    std::uint64_t generation = 0;
    {
      std::lock_guard<std::mutex> lock(deferMtx_);
      generation = resumeGeneration_;
    }

    std::optional<std::string> reply;
    try {
      reply = handler_(payload);
    } catch (const std::exception& e) {
      logger_.error(kComponent, std::string("request handler threw: ") + e.what());
      dropConnection(conn, "handler failure");
      continue;
    }
    if (!reply) {
      if (park(conn, generation))
        return; // busy stays set; resubmitParked() restarts the drain
      continue; // a slot was released meanwhile
    }

    {
      std::lock_guard<std::mutex> lock(conn->mtx);
      if (conn->closed)
        continue; // client went away mid-request; result discarded
      conn->pending.pop_front();
    }
    if (!conn->socket.writeFrame(*reply))
      dropConnection(conn, "write failed");
  }
}

// False if resumeDeferred() ran after \p generation was read: retry at once.
bool IpcListener::park(const ConnectionPtr& conn, std::uint64_t generation) {
  std::lock_guard<std::mutex> lock(deferMtx_);
  if (generation != resumeGeneration_)
    return false;
  parked_.push_back(conn);
  logger_.debug(kComponent, "client #" + std::to_string(conn->id) + " waits for a device slot");
  return true;
}

void IpcListener::resubmitParked() {
  std::vector<ConnectionPtr> ready;
  {
    std::lock_guard<std::mutex> lock(deferMtx_);
    ready.swap(parked_);
  }
  for (const auto& conn : ready) {
    if (!schedule(conn))
      dropConnection(conn, "worker pool stopped");
  }
}

void IpcListener::dropConnection(const ConnectionPtr& conn, const char* why) {
  {
    std::lock_guard<std::mutex> lock(conn->mtx);
    if (conn->closed)
      return;
    conn->closed = true;
    conn->pending.clear();
  }
  conn->socket.shutdown(); // descriptor released when the last reference goes

  std::size_t active = 0;
  {
    std::lock_guard<std::mutex> lock(connMtx_);
    connections_.erase(conn->id);
    active = connections_.size();
  }
  logger_.debug(kComponent, "client #" + std::to_string(conn->id) + " closed: " + why + " (" +
                                std::to_string(active) + " active)");
}

void IpcListener::wakeLoop() {
  if (wakePipe_[1] < 0)
    return;
  if (::write(wakePipe_[1], "x", 1) == -1 && errno != EAGAIN)
    logger_.warning(kComponent, std::string("wake pipe: ") + std::strerror(errno));
}
