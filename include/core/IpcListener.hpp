#pragma once
/** @file  IpcListener.hpp
 *  @brief Local socket front end: accepts clients, frames requests, answers in order.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// devbroker headers
#include "io/StreamSocket.hpp"
#include "protocols/Framing.hpp"

namespace devbroker::core {

  class Logger;
  class WorkerPool;

  /**
 * @class IpcListener
 * @brief One poll() loop thread multiplexes the listening socket and every
 *        client; request handling runs on the WorkerPool.
 *
 *  * Per connection at most one job is in flight and it drains that
 *    connection's queue front to back, so replies keep request order.
 *  * An I/O failure or oversized frame closes only that connection.
 *  * A client that disconnects mid-request does not cancel the request;
 *    its reply is dropped.
 *  * A handler that cannot proceed yet (no free device slot) returns nullopt.
 *    The connection is parked without holding a worker and its request is
 *    retried after resumeDeferred().
 */
  class IpcListener {
  public:
    /// Maps one request payload to one reply payload, or nullopt to retry later; must not throw.
    using Handler = std::function<std::optional<std::string>(const std::string&)>;

    IpcListener(std::string socketPath, WorkerPool& pool, Handler handler, Logger& logger,
                std::size_t maxFrameBytes = protocols::kDefaultMaxFrameBytes);
    ~IpcListener(); ///< stop()

    IpcListener(const IpcListener&) = delete;
    IpcListener& operator=(const IpcListener&) = delete;

    /// Create the socket file and listen; throws `std::runtime_error`.
    void bind();

    /// Launch the loop thread (bind() first).
    void start();

    /// Stop accepting, join the loop, close tracked clients. Idempotent.
    void stop();

    /// Close the listening socket and remove the socket file. Idempotent.
    void close();

    /// Retry every parked request. Thread-safe; called when a device slot frees up.
    void resumeDeferred();

    std::size_t activeClients() const;
    const std::string& socketPath() const { return socketPath_; }
    bool running() const { return running_.load(); }

  private:
    struct ClientConnection {
      ClientConnection(std::uint64_t connId, int fd, std::size_t maxFrameBytes)
          : id(connId), socket(fd), decoder(maxFrameBytes) {}

      const std::uint64_t id;
      io::StreamSocket socket;
      protocols::FrameDecoder decoder; ///< loop thread only
      std::mutex mtx;                  ///< guards pending / busy / closed
      std::deque<std::string> pending;
      bool busy{ false };
      bool closed{ false };
    };
    using ConnectionPtr = std::shared_ptr<ClientConnection>;

    void loop();
    void acceptPending();
    void readFrom(const ConnectionPtr& conn);
    void enqueue(const ConnectionPtr& conn, std::string payload);
    bool schedule(const ConnectionPtr& conn);
    void drain(const ConnectionPtr& conn);
    bool park(const ConnectionPtr& conn, std::uint64_t generation);
    void resubmitParked();
    void dropConnection(const ConnectionPtr& conn, const char* why);
    void wakeLoop();

    const std::string socketPath_;
    WorkerPool& pool_;
    Handler handler_;
    Logger& logger_;
    const std::size_t maxFrameBytes_;

    io::UnixListener listener_;
    int wakePipe_[2]{ -1, -1 };
    std::thread loopThread_;
    std::atomic<bool> running_{ false };
    std::atomic<bool> stopRequested_{ false };
    std::mutex stopMtx_;

    mutable std::mutex connMtx_; ///< guards connections_
    std::unordered_map<std::uint64_t, ConnectionPtr> connections_;
    std::uint64_t nextId_{ 1 };

    std::mutex deferMtx_; ///< guards parked_ and resumeGeneration_
    std::vector<ConnectionPtr> parked_;
    std::uint64_t resumeGeneration_{ 0 };
  };

} // namespace devbroker::core
