#pragma once
/** @file  WorkerPool.hpp
 *  @brief Fixed thread pool behind a bounded job queue.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace devbroker::core {

  class Logger;

  /**
 * @class WorkerPool
 * @brief Device I/O runs here so a slow device never stalls the IPC loop.
 *
 *  * `submit()` blocks while the queue is full (backpressure).
 *  * `shutdown()` lets queued jobs finish, then joins every thread.
 */
  class WorkerPool {
  public:
    WorkerPool(std::size_t threads, std::size_t queueCapacity, Logger& logger);
    ~WorkerPool(); ///< shutdown()

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    enum class SubmitResult { Accepted, QueueFull, Stopped };

    /// Enqueue \p job; returns false once shutdown has begun.
    bool submit(std::function<void()> job);

    /// submit() that gives up after \p wait while the queue stays full.
    SubmitResult submitFor(std::function<void()> job, std::chrono::milliseconds wait);

    /// Idempotent.
    void shutdown();

    std::size_t threadCount() const { return threadCount_; }
    std::size_t queued() const;

  private:
    void workerLoop();

    Logger& logger_;
    const std::size_t capacity_;
    std::vector<std::thread> threads_;
    std::size_t threadCount_{ 0 };
    std::mutex joinMtx_;
    std::deque<std::function<void()>> jobs_;
    mutable std::mutex mtx_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    bool stopping_{ false };
  };

} // namespace devbroker::core
