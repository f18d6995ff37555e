/* @file WorkerPool.cpp
 * @brief bounded job queue drained by a fixed set of threads
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>

#include "core/Logger.hpp"
#include "core/WorkerPool.hpp"

using namespace devbroker::core;

WorkerPool::WorkerPool(std::size_t threads, std::size_t queueCapacity, Logger& logger)
    : logger_(logger), capacity_(std::max<std::size_t>(queueCapacity, 1)) {
  const std::size_t count = std::max<std::size_t>(threads, 1);
  threads_.reserve(count);
  for (std::size_t i = 0; i < count; ++i)
    threads_.emplace_back(&WorkerPool::workerLoop, this);
  threadCount_ = count;
}

WorkerPool::~WorkerPool() { shutdown(); }

bool WorkerPool::submit(std::function<void()> job) {
  {
    std::unique_lock<std::mutex> lock(mtx_);
    notFull_.wait(lock, [this] { return stopping_ || jobs_.size() < capacity_; });
    if (stopping_)
      return false;
    jobs_.push_back(std::move(job));
  }
  notEmpty_.notify_one();
  return true;
}

WorkerPool::SubmitResult WorkerPool::submitFor(std::function<void()> job,
                                               std::chrono::milliseconds wait) {
  {
    std::unique_lock<std::mutex> lock(mtx_);
    if (!notFull_.wait_for(lock, wait, [this] { return stopping_ || jobs_.size() < capacity_; }))
      return SubmitResult::QueueFull;
    if (stopping_)
      return SubmitResult::Stopped;
    jobs_.push_back(std::move(job));
  }
  notEmpty_.notify_one();
  return SubmitResult::Accepted;
}

void WorkerPool::shutdown() {
  std::lock_guard<std::mutex> joinLock(joinMtx_);
  {
    std::lock_guard<std::mutex> lock(mtx_);
    stopping_ = true;
  }
  notEmpty_.notify_all();
  notFull_.notify_all();

  for (auto& t : threads_) {
    if (t.joinable())
      t.join();
  }
  threads_.clear();
}

std::size_t WorkerPool::queued() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return jobs_.size();
}

void WorkerPool::workerLoop() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      notEmpty_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
      if (jobs_.empty())
        return; // stopping and drained
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    notFull_.notify_one();

    try {
      job();
    } catch (const std::exception& e) {
      logger_.error("WorkerPool", std::string("job failed: ") + e.what());
    }
  }
}
