#pragma once

#include "devpulse/common/result.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace devpulse::health {

/// Fixed set of worker threads fed by a bounded FIFO queue.
class WorkerPool {
public:
  using Task = std::function<void()>;

  WorkerPool(std::size_t threads, std::size_t queue_capacity);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /// Fails when the queue is full or the pool is shutting down.
  [[nodiscard]] common::Status submit(Task task);

  /// Rejects further submissions; queued work still runs.
  void stop_accepting();

  /// Waits until no task is queued or running. Returns false on timeout.
  [[nodiscard]] bool wait_idle(std::chrono::milliseconds timeout);

  /// Rejects new work, lets the workers finish everything already queued and joins them.
  /// Returns false if the queue was not idle within timeout; the join still happens.
  bool shutdown(std::chrono::milliseconds timeout);

  [[nodiscard]] std::size_t queue_depth() const;
  [[nodiscard]] std::size_t active() const;

private:
  void worker_loop();

  std::size_t queue_capacity_;
  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::queue<Task> queue_;
  std::size_t active_ = 0;
  bool accepting_ = true;
  bool stopping_ = false;
  std::vector<std::thread> threads_;
};

} // namespace devpulse::health
