#include "devpulse/health/worker_pool.hpp"

#include <algorithm>

namespace devpulse::health {

WorkerPool::WorkerPool(const std::size_t threads, const std::size_t queue_capacity)
    : queue_capacity_(std::max<std::size_t>(1, queue_capacity)) {
  const std::size_t count = std::max<std::size_t>(1, threads);
  threads_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    threads_.emplace_back([this]() { worker_loop(); });
  }
}

WorkerPool::~WorkerPool() { (void)shutdown(std::chrono::milliseconds(0)); }

common::Status WorkerPool::submit(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_) {
      return common::Status::error("worker pool is shutting down");
    }
    if (queue_.size() >= queue_capacity_) {
      return common::Status::error("worker queue is full (capacity " +
                                   std::to_string(queue_capacity_) + ")");
    }
    queue_.push(std::move(task));
  }
  work_cv_.notify_one();
  return common::Status::success();
}

void WorkerPool::stop_accepting() {
  std::lock_guard<std::mutex> lock(mutex_);
  accepting_ = false;
}

bool WorkerPool::wait_idle(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [this]() { return queue_.empty() && active_ == 0; });
}

bool WorkerPool::shutdown(const std::chrono::milliseconds timeout) {
  stop_accepting();
  const bool drained = wait_idle(timeout);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  work_cv_.notify_all();
  for (auto &thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
  return drained;
}

std::size_t WorkerPool::queue_depth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

std::size_t WorkerPool::active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

void WorkerPool::worker_loop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop();
      ++active_;
    }

    task();

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --active_;
      if (queue_.empty() && active_ == 0) {
        idle_cv_.notify_all();
      }
    }
  }
}

} // namespace devpulse::health
