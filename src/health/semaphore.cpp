#include "devpulse/health/semaphore.hpp"

#include <algorithm>
#include <memory>

namespace devpulse::health {

CountingSemaphore::CountingSemaphore(const std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

common::Status CountingSemaphore::acquire(const common::Context &ctx) {
  if (auto status = ctx.error(); !status.ok()) {
    return status;
  }

  // The callback may run on another thread after remove_callback, so the flag is shared.
  auto aborted = std::make_shared<bool>(false);
  const auto callback = ctx.on_cancel([this, aborted]() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      *aborted = true;
    }
    cv_.notify_all();
  });

  bool acquired = false;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto ready = [&]() { return in_use_ < capacity_ || *aborted; };
    if (const auto deadline = ctx.deadline(); deadline.has_value()) {
      cv_.wait_until(lock, *deadline, ready);
    } else {
      cv_.wait(lock, ready);
    }
    if (in_use_ < capacity_ && !*aborted) {
      ++in_use_;
      peak_ = std::max(peak_, in_use_);
      acquired = true;
    }
  }
  ctx.remove_callback(callback);

  if (acquired) {
    return common::Status::success();
  }
  auto status = ctx.error();
  return status.ok() ? common::Status::cancelled(common::kContextDeadlineExceeded) : status;
}

void CountingSemaphore::release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_use_ > 0) {
      --in_use_;
    }
  }
  cv_.notify_one();
}

std::size_t CountingSemaphore::in_use() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_use_;
}

std::size_t CountingSemaphore::peak() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peak_;
}

} // namespace devpulse::health
