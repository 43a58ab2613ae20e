#pragma once

#include "devpulse/common/context.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace devpulse::health {

/// Counting semaphore whose acquire can be abandoned through a Context. Tracks the
/// current and peak number of held slots.
class CountingSemaphore {
public:
  explicit CountingSemaphore(std::size_t capacity);

  /// Blocks until a slot is free. Fails with the context's error if it ends first.
  [[nodiscard]] common::Status acquire(const common::Context &ctx);
  void release();

  [[nodiscard]] std::size_t capacity() const { return capacity_; }
  [[nodiscard]] std::size_t in_use() const;
  [[nodiscard]] std::size_t peak() const;

private:
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::size_t in_use_ = 0;
  std::size_t peak_ = 0;
};

/// Releases a held slot on scope exit.
class SemaphoreGuard {
public:
  explicit SemaphoreGuard(CountingSemaphore &semaphore) : semaphore_(&semaphore) {}
  ~SemaphoreGuard() {
    if (semaphore_ != nullptr) {
      semaphore_->release();
    }
  }
  SemaphoreGuard(const SemaphoreGuard &) = delete;
  SemaphoreGuard &operator=(const SemaphoreGuard &) = delete;

private:
  CountingSemaphore *semaphore_;
};

} // namespace devpulse::health
