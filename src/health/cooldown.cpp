#include "devpulse/health/cooldown.hpp"

#include <mutex>

namespace devpulse::health {

CooldownCache::CooldownCache(const std::chrono::milliseconds cooldown, NowFn now)
    : cooldown_(cooldown), now_(std::move(now)) {}

CooldownCache::Clock::time_point CooldownCache::now() const {
  return now_ ? now_() : Clock::now();
}

bool CooldownCache::can_check(const std::string &identifier) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = entries_.find(identifier);
  if (it == entries_.end()) {
    return true;
  }
  return now() - it->second >= cooldown_;
}

void CooldownCache::mark_checked(const std::string &identifier) {
  const auto at = now();
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_[identifier] = at;
}

void CooldownCache::forget(const std::string &identifier) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.erase(identifier);
}

std::chrono::milliseconds CooldownCache::time_until_next_check(const std::string &identifier) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = entries_.find(identifier);
  if (it == entries_.end()) {
    return std::chrono::milliseconds(0);
  }
  const auto elapsed = now() - it->second;
  if (elapsed >= cooldown_) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::ceil<std::chrono::milliseconds>(cooldown_ - elapsed);
}

std::optional<CooldownCache::Clock::time_point>
CooldownCache::last_checked(const std::string &identifier) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = entries_.find(identifier);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t CooldownCache::cleanup() {
  const auto cutoff = now() - 2 * cooldown_;
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second < cutoff) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t CooldownCache::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

} // namespace devpulse::health
