#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace devpulse::health {

/// Remembers when each device was last probed and suppresses re-probing inside the
/// cooldown window. Keys are normalized device identifiers.
class CooldownCache {
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  explicit CooldownCache(std::chrono::milliseconds cooldown, NowFn now = {});

  [[nodiscard]] bool can_check(const std::string &identifier) const;
  void mark_checked(const std::string &identifier);
  /// Drops the entry so the next detection is probed straight away.
  void forget(const std::string &identifier);
  /// Zero when a check is allowed now.
  [[nodiscard]] std::chrono::milliseconds time_until_next_check(const std::string &identifier) const;
  [[nodiscard]] std::optional<Clock::time_point> last_checked(const std::string &identifier) const;

  /// Evicts entries older than twice the cooldown and returns how many were removed.
  std::size_t cleanup();
  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] std::chrono::milliseconds cooldown() const { return cooldown_; }

private:
  [[nodiscard]] Clock::time_point now() const;

  std::chrono::milliseconds cooldown_;
  NowFn now_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Clock::time_point> entries_;
};

} // namespace devpulse::health
