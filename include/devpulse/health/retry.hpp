#pragma once

#include "devpulse/health/probe.hpp"
#include "devpulse/observability/observer.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace devpulse::health {

struct ProbeOutcome {
  bool success = false;
  std::uint32_t attempts = 0;
  std::optional<std::string> last_error;
  bool cancelled = false;
  std::uint16_t status_code = 0;
  /// Duration of the last attempt.
  std::chrono::milliseconds duration{0};
  std::string response_snippet;
};

class IHealthChecker {
public:
  virtual ~IHealthChecker() = default;
  [[nodiscard]] virtual ProbeOutcome check_health(const common::Context &ctx,
                                                  const std::string &address) = 0;
};

struct RetryPolicy {
  std::uint32_t attempts = 3;
  std::chrono::milliseconds initial_delay{3000};
};

/// Retries every failed probe with exponential backoff. Backoff waits end early when the
/// context is cancelled and the outcome is then reported as cancelled.
class RetryingHealthProbe final : public IHealthChecker {
public:
  RetryingHealthProbe(HealthProbe probe, RetryPolicy policy, observability::IObserver &observer);

  [[nodiscard]] ProbeOutcome check_health(const common::Context &ctx,
                                          const std::string &address) override;

  [[nodiscard]] const RetryPolicy &policy() const { return policy_; }

private:
  HealthProbe probe_;
  RetryPolicy policy_;
  observability::IObserver &observer_;
};

} // namespace devpulse::health
