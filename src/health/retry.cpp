#include "devpulse/health/retry.hpp"

namespace devpulse::health {

namespace {

ProbeOutcome cancelled_outcome(ProbeOutcome outcome, const common::Context &ctx) {
  outcome.success = false;
  outcome.cancelled = true;
  const auto status = ctx.error();
  outcome.last_error = status.ok() ? "context cancelled after " +
                                         std::to_string(outcome.attempts) + " attempts"
                                   : status.error();
  return outcome;
}

} // namespace

RetryingHealthProbe::RetryingHealthProbe(HealthProbe probe, RetryPolicy policy,
                                         observability::IObserver &observer)
    : probe_(std::move(probe)), policy_(policy), observer_(observer) {
  if (policy_.attempts == 0) {
    policy_.attempts = 1;
  }
}

ProbeOutcome RetryingHealthProbe::check_health(const common::Context &ctx,
                                               const std::string &address) {
  ProbeOutcome outcome;
  if (ctx.cancelled()) {
    return cancelled_outcome(std::move(outcome), ctx);
  }

  auto delay = policy_.initial_delay;
  for (std::uint32_t attempt = 1; attempt <= policy_.attempts; ++attempt) {
    auto result = probe_.probe(ctx, address);
    outcome.attempts = attempt;
    outcome.status_code = result.status_code;
    outcome.duration = result.duration;
    outcome.response_snippet = std::move(result.body_snippet);
    outcome.last_error = result.error;

    observer_.record_event(observability::ProbeAttemptEvent{
        .address = address,
        .attempt = attempt,
        .status_code = result.status_code,
        .success = result.success,
        .duration = result.duration,
        .error = result.error.value_or(""),
    });
    observer_.record_metric(observability::ProbeLatencyMetric{.latency = result.duration});

    if (result.success) {
      outcome.success = true;
      outcome.last_error.reset();
      return outcome;
    }
    if (result.cancelled || ctx.cancelled()) {
      return cancelled_outcome(std::move(outcome), ctx);
    }
    if (attempt == policy_.attempts) {
      break;
    }

    observer_.record_event(observability::RetryScheduledEvent{
        .address = address,
        .attempt = attempt + 1,
        .delay = delay,
    });
    if (!ctx.wait_for(delay)) {
      return cancelled_outcome(std::move(outcome), ctx);
    }
    delay *= 2;
  }

  return outcome;
}

} // namespace devpulse::health
