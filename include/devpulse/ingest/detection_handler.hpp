#pragma once

#include "devpulse/common/context.hpp"
#include "devpulse/health/orchestrator.hpp"
#include "devpulse/observability/observer.hpp"

#include <string>

namespace devpulse::ingest {

/// Bridges bus deliveries on the detected subject to the orchestrator. Anything it cannot
/// interpret is rejected with a descriptive error instead of being dropped.
class DetectionHandler {
public:
  DetectionHandler(std::string subject, health::HealthCheckOrchestrator &orchestrator,
                   observability::IObserver &observer);

  [[nodiscard]] common::Status handle(const common::Context &ctx, const std::string &subject,
                                      const std::string &payload);

  [[nodiscard]] const std::string &subject() const { return subject_; }

private:
  std::string subject_;
  health::HealthCheckOrchestrator &orchestrator_;
  observability::IObserver &observer_;
};

} // namespace devpulse::ingest
