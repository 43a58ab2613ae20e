#pragma once

#include "devpulse/config/schema.hpp"
#include "devpulse/observability/observer.hpp"

#include <memory>

namespace devpulse::observability {

/// Builds the observer named by observability.backend ("log", "none", or a comma list),
/// filtered at observability.level.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config);

} // namespace devpulse::observability
