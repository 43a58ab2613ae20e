#include "devpulse/observability/factory.hpp"

#include "devpulse/common/fs.hpp"
#include "devpulse/observability/log_observer.hpp"
#include "devpulse/observability/multi_observer.hpp"
#include "devpulse/observability/noop_observer.hpp"

#include <sstream>

namespace devpulse::observability {

std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config) {
  const LogLevel level = parse_log_level(config.level).value_or(LogLevel::Info);
  const std::string backend = common::to_lower(common::trim(config.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend == "log") {
    return std::make_unique<LogObserver>(level);
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    bool has_log = false;
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string p = common::trim(part);
      if (p == "log" && !has_log) {
        multi->add(std::make_unique<LogObserver>(level));
        has_log = true;
      }
    }
    if (multi->size() == 0) {
      return std::make_unique<NoopObserver>();
    }
    return multi;
  }

  return std::make_unique<LogObserver>(level);
}

} // namespace devpulse::observability
