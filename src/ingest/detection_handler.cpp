#include "devpulse/ingest/detection_handler.hpp"

#include "devpulse/common/json_util.hpp"
#include "devpulse/events/detection.hpp"

namespace devpulse::ingest {

DetectionHandler::DetectionHandler(std::string subject,
                                   health::HealthCheckOrchestrator &orchestrator,
                                   observability::IObserver &observer)
    : subject_(std::move(subject)), orchestrator_(orchestrator), observer_(observer) {}

common::Status DetectionHandler::handle(const common::Context &ctx, const std::string &subject,
                                        const std::string &payload) {
  if (subject != subject_) {
    return common::Status::validation("unknown subject: " + subject);
  }

  const std::string event_type = common::json_get_string(payload, "event_type");
  if (event_type != events::kDeviceDetectedType) {
    return common::Status::validation("invalid event type: " +
                                      (event_type.empty() ? std::string("<missing>") : event_type));
  }

  auto event = events::parse_detection_event(payload);
  if (!event.ok()) {
    observer_.record_event(observability::ErrorEvent{
        .component = "ingest",
        .message = "rejected detection: " + event.error(),
        .identifier = common::json_get_string(payload, "mac_address"),
        .event_id = common::json_get_string(payload, "event_id"),
    });
    return event.status();
  }
  return orchestrator_.on_detection_event(ctx, event.value());
}

} // namespace devpulse::ingest
