#pragma once

#include "devpulse/common/result.hpp"
#include "devpulse/common/time_util.hpp"

#include <optional>
#include <string>

namespace devpulse::events {

inline constexpr const char *kDeviceDetectedType = "device.detected";
inline constexpr const char *kDeviceStatusChangedType = "device.status_changed";

/// A device was seen on the network at the given address.
struct DetectionEvent {
  std::string event_id;
  std::string event_type = kDeviceDetectedType;
  std::string identifier;
  std::string address;
  common::SystemTime detected_at{};
};

struct DeviceStatusChangedEvent {
  std::string event_id;
  std::string identifier;
  std::string previous_status;
  std::string status;
  common::SystemTime changed_at{};
  /// Id of the detection that triggered the check.
  std::string cause_event_id;
};

/// Random RFC 4122 version 4 identifier.
[[nodiscard]] common::Result<std::string> generate_event_id();

[[nodiscard]] common::Result<DetectionEvent> make_detection_event(const std::string &identifier,
                                                                  const std::string &address);

/// Structural checks only: required fields, type sentinel, identifier and address format.
[[nodiscard]] common::Status validate_detection_event(const DetectionEvent &event);

/// Decodes the wire form. A missing detected_at defaults to now.
[[nodiscard]] common::Result<DetectionEvent> parse_detection_event(const std::string &json);

[[nodiscard]] std::string to_json(const DetectionEvent &event);
[[nodiscard]] std::string to_json(const DeviceStatusChangedEvent &event);

[[nodiscard]] common::Result<DeviceStatusChangedEvent>
make_status_changed_event(const std::string &identifier, const std::string &previous_status,
                          const std::string &status, const std::string &cause_event_id);

} // namespace devpulse::events
