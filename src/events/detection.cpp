#include "devpulse/events/detection.hpp"

#include "devpulse/common/fs.hpp"
#include "devpulse/common/json_util.hpp"
#include "devpulse/devices/device.hpp"

#include <openssl/rand.h>

#include <array>
#include <iomanip>
#include <sstream>

namespace devpulse::events {

namespace {

std::string field(const common::JsonFlatMap &values, const std::string &key) {
  const auto it = values.find(key);
  return it == values.end() ? "" : common::trim(it->second);
}

} // namespace

common::Result<std::string> generate_event_id() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    return common::Result<std::string>::failure("failed to generate event id");
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out << '-';
    }
    out << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return common::Result<std::string>::success(out.str());
}

common::Result<DetectionEvent> make_detection_event(const std::string &identifier,
                                                    const std::string &address) {
  auto id = generate_event_id();
  if (!id.ok()) {
    return common::Result<DetectionEvent>::failure(id.status());
  }
  DetectionEvent event;
  event.event_id = id.value();
  event.identifier = devices::normalize_identifier(identifier);
  event.address = common::trim(address);
  event.detected_at = std::chrono::system_clock::now();

  if (auto status = validate_detection_event(event); !status.ok()) {
    return common::Result<DetectionEvent>::failure(status);
  }
  return common::Result<DetectionEvent>::success(std::move(event));
}

common::Status validate_detection_event(const DetectionEvent &event) {
  if (event.identifier.empty()) {
    return common::Status::validation("mac address is required");
  }
  if (event.address.empty()) {
    return common::Status::validation("ip address is required");
  }
  if (event.event_id.empty()) {
    return common::Status::validation("event ID is required");
  }
  if (event.event_type.empty()) {
    return common::Status::validation("event type is required");
  }
  if (event.event_type != kDeviceDetectedType) {
    return common::Status::validation("invalid event type: " + event.event_type);
  }
  if (auto status = devices::validate_identifier(event.identifier); !status.ok()) {
    return status;
  }
  return devices::validate_address(event.address);
}

common::Result<DetectionEvent> parse_detection_event(const std::string &json) {
  if (!common::json_looks_like_object(json)) {
    return common::Result<DetectionEvent>::failure("detection event is not a JSON object",
                                                   common::ErrorKind::Validation);
  }
  const auto values = common::json_parse_flat(json);

  DetectionEvent event;
  event.event_id = field(values, "event_id");
  event.event_type = field(values, "event_type");
  event.identifier = devices::normalize_identifier(field(values, "mac_address"));
  event.address = field(values, "ip_address");

  const std::string detected_at = field(values, "detected_at");
  if (detected_at.empty() || detected_at == "null") {
    event.detected_at = std::chrono::system_clock::now();
  } else {
    auto parsed = common::parse_rfc3339(detected_at);
    if (!parsed.ok()) {
      return common::Result<DetectionEvent>::failure("invalid detected_at: " + parsed.error(),
                                                     common::ErrorKind::Validation);
    }
    event.detected_at = parsed.value();
  }

  if (auto status = validate_detection_event(event); !status.ok()) {
    return common::Result<DetectionEvent>::failure(status);
  }
  return common::Result<DetectionEvent>::success(std::move(event));
}

std::string to_json(const DetectionEvent &event) {
  std::ostringstream out;
  out << "{\"mac_address\":\"" << common::json_escape(event.identifier) << "\","
      << "\"ip_address\":\"" << common::json_escape(event.address) << "\","
      << "\"detected_at\":\"" << common::format_rfc3339(event.detected_at) << "\","
      << "\"event_id\":\"" << common::json_escape(event.event_id) << "\","
      << "\"event_type\":\"" << common::json_escape(event.event_type) << "\"}";
  return out.str();
}

std::string to_json(const DeviceStatusChangedEvent &event) {
  std::ostringstream out;
  out << "{\"event_id\":\"" << common::json_escape(event.event_id) << "\","
      << "\"event_type\":\"" << kDeviceStatusChangedType << "\","
      << "\"mac_address\":\"" << common::json_escape(event.identifier) << "\","
      << "\"previous_status\":\"" << common::json_escape(event.previous_status) << "\","
      << "\"status\":\"" << common::json_escape(event.status) << "\","
      << "\"changed_at\":\"" << common::format_rfc3339(event.changed_at) << "\","
      << "\"cause_event_id\":\"" << common::json_escape(event.cause_event_id) << "\"}";
  return out.str();
}

common::Result<DeviceStatusChangedEvent>
make_status_changed_event(const std::string &identifier, const std::string &previous_status,
                          const std::string &status, const std::string &cause_event_id) {
  auto id = generate_event_id();
  if (!id.ok()) {
    return common::Result<DeviceStatusChangedEvent>::failure(id.status());
  }
  DeviceStatusChangedEvent event;
  event.event_id = id.value();
  event.identifier = identifier;
  event.previous_status = previous_status;
  event.status = status;
  event.changed_at = std::chrono::system_clock::now();
  event.cause_event_id = cause_event_id;
  return common::Result<DeviceStatusChangedEvent>::success(std::move(event));
}

} // namespace devpulse::events
