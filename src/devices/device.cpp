#include "devpulse/devices/device.hpp"

#include "devpulse/common/fs.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cctype>
#include <regex>

namespace devpulse::devices {

namespace {

bool is_ipv4(const std::string &host) {
  in_addr addr{};
  return inet_pton(AF_INET, host.c_str(), &addr) == 1;
}

bool is_ipv6(const std::string &host) {
  in6_addr addr{};
  return inet_pton(AF_INET6, host.c_str(), &addr) == 1;
}

bool valid_port(const std::string &port) {
  if (port.empty() || port.size() > 5) {
    return false;
  }
  for (const char ch : port) {
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
      return false;
    }
  }
  const auto value = std::stoul(port);
  return value >= 1 && value <= 65535;
}

} // namespace

std::string status_to_string(const DeviceStatus status) {
  switch (status) {
  case DeviceStatus::Unknown:
    return "unknown";
  case DeviceStatus::Registered:
    return "registered";
  case DeviceStatus::Online:
    return "online";
  case DeviceStatus::Offline:
    return "offline";
  }
  return "unknown";
}

std::optional<DeviceStatus> status_from_string(std::string_view value) {
  const std::string v = common::to_lower(common::trim(std::string(value)));
  if (v == "unknown") {
    return DeviceStatus::Unknown;
  }
  if (v == "registered") {
    return DeviceStatus::Registered;
  }
  if (v == "online") {
    return DeviceStatus::Online;
  }
  if (v == "offline") {
    return DeviceStatus::Offline;
  }
  return std::nullopt;
}

void Device::update_status(const DeviceStatus next, const common::SystemTime at) {
  status = next;
  last_seen = at;
}

std::string normalize_identifier(const std::string &identifier) {
  return common::to_upper(common::trim(identifier));
}

common::Status validate_identifier(const std::string &identifier) {
  if (identifier.empty()) {
    return common::Status::validation("device identifier is required");
  }
  static const std::regex mac_re(R"(^([0-9A-Fa-f]{2}[:-]){5}([0-9A-Fa-f]{2})$)");
  if (!std::regex_match(identifier, mac_re)) {
    return common::Status::validation("invalid hardware address: " + identifier);
  }
  if (identifier.find(':') != std::string::npos && identifier.find('-') != std::string::npos) {
    return common::Status::validation("hardware address mixes separators: " + identifier);
  }
  return common::Status::success();
}

common::Status validate_address(const std::string &address) {
  if (address.empty()) {
    return common::Status::validation("device address is required");
  }
  if (address.size() > kMaxAddressLength) {
    return common::Status::validation("device address is too long");
  }

  if (address.front() == '[') {
    const auto close = address.find(']');
    if (close == std::string::npos || !is_ipv6(address.substr(1, close - 1))) {
      return common::Status::validation("invalid IPv6 device address: " + address);
    }
    const std::string rest = address.substr(close + 1);
    if (rest.empty() || (rest.front() == ':' && valid_port(rest.substr(1)))) {
      return common::Status::success();
    }
    return common::Status::validation("invalid port in device address: " + address);
  }
  if (is_ipv4(address) || is_ipv6(address)) {
    return common::Status::success();
  }

  const auto colon = address.rfind(':');
  if (colon != std::string::npos && is_ipv4(address.substr(0, colon))) {
    if (valid_port(address.substr(colon + 1))) {
      return common::Status::success();
    }
    return common::Status::validation("invalid port in device address: " + address);
  }
  return common::Status::validation("device address must be an IP address: " + address);
}

common::Status validate_device(const Device &device) {
  if (auto status = validate_identifier(device.identifier); !status.ok()) {
    return status;
  }
  if (common::trim(device.name).empty()) {
    return common::Status::validation("device name is required");
  }
  if (device.name.size() > kMaxNameLength) {
    return common::Status::validation("device name must be at most " +
                                      std::to_string(kMaxNameLength) + " characters");
  }
  if (device.location.size() > kMaxLocationLength) {
    return common::Status::validation("device location must be at most " +
                                      std::to_string(kMaxLocationLength) + " characters");
  }
  return validate_address(device.address);
}

common::Result<Device> make_device(const std::string &identifier, const std::string &name,
                                   const std::string &address, const std::string &location) {
  Device device;
  device.identifier = normalize_identifier(identifier);
  device.name = common::trim(name);
  device.address = common::trim(address);
  device.location = common::trim(location);
  device.registered_at = std::chrono::system_clock::now();
  device.last_seen = device.registered_at;
  device.status = DeviceStatus::Registered;

  if (auto status = validate_device(device); !status.ok()) {
    return common::Result<Device>::failure(status);
  }
  return common::Result<Device>::success(std::move(device));
}

} // namespace devpulse::devices
