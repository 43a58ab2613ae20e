#pragma once

#include "devpulse/common/result.hpp"
#include "devpulse/common/time_util.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace devpulse::devices {

inline constexpr std::size_t kMaxNameLength = 100;
inline constexpr std::size_t kMaxLocationLength = 255;
inline constexpr std::size_t kMaxAddressLength = 255;

enum class DeviceStatus {
  Unknown,
  Registered,
  Online,
  Offline,
};

[[nodiscard]] std::string status_to_string(DeviceStatus status);
[[nodiscard]] std::optional<DeviceStatus> status_from_string(std::string_view value);

struct Device {
  std::string identifier;
  std::string name;
  std::string address;
  std::string location;
  common::SystemTime registered_at{};
  common::SystemTime last_seen{};
  DeviceStatus status = DeviceStatus::Unknown;

  /// Sets the status and refreshes last_seen.
  void update_status(DeviceStatus next, common::SystemTime at = std::chrono::system_clock::now());
};

/// Trimmed, upper-cased form used as the key everywhere.
[[nodiscard]] std::string normalize_identifier(const std::string &identifier);

/// Hardware address in XX:XX:XX:XX:XX:XX or XX-XX-XX-XX-XX-XX form (separators not mixed).
[[nodiscard]] common::Status validate_identifier(const std::string &identifier);

/// Host or IP literal with an optional port, suitable for http://{address}/.
[[nodiscard]] common::Status validate_address(const std::string &address);

[[nodiscard]] common::Status validate_device(const Device &device);

/// New device in Registered status, registered and last seen now.
[[nodiscard]] common::Result<Device> make_device(const std::string &identifier,
                                                 const std::string &name,
                                                 const std::string &address,
                                                 const std::string &location);

} // namespace devpulse::devices
