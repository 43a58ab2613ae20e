#pragma once

#include "devpulse/common/result.hpp"

#include <chrono>
#include <string>

namespace devpulse::common {

using SystemTime = std::chrono::system_clock::time_point;

[[nodiscard]] std::string format_rfc3339(SystemTime time);
[[nodiscard]] std::string now_rfc3339();

/// Accepts "2024-01-02T03:04:05Z", fractional seconds and numeric offsets ("+02:00").
[[nodiscard]] Result<SystemTime> parse_rfc3339(const std::string &text);

} // namespace devpulse::common
