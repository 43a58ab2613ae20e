#pragma once

#include <string>

namespace devpulse::events {

[[nodiscard]] std::string detected_subject(const std::string &prefix);
[[nodiscard]] std::string status_changed_subject(const std::string &prefix);

} // namespace devpulse::events
