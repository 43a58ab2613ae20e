#include "devpulse/events/subjects.hpp"

#include "devpulse/events/detection.hpp"

namespace devpulse::events {

namespace {

std::string join_subject(const std::string &prefix, const std::string &suffix) {
  if (prefix.empty()) {
    return suffix;
  }
  if (prefix.back() == '.') {
    return prefix + suffix;
  }
  return prefix + "." + suffix;
}

} // namespace

std::string detected_subject(const std::string &prefix) {
  return join_subject(prefix, kDeviceDetectedType);
}

std::string status_changed_subject(const std::string &prefix) {
  return join_subject(prefix, kDeviceStatusChangedType);
}

} // namespace devpulse::events
