#include "devpulse/observability/log_observer.hpp"

#include "devpulse/common/fs.hpp"
#include "devpulse/common/time_util.hpp"

#include <iostream>
#include <type_traits>

namespace devpulse::observability {

namespace {

const char *level_label(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

std::string ms(const std::chrono::milliseconds value) { return std::to_string(value.count()); }

// Body snippets can contain newlines; keep each record on one line.
std::string single_line(std::string text) {
  for (auto &ch : text) {
    if (ch == '\n' || ch == '\r') {
      ch = ' ';
    }
  }
  return text;
}

} // namespace

std::string_view bus_state_name(const BusState state) {
  switch (state) {
  case BusState::Connected:
    return "connected";
  case BusState::Disconnected:
    return "disconnected";
  case BusState::Reconnected:
    return "reconnected";
  case BusState::Closed:
    return "closed";
  }
  return "unknown";
}

std::optional<LogLevel> parse_log_level(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "info") {
    return LogLevel::Info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << common::now_rfc3339() << " [" << level_label(level) << "] " << message << "\n";
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, DetectionReceivedEvent>) {
          log_line(LogLevel::Debug, "detection.received device=" + evt.identifier +
                                        " event_id=" + evt.event_id + " address=" + evt.address);
        } else if constexpr (std::is_same_v<T, CooldownSuppressedEvent>) {
          log_line(LogLevel::Info, "health.cooldown_skip device=" + evt.identifier +
                                       " event_id=" + evt.event_id +
                                       " retry_in_ms=" + ms(evt.remaining));
        } else if constexpr (std::is_same_v<T, HealthCheckStartedEvent>) {
          log_line(LogLevel::Info, "health.check_start device=" + evt.identifier +
                                       " event_id=" + evt.event_id + " address=" + evt.address);
        } else if constexpr (std::is_same_v<T, ProbeAttemptEvent>) {
          std::string line = "probe.attempt address=" + evt.address +
                             " attempt=" + std::to_string(evt.attempt) +
                             " status=" + std::to_string(evt.status_code) +
                             " success=" + bool_text(evt.success) +
                             " duration_ms=" + ms(evt.duration);
          if (!evt.error.empty()) {
            line += " error=\"" + evt.error + "\"";
          }
          log_line(LogLevel::Debug, line);
        } else if constexpr (std::is_same_v<T, RetryScheduledEvent>) {
          log_line(LogLevel::Debug, "probe.retry address=" + evt.address +
                                        " attempt=" + std::to_string(evt.attempt) +
                                        " delay_ms=" + ms(evt.delay));
        } else if constexpr (std::is_same_v<T, HealthCheckCompletedEvent>) {
          std::string line = "health.check_done device=" + evt.identifier +
                             " event_id=" + evt.event_id + " success=" + bool_text(evt.success) +
                             " attempts=" + std::to_string(evt.attempts) +
                             " duration_ms=" + ms(evt.duration);
          if (evt.cancelled) {
            line += " cancelled=true";
          }
          if (!evt.error.empty()) {
            line += " error=\"" + evt.error + "\"";
          }
          log_line(evt.success ? LogLevel::Info : LogLevel::Warn, line);
          if (!evt.response_snippet.empty()) {
            log_line(LogLevel::Debug, "health.whoami device=" + evt.identifier +
                                          " body=" + single_line(evt.response_snippet));
          }
        } else if constexpr (std::is_same_v<T, DeviceStatusUpdatedEvent>) {
          log_line(LogLevel::Info, "device.status device=" + evt.identifier +
                                       " event_id=" + evt.event_id + " from=" +
                                       evt.previous_status + " to=" + evt.status);
        } else if constexpr (std::is_same_v<T, BusConnectionEvent>) {
          std::string line = "bus." + std::string(bus_state_name(evt.state));
          if (!evt.server.empty()) {
            line += " server=" + evt.server;
          }
          if (!evt.detail.empty()) {
            line += " detail=\"" + evt.detail + "\"";
          }
          log_line(evt.state == BusState::Disconnected ? LogLevel::Warn : LogLevel::Info, line);
        } else if constexpr (std::is_same_v<T, CleanupSweepEvent>) {
          log_line(LogLevel::Debug, "cooldown.cleanup removed=" + std::to_string(evt.removed) +
                                        " remaining=" + std::to_string(evt.remaining));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          std::string line = evt.component + ": " + evt.message;
          if (!evt.identifier.empty()) {
            line += " device=" + evt.identifier;
          }
          if (!evt.event_id.empty()) {
            line += " event_id=" + evt.event_id;
          }
          log_line(LogLevel::Error, line);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ProbesInFlightMetric>) {
          log_line(LogLevel::Debug, "metric.probes_in_flight=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, ProbeLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.probe_latency_ms=" + ms(m.latency));
        } else if constexpr (std::is_same_v<T, CooldownEntriesMetric>) {
          log_line(LogLevel::Debug, "metric.cooldown_entries=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, QueueDepthMetric>) {
          log_line(LogLevel::Debug, "metric.queue_depth=" + std::to_string(m.depth));
        }
      },
      metric);
}

} // namespace devpulse::observability
