#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace devpulse::observability {

struct DetectionReceivedEvent {
  std::string identifier;
  std::string event_id;
  std::string address;
};

struct CooldownSuppressedEvent {
  std::string identifier;
  std::string event_id;
  std::chrono::milliseconds remaining{0};
};

struct HealthCheckStartedEvent {
  std::string identifier;
  std::string event_id;
  std::string address;
};

struct ProbeAttemptEvent {
  std::string address;
  std::uint32_t attempt = 0;
  std::uint16_t status_code = 0;
  bool success = false;
  std::chrono::milliseconds duration{0};
  std::string error;
};

struct RetryScheduledEvent {
  std::string address;
  std::uint32_t attempt = 0;
  std::chrono::milliseconds delay{0};
};

struct HealthCheckCompletedEvent {
  std::string identifier;
  std::string event_id;
  bool success = false;
  bool cancelled = false;
  std::uint32_t attempts = 0;
  std::chrono::milliseconds duration{0};
  std::string error;
  std::string response_snippet;
};

struct DeviceStatusUpdatedEvent {
  std::string identifier;
  std::string event_id;
  std::string previous_status;
  std::string status;
};

enum class BusState { Connected, Disconnected, Reconnected, Closed };

struct BusConnectionEvent {
  BusState state = BusState::Connected;
  std::string server;
  std::string detail;
};

struct CleanupSweepEvent {
  std::size_t removed = 0;
  std::size_t remaining = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
  std::string identifier;
  std::string event_id;
};

using ObserverEvent =
    std::variant<DetectionReceivedEvent, CooldownSuppressedEvent, HealthCheckStartedEvent,
                 ProbeAttemptEvent, RetryScheduledEvent, HealthCheckCompletedEvent,
                 DeviceStatusUpdatedEvent, BusConnectionEvent, CleanupSweepEvent, ErrorEvent>;

struct ProbesInFlightMetric {
  std::uint64_t count = 0;
};

struct ProbeLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct CooldownEntriesMetric {
  std::uint64_t count = 0;
};

struct QueueDepthMetric {
  std::uint64_t depth = 0;
};

using ObserverMetric = std::variant<ProbesInFlightMetric, ProbeLatencyMetric,
                                    CooldownEntriesMetric, QueueDepthMetric>;

[[nodiscard]] std::string_view bus_state_name(BusState state);

/// Sink for pipeline events and metrics. Implementations must be safe to call from
/// worker threads concurrently.
class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace devpulse::observability
