#pragma once

#include "devpulse/common/context.hpp"
#include "devpulse/common/result.hpp"
#include "devpulse/config/schema.hpp"
#include "devpulse/devices/store.hpp"
#include "devpulse/events/detection.hpp"
#include "devpulse/events/publisher.hpp"
#include "devpulse/health/cooldown.hpp"
#include "devpulse/health/retry.hpp"
#include "devpulse/health/semaphore.hpp"
#include "devpulse/health/worker_pool.hpp"
#include "devpulse/observability/observer.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace devpulse::health {

struct OrchestratorOptions {
  std::chrono::milliseconds cooldown{std::chrono::seconds(120)};
  std::chrono::milliseconds cleanup_interval{std::chrono::minutes(10)};
  std::size_t max_concurrent = 10;
  std::size_t worker_threads = 16;
  std::size_t queue_capacity = 256;
  bool publish_status_changes = true;
  std::string status_subject;
  std::chrono::milliseconds publish_timeout{5000};
};

[[nodiscard]] OrchestratorOptions make_orchestrator_options(const config::Config &config);

/// What happened to one dispatched detection.
struct CheckReport {
  std::string identifier;
  std::string event_id;
  /// The check never ran to completion (no slot, or cancelled mid-probe).
  bool abandoned = false;
  ProbeOutcome outcome;
  std::optional<devices::DeviceStatus> previous_status;
  std::optional<devices::DeviceStatus> status;
  bool persisted = false;
  bool published = false;
  std::optional<std::string> error;
};

/// Turns detection events into health checks: cooldown dedup, bounded concurrency, retrying
/// probe, status persistence and an optional status-changed publication.
///
/// Checks run on an internal worker pool under the orchestrator's own dispatch context, so
/// cancelling the context that delivered an event never aborts a check already accepted.
/// shutdown() is what ends in-flight work.
class HealthCheckOrchestrator {
public:
  HealthCheckOrchestrator(std::shared_ptr<devices::IDeviceStore> store,
                          std::shared_ptr<IHealthChecker> checker, OrchestratorOptions options,
                          observability::IObserver &observer,
                          events::IEventPublisher *publisher = nullptr,
                          CooldownCache::NowFn now = {});
  ~HealthCheckOrchestrator();

  HealthCheckOrchestrator(const HealthCheckOrchestrator &) = delete;
  HealthCheckOrchestrator &operator=(const HealthCheckOrchestrator &) = delete;

  /// Validation errors and a full queue are returned; the check itself runs asynchronously
  /// and its result is only observable through the observer and the device store.
  [[nodiscard]] common::Status on_detection_event(const common::Context &ctx,
                                                  const events::DetectionEvent &event);

  /// Queues a check without consulting the cooldown.
  [[nodiscard]] common::Result<std::shared_future<CheckReport>>
  dispatch(const events::DetectionEvent &event);

  void start_cleanup(const common::Context &ctx);
  void stop_cleanup();

  /// Stops accepting events, waits up to timeout for queued and running checks, then
  /// cancels whatever is left and joins the workers. Returns true if everything finished
  /// inside the timeout.
  bool shutdown(std::chrono::milliseconds timeout);

  [[nodiscard]] std::size_t in_flight() const { return semaphore_.in_use(); }
  [[nodiscard]] std::size_t peak_in_flight() const { return semaphore_.peak(); }
  [[nodiscard]] CooldownCache &cooldown() { return cooldown_; }
  [[nodiscard]] const OrchestratorOptions &options() const { return options_; }

private:
  [[nodiscard]] CheckReport run_check(const events::DetectionEvent &event);
  void publish_status_change(const events::DetectionEvent &event, CheckReport &report);
  void report_error(const events::DetectionEvent &event, const std::string &message);
  void cleanup_loop(common::Context ctx);

  std::shared_ptr<devices::IDeviceStore> store_;
  std::shared_ptr<IHealthChecker> checker_;
  OrchestratorOptions options_;
  observability::IObserver &observer_;
  events::IEventPublisher *publisher_;

  CooldownCache cooldown_;
  CountingSemaphore semaphore_;
  common::Context dispatch_ctx_;
  WorkerPool pool_;

  std::mutex cleanup_mutex_;
  bool cleanup_started_ = false;
  bool cleanup_stopped_ = false;
  std::optional<common::Context> cleanup_ctx_;
  std::thread cleanup_thread_;
  std::atomic<bool> shut_down_{false};
};

} // namespace devpulse::health
