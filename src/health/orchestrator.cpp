#include "devpulse/health/orchestrator.hpp"

#include "devpulse/events/subjects.hpp"

namespace devpulse::health {

OrchestratorOptions make_orchestrator_options(const config::Config &config) {
  OrchestratorOptions options;
  options.cooldown = std::chrono::seconds(config.health.cooldown_secs);
  options.cleanup_interval = std::chrono::seconds(config.health.cleanup_interval_secs);
  options.max_concurrent = config.health.max_concurrent;
  options.worker_threads = config.health.worker_threads;
  options.queue_capacity = config.health.queue_capacity;
  options.publish_status_changes = config.health.publish_status_changes;
  options.status_subject = events::status_changed_subject(config.bus.subject_prefix);
  options.publish_timeout = std::chrono::milliseconds(config.bus.publish_timeout_ms);
  return options;
}

HealthCheckOrchestrator::HealthCheckOrchestrator(std::shared_ptr<devices::IDeviceStore> store,
                                                 std::shared_ptr<IHealthChecker> checker,
                                                 OrchestratorOptions options,
                                                 observability::IObserver &observer,
                                                 events::IEventPublisher *publisher,
                                                 CooldownCache::NowFn now)
    : store_(std::move(store)), checker_(std::move(checker)), options_(std::move(options)),
      observer_(observer), publisher_(publisher), cooldown_(options_.cooldown, std::move(now)),
      semaphore_(options_.max_concurrent), dispatch_ctx_(common::Context::background()),
      pool_(options_.worker_threads, options_.queue_capacity) {}

HealthCheckOrchestrator::~HealthCheckOrchestrator() {
  stop_cleanup();
  (void)shutdown(std::chrono::milliseconds(0));
}

common::Status HealthCheckOrchestrator::on_detection_event(const common::Context &ctx,
                                                           const events::DetectionEvent &event) {
  if (auto status = ctx.error(); !status.ok()) {
    return status;
  }
  if (auto status = events::validate_detection_event(event); !status.ok()) {
    return status;
  }

  const std::string identifier = devices::normalize_identifier(event.identifier);
  observer_.record_event(observability::DetectionReceivedEvent{
      .identifier = identifier,
      .event_id = event.event_id,
      .address = event.address,
  });

  if (!cooldown_.can_check(identifier)) {
    observer_.record_event(observability::CooldownSuppressedEvent{
        .identifier = identifier,
        .event_id = event.event_id,
        .remaining = cooldown_.time_until_next_check(identifier),
    });
    return common::Status::success();
  }
  cooldown_.mark_checked(identifier);

  auto dispatched = dispatch(event);
  if (!dispatched.ok()) {
    // Nothing was probed, so a re-delivery must not be suppressed.
    cooldown_.forget(identifier);
    report_error(event, dispatched.error());
    return dispatched.status();
  }
  return common::Status::success();
}

common::Result<std::shared_future<CheckReport>>
HealthCheckOrchestrator::dispatch(const events::DetectionEvent &event) {
  using R = common::Result<std::shared_future<CheckReport>>;
  if (shut_down_) {
    return R::failure("orchestrator is shut down");
  }
  if (auto status = events::validate_detection_event(event); !status.ok()) {
    return R::failure(status);
  }

  auto promise = std::make_shared<std::promise<CheckReport>>();
  std::shared_future<CheckReport> future = promise->get_future().share();

  auto submitted = pool_.submit([this, event, promise]() {
    try {
      promise->set_value(run_check(event));
    } catch (const std::exception &ex) {
      report_error(event, std::string("health check failed: ") + ex.what());
      promise->set_exception(std::current_exception());
    } catch (...) {
      report_error(event, "health check failed: unknown exception");
      promise->set_exception(std::current_exception());
    }
  });
  if (!submitted.ok()) {
    return R::failure(submitted);
  }
  observer_.record_metric(observability::QueueDepthMetric{.depth = pool_.queue_depth()});
  return R::success(std::move(future));
}

CheckReport HealthCheckOrchestrator::run_check(const events::DetectionEvent &event) {
  CheckReport report;
  report.identifier = devices::normalize_identifier(event.identifier);
  report.event_id = event.event_id;

  if (auto acquired = semaphore_.acquire(dispatch_ctx_); !acquired.ok()) {
    report.abandoned = true;
    report.error = "abandoned waiting for probe slot: " + acquired.error();
    report_error(event, *report.error);
    return report;
  }
  SemaphoreGuard slot(semaphore_);
  observer_.record_metric(observability::ProbesInFlightMetric{.count = semaphore_.in_use()});

  observer_.record_event(observability::HealthCheckStartedEvent{
      .identifier = report.identifier,
      .event_id = event.event_id,
      .address = event.address,
  });

  report.outcome = checker_->check_health(dispatch_ctx_, event.address);
  cooldown_.mark_checked(report.identifier);

  observer_.record_event(observability::HealthCheckCompletedEvent{
      .identifier = report.identifier,
      .event_id = event.event_id,
      .success = report.outcome.success,
      .cancelled = report.outcome.cancelled,
      .attempts = report.outcome.attempts,
      .duration = report.outcome.duration,
      .error = report.outcome.last_error.value_or(""),
      .response_snippet = report.outcome.response_snippet,
  });

  if (report.outcome.cancelled) {
    // A shutdown says nothing about the device, so its status is left alone.
    report.abandoned = true;
    report.error = report.outcome.last_error.value_or(common::kContextCanceled);
    report_error(event, "health check cancelled: " + *report.error);
    return report;
  }

  auto found = store_->find_by_identifier(dispatch_ctx_, report.identifier);
  if (!found.ok()) {
    report.error = "device lookup failed: " + found.error();
    report_error(event, *report.error);
    return report;
  }
  if (!found.value().has_value()) {
    report.error = "device not found: " + report.identifier;
    report_error(event, *report.error);
    return report;
  }

  devices::Device device = *found.value();
  const auto target =
      report.outcome.success ? devices::DeviceStatus::Online : devices::DeviceStatus::Offline;
  report.previous_status = device.status;
  report.status = target;
  device.update_status(target);

  if (auto updated = store_->update(dispatch_ctx_, device); !updated.ok()) {
    report.error = "failed to update device status: " + updated.error();
    report_error(event, *report.error);
    return report;
  }
  report.persisted = true;

  observer_.record_event(observability::DeviceStatusUpdatedEvent{
      .identifier = report.identifier,
      .event_id = event.event_id,
      .previous_status = devices::status_to_string(*report.previous_status),
      .status = devices::status_to_string(target),
  });

  if (*report.previous_status != target) {
    publish_status_change(event, report);
  }
  return report;
}

void HealthCheckOrchestrator::publish_status_change(const events::DetectionEvent &event,
                                                    CheckReport &report) {
  if (publisher_ == nullptr || !options_.publish_status_changes ||
      options_.status_subject.empty()) {
    return;
  }

  auto changed = events::make_status_changed_event(
      report.identifier, devices::status_to_string(*report.previous_status),
      devices::status_to_string(*report.status), event.event_id);
  if (!changed.ok()) {
    report_error(event, changed.error());
    return;
  }

  const auto ctx = common::Context::with_timeout(dispatch_ctx_, options_.publish_timeout);
  auto published =
      events::publish_event(*publisher_, ctx, options_.status_subject, changed.value());
  if (!published.ok()) {
    report_error(event, "failed to publish status change: " + published.error());
    return;
  }
  report.published = true;
}

void HealthCheckOrchestrator::report_error(const events::DetectionEvent &event,
                                           const std::string &message) {
  observer_.record_event(observability::ErrorEvent{
      .component = "health",
      .message = message,
      .identifier = devices::normalize_identifier(event.identifier),
      .event_id = event.event_id,
  });
}

void HealthCheckOrchestrator::start_cleanup(const common::Context &ctx) {
  std::lock_guard<std::mutex> lock(cleanup_mutex_);
  if (cleanup_started_) {
    return;
  }
  cleanup_started_ = true;
  cleanup_ctx_ = common::Context::with_cancel(ctx);
  cleanup_thread_ = std::thread([this, loop_ctx = *cleanup_ctx_]() { cleanup_loop(loop_ctx); });
}

void HealthCheckOrchestrator::stop_cleanup() {
  std::thread thread;
  {
    std::lock_guard<std::mutex> lock(cleanup_mutex_);
    if (!cleanup_started_ || cleanup_stopped_) {
      return;
    }
    cleanup_stopped_ = true;
    cleanup_ctx_->cancel();
    thread = std::move(cleanup_thread_);
  }
  if (thread.joinable()) {
    thread.join();
  }
}

void HealthCheckOrchestrator::cleanup_loop(common::Context ctx) {
  while (ctx.wait_for(options_.cleanup_interval)) {
    const std::size_t removed = cooldown_.cleanup();
    const std::size_t remaining = cooldown_.size();
    observer_.record_event(observability::CleanupSweepEvent{
        .removed = removed,
        .remaining = remaining,
    });
    observer_.record_metric(observability::CooldownEntriesMetric{.count = remaining});
  }
}

bool HealthCheckOrchestrator::shutdown(const std::chrono::milliseconds timeout) {
  if (shut_down_.exchange(true)) {
    return true;
  }
  stop_cleanup();
  pool_.stop_accepting();
  const bool drained = pool_.wait_idle(timeout);
  dispatch_ctx_.cancel();
  (void)pool_.shutdown(std::chrono::milliseconds(0));
  return drained;
}

} // namespace devpulse::health
