#include "devpulse/runtime/service.hpp"

#include "devpulse/events/subjects.hpp"
#include "devpulse/health/retry.hpp"

#include <iostream>

namespace devpulse::runtime {

health::ProbeOptions make_probe_options(const config::HealthConfig &config) {
  health::ProbeOptions options;
  options.timeout = std::chrono::milliseconds(config.request_timeout_ms);
  options.user_agent = config.user_agent;
  options.max_body_bytes = static_cast<std::size_t>(config.max_body_bytes);
  return options;
}

health::RetryPolicy make_retry_policy(const config::HealthConfig &config) {
  return health::RetryPolicy{
      .attempts = config.retry_attempts,
      .initial_delay = std::chrono::milliseconds(config.initial_delay_ms),
  };
}

Service::Service(config::Config config, observability::IObserver &observer,
                 ServiceOverrides overrides)
    : config_(std::move(config)), observer_(observer), overrides_(std::move(overrides)),
      ctx_(common::Context::with_cancel(common::Context::background())) {}

Service::~Service() {
  if (running_.load()) {
    auto stopped = stop();
    if (!stopped.ok()) {
      std::cerr << "[service][stop] error=" << stopped.error() << "\n";
    }
  }
}

common::Status Service::start() {
  if (running_.load()) {
    return common::Status::error("service already running");
  }

  if (overrides_.store != nullptr) {
    store_ = overrides_.store;
  } else {
    auto created = devices::create_device_store(config_.storage);
    if (!created.ok()) {
      return created.status();
    }
    store_ = std::shared_ptr<devices::IDeviceStore>(std::move(created.value()));
  }

  std::shared_ptr<http::HttpClient> client = overrides_.http_client;
  if (client == nullptr) {
    client = std::make_shared<http::CurlHttpClient>();
  }
  auto checker = std::make_shared<health::RetryingHealthProbe>(
      health::HealthProbe(client, make_probe_options(config_.health)),
      make_retry_policy(config_.health), observer_);

  channel_ = std::make_unique<bus::EventChannel>(bus::make_channel_options(config_.bus), observer_,
                                                 overrides_.transport_factory);
  orchestrator_ = std::make_unique<health::HealthCheckOrchestrator>(
      store_, checker, health::make_orchestrator_options(config_), observer_, channel_.get());
  handler_ = std::make_unique<ingest::DetectionHandler>(
      events::detected_subject(config_.bus.subject_prefix), *orchestrator_, observer_);

  auto subscribed = channel_->subscribe(
      handler_->subject(),
      [this](const common::Context &ctx, const std::string &subject, const std::string &payload) {
        return handler_->handle(ctx, subject, payload);
      });
  if (!subscribed.ok()) {
    return subscribed;
  }

  auto connected = channel_->connect();
  if (!connected.ok()) {
    (void)orchestrator_->shutdown(std::chrono::milliseconds(0));
    return connected;
  }

  orchestrator_->start_cleanup(ctx_);
  running_.store(true);
  return common::Status::success();
}

common::Status Service::stop() {
  if (!running_.exchange(false)) {
    return common::Status::success();
  }
  const auto close_timeout = std::chrono::milliseconds(config_.bus.close_timeout_ms);

  orchestrator_->stop_cleanup();

  const auto close_ctx = common::Context::with_timeout(ctx_, close_timeout);
  auto closed = channel_->close(close_ctx);

  const bool drained = orchestrator_->shutdown(close_timeout);
  ctx_.cancel();

  if (!closed.ok()) {
    return closed;
  }
  if (!drained) {
    return common::Status::error("health checks still running after " +
                                     std::to_string(close_timeout.count()) + "ms were cancelled",
                                 common::ErrorKind::Cancelled);
  }
  return common::Status::success();
}

} // namespace devpulse::runtime
