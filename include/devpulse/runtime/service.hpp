#pragma once

#include "devpulse/bus/event_channel.hpp"
#include "devpulse/common/context.hpp"
#include "devpulse/common/result.hpp"
#include "devpulse/config/schema.hpp"
#include "devpulse/devices/store.hpp"
#include "devpulse/health/orchestrator.hpp"
#include "devpulse/health/probe.hpp"
#include "devpulse/http/client.hpp"
#include "devpulse/ingest/detection_handler.hpp"
#include "devpulse/observability/observer.hpp"

#include <atomic>
#include <memory>

namespace devpulse::runtime {

/// Collaborators a caller may supply instead of the ones built from config.
struct ServiceOverrides {
  std::shared_ptr<devices::IDeviceStore> store;
  std::shared_ptr<http::HttpClient> http_client;
  bus::TransportFactory transport_factory;
};

[[nodiscard]] health::ProbeOptions make_probe_options(const config::HealthConfig &config);
[[nodiscard]] health::RetryPolicy make_retry_policy(const config::HealthConfig &config);

/// Wires the store, probe, orchestrator, bus channel and detection handler together.
class Service {
public:
  Service(config::Config config, observability::IObserver &observer,
          ServiceOverrides overrides = {});
  ~Service();

  Service(const Service &) = delete;
  Service &operator=(const Service &) = delete;

  /// Connects to the bus, subscribes to detections and starts the cooldown sweep.
  [[nodiscard]] common::Status start();
  /// Stops the sweep, closes the channel within bus.close_timeout_ms, then drains the
  /// orchestrator. Safe to call more than once.
  [[nodiscard]] common::Status stop();
  [[nodiscard]] bool is_running() const { return running_.load(); }

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] devices::IDeviceStore *store() const { return store_.get(); }
  [[nodiscard]] health::HealthCheckOrchestrator *orchestrator() const {
    return orchestrator_.get();
  }
  [[nodiscard]] bus::EventChannel *channel() const { return channel_.get(); }

private:
  config::Config config_;
  observability::IObserver &observer_;
  ServiceOverrides overrides_;

  common::Context ctx_;
  std::shared_ptr<devices::IDeviceStore> store_;
  std::unique_ptr<bus::EventChannel> channel_;
  std::unique_ptr<health::HealthCheckOrchestrator> orchestrator_;
  std::unique_ptr<ingest::DetectionHandler> handler_;
  std::atomic<bool> running_{false};
};

} // namespace devpulse::runtime
