#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace devpulse::config {

struct HealthConfig {
  std::uint64_t cooldown_secs = 120;
  std::uint64_t cleanup_interval_secs = 600;
  std::uint32_t max_concurrent = 10;
  std::uint32_t worker_threads = 16;
  std::uint32_t queue_capacity = 256;
  std::uint32_t retry_attempts = 3;
  std::uint64_t initial_delay_ms = 3000;
  std::uint64_t request_timeout_ms = 15000;
  std::string user_agent = "devpulse/0.1";
  std::uint64_t max_body_bytes = 4096;
  bool publish_status_changes = true;
};

struct BusConfig {
  std::vector<std::string> urls = {"nats://localhost:4222"};
  std::string client_id = "devpulse";
  std::string subject_prefix = "liwaisi.iot.smart-irrigation";
  std::optional<std::string> user;
  std::optional<std::string> password;
  std::optional<std::string> token;
  std::uint64_t connect_timeout_ms = 5000;
  std::uint64_t reconnect_wait_ms = 2000;
  std::uint32_t max_reconnect_attempts = 60;
  std::uint64_t ping_interval_secs = 30;
  std::uint32_t max_pings_outstanding = 2;
  std::uint64_t close_timeout_ms = 10000;
  std::uint64_t publish_timeout_ms = 5000;
};

struct StorageConfig {
  std::string backend = "sqlite";
  std::string path = "~/.devpulse/devices.db";
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "info";
};

struct Config {
  HealthConfig health;
  BusConfig bus;
  StorageConfig storage;
  ObservabilityConfig observability;
};

} // namespace devpulse::config
