#pragma once

#include "devpulse/common/context.hpp"
#include "devpulse/http/client.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace devpulse::health {

inline constexpr const char *kWhoamiPath = "/whoami";
inline constexpr const char *kProbeAccept = "application/json, text/plain, */*";

struct ProbeOptions {
  std::chrono::milliseconds timeout{15000};
  std::string user_agent = "devpulse/0.1";
  std::size_t max_body_bytes = 4096;
};

/// Result of a single GET against a device.
struct ProbeAttempt {
  bool success = false;
  std::uint16_t status_code = 0;
  std::string body_snippet;
  std::optional<std::string> error;
  bool cancelled = false;
  std::chrono::milliseconds duration{0};
};

[[nodiscard]] std::string probe_url(const std::string &address);

class HealthProbe {
public:
  HealthProbe(std::shared_ptr<http::HttpClient> client, ProbeOptions options);

  /// Alive means HTTP 200 exactly; redirects and every other status are failures.
  [[nodiscard]] ProbeAttempt probe(const common::Context &ctx, const std::string &address) const;

  [[nodiscard]] const ProbeOptions &options() const { return options_; }

private:
  std::shared_ptr<http::HttpClient> client_;
  ProbeOptions options_;
};

} // namespace devpulse::health
