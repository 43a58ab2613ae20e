#include "devpulse/health/probe.hpp"

#include <algorithm>
#include <unordered_map>

namespace devpulse::health {

std::string probe_url(const std::string &address) {
  // A bare IPv6 literal needs brackets to form a valid URL authority.
  if (!address.empty() && address.front() != '[' &&
      std::count(address.begin(), address.end(), ':') > 1) {
    return "http://[" + address + "]" + kWhoamiPath;
  }
  return "http://" + address + kWhoamiPath;
}

HealthProbe::HealthProbe(std::shared_ptr<http::HttpClient> client, ProbeOptions options)
    : client_(std::move(client)), options_(std::move(options)) {}

ProbeAttempt HealthProbe::probe(const common::Context &ctx, const std::string &address) const {
  ProbeAttempt attempt;
  const auto started = std::chrono::steady_clock::now();

  const std::unordered_map<std::string, std::string> headers = {
      {"User-Agent", options_.user_agent},
      {"Accept", kProbeAccept},
  };
  const auto response =
      client_->get(ctx, probe_url(address), headers,
                   static_cast<std::uint64_t>(options_.timeout.count()), options_.max_body_bytes);

  attempt.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  attempt.status_code = response.status;
  attempt.body_snippet = response.body.size() > options_.max_body_bytes
                             ? response.body.substr(0, options_.max_body_bytes)
                             : response.body;

  if (response.cancelled) {
    attempt.cancelled = true;
    attempt.error = response.message.empty() ? std::string(common::kContextCanceled)
                                             : response.message;
    return attempt;
  }
  if (response.network_error) {
    attempt.error = response.timeout ? "request timed out: " + response.message
                                     : "request failed: " + response.message;
    return attempt;
  }
  if (response.status != 200) {
    attempt.error = "HTTP status " + std::to_string(response.status) + " (expected 200)";
    return attempt;
  }

  attempt.success = true;
  return attempt;
}

} // namespace devpulse::health
