#pragma once

#include "devpulse/common/context.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace devpulse::http {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  /// The body was cut at max_body_bytes.
  bool truncated = false;
  bool timeout = false;
  bool network_error = false;
  bool cancelled = false;
  std::string message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  /// GET without following redirects. At most max_body_bytes of the body are kept.
  [[nodiscard]] virtual HttpResponse
  get(const common::Context &ctx, const std::string &url,
      const std::unordered_map<std::string, std::string> &headers, std::uint64_t timeout_ms,
      std::size_t max_body_bytes) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse get(const common::Context &ctx, const std::string &url,
                                 const std::unordered_map<std::string, std::string> &headers,
                                 std::uint64_t timeout_ms, std::size_t max_body_bytes) override;
};

} // namespace devpulse::http
