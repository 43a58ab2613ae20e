#include "devpulse/http/client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace devpulse::http {

namespace {

struct CurlHandleDeleter {
  void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
};

struct CurlListDeleter {
  void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
using CurlList = std::unique_ptr<curl_slist, CurlListDeleter>;

struct BodySink {
  std::string *body = nullptr;
  std::size_t limit = 0;
  bool truncated = false;
};

size_t capped_write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *sink = static_cast<BodySink *>(userdata);
  const std::size_t room = sink->limit > sink->body->size() ? sink->limit - sink->body->size() : 0;
  if (total > room) {
    sink->body->append(ptr, room);
    sink->truncated = true;
    // Returning short makes curl stop the transfer with CURLE_WRITE_ERROR.
    return room;
  }
  sink->body->append(ptr, total);
  return total;
}

int progress_callback(void *userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto *ctx = static_cast<const common::Context *>(userdata);
  return ctx->cancelled() ? 1 : 0;
}

std::once_flag g_curl_init;

} // namespace

CurlHttpClient::CurlHttpClient() {
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::get(const common::Context &ctx, const std::string &url,
                                 const std::unordered_map<std::string, std::string> &headers,
                                 const std::uint64_t timeout_ms,
                                 const std::size_t max_body_bytes) {
  HttpResponse response;
  if (auto status = ctx.error(); !status.ok()) {
    response.cancelled = true;
    response.message = status.error();
    return response;
  }

  CurlHandle curl(curl_easy_init());
  if (!curl) {
    response.network_error = true;
    response.message = "curl_easy_init failed";
    return response;
  }

  std::uint64_t effective_timeout = timeout_ms;
  if (const auto deadline = ctx.deadline(); deadline.has_value()) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *deadline - common::Context::Clock::now());
    const auto left_ms = left.count() > 0 ? static_cast<std::uint64_t>(left.count()) : 1;
    if (effective_timeout == 0 || left_ms < effective_timeout) {
      effective_timeout = left_ms;
    }
  }

  BodySink sink{.body = &response.body, .limit = max_body_bytes, .truncated = false};

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(effective_timeout));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, capped_write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

  curl_slist *raw_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    raw_list = curl_slist_append(raw_list, line.c_str());
  }
  CurlList header_list(raw_list);
  if (header_list) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
  }

  const CURLcode code = curl_easy_perform(curl.get());
  response.truncated = sink.truncated;

  if (code == CURLE_OK || (code == CURLE_WRITE_ERROR && sink.truncated)) {
    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
    return response;
  }

  if (code == CURLE_ABORTED_BY_CALLBACK) {
    response.cancelled = true;
    response.message = ctx.error().ok() ? "transfer aborted" : ctx.error().error();
    return response;
  }

  response.network_error = true;
  response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  response.message = curl_easy_strerror(code);
  if (response.timeout && ctx.cancelled()) {
    response.cancelled = true;
    response.message = ctx.error().error();
  }
  return response;
}

} // namespace devpulse::http
