#include "tests/helpers/test_helpers.hpp"

#include "devpulse/devices/device.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <fstream>
#include <random>
#include <stdexcept>

namespace devpulse::testing {

config::Config mock_config() {
  config::Config config;
  config.health.cooldown_secs = 120;
  config.health.retry_attempts = 3;
  config.health.initial_delay_ms = 10;
  config.health.request_timeout_ms = 2000;
  config.health.max_concurrent = 4;
  config.health.worker_threads = 8;
  config.bus.urls = {"nats://127.0.0.1:4222"};
  config.bus.connect_timeout_ms = 500;
  config.bus.reconnect_wait_ms = 20;
  config.bus.max_reconnect_attempts = 2;
  config.bus.close_timeout_ms = 1000;
  config.bus.publish_timeout_ms = 1000;
  config.storage.backend = "memory";
  config.observability.backend = "none";
  return config;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("devpulse-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

config::Config temp_config(const TempWorkspace &workspace) {
  auto config = mock_config();
  config.storage.backend = "sqlite";
  config.storage.path = (workspace.path() / "devices.db").string();
  return config;
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> RecordingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> RecordingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

FakeHttpClient::FakeHttpClient(Responder responder, const std::chrono::milliseconds latency)
    : responder_(std::move(responder)), latency_(latency) {}

std::shared_ptr<FakeHttpClient> FakeHttpClient::with_status(const std::uint16_t status,
                                                            const std::chrono::milliseconds latency) {
  return std::make_shared<FakeHttpClient>(
      [status](const std::string &) {
        http::HttpResponse response;
        response.status = status;
        response.body = status == 200 ? "{\"device\":\"ok\"}" : "unavailable";
        return response;
      },
      latency);
}

http::HttpResponse FakeHttpClient::get(const common::Context &ctx, const std::string &url,
                                       const std::unordered_map<std::string, std::string> &headers,
                                       std::uint64_t, std::size_t max_body_bytes) {
  ++calls_;
  const std::size_t now = ++current_;
  std::size_t peak = peak_.load();
  while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    urls_.push_back(url);
    last_headers_ = headers;
  }

  http::HttpResponse response;
  if (latency_.count() > 0 && !ctx.wait_for(latency_)) {
    response.cancelled = true;
    response.network_error = true;
    response.message = ctx.error().error();
  } else if (ctx.cancelled()) {
    response.cancelled = true;
    response.network_error = true;
    response.message = ctx.error().error();
  } else {
    response = responder_(url);
    if (response.body.size() > max_body_bytes) {
      response.body.resize(max_body_bytes);
      response.truncated = true;
    }
  }
  --current_;
  return response;
}

std::vector<std::string> FakeHttpClient::urls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return urls_;
}

std::unordered_map<std::string, std::string> FakeHttpClient::last_headers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_headers_;
}

LocalHttpResponder::LocalHttpResponder(const int status, std::string body)
    : status_(status), body_(std::move(body)) {
  listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    return;
  }
  int reuse = 1;
  (void)::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = 0;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
      ::listen(listen_fd_, 16) != 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }
  socklen_t len = sizeof(addr);
  if (::getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }
  port_ = ntohs(addr.sin_port);
  running_.store(true);
  thread_ = std::thread([this]() { serve(); });
}

LocalHttpResponder::~LocalHttpResponder() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
  }
}

std::string LocalHttpResponder::address() const { return "127.0.0.1:" + std::to_string(port_); }

std::string LocalHttpResponder::last_request() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_request_;
}

void LocalHttpResponder::serve() {
  while (running_.load()) {
    pollfd pfd{};
    pfd.fd = listen_fd_;
    pfd.events = POLLIN;
    if (::poll(&pfd, 1, 50) <= 0) {
      continue;
    }
    const int client = ::accept(listen_fd_, nullptr, nullptr);
    if (client < 0) {
      continue;
    }

    std::string request;
    char buffer[2048];
    while (request.find("\r\n\r\n") == std::string::npos) {
      pollfd cpfd{};
      cpfd.fd = client;
      cpfd.events = POLLIN;
      if (::poll(&cpfd, 1, 1000) <= 0) {
        break;
      }
      const ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
      if (n <= 0) {
        break;
      }
      request.append(buffer, static_cast<std::size_t>(n));
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_request_ = request;
    }
    ++requests_;

    const std::string reason = status_ == 200 ? "OK" : "Service Unavailable";
    const std::string response = "HTTP/1.1 " + std::to_string(status_) + " " + reason +
                                 "\r\nContent-Type: text/plain\r\nContent-Length: " +
                                 std::to_string(body_.size()) +
                                 "\r\nConnection: close\r\n\r\n" + body_;
    std::size_t sent = 0;
    while (sent < response.size()) {
      const ssize_t n =
          ::send(client, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
      if (n <= 0) {
        break;
      }
      sent += static_cast<std::size_t>(n);
    }
    ::shutdown(client, SHUT_RDWR);
    ::close(client);
  }
}

void seed_device(devices::IDeviceStore &store, const std::string &identifier,
                 const std::string &address) {
  auto device = devices::make_device(identifier, "sensor", address, "greenhouse");
  if (!device.ok()) {
    throw std::runtime_error("seed_device: " + device.error());
  }
  auto saved = store.save(common::Context::background(), device.value());
  if (!saved.ok()) {
    throw std::runtime_error("seed_device: " + saved.error());
  }
}

bool wait_until(const std::function<bool()> &predicate, const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

} // namespace devpulse::testing
