#pragma once

#include "devpulse/bus/transport.hpp"
#include "devpulse/config/schema.hpp"
#include "devpulse/devices/store.hpp"
#include "devpulse/http/client.hpp"
#include "devpulse/observability/observer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace devpulse::testing {

/// Defaults with fast timings, in-memory storage and no log output.
config::Config mock_config();

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

config::Config temp_config(const TempWorkspace &workspace);

/// Keeps every event and metric for later inspection.
class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;

  template <typename T> [[nodiscard]] std::vector<T> events_of() const {
    std::vector<T> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &event : events_) {
      if (const auto *typed = std::get_if<T>(&event); typed != nullptr) {
        out.push_back(*typed);
      }
    }
    return out;
  }

  template <typename T> [[nodiscard]] std::size_t count() const { return events_of<T>().size(); }

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Scripted HttpClient. The responder decides each reply; an optional latency is slept
/// through (cut short by the context) before answering.
class FakeHttpClient final : public http::HttpClient {
public:
  using Responder = std::function<http::HttpResponse(const std::string &url)>;

  explicit FakeHttpClient(Responder responder,
                          std::chrono::milliseconds latency = std::chrono::milliseconds(0));

  static std::shared_ptr<FakeHttpClient> with_status(std::uint16_t status,
                                                     std::chrono::milliseconds latency =
                                                         std::chrono::milliseconds(0));

  [[nodiscard]] http::HttpResponse get(const common::Context &ctx, const std::string &url,
                                       const std::unordered_map<std::string, std::string> &headers,
                                       std::uint64_t timeout_ms,
                                       std::size_t max_body_bytes) override;

  [[nodiscard]] std::size_t calls() const { return calls_.load(); }
  [[nodiscard]] std::size_t peak_concurrent() const { return peak_.load(); }
  [[nodiscard]] std::vector<std::string> urls() const;
  [[nodiscard]] std::unordered_map<std::string, std::string> last_headers() const;

private:
  Responder responder_;
  std::chrono::milliseconds latency_;
  std::atomic<std::size_t> calls_{0};
  std::atomic<std::size_t> current_{0};
  std::atomic<std::size_t> peak_{0};
  mutable std::mutex mutex_;
  std::vector<std::string> urls_;
  std::unordered_map<std::string, std::string> last_headers_;
};

/// Minimal HTTP/1.1 server on 127.0.0.1 that answers every request with a fixed status.
class LocalHttpResponder {
public:
  explicit LocalHttpResponder(int status, std::string body = "ok");
  ~LocalHttpResponder();

  LocalHttpResponder(const LocalHttpResponder &) = delete;
  LocalHttpResponder &operator=(const LocalHttpResponder &) = delete;

  [[nodiscard]] bool ok() const { return listen_fd_ >= 0; }
  [[nodiscard]] std::uint16_t port() const { return port_; }
  /// host:port form accepted as a device address.
  [[nodiscard]] std::string address() const;
  [[nodiscard]] std::size_t requests() const { return requests_.load(); }
  [[nodiscard]] std::string last_request() const;

private:
  void serve();

  int status_;
  std::string body_;
  int listen_fd_ = -1;
  std::uint16_t port_ = 0;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> requests_{0};
  mutable std::mutex mutex_;
  std::string last_request_;
  std::thread thread_;
};

/// In-process stand-in for a NATS server. Every transport it hands out answers the
/// handshake automatically; tests push server frames with deliver() and cut the
/// connection with drop().
class FakeBusServer {
public:
  struct Connection {
    std::deque<std::string> inbound;
    bool closed = false;
  };

  common::Status open(std::shared_ptr<Connection> &out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (refuse_) {
      return common::Status::error("connection refused", common::ErrorKind::Transport);
    }
    out = std::make_shared<Connection>();
    out->inbound.push_back("INFO {\"server_id\":\"fake\",\"max_payload\":1048576}\r\n");
    connections_.push_back(out);
    cv_.notify_all();
    return common::Status::success();
  }

  common::Status send(const std::shared_ptr<Connection> &conn, const std::string &bytes) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&]() { return !block_sends_ || conn->closed; });
    if (conn->closed) {
      return common::Status::error("connection closed", common::ErrorKind::Transport);
    }
    sent_ += bytes;
    if (bytes.find("CONNECT ") != std::string::npos) {
      conn->inbound.push_back(handshake_reply_);
    }
    cv_.notify_all();
    return common::Status::success();
  }

  common::Result<std::string> receive(const std::shared_ptr<Connection> &conn,
                                      const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&]() { return conn->closed || !conn->inbound.empty(); });
    if (conn->closed) {
      return common::Result<std::string>::failure("connection closed",
                                                  common::ErrorKind::Transport);
    }
    if (conn->inbound.empty()) {
      return common::Result<std::string>::failure(bus::kReceiveTimeout,
                                                  common::ErrorKind::Transport);
    }
    std::string chunk = std::move(conn->inbound.front());
    conn->inbound.pop_front();
    return common::Result<std::string>::success(std::move(chunk));
  }

  void close(const std::shared_ptr<Connection> &conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    conn->closed = true;
    cv_.notify_all();
  }

  void deliver(const std::string &bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connections_.empty()) {
      connections_.back()->inbound.push_back(bytes);
    }
    cv_.notify_all();
  }

  void drop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connections_.empty()) {
      connections_.back()->closed = true;
    }
    cv_.notify_all();
  }

  void set_refuse(const bool refuse) {
    std::lock_guard<std::mutex> lock(mutex_);
    refuse_ = refuse;
  }

  void set_block_sends(const bool block) {
    std::lock_guard<std::mutex> lock(mutex_);
    block_sends_ = block;
    cv_.notify_all();
  }

  void set_handshake_reply(std::string reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    handshake_reply_ = std::move(reply);
  }

  std::string sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
  }

  bool sent_contains(const std::string &needle) const { return sent().find(needle) != std::string::npos; }

  std::size_t connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::shared_ptr<Connection>> connections_;
  std::string sent_;
  std::string handshake_reply_ = "PONG\r\n";
  bool refuse_ = false;
  bool block_sends_ = false;
};

class FakeTransport final : public bus::IBusTransport {
public:
  explicit FakeTransport(std::shared_ptr<FakeBusServer> server) : server_(std::move(server)) {}

  common::Status connect(const std::string &, std::uint16_t, std::chrono::milliseconds) override {
    return server_->open(conn_);
  }
  void close() override {
    if (conn_ != nullptr) {
      server_->close(conn_);
    }
  }
  bool is_connected() const override { return conn_ != nullptr && !conn_->closed; }
  common::Status send(const std::string &bytes) override {
    if (conn_ == nullptr) {
      return common::Status::error("not connected", common::ErrorKind::Transport);
    }
    return server_->send(conn_, bytes);
  }
  common::Result<std::string> receive(const std::chrono::milliseconds timeout) override {
    if (conn_ == nullptr) {
      return common::Result<std::string>::failure("not connected", common::ErrorKind::Transport);
    }
    return server_->receive(conn_, timeout);
  }

private:
  std::shared_ptr<FakeBusServer> server_;
  std::shared_ptr<FakeBusServer::Connection> conn_;
};

[[nodiscard]] inline std::function<std::unique_ptr<bus::IBusTransport>()>
fake_transport_factory(const std::shared_ptr<FakeBusServer> &server) {
  return [server]() { return std::make_unique<FakeTransport>(server); };
}

/// Seeds a registered device into the store, failing the test on error.
void seed_device(devices::IDeviceStore &store, const std::string &identifier,
                 const std::string &address);

/// Polls until predicate holds or timeout passes.
bool wait_until(const std::function<bool()> &predicate,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(3000));

} // namespace devpulse::testing
