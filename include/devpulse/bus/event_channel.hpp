#pragma once

#include "devpulse/bus/nats_protocol.hpp"
#include "devpulse/bus/transport.hpp"
#include "devpulse/common/context.hpp"
#include "devpulse/config/schema.hpp"
#include "devpulse/events/publisher.hpp"
#include "devpulse/observability/observer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace devpulse::bus {

struct EventChannelOptions {
  std::vector<std::string> servers = {"nats://localhost:4222"};
  std::string client_name = "devpulse";
  std::optional<std::string> user;
  std::optional<std::string> password;
  std::optional<std::string> token;
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds reconnect_wait{2000};
  std::uint32_t max_reconnect_attempts = 60;
  std::chrono::milliseconds ping_interval{30000};
  std::uint32_t max_pings_outstanding = 2;
};

[[nodiscard]] EventChannelOptions make_channel_options(const config::BusConfig &config);

/// Invoked on the channel's reader thread; the context ends when the channel closes.
using MessageHandler = std::function<common::Status(
    const common::Context &ctx, const std::string &subject, const std::string &payload)>;
using TransportFactory = std::function<std::unique_ptr<IBusTransport>()>;

/// Managed publish/subscribe connection to a NATS server.
///
/// A writer thread performs every socket send so that publish() can give up on a cancelled
/// context without waiting for a slow transport. A reader thread handles server pings,
/// message delivery and, after an unexpected disconnect, reconnection with resubscription.
/// Connection transitions are reported to the observer only.
class EventChannel final : public events::IEventPublisher {
public:
  EventChannel(EventChannelOptions options, observability::IObserver &observer,
               TransportFactory factory = {});
  ~EventChannel() override;

  EventChannel(const EventChannel &) = delete;
  EventChannel &operator=(const EventChannel &) = delete;

  /// Tries each configured server once, in order.
  [[nodiscard]] common::Status connect();

  [[nodiscard]] common::Status publish(const common::Context &ctx, const std::string &subject,
                                       const std::string &payload) override;
  [[nodiscard]] bool is_connected() const override;

  /// Subscriptions made before connect() are sent once the connection is up.
  [[nodiscard]] common::Status subscribe(const std::string &subject, MessageHandler handler);
  [[nodiscard]] common::Status unsubscribe(const std::string &subject);

  /// Flushes pending writes and closes within the context. When the context ends first the
  /// transport is closed forcibly and the context's error is returned. Must not be called
  /// from a MessageHandler.
  [[nodiscard]] common::Status close(const common::Context &ctx);

private:
  struct PendingWrite {
    std::mutex mutex;
    std::condition_variable cv;
    bool complete = false;
    bool abandoned = false;
    common::Status status = common::Status::success();
  };

  struct Outbound {
    std::string bytes;
    /// Null for frames nobody waits on (PING, PONG, SUB).
    std::shared_ptr<PendingWrite> pending;
  };

  struct Subscription {
    std::uint64_t sid = 0;
    std::string subject;
    MessageHandler handler;
  };

  [[nodiscard]] common::Status establish(const ServerUrl &server);
  [[nodiscard]] common::Status handshake(IBusTransport &transport, const ServerUrl &server);
  [[nodiscard]] common::Result<ServerOp> await_op(IBusTransport &transport,
                                                  common::Context::Clock::time_point deadline);
  [[nodiscard]] std::shared_ptr<IBusTransport> current_transport() const;

  void enqueue(Outbound frame);
  void writer_loop();
  void reader_loop();
  void handle_op(const ServerOp &op);
  void handle_disconnect(const std::string &reason);
  void fail_pending(const std::string &reason);
  static void complete(const std::shared_ptr<PendingWrite> &pending, common::Status status);
  void join_workers();
  void teardown();

  EventChannelOptions options_;
  observability::IObserver &observer_;
  TransportFactory factory_;
  std::vector<ServerUrl> servers_;
  std::size_t next_server_ = 0;
  common::Status servers_status_ = common::Status::success();

  // Guards connect/close transitions only.
  std::mutex lifecycle_mutex_;
  bool closed_ = false;

  mutable std::mutex transport_mutex_;
  std::shared_ptr<IBusTransport> transport_;
  std::string server_display_;
  ProtocolParser parser_;

  std::atomic<bool> running_{false};
  std::atomic<bool> connected_{false};
  common::Context channel_ctx_;
  std::thread reader_thread_;
  std::thread writer_thread_;

  std::mutex out_mutex_;
  std::condition_variable out_cv_;
  std::condition_variable drained_cv_;
  std::deque<Outbound> outbound_;
  bool writing_ = false;
  bool writer_stop_ = false;

  std::mutex subs_mutex_;
  std::uint64_t next_sid_ = 1;
  std::unordered_map<std::string, Subscription> subscriptions_;

  std::chrono::steady_clock::time_point last_ping_{};
  std::uint32_t pings_outstanding_ = 0;
};

} // namespace devpulse::bus
