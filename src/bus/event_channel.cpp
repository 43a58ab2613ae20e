#include "devpulse/bus/event_channel.hpp"

#include "devpulse/common/fs.hpp"

#include <algorithm>

namespace devpulse::bus {

namespace {

constexpr auto kReceivePoll = std::chrono::milliseconds(200);

bool is_fatal_server_error(const std::string &text) {
  const std::string lower = common::to_lower(text);
  return lower.find("stale connection") != std::string::npos ||
         lower.find("authorization") != std::string::npos ||
         lower.find("maximum connections") != std::string::npos;
}

} // namespace

EventChannelOptions make_channel_options(const config::BusConfig &config) {
  EventChannelOptions options;
  options.servers = config.urls;
  options.client_name = config.client_id;
  options.user = config.user;
  options.password = config.password;
  options.token = config.token;
  options.connect_timeout = std::chrono::milliseconds(config.connect_timeout_ms);
  options.reconnect_wait = std::chrono::milliseconds(config.reconnect_wait_ms);
  options.max_reconnect_attempts = config.max_reconnect_attempts;
  options.ping_interval = std::chrono::seconds(config.ping_interval_secs);
  options.max_pings_outstanding = config.max_pings_outstanding;
  return options;
}

EventChannel::EventChannel(EventChannelOptions options, observability::IObserver &observer,
                           TransportFactory factory)
    : options_(std::move(options)), observer_(observer), factory_(std::move(factory)),
      channel_ctx_(common::Context::with_cancel(common::Context::background())) {
  if (!factory_) {
    factory_ = []() { return make_tcp_transport(); };
  }
  for (const auto &url : options_.servers) {
    auto parsed = parse_server_url(url);
    if (!parsed.ok()) {
      servers_status_ = parsed.status();
      continue;
    }
    servers_.push_back(parsed.value());
  }
}

EventChannel::~EventChannel() {
  const auto ctx = common::Context::with_timeout(common::Context::background(),
                                                 options_.connect_timeout);
  (void)close(ctx);
}

common::Status EventChannel::connect() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (closed_) {
    return common::Status::error("channel is closed");
  }
  if (running_.load()) {
    return common::Status::success();
  }
  if (!servers_status_.ok()) {
    return servers_status_;
  }
  if (servers_.empty()) {
    return common::Status::validation("no bus servers configured");
  }
  // Threads left behind after reconnect attempts ran out.
  join_workers();

  std::string last_error;
  for (std::size_t i = 0; i < servers_.size(); ++i) {
    const ServerUrl &server = servers_[(next_server_ + i) % servers_.size()];
    auto status = establish(server);
    if (!status.ok()) {
      last_error = server.display() + ": " + status.error();
      continue;
    }
    next_server_ = (next_server_ + i + 1) % servers_.size();

    running_.store(true);
    {
      std::lock_guard<std::mutex> out_lock(out_mutex_);
      writer_stop_ = false;
    }
    writer_thread_ = std::thread([this]() { writer_loop(); });
    reader_thread_ = std::thread([this]() { reader_loop(); });
    observer_.record_event(observability::BusConnectionEvent{
        .state = observability::BusState::Connected,
        .server = server.display(),
        .detail = "",
    });
    return common::Status::success();
  }
  return common::Status::error("failed to connect to message bus: " + last_error,
                               common::ErrorKind::Transport);
}

common::Status EventChannel::establish(const ServerUrl &server) {
  std::shared_ptr<IBusTransport> transport(factory_());
  if (transport == nullptr) {
    return common::Status::error("bus transport unavailable");
  }
  auto status = transport->connect(server.host, server.port, options_.connect_timeout);
  if (!status.ok()) {
    return status;
  }

  parser_.reset();
  status = handshake(*transport, server);
  if (!status.ok()) {
    transport->close();
    return status;
  }

  std::string resubscribe;
  {
    std::lock_guard<std::mutex> lock(subs_mutex_);
    for (const auto &[subject, subscription] : subscriptions_) {
      resubscribe += encode_sub(subject, subscription.sid);
    }
  }
  if (!resubscribe.empty()) {
    status = transport->send(resubscribe);
    if (!status.ok()) {
      transport->close();
      return status;
    }
  }

  {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    transport_ = transport;
    server_display_ = server.display();
  }
  last_ping_ = std::chrono::steady_clock::now();
  pings_outstanding_ = 0;
  connected_.store(true);
  return common::Status::success();
}

common::Status EventChannel::handshake(IBusTransport &transport, const ServerUrl &server) {
  const auto deadline = common::Context::Clock::now() + options_.connect_timeout;

  auto info = await_op(transport, deadline);
  if (!info.ok()) {
    return info.status();
  }
  if (info.value().kind != ServerOpKind::Info) {
    return common::Status::error("expected INFO from server", common::ErrorKind::Transport);
  }

  ConnectOptions connect_options;
  connect_options.name = options_.client_name;
  connect_options.token = options_.token;
  connect_options.user = options_.user.has_value() ? options_.user : server.user;
  connect_options.password = options_.password.has_value() ? options_.password : server.password;
  auto status = transport.send(encode_connect(connect_options) + kPingFrame);
  if (!status.ok()) {
    return status;
  }

  while (true) {
    auto op = await_op(transport, deadline);
    if (!op.ok()) {
      return op.status();
    }
    switch (op.value().kind) {
    case ServerOpKind::Pong:
      return common::Status::success();
    case ServerOpKind::Err:
      return common::Status::error("server rejected connection: " + op.value().text,
                                   common::ErrorKind::Transport);
    case ServerOpKind::Ping:
      status = transport.send(kPongFrame);
      if (!status.ok()) {
        return status;
      }
      break;
    default:
      break;
    }
  }
}

common::Result<ServerOp> EventChannel::await_op(IBusTransport &transport,
                                                const common::Context::Clock::time_point deadline) {
  while (true) {
    auto parsed = parser_.next();
    if (!parsed.ok()) {
      return common::Result<ServerOp>::failure(parsed.status());
    }
    if (parsed.value().has_value()) {
      return common::Result<ServerOp>::success(std::move(*parsed.value()));
    }

    const auto now = common::Context::Clock::now();
    if (now >= deadline) {
      return common::Result<ServerOp>::failure("timed out waiting for server",
                                               common::ErrorKind::Transport);
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    auto chunk = transport.receive(std::min(remaining, kReceivePoll));
    if (!chunk.ok()) {
      if (chunk.error() == kReceiveTimeout) {
        continue;
      }
      return common::Result<ServerOp>::failure(chunk.status());
    }
    parser_.feed(chunk.value());
  }
}

std::shared_ptr<IBusTransport> EventChannel::current_transport() const {
  std::lock_guard<std::mutex> lock(transport_mutex_);
  return transport_;
}

bool EventChannel::is_connected() const { return running_.load() && connected_.load(); }

common::Status EventChannel::publish(const common::Context &ctx, const std::string &subject,
                                     const std::string &payload) {
  if (auto status = ctx.error(); !status.ok()) {
    return status;
  }
  if (auto status = validate_subject(subject, false); !status.ok()) {
    return status;
  }
  if (!is_connected()) {
    return common::Status::error("not connected to message bus", common::ErrorKind::Transport);
  }

  auto pending = std::make_shared<PendingWrite>();
  enqueue(Outbound{.bytes = encode_pub(subject, payload), .pending = pending});

  const auto callback = ctx.on_cancel([pending]() {
    {
      std::lock_guard<std::mutex> lock(pending->mutex);
      pending->abandoned = true;
    }
    pending->cv.notify_all();
  });

  bool done = false;
  common::Status result = common::Status::success();
  {
    std::unique_lock<std::mutex> lock(pending->mutex);
    const auto ready = [&]() { return pending->complete || pending->abandoned; };
    if (const auto deadline = ctx.deadline(); deadline.has_value()) {
      pending->cv.wait_until(lock, *deadline, ready);
    } else {
      pending->cv.wait(lock, ready);
    }
    done = pending->complete;
    if (done) {
      result = pending->status;
    } else {
      // The writer skips abandoned frames that have not gone out yet.
      pending->abandoned = true;
    }
  }
  ctx.remove_callback(callback);

  if (done) {
    return result;
  }
  auto status = ctx.error();
  return status.ok() ? common::Status::cancelled(common::kContextDeadlineExceeded) : status;
}

common::Status EventChannel::subscribe(const std::string &subject, MessageHandler handler) {
  if (auto status = validate_subject(subject, true); !status.ok()) {
    return status;
  }
  if (!handler) {
    return common::Status::validation("subscription handler is required");
  }
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (closed_) {
      return common::Status::error("channel is closed");
    }
  }

  std::uint64_t sid = 0;
  {
    std::lock_guard<std::mutex> lock(subs_mutex_);
    if (subscriptions_.contains(subject)) {
      return common::Status::validation("already subscribed to subject: " + subject);
    }
    sid = next_sid_++;
    subscriptions_.emplace(subject,
                           Subscription{.sid = sid, .subject = subject, .handler = std::move(handler)});
  }
  if (is_connected()) {
    enqueue(Outbound{.bytes = encode_sub(subject, sid), .pending = nullptr});
  }
  return common::Status::success();
}

common::Status EventChannel::unsubscribe(const std::string &subject) {
  std::uint64_t sid = 0;
  {
    std::lock_guard<std::mutex> lock(subs_mutex_);
    const auto it = subscriptions_.find(subject);
    if (it == subscriptions_.end()) {
      return common::Status::not_found("not subscribed to subject: " + subject);
    }
    sid = it->second.sid;
    subscriptions_.erase(it);
  }
  if (is_connected()) {
    enqueue(Outbound{.bytes = encode_unsub(sid), .pending = nullptr});
  }
  return common::Status::success();
}

void EventChannel::complete(const std::shared_ptr<PendingWrite> &pending, common::Status status) {
  if (pending == nullptr) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(pending->mutex);
    pending->complete = true;
    pending->status = std::move(status);
  }
  pending->cv.notify_all();
}

void EventChannel::enqueue(Outbound frame) {
  {
    std::lock_guard<std::mutex> lock(out_mutex_);
    if (!writer_stop_) {
      outbound_.push_back(std::move(frame));
      out_cv_.notify_one();
      return;
    }
  }
  complete(frame.pending, common::Status::error("channel is closed"));
}

void EventChannel::writer_loop() {
  while (true) {
    Outbound frame;
    {
      std::unique_lock<std::mutex> lock(out_mutex_);
      out_cv_.wait(lock, [this]() { return writer_stop_ || !outbound_.empty(); });
      if (writer_stop_) {
        break;
      }
      frame = std::move(outbound_.front());
      outbound_.pop_front();
      writing_ = true;
    }

    bool skip = false;
    if (frame.pending != nullptr) {
      std::lock_guard<std::mutex> lock(frame.pending->mutex);
      skip = frame.pending->abandoned;
    }

    if (!skip) {
      auto transport = current_transport();
      common::Status status =
          transport != nullptr && connected_.load()
              ? transport->send(frame.bytes)
              : common::Status::error("not connected to message bus", common::ErrorKind::Transport);
      complete(frame.pending, std::move(status));
    }

    {
      std::lock_guard<std::mutex> lock(out_mutex_);
      writing_ = false;
      if (outbound_.empty()) {
        drained_cv_.notify_all();
      }
    }
  }
}

void EventChannel::reader_loop() {
  while (running_.load()) {
    auto transport = current_transport();
    if (transport == nullptr) {
      break;
    }

    if (connected_.load() && options_.ping_interval.count() > 0 &&
        std::chrono::steady_clock::now() - last_ping_ >= options_.ping_interval) {
      if (pings_outstanding_ >= options_.max_pings_outstanding) {
        handle_disconnect("stale connection: " + std::to_string(pings_outstanding_) +
                          " pings unanswered");
        continue;
      }
      ++pings_outstanding_;
      last_ping_ = std::chrono::steady_clock::now();
      enqueue(Outbound{.bytes = kPingFrame, .pending = nullptr});
    }

    auto chunk = transport->receive(kReceivePoll);
    if (!chunk.ok()) {
      if (chunk.error() == kReceiveTimeout) {
        continue;
      }
      if (!running_.load()) {
        break;
      }
      handle_disconnect(chunk.error());
      continue;
    }

    parser_.feed(chunk.value());
    while (running_.load()) {
      auto op = parser_.next();
      if (!op.ok()) {
        handle_disconnect(op.error());
        break;
      }
      if (!op.value().has_value()) {
        break;
      }
      handle_op(*op.value());
    }
  }
}

void EventChannel::handle_op(const ServerOp &op) {
  switch (op.kind) {
  case ServerOpKind::Ping:
    enqueue(Outbound{.bytes = kPongFrame, .pending = nullptr});
    return;
  case ServerOpKind::Pong:
    pings_outstanding_ = 0;
    return;
  case ServerOpKind::Err:
    observer_.record_event(observability::ErrorEvent{
        .component = "bus",
        .message = "server error: " + op.text,
        .identifier = "",
        .event_id = "",
    });
    if (is_fatal_server_error(op.text)) {
      handle_disconnect(op.text);
    }
    return;
  case ServerOpKind::Msg:
    break;
  default:
    return;
  }

  MessageHandler handler;
  std::string subject;
  {
    std::lock_guard<std::mutex> lock(subs_mutex_);
    for (const auto &[key, subscription] : subscriptions_) {
      if (subscription.sid == op.sid) {
        handler = subscription.handler;
        subject = key;
        break;
      }
    }
  }
  if (!handler) {
    return;
  }
  auto status = handler(channel_ctx_, op.subject, op.payload);
  if (!status.ok()) {
    observer_.record_event(observability::ErrorEvent{
        .component = "bus",
        .message = "handler for " + subject + " failed: " + status.error(),
        .identifier = "",
        .event_id = "",
    });
  }
}

void EventChannel::handle_disconnect(const std::string &reason) {
  connected_.store(false);
  std::string server;
  {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    if (transport_ != nullptr) {
      transport_->close();
    }
    server = server_display_;
  }
  observer_.record_event(observability::BusConnectionEvent{
      .state = observability::BusState::Disconnected,
      .server = server,
      .detail = reason,
  });

  for (std::uint32_t attempt = 1; attempt <= options_.max_reconnect_attempts; ++attempt) {
    if (!channel_ctx_.wait_for(options_.reconnect_wait)) {
      return;
    }
    const ServerUrl &target = servers_[next_server_ % servers_.size()];
    next_server_ = (next_server_ + 1) % servers_.size();
    auto status = establish(target);
    if (status.ok()) {
      observer_.record_event(observability::BusConnectionEvent{
          .state = observability::BusState::Reconnected,
          .server = target.display(),
          .detail = "attempt " + std::to_string(attempt),
      });
      return;
    }
    observer_.record_event(observability::ErrorEvent{
        .component = "bus",
        .message = "reconnect to " + target.display() + " failed: " + status.error(),
        .identifier = "",
        .event_id = "",
    });
  }

  if (channel_ctx_.cancelled()) {
    return;
  }
  running_.store(false);
  fail_pending("message bus connection lost");
  observer_.record_event(observability::BusConnectionEvent{
      .state = observability::BusState::Closed,
      .server = server,
      .detail = "reconnect attempts exhausted",
  });
}

void EventChannel::fail_pending(const std::string &reason) {
  std::deque<Outbound> dropped;
  {
    std::lock_guard<std::mutex> lock(out_mutex_);
    dropped.swap(outbound_);
    drained_cv_.notify_all();
  }
  for (auto &frame : dropped) {
    complete(frame.pending, common::Status::error(reason, common::ErrorKind::Transport));
  }
}

void EventChannel::join_workers() {
  {
    std::lock_guard<std::mutex> lock(out_mutex_);
    writer_stop_ = true;
  }
  out_cv_.notify_all();
  if (writer_thread_.joinable()) {
    writer_thread_.join();
  }
  if (reader_thread_.joinable()) {
    reader_thread_.join();
  }
  fail_pending("message bus connection lost");
}

void EventChannel::teardown() {
  running_.store(false);
  channel_ctx_.cancel();
  {
    std::lock_guard<std::mutex> lock(out_mutex_);
    writer_stop_ = true;
  }
  out_cv_.notify_all();
  if (auto transport = current_transport(); transport != nullptr) {
    transport->close();
  }
  if (writer_thread_.joinable()) {
    writer_thread_.join();
  }
  if (reader_thread_.joinable()) {
    reader_thread_.join();
  }
  connected_.store(false);
  fail_pending("channel is closed");
}

common::Status EventChannel::close(const common::Context &ctx) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (closed_) {
    return common::Status::success();
  }
  closed_ = true;

  const bool was_started = writer_thread_.joinable() || reader_thread_.joinable();
  common::Status result = common::Status::success();

  if (was_started && is_connected() && !ctx.cancelled()) {
    std::vector<std::uint64_t> sids;
    {
      std::lock_guard<std::mutex> subs_lock(subs_mutex_);
      for (const auto &[subject, subscription] : subscriptions_) {
        (void)subject;
        sids.push_back(subscription.sid);
      }
    }
    for (const auto sid : sids) {
      enqueue(Outbound{.bytes = encode_unsub(sid), .pending = nullptr});
    }

    auto ended = std::make_shared<bool>(false);
    const auto callback = ctx.on_cancel([this, ended]() {
      {
        std::lock_guard<std::mutex> out_lock(out_mutex_);
        *ended = true;
      }
      drained_cv_.notify_all();
    });
    bool drained = false;
    {
      std::unique_lock<std::mutex> out_lock(out_mutex_);
      const auto ready = [&]() {
        return (outbound_.empty() && !writing_) || !connected_.load() || *ended;
      };
      if (const auto deadline = ctx.deadline(); deadline.has_value()) {
        drained_cv_.wait_until(out_lock, *deadline, ready);
      } else {
        drained_cv_.wait(out_lock, ready);
      }
      drained = outbound_.empty() && !writing_;
    }
    ctx.remove_callback(callback);
    if (!drained) {
      if (!connected_.load()) {
        result = common::Status::error("connection lost before pending writes were flushed",
                                       common::ErrorKind::Transport);
      } else {
        result = ctx.error();
        if (result.ok()) {
          result = common::Status::cancelled(common::kContextDeadlineExceeded);
        }
      }
    }
  } else if (ctx.cancelled()) {
    result = ctx.error();
  }

  std::string server;
  {
    std::lock_guard<std::mutex> transport_lock(transport_mutex_);
    server = server_display_;
  }
  teardown();
  if (was_started) {
    observer_.record_event(observability::BusConnectionEvent{
        .state = observability::BusState::Closed,
        .server = server,
        .detail = result.ok() ? "closed" : "forced close: " + result.error(),
    });
  }
  return result;
}

} // namespace devpulse::bus
