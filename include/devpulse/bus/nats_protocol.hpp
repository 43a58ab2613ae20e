#pragma once

#include "devpulse/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace devpulse::bus {

inline constexpr std::uint16_t kDefaultNatsPort = 4222;
inline constexpr const char *kPingFrame = "PING\r\n";
inline constexpr const char *kPongFrame = "PONG\r\n";

struct ServerUrl {
  std::string host;
  std::uint16_t port = kDefaultNatsPort;
  std::optional<std::string> user;
  std::optional<std::string> password;

  [[nodiscard]] std::string display() const;
};

/// Accepts nats://[user[:password]@]host[:port] and a bare host[:port].
[[nodiscard]] common::Result<ServerUrl> parse_server_url(const std::string &url);

/// Publish subjects must be literal; subscriptions may use the * and > wildcards.
[[nodiscard]] common::Status validate_subject(const std::string &subject, bool allow_wildcards);

struct ConnectOptions {
  std::string name;
  std::optional<std::string> user;
  std::optional<std::string> password;
  std::optional<std::string> token;
  bool verbose = false;
  bool pedantic = false;
};

[[nodiscard]] std::string encode_connect(const ConnectOptions &options);
[[nodiscard]] std::string encode_pub(const std::string &subject, const std::string &payload);
[[nodiscard]] std::string encode_sub(const std::string &subject, std::uint64_t sid);
[[nodiscard]] std::string encode_unsub(std::uint64_t sid);

enum class ServerOpKind { Info, Msg, Ok, Err, Ping, Pong };

struct ServerOp {
  ServerOpKind kind = ServerOpKind::Ok;
  std::string subject;
  std::uint64_t sid = 0;
  std::string reply_to;
  std::string payload;
  /// INFO JSON or -ERR message.
  std::string text;
};

/// Incremental decoder for the server side of the protocol. Bytes may arrive split at any
/// point; next() yields complete operations in order.
class ProtocolParser {
public:
  void feed(std::string_view bytes);
  /// Empty optional when more bytes are needed. A malformed operation is an error and the
  /// connection should be dropped.
  [[nodiscard]] common::Result<std::optional<ServerOp>> next();
  void reset();

  [[nodiscard]] std::size_t buffered() const { return buffer_.size(); }

private:
  std::string buffer_;
};

} // namespace devpulse::bus
