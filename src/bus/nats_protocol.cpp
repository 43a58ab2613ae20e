#include "devpulse/bus/nats_protocol.hpp"

#include "devpulse/common/fs.hpp"
#include "devpulse/common/json_util.hpp"

#include <cctype>
#include <sstream>
#include <vector>

namespace devpulse::bus {

namespace {

constexpr std::size_t kMaxControlLine = 4096;

std::vector<std::string> split_ws(const std::string &line) {
  std::vector<std::string> out;
  std::istringstream stream(line);
  std::string token;
  while (stream >> token) {
    out.push_back(token);
  }
  return out;
}

std::optional<std::uint64_t> parse_u64(const std::string &text) {
  if (text.empty() || text.size() > 19) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  for (const char ch : text) {
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
      return std::nullopt;
    }
    value = value * 10 + static_cast<std::uint64_t>(ch - '0');
  }
  return value;
}

std::string quoted_field(const std::string &key, const std::string &value) {
  return "\"" + key + "\":\"" + common::json_escape(value) + "\"";
}

} // namespace

std::string ServerUrl::display() const {
  return "nats://" + host + ":" + std::to_string(port);
}

common::Result<ServerUrl> parse_server_url(const std::string &url) {
  std::string rest = common::trim(url);
  if (rest.empty()) {
    return common::Result<ServerUrl>::failure("server url is empty",
                                              common::ErrorKind::Validation);
  }
  const auto scheme = rest.find("://");
  if (scheme != std::string::npos) {
    const std::string name = common::to_lower(rest.substr(0, scheme));
    if (name != "nats" && name != "tcp") {
      return common::Result<ServerUrl>::failure("unsupported url scheme: " + name,
                                                common::ErrorKind::Validation);
    }
    rest = rest.substr(scheme + 3);
  }
  if (const auto slash = rest.find('/'); slash != std::string::npos) {
    rest = rest.substr(0, slash);
  }

  ServerUrl parsed;
  if (const auto at = rest.rfind('@'); at != std::string::npos) {
    const std::string credentials = rest.substr(0, at);
    rest = rest.substr(at + 1);
    const auto colon = credentials.find(':');
    if (colon == std::string::npos) {
      parsed.user = credentials;
    } else {
      parsed.user = credentials.substr(0, colon);
      parsed.password = credentials.substr(colon + 1);
    }
  }

  std::string host = rest;
  if (!rest.empty() && rest.front() == '[') {
    const auto close = rest.find(']');
    if (close == std::string::npos) {
      return common::Result<ServerUrl>::failure("unterminated IPv6 host in " + url,
                                                common::ErrorKind::Validation);
    }
    host = rest.substr(1, close - 1);
    const std::string tail = rest.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':') {
        return common::Result<ServerUrl>::failure("invalid server url: " + url,
                                                  common::ErrorKind::Validation);
      }
      const auto port = parse_u64(tail.substr(1));
      if (!port.has_value() || *port == 0 || *port > 65535) {
        return common::Result<ServerUrl>::failure("invalid port in " + url,
                                                  common::ErrorKind::Validation);
      }
      parsed.port = static_cast<std::uint16_t>(*port);
    }
  } else if (const auto colon = rest.rfind(':'); colon != std::string::npos) {
    host = rest.substr(0, colon);
    const auto port = parse_u64(rest.substr(colon + 1));
    if (!port.has_value() || *port == 0 || *port > 65535) {
      return common::Result<ServerUrl>::failure("invalid port in " + url,
                                                common::ErrorKind::Validation);
    }
    parsed.port = static_cast<std::uint16_t>(*port);
  }

  if (host.empty()) {
    return common::Result<ServerUrl>::failure("missing host in " + url,
                                              common::ErrorKind::Validation);
  }
  parsed.host = host;
  return common::Result<ServerUrl>::success(std::move(parsed));
}

common::Status validate_subject(const std::string &subject, const bool allow_wildcards) {
  if (subject.empty()) {
    return common::Status::validation("subject is required");
  }
  std::size_t start = 0;
  while (start <= subject.size()) {
    const auto dot = subject.find('.', start);
    const std::size_t end = dot == std::string::npos ? subject.size() : dot;
    const std::string token = subject.substr(start, end - start);
    if (token.empty()) {
      return common::Status::validation("subject has an empty token: " + subject);
    }
    for (const char ch : token) {
      if (std::isspace(static_cast<unsigned char>(ch)) != 0 || ch == '\0') {
        return common::Status::validation("subject contains whitespace: " + subject);
      }
    }
    if (token.find_first_of("*>") != std::string::npos) {
      if (!allow_wildcards) {
        return common::Status::validation("wildcards are not allowed here: " + subject);
      }
      if (token.size() != 1) {
        return common::Status::validation("wildcard must be a whole token: " + subject);
      }
      if (token == ">" && end != subject.size()) {
        return common::Status::validation("'>' must be the last token: " + subject);
      }
    }
    if (dot == std::string::npos) {
      break;
    }
    start = dot + 1;
  }
  return common::Status::success();
}

std::string encode_connect(const ConnectOptions &options) {
  std::ostringstream out;
  out << "CONNECT {"
      << "\"verbose\":" << (options.verbose ? "true" : "false") << ","
      << "\"pedantic\":" << (options.pedantic ? "true" : "false") << ","
      << "\"tls_required\":false,"
      << quoted_field("name", options.name) << ","
      << quoted_field("lang", "cpp") << ","
      << quoted_field("version", "0.1.0") << ","
      << "\"protocol\":1";
  if (options.token.has_value()) {
    out << "," << quoted_field("auth_token", *options.token);
  } else if (options.user.has_value()) {
    out << "," << quoted_field("user", *options.user);
    out << "," << quoted_field("pass", options.password.value_or(""));
  }
  out << "}\r\n";
  return out.str();
}

std::string encode_pub(const std::string &subject, const std::string &payload) {
  return "PUB " + subject + " " + std::to_string(payload.size()) + "\r\n" + payload + "\r\n";
}

std::string encode_sub(const std::string &subject, const std::uint64_t sid) {
  return "SUB " + subject + " " + std::to_string(sid) + "\r\n";
}

std::string encode_unsub(const std::uint64_t sid) {
  return "UNSUB " + std::to_string(sid) + "\r\n";
}

void ProtocolParser::feed(const std::string_view bytes) { buffer_.append(bytes); }

void ProtocolParser::reset() { buffer_.clear(); }

common::Result<std::optional<ServerOp>> ProtocolParser::next() {
  using R = common::Result<std::optional<ServerOp>>;

  const auto line_end = buffer_.find("\r\n");
  if (line_end == std::string::npos) {
    if (buffer_.size() > kMaxControlLine) {
      return R::failure("protocol control line too long", common::ErrorKind::Transport);
    }
    return R::success(std::nullopt);
  }

  const std::string line = buffer_.substr(0, line_end);
  const auto space = line.find_first_of(" \t");
  const std::string op = common::to_upper(line.substr(0, space));
  const std::string args =
      space == std::string::npos ? std::string() : common::trim(line.substr(space + 1));

  ServerOp parsed;
  if (op == "MSG") {
    const auto parts = split_ws(args);
    if (parts.size() != 3 && parts.size() != 4) {
      return R::failure("malformed MSG: " + line, common::ErrorKind::Transport);
    }
    const auto sid = parse_u64(parts[1]);
    const auto size = parse_u64(parts.back());
    if (!sid.has_value() || !size.has_value()) {
      return R::failure("malformed MSG: " + line, common::ErrorKind::Transport);
    }
    const std::size_t payload_start = line_end + 2;
    const std::size_t needed = payload_start + static_cast<std::size_t>(*size) + 2;
    if (buffer_.size() < needed) {
      return R::success(std::nullopt);
    }
    if (buffer_.compare(needed - 2, 2, "\r\n") != 0) {
      return R::failure("MSG payload not terminated", common::ErrorKind::Transport);
    }
    parsed.kind = ServerOpKind::Msg;
    parsed.subject = parts[0];
    parsed.sid = *sid;
    if (parts.size() == 4) {
      parsed.reply_to = parts[2];
    }
    parsed.payload = buffer_.substr(payload_start, static_cast<std::size_t>(*size));
    buffer_.erase(0, needed);
    return R::success(std::move(parsed));
  }

  buffer_.erase(0, line_end + 2);
  if (op == "PING") {
    parsed.kind = ServerOpKind::Ping;
  } else if (op == "PONG") {
    parsed.kind = ServerOpKind::Pong;
  } else if (op == "+OK") {
    parsed.kind = ServerOpKind::Ok;
  } else if (op == "-ERR") {
    parsed.kind = ServerOpKind::Err;
    std::string text = args;
    if (text.size() >= 2 && text.front() == '\'' && text.back() == '\'') {
      text = text.substr(1, text.size() - 2);
    }
    parsed.text = text;
  } else if (op == "INFO") {
    parsed.kind = ServerOpKind::Info;
    parsed.text = args;
  } else {
    return R::failure("unknown protocol operation: " + op, common::ErrorKind::Transport);
  }
  return R::success(std::move(parsed));
}

} // namespace devpulse::bus
