#pragma once

#include "devpulse/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace devpulse::bus {

/// Error text returned by receive() when nothing arrived within the timeout.
inline constexpr const char *kReceiveTimeout = "timeout";

/// Byte stream to a bus server. send() and receive() may be called from different threads;
/// close() unblocks both.
class IBusTransport {
public:
  virtual ~IBusTransport() = default;
  [[nodiscard]] virtual common::Status connect(const std::string &host, std::uint16_t port,
                                               std::chrono::milliseconds timeout) = 0;
  virtual void close() = 0;
  [[nodiscard]] virtual bool is_connected() const = 0;
  [[nodiscard]] virtual common::Status send(const std::string &bytes) = 0;
  [[nodiscard]] virtual common::Result<std::string>
  receive(std::chrono::milliseconds timeout) = 0;
};

[[nodiscard]] std::unique_ptr<IBusTransport> make_tcp_transport();

} // namespace devpulse::bus
