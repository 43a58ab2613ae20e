#include "devpulse/bus/transport.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace devpulse::bus {

namespace {

bool send_all(const int fd, const char *data, const std::size_t size) {
  std::size_t sent = 0;
  while (sent < size) {
    const ssize_t n = ::send(fd, data + sent, size - sent, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

timeval to_timeval(const std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<long>(timeout.count() / 1000);
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>((timeout.count() % 1000) * 1000);
  return tv;
}

common::Status connect_with_timeout(const int fd, const sockaddr *addr, const socklen_t len,
                                    const std::chrono::milliseconds timeout) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    return common::Status::error("failed to configure socket", common::ErrorKind::Transport);
  }

  if (::connect(fd, addr, len) != 0) {
    if (errno != EINPROGRESS) {
      return common::Status::error(std::string("connect failed: ") + std::strerror(errno),
                                   common::ErrorKind::Transport);
    }
    fd_set write_fds;
    FD_ZERO(&write_fds);
    FD_SET(fd, &write_fds);
    timeval tv = to_timeval(timeout);
    const int ready = select(fd + 1, nullptr, &write_fds, nullptr, &tv);
    if (ready == 0) {
      return common::Status::error("connect timed out", common::ErrorKind::Transport);
    }
    if (ready < 0) {
      return common::Status::error(std::string("connect select failed: ") +
                                       std::strerror(errno),
                                   common::ErrorKind::Transport);
    }
    int so_error = 0;
    socklen_t so_len = sizeof(so_error);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0 || so_error != 0) {
      return common::Status::error(std::string("connect failed: ") + std::strerror(so_error),
                                   common::ErrorKind::Transport);
    }
  }

  if (fcntl(fd, F_SETFL, flags) < 0) {
    return common::Status::error("failed to configure socket", common::ErrorKind::Transport);
  }
  return common::Status::success();
}

class TcpBusTransport final : public IBusTransport {
public:
  ~TcpBusTransport() override { close(); }

  common::Status connect(const std::string &host, const std::uint16_t port,
                         const std::chrono::milliseconds timeout) override {
    if (connected_.load()) {
      return common::Status::error("transport already connected");
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *results = nullptr;
    const std::string service = std::to_string(port);
    if (const int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &results); rc != 0) {
      return common::Status::error("failed to resolve " + host + ": " + gai_strerror(rc),
                                   common::ErrorKind::Transport);
    }

    common::Status last = common::Status::error("no usable address for " + host,
                                                common::ErrorKind::Transport);
    int fd = -1;
    for (addrinfo *it = results; it != nullptr; it = it->ai_next) {
      fd = socket(it->ai_family, it->ai_socktype, it->ai_protocol);
      if (fd < 0) {
        continue;
      }
      last = connect_with_timeout(fd, it->ai_addr, it->ai_addrlen, timeout);
      if (last.ok()) {
        break;
      }
      ::close(fd);
      fd = -1;
    }
    freeaddrinfo(results);
    if (fd < 0) {
      return last;
    }

    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    {
      std::lock_guard<std::mutex> lock(io_mutex_);
      fd_ = fd;
    }
    connected_.store(true);
    return common::Status::success();
  }

  void close() override {
    int fd = -1;
    {
      std::lock_guard<std::mutex> lock(io_mutex_);
      fd = fd_;
      fd_ = -1;
    }
    connected_.store(false);
    if (fd >= 0) {
      shutdown(fd, SHUT_RDWR);
      ::close(fd);
    }
  }

  bool is_connected() const override { return connected_.load(); }

  common::Status send(const std::string &bytes) override {
    const int fd = current_fd();
    if (!connected_.load() || fd < 0) {
      return common::Status::error("transport not connected", common::ErrorKind::Transport);
    }
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (!send_all(fd, bytes.data(), bytes.size())) {
      connected_.store(false);
      return common::Status::error("socket send failed", common::ErrorKind::Transport);
    }
    return common::Status::success();
  }

  common::Result<std::string> receive(const std::chrono::milliseconds timeout) override {
    const int fd = current_fd();
    if (!connected_.load() || fd < 0) {
      return common::Result<std::string>::failure("transport not connected",
                                                  common::ErrorKind::Transport);
    }

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(fd, &read_fds);
    timeval tv = to_timeval(timeout);
    const int ready = select(fd + 1, &read_fds, nullptr, nullptr, &tv);
    if (ready < 0) {
      if (errno == EINTR) {
        return common::Result<std::string>::failure(kReceiveTimeout);
      }
      return common::Result<std::string>::failure("socket select failed",
                                                  common::ErrorKind::Transport);
    }
    if (ready == 0) {
      return common::Result<std::string>::failure(kReceiveTimeout);
    }

    std::array<char, 16 * 1024> buffer{};
    const ssize_t n = recv(fd, buffer.data(), buffer.size(), 0);
    if (n == 0) {
      connected_.store(false);
      return common::Result<std::string>::failure("connection closed by server",
                                                  common::ErrorKind::Transport);
    }
    if (n < 0) {
      connected_.store(false);
      return common::Result<std::string>::failure(std::string("socket receive failed: ") +
                                                      std::strerror(errno),
                                                  common::ErrorKind::Transport);
    }
    return common::Result<std::string>::success(
        std::string(buffer.data(), static_cast<std::size_t>(n)));
  }

private:
  int current_fd() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return fd_;
  }

  mutable std::mutex io_mutex_;
  std::mutex send_mutex_;
  int fd_ = -1;
  std::atomic<bool> connected_{false};
};

} // namespace

std::unique_ptr<IBusTransport> make_tcp_transport() {
  return std::make_unique<TcpBusTransport>();
}

} // namespace devpulse::bus
