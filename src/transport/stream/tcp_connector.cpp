#include "transport/stream/tcp_connector.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

#include "common/errors/error.h"
#include "common/logging/logger.h"
#include "transport/stream/fd_stream.h"

namespace {

std::error_code last_error() { return std::error_code(errno, std::generic_category()); }

bool resolve(const std::string& host, std::uint16_t port, sockaddr_in& addr) {
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  return inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1;
}

std::string address_string(const sockaddr_in& addr) {
  std::array<char, INET_ADDRSTRLEN> buffer{};
  const char* res = inet_ntop(AF_INET, &addr.sin_addr, buffer.data(), buffer.size());
  return (res != nullptr) ? std::string(buffer.data()) : std::string();
}

void configure_stream_socket(int fd) {
  const int enable = 1;
  // Frames are small and latency matters more than throughput here.
  ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &enable, sizeof(enable));
}

bool set_blocking(int fd, bool blocking) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  const int updated = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
  return ::fcntl(fd, F_SETFL, updated) == 0;
}

int make_cancel_fd() { return ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK); }

void signal_cancel(int fd) {
  if (fd < 0) {
    return;
  }
  const std::uint64_t one = 1;
  [[maybe_unused]] const auto n = ::write(fd, &one, sizeof(one));
}

// Waits for events on fd while watching the cancel descriptor.
// Returns 1 when fd is ready, 0 on timeout, -1 on cancel or failure.
int wait_ready(int fd, short events, int cancel_fd, std::chrono::milliseconds timeout,
               std::error_code& ec) {
  std::array<pollfd, 2> fds{};
  fds[0] = pollfd{fd, events, 0};
  fds[1] = pollfd{cancel_fd, POLLIN, 0};
  while (true) {
    const int rc = ::poll(fds.data(), cancel_fd >= 0 ? 2 : 1, static_cast<int>(timeout.count()));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      ec = ghostlink::TransportError::kIoFault;
      return -1;
    }
    if (rc == 0) {
      ec = ghostlink::TransportError::kTimeout;
      return 0;
    }
    if (cancel_fd >= 0 && (fds[1].revents & POLLIN) != 0) {
      ec = ghostlink::TransportError::kCancelled;
      return -1;
    }
    return 1;
  }
}

}  // namespace

namespace ghostlink::transport {

TcpListenConnector::TcpListenConnector(std::string bind_address, std::uint16_t port)
    : bind_address_(std::move(bind_address)), port_(port), cancel_fd_(make_cancel_fd()) {}

TcpListenConnector::~TcpListenConnector() {
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
  }
  if (cancel_fd_ >= 0) {
    ::close(cancel_fd_);
  }
}

bool TcpListenConnector::listen(std::error_code& ec) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (listen_fd_ >= 0) {
    return true;
  }
  sockaddr_in addr{};
  if (!resolve(bind_address_, port_, addr)) {
    ec = std::make_error_code(std::errc::invalid_argument);
    LOG_ERROR("Invalid bind address: {}", bind_address_);
    return false;
  }
  const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    ec = last_error();
    return false;
  }
  const int enable = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd, 1) != 0) {
    ec = last_error();
    LOG_ERROR("Failed to listen on {}:{}: {}", bind_address_, port_, ec.message());
    ::close(fd);
    return false;
  }
  listen_fd_ = fd;
  LOG_INFO("Listening on {}:{}", bind_address_, local_port());
  return true;
}

std::unique_ptr<ByteStream> TcpListenConnector::open(std::chrono::milliseconds timeout,
                                                     std::error_code& ec) {
  if (cancelled_.load()) {
    ec = TransportError::kCancelled;
    return nullptr;
  }
  if (!listen(ec)) {
    return nullptr;
  }
  if (wait_ready(listen_fd_, POLLIN, cancel_fd_, timeout, ec) <= 0) {
    return nullptr;
  }

  sockaddr_in peer{};
  socklen_t len = sizeof(peer);
  const int fd = ::accept4(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &len, SOCK_CLOEXEC);
  if (fd < 0) {
    ec = last_error();
    LOG_WARN("accept failed: {}", ec.message());
    return nullptr;
  }
  configure_stream_socket(fd);
  auto address = address_string(peer);
  LOG_DEBUG("Accepted stream from {}", address);
  return std::make_unique<FdByteStream>(fd, std::move(address));
}

void TcpListenConnector::cancel() {
  cancelled_.store(true);
  signal_cancel(cancel_fd_);
}

std::uint16_t TcpListenConnector::local_port() const {
  if (listen_fd_ < 0) {
    return 0;
  }
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return 0;
  }
  return ntohs(addr.sin_port);
}

TcpDialConnector::TcpDialConnector(std::string host, std::uint16_t port)
    : host_(std::move(host)), port_(port), cancel_fd_(make_cancel_fd()) {}

TcpDialConnector::~TcpDialConnector() {
  if (cancel_fd_ >= 0) {
    ::close(cancel_fd_);
  }
}

std::unique_ptr<ByteStream> TcpDialConnector::open(std::chrono::milliseconds timeout,
                                                   std::error_code& ec) {
  if (cancelled_.load()) {
    ec = TransportError::kCancelled;
    return nullptr;
  }
  sockaddr_in addr{};
  if (!resolve(host_, port_, addr)) {
    ec = std::make_error_code(std::errc::invalid_argument);
    LOG_ERROR("Invalid peer address: {}", host_);
    return nullptr;
  }
  const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (fd < 0) {
    ec = last_error();
    return nullptr;
  }

  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    if (errno != EINPROGRESS) {
      ec = TransportError::kIoFault;
      LOG_DEBUG("connect to {}:{} failed: {}", host_, port_, last_error().message());
      ::close(fd);
      return nullptr;
    }
    if (wait_ready(fd, POLLOUT, cancel_fd_, timeout, ec) <= 0) {
      ::close(fd);
      return nullptr;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
      ec = TransportError::kIoFault;
      LOG_DEBUG("connect to {}:{} failed: {}", host_, port_,
                std::error_code(so_error, std::generic_category()).message());
      ::close(fd);
      return nullptr;
    }
  }

  if (!set_blocking(fd, true)) {
    ec = last_error();
    ::close(fd);
    return nullptr;
  }
  configure_stream_socket(fd);
  LOG_DEBUG("Connected to {}:{}", host_, port_);
  return std::make_unique<FdByteStream>(fd, host_);
}

void TcpDialConnector::cancel() {
  cancelled_.store(true);
  signal_cancel(cancel_fd_);
}

}  // namespace ghostlink::transport
