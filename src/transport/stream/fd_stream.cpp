#include "transport/stream/fd_stream.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>

#include "common/errors/error.h"
#include "common/logging/logger.h"

namespace ghostlink::transport {

FdByteStream::FdByteStream(int fd, std::string peer_address)
    : fd_(fd), peer_address_(std::move(peer_address)) {}

FdByteStream::~FdByteStream() {
  close();
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

std::size_t FdByteStream::read(std::span<std::uint8_t> buffer, std::error_code& ec) {
  if (closed_.load()) {
    ec = TransportError::kClosed;
    return 0;
  }
  while (true) {
    const auto n = ::recv(fd_, buffer.data(), buffer.size(), 0);
    if (n > 0) {
      return static_cast<std::size_t>(n);
    }
    if (n == 0) {
      ec = TransportError::kClosed;
      return 0;
    }
    if (errno == EINTR) {
      continue;
    }
    if (closed_.load()) {
      ec = TransportError::kClosed;
      return 0;
    }
    LOG_DEBUG("FdByteStream::read failed on {}: {}", peer_address_,
              std::error_code(errno, std::generic_category()).message());
    ec = TransportError::kIoFault;
    return 0;
  }
}

bool FdByteStream::write(std::span<const std::uint8_t> data, std::error_code& ec) {
  std::size_t written = 0;
  while (written < data.size()) {
    if (closed_.load()) {
      ec = TransportError::kClosed;
      return false;
    }
    const auto n = ::send(fd_, data.data() + written, data.size() - written, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const auto sys_ec = std::error_code(errno, std::generic_category());
      LOG_DEBUG("FdByteStream::write failed on {}: {}", peer_address_, sys_ec.message());
      ec = (errno == EPIPE || errno == ECONNRESET) ? make_error_code(TransportError::kClosed)
                                                   : make_error_code(TransportError::kIoFault);
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  return true;
}

void FdByteStream::close() {
  if (closed_.exchange(true)) {
    return;
  }
  // shutdown() wakes a reader blocked in recv(); the descriptor itself is
  // released in the destructor once no thread can still be using it.
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
}

}  // namespace ghostlink::transport
