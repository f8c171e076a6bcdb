#pragma once

#include <atomic>
#include <string>

#include "transport/stream/byte_stream.h"

namespace ghostlink::transport {

// ByteStream over a connected stream socket descriptor. Takes ownership of fd.
// Works for an RFCOMM socket handed over by the platform as well as TCP
// sockets and socketpair() ends.
class FdByteStream final : public ByteStream {
 public:
  FdByteStream(int fd, std::string peer_address);
  ~FdByteStream() override;

  // Non-copyable, non-movable (owns a descriptor shared with a blocked reader).
  FdByteStream(const FdByteStream&) = delete;
  FdByteStream& operator=(const FdByteStream&) = delete;
  FdByteStream(FdByteStream&&) = delete;
  FdByteStream& operator=(FdByteStream&&) = delete;

  std::size_t read(std::span<std::uint8_t> buffer, std::error_code& ec) override;
  bool write(std::span<const std::uint8_t> data, std::error_code& ec) override;
  void close() override;
  std::string peer_address() const override { return peer_address_; }

  int fd() const { return fd_; }

 private:
  int fd_{-1};
  std::string peer_address_;
  std::atomic<bool> closed_{false};
};

}  // namespace ghostlink::transport
