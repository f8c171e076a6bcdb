#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

#include "transport/stream/byte_stream.h"

namespace ghostlink::transport {

// HOST-side connector over TCP. Stands in for an RFCOMM listening socket in
// the demo tool and tests.
class TcpListenConnector final : public StreamConnector {
 public:
  TcpListenConnector(std::string bind_address, std::uint16_t port);
  ~TcpListenConnector() override;

  TcpListenConnector(const TcpListenConnector&) = delete;
  TcpListenConnector& operator=(const TcpListenConnector&) = delete;
  TcpListenConnector(TcpListenConnector&&) = delete;
  TcpListenConnector& operator=(TcpListenConnector&&) = delete;

  // Bind and listen. open() calls this lazily; calling it first lets the
  // caller learn the port when 0 was requested.
  bool listen(std::error_code& ec);

  std::unique_ptr<ByteStream> open(std::chrono::milliseconds timeout,
                                   std::error_code& ec) override;
  void cancel() override;

  // Actual bound port, or 0 if not listening.
  std::uint16_t local_port() const;

 private:
  std::string bind_address_;
  std::uint16_t port_{0};
  std::mutex mutex_;
  int listen_fd_{-1};
  int cancel_fd_{-1};
  std::atomic<bool> cancelled_{false};
};

// CLIENT-side connector over TCP.
class TcpDialConnector final : public StreamConnector {
 public:
  TcpDialConnector(std::string host, std::uint16_t port);
  ~TcpDialConnector() override;

  TcpDialConnector(const TcpDialConnector&) = delete;
  TcpDialConnector& operator=(const TcpDialConnector&) = delete;
  TcpDialConnector(TcpDialConnector&&) = delete;
  TcpDialConnector& operator=(TcpDialConnector&&) = delete;

  std::unique_ptr<ByteStream> open(std::chrono::milliseconds timeout,
                                   std::error_code& ec) override;
  void cancel() override;

 private:
  std::string host_;
  std::uint16_t port_{0};
  int cancel_fd_{-1};
  std::atomic<bool> cancelled_{false};
};

}  // namespace ghostlink::transport
