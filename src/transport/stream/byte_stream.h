#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <system_error>

namespace ghostlink::transport {

// A connected, order-preserving, bidirectional byte stream (an RFCOMM socket
// in production). No protocol knowledge and no internal retries: every
// failure is reported once and the stream is then unusable.
class ByteStream {
 public:
  virtual ~ByteStream() = default;

  // Blocks until at least one byte is available. Returns the byte count, or 0
  // with ec set (TransportError::kClosed at end of stream, kIoFault otherwise).
  virtual std::size_t read(std::span<std::uint8_t> buffer, std::error_code& ec) = 0;

  // Writes every byte or fails.
  virtual bool write(std::span<const std::uint8_t> data, std::error_code& ec) = 0;

  // Unblocks pending reads and writes. Idempotent and callable from any thread.
  virtual void close() = 0;

  virtual std::string peer_address() const = 0;
};

// Produces a fresh ByteStream for every (re)connect: accept on the HOST side,
// connect on the CLIENT side.
class StreamConnector {
 public:
  virtual ~StreamConnector() = default;

  // Blocks until a stream is open, the timeout passes (TransportError::kTimeout)
  // or cancel() is called (TransportError::kCancelled).
  virtual std::unique_ptr<ByteStream> open(std::chrono::milliseconds timeout,
                                           std::error_code& ec) = 0;

  // Aborts a blocking open(). Sticky: later calls to open() fail immediately.
  virtual void cancel() = 0;
};

}  // namespace ghostlink::transport
