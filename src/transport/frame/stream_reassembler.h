#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "common/errors/error.h"
#include "transport/frame/frame.h"

namespace ghostlink::frame {

// Bytes read from the stream per call; also the slack the reassembler keeps
// above one maximum-size frame.
inline constexpr std::size_t kReadChunkSize = 4096;

struct ReassemblyResult {
  enum class Status : std::uint8_t { kFrame, kNeedMore, kError };

  Status status{Status::kNeedMore};
  Frame frame;
  FrameError error{};
};

/**
 * Finds frame boundaries in an arbitrarily chunked byte stream.
 *
 * feed() appends bytes, next() yields at most one complete, digest-verified
 * frame. The output sequence does not depend on how the input was split.
 * The buffer never holds more than one maximum-size frame plus one read chunk
 * as long as the caller drains next() after every feed().
 *
 * After kError nothing is consumed; the caller either tears the connection
 * down (and calls reset()) or calls resync() to skip to the next magic.
 *
 * Thread Safety: not thread-safe. Owned by the session reader thread.
 */
class StreamReassembler {
 public:
  explicit StreamReassembler(std::size_t max_buffer_bytes = kMaxFrameSize + kReadChunkSize);

  // Returns false without buffering anything if capacity would be exceeded.
  bool feed(std::span<const std::uint8_t> bytes);

  ReassemblyResult next();

  // Discard at least one byte and then everything up to the next plausible
  // frame start. Returns the number of bytes dropped.
  std::size_t resync();

  void reset();

  [[nodiscard]] std::size_t buffered() const { return buffer_.size() - offset_; }
  [[nodiscard]] std::size_t capacity() const { return max_buffer_bytes_; }

 private:
  void compact();

  std::size_t max_buffer_bytes_;
  std::vector<std::uint8_t> buffer_;
  std::size_t offset_{0};
};

}  // namespace ghostlink::frame
