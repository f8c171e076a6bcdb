#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ghostlink::frame {

inline constexpr std::array<std::uint8_t, 2> kMagic{'G', 'L'};
inline constexpr std::uint8_t kProtocolVersion = 1;

// magic(2) + version(1) + type(1) + sequence(8) + length(4)
inline constexpr std::size_t kHeaderSize = 16;
inline constexpr std::size_t kDigestSize = 32;
inline constexpr std::size_t kMaxPayloadSize = 64 * 1024;
inline constexpr std::size_t kMaxFrameSize = kHeaderSize + kMaxPayloadSize + kDigestSize;

enum class FrameType : std::uint8_t {
  kHello = 1,
  kHelloAck = 2,
  kDataText = 3,
  kDataChunk = 4,
  kChunkAck = 5,
  kPing = 6,
  kPong = 7,
  kBye = 8,
};

bool is_known_type(std::uint8_t raw) noexcept;
const char* to_string(FrameType type) noexcept;

// HELLO and HELLO_ACK travel before a key exists. Every other type is sealed
// and carries a per-direction sequence number.
inline constexpr bool is_sealed_type(FrameType type) noexcept {
  return type != FrameType::kHello && type != FrameType::kHelloAck;
}

struct FrameHeader {
  FrameType type{};
  std::uint64_t sequence{0};
  std::uint32_t length{0};
};

// One decoded frame. For sealed types the payload is still the envelope
// (nonce || ciphertext || tag) until the session opens it.
struct Frame {
  FrameType type{};
  std::uint64_t sequence{0};
  std::vector<std::uint8_t> payload;
};

enum class PayloadKind : std::uint8_t { kText = 1, kMedia = 2 };

// Plaintext body of a DATA_CHUNK frame.
struct ChunkBody {
  std::uint64_t transfer_id{0};
  std::uint32_t index{0};
  std::uint32_t total{0};
  PayloadKind kind{PayloadKind::kMedia};
  std::vector<std::uint8_t> data;
};

// Plaintext body of a CHUNK_ACK frame. It also carries the sender's cumulative
// acknowledgement so a busy transfer does not wait for the next heartbeat.
struct ChunkAckBody {
  std::uint64_t transfer_id{0};
  std::uint32_t index{0};
  std::uint64_t next_recv_seq{0};
};

// Plaintext body of PING and PONG. next_recv_seq is a cumulative acknowledgement:
// every sealed frame below it has been received.
struct HeartbeatBody {
  std::uint64_t next_recv_seq{0};
  std::uint64_t timestamp_ms{0};
};

enum class ByeReason : std::uint8_t { kNormal = 0, kShutdown = 1 };

}  // namespace ghostlink::frame
