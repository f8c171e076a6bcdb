#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "common/errors/error.h"
#include "transport/frame/frame.h"

namespace ghostlink::frame {

// Serializes and parses frames for the byte stream.
// Wire format (all integers big-endian):
//   [magic: 2 bytes 'G' 'L']
//   [version: 1 byte]
//   [type: 1 byte]
//   [sequence: 8 bytes]
//   [length: 4 bytes]
//   [payload: length bytes]
//   [digest: 32 bytes, SHA-256 over header and payload]
// The digest catches corruption on the wire. Authenticity comes from the
// crypto envelope inside the payload.
class FrameCodec {
 public:
  // Serialize one frame. Throws std::invalid_argument if payload exceeds kMaxPayloadSize.
  static std::vector<std::uint8_t> encode(FrameType type, std::uint64_t sequence,
                                          std::span<const std::uint8_t> payload);

  // Parse exactly one frame. On failure returns nullopt and sets error.
  // Pure: the input is not modified and no state is kept.
  static std::optional<Frame> decode(std::span<const std::uint8_t> data, FrameError& error);

  // Validate the fixed header. data must hold at least kHeaderSize bytes.
  // Rejects oversize lengths before anything proportional to them is allocated.
  static std::optional<FrameHeader> peek_header(std::span<const std::uint8_t> data,
                                                FrameError& error);

  static constexpr std::size_t encoded_size(std::size_t payload_len) {
    return kHeaderSize + payload_len + kDigestSize;
  }
};

inline constexpr std::size_t kChunkBodyHeaderSize = 8 + 4 + 4 + 1;
inline constexpr std::size_t kChunkAckBodySize = 8 + 4 + 8;
inline constexpr std::size_t kHeartbeatBodySize = 8 + 8;

std::vector<std::uint8_t> encode_chunk_body(const ChunkBody& body);
std::optional<ChunkBody> decode_chunk_body(std::span<const std::uint8_t> data);

std::vector<std::uint8_t> encode_chunk_ack_body(const ChunkAckBody& body);
std::optional<ChunkAckBody> decode_chunk_ack_body(std::span<const std::uint8_t> data);

std::vector<std::uint8_t> encode_heartbeat_body(const HeartbeatBody& body);
std::optional<HeartbeatBody> decode_heartbeat_body(std::span<const std::uint8_t> data);

}  // namespace ghostlink::frame
