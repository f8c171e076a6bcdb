#include "transport/frame/frame_codec.h"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

#include "common/crypto/crypto_engine.h"

namespace {

void write_u32(std::vector<std::uint8_t>& out, std::uint32_t value) {
  out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
  out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

void write_u64(std::vector<std::uint8_t>& out, std::uint64_t value) {
  for (int i = 7; i >= 0; --i) {
    out.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
  }
}

std::uint32_t read_u32(std::span<const std::uint8_t> data, std::size_t offset) {
  return (static_cast<std::uint32_t>(data[offset]) << 24) |
         (static_cast<std::uint32_t>(data[offset + 1]) << 16) |
         (static_cast<std::uint32_t>(data[offset + 2]) << 8) |
         static_cast<std::uint32_t>(data[offset + 3]);
}

std::uint64_t read_u64(std::span<const std::uint8_t> data, std::size_t offset) {
  std::uint64_t value = 0;
  for (int i = 0; i < 8; ++i) {
    value = (value << 8) | data[offset + static_cast<std::size_t>(i)];
  }
  return value;
}

}  // namespace

namespace ghostlink::frame {

bool is_known_type(std::uint8_t raw) noexcept {
  return raw >= static_cast<std::uint8_t>(FrameType::kHello) &&
         raw <= static_cast<std::uint8_t>(FrameType::kBye);
}

const char* to_string(FrameType type) noexcept {
  switch (type) {
    case FrameType::kHello:
      return "HELLO";
    case FrameType::kHelloAck:
      return "HELLO_ACK";
    case FrameType::kDataText:
      return "DATA_TEXT";
    case FrameType::kDataChunk:
      return "DATA_CHUNK";
    case FrameType::kChunkAck:
      return "CHUNK_ACK";
    case FrameType::kPing:
      return "PING";
    case FrameType::kPong:
      return "PONG";
    case FrameType::kBye:
      return "BYE";
  }
  return "UNKNOWN";
}

std::vector<std::uint8_t> FrameCodec::encode(FrameType type, std::uint64_t sequence,
                                             std::span<const std::uint8_t> payload) {
  if (payload.size() > kMaxPayloadSize) {
    throw std::invalid_argument("frame payload exceeds maximum size");
  }
  std::vector<std::uint8_t> out;
  out.reserve(encoded_size(payload.size()));
  out.insert(out.end(), kMagic.begin(), kMagic.end());
  out.push_back(kProtocolVersion);
  out.push_back(static_cast<std::uint8_t>(type));
  write_u64(out, sequence);
  write_u32(out, static_cast<std::uint32_t>(payload.size()));
  out.insert(out.end(), payload.begin(), payload.end());

  const auto digest = crypto::sha256(out);
  out.insert(out.end(), digest.begin(), digest.end());
  return out;
}

std::optional<FrameHeader> FrameCodec::peek_header(std::span<const std::uint8_t> data,
                                                   FrameError& error) {
  if (data.size() < kHeaderSize) {
    error = FrameError::kLengthMismatch;
    return std::nullopt;
  }
  if (!std::equal(kMagic.begin(), kMagic.end(), data.begin())) {
    error = FrameError::kBadMagic;
    return std::nullopt;
  }
  if (data[2] != kProtocolVersion) {
    error = FrameError::kBadVersion;
    return std::nullopt;
  }
  if (!is_known_type(data[3])) {
    error = FrameError::kUnknownType;
    return std::nullopt;
  }
  FrameHeader header{
      .type = static_cast<FrameType>(data[3]),
      .sequence = read_u64(data, 4),
      .length = read_u32(data, 12),
  };
  if (header.length > kMaxPayloadSize) {
    error = FrameError::kOversize;
    return std::nullopt;
  }
  return header;
}

std::optional<Frame> FrameCodec::decode(std::span<const std::uint8_t> data, FrameError& error) {
  const auto header = peek_header(data, error);
  if (!header) {
    return std::nullopt;
  }
  if (data.size() != encoded_size(header->length)) {
    error = FrameError::kLengthMismatch;
    return std::nullopt;
  }

  const auto covered = data.first(kHeaderSize + header->length);
  const auto provided = data.subspan(kHeaderSize + header->length, kDigestSize);
  const auto expected = crypto::sha256(covered);
  if (!std::equal(expected.begin(), expected.end(), provided.begin())) {
    error = FrameError::kBadDigest;
    return std::nullopt;
  }

  Frame frame{};
  frame.type = header->type;
  frame.sequence = header->sequence;
  frame.payload.assign(covered.begin() + kHeaderSize, covered.end());
  return frame;
}

std::vector<std::uint8_t> encode_chunk_body(const ChunkBody& body) {
  std::vector<std::uint8_t> out;
  out.reserve(kChunkBodyHeaderSize + body.data.size());
  write_u64(out, body.transfer_id);
  write_u32(out, body.index);
  write_u32(out, body.total);
  out.push_back(static_cast<std::uint8_t>(body.kind));
  out.insert(out.end(), body.data.begin(), body.data.end());
  return out;
}

std::optional<ChunkBody> decode_chunk_body(std::span<const std::uint8_t> data) {
  if (data.size() < kChunkBodyHeaderSize) {
    return std::nullopt;
  }
  const auto kind = data[16];
  if (kind != static_cast<std::uint8_t>(PayloadKind::kText) &&
      kind != static_cast<std::uint8_t>(PayloadKind::kMedia)) {
    return std::nullopt;
  }
  ChunkBody body{};
  body.transfer_id = read_u64(data, 0);
  body.index = read_u32(data, 8);
  body.total = read_u32(data, 12);
  body.kind = static_cast<PayloadKind>(kind);
  body.data.assign(data.begin() + kChunkBodyHeaderSize, data.end());
  return body;
}

std::vector<std::uint8_t> encode_chunk_ack_body(const ChunkAckBody& body) {
  std::vector<std::uint8_t> out;
  out.reserve(kChunkAckBodySize);
  write_u64(out, body.transfer_id);
  write_u32(out, body.index);
  write_u64(out, body.next_recv_seq);
  return out;
}

std::optional<ChunkAckBody> decode_chunk_ack_body(std::span<const std::uint8_t> data) {
  if (data.size() != kChunkAckBodySize) {
    return std::nullopt;
  }
  return ChunkAckBody{
      .transfer_id = read_u64(data, 0),
      .index = read_u32(data, 8),
      .next_recv_seq = read_u64(data, 12),
  };
}

std::vector<std::uint8_t> encode_heartbeat_body(const HeartbeatBody& body) {
  std::vector<std::uint8_t> out;
  out.reserve(kHeartbeatBodySize);
  write_u64(out, body.next_recv_seq);
  write_u64(out, body.timestamp_ms);
  return out;
}

std::optional<HeartbeatBody> decode_heartbeat_body(std::span<const std::uint8_t> data) {
  if (data.size() != kHeartbeatBodySize) {
    return std::nullopt;
  }
  return HeartbeatBody{.next_recv_seq = read_u64(data, 0), .timestamp_ms = read_u64(data, 8)};
}

}  // namespace ghostlink::frame
