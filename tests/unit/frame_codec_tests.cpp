#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

#include "transport/frame/frame_codec.h"

namespace ghostlink::tests {

using frame::FrameCodec;
using frame::FrameType;

TEST(FrameCodecTests, EncodeDecodeRoundTrip) {
  const std::vector<std::uint8_t> payload{'h', 'e', 'l', 'l', 'o'};
  const auto wire = FrameCodec::encode(FrameType::kDataText, 42, payload);
  ASSERT_EQ(wire.size(), FrameCodec::encoded_size(payload.size()));

  FrameError error{};
  const auto decoded = FrameCodec::decode(wire, error);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->type, FrameType::kDataText);
  EXPECT_EQ(decoded->sequence, 42U);
  EXPECT_EQ(decoded->payload, payload);
}

TEST(FrameCodecTests, HeaderLayoutIsBigEndian) {
  const std::vector<std::uint8_t> payload(3, 0x7F);
  const auto wire = FrameCodec::encode(FrameType::kPing, 0x0102030405060708ULL, payload);

  EXPECT_EQ(wire[0], 'G');
  EXPECT_EQ(wire[1], 'L');
  EXPECT_EQ(wire[2], frame::kProtocolVersion);
  EXPECT_EQ(wire[3], static_cast<std::uint8_t>(FrameType::kPing));
  for (std::size_t i = 0; i < 8; ++i) {
    EXPECT_EQ(wire[4 + i], i + 1);
  }
  EXPECT_EQ(wire[12], 0);
  EXPECT_EQ(wire[13], 0);
  EXPECT_EQ(wire[14], 0);
  EXPECT_EQ(wire[15], 3);
}

TEST(FrameCodecTests, EmptyPayloadIsValid) {
  const auto wire = FrameCodec::encode(FrameType::kBye, 7, {});
  EXPECT_EQ(wire.size(), frame::kHeaderSize + frame::kDigestSize);

  FrameError error{};
  const auto decoded = FrameCodec::decode(wire, error);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_TRUE(decoded->payload.empty());
}

TEST(FrameCodecTests, MaximumPayloadAccepted) {
  const std::vector<std::uint8_t> payload(frame::kMaxPayloadSize, 0x11);
  const auto wire = FrameCodec::encode(FrameType::kDataChunk, 1, payload);

  FrameError error{};
  const auto decoded = FrameCodec::decode(wire, error);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->payload.size(), frame::kMaxPayloadSize);
}

TEST(FrameCodecTests, OversizePayloadRejectedOnEncode) {
  const std::vector<std::uint8_t> payload(frame::kMaxPayloadSize + 1, 0x00);
  EXPECT_THROW(FrameCodec::encode(FrameType::kDataChunk, 1, payload), std::invalid_argument);
}

TEST(FrameCodecTests, OversizeLengthRejectedFromHeaderAlone) {
  auto wire = FrameCodec::encode(FrameType::kDataText, 1, std::vector<std::uint8_t>(4, 1));
  // Claim one byte more than the maximum.
  const std::uint32_t bogus = frame::kMaxPayloadSize + 1;
  wire[12] = static_cast<std::uint8_t>(bogus >> 24);
  wire[13] = static_cast<std::uint8_t>(bogus >> 16);
  wire[14] = static_cast<std::uint8_t>(bogus >> 8);
  wire[15] = static_cast<std::uint8_t>(bogus);

  FrameError error{};
  EXPECT_FALSE(FrameCodec::peek_header(wire, error).has_value());
  EXPECT_EQ(error, FrameError::kOversize);
}

TEST(FrameCodecTests, FlippedPayloadBitFailsDigest) {
  auto wire = FrameCodec::encode(FrameType::kDataText, 5, std::vector<std::uint8_t>(32, 0xAA));
  wire[frame::kHeaderSize + 10] ^= 0x01;

  FrameError error{};
  EXPECT_FALSE(FrameCodec::decode(wire, error).has_value());
  EXPECT_EQ(error, FrameError::kBadDigest);
}

TEST(FrameCodecTests, FlippedSequenceBitFailsDigest) {
  auto wire = FrameCodec::encode(FrameType::kDataText, 5, std::vector<std::uint8_t>(8, 0xAA));
  wire[11] ^= 0x80;

  FrameError error{};
  EXPECT_FALSE(FrameCodec::decode(wire, error).has_value());
  EXPECT_EQ(error, FrameError::kBadDigest);
}

TEST(FrameCodecTests, FlippedDigestBitFailsDigest) {
  auto wire = FrameCodec::encode(FrameType::kPong, 9, std::vector<std::uint8_t>(16, 0x01));
  wire.back() ^= 0x40;

  FrameError error{};
  EXPECT_FALSE(FrameCodec::decode(wire, error).has_value());
  EXPECT_EQ(error, FrameError::kBadDigest);
}

TEST(FrameCodecTests, EverySingleBitFlipIsRejected) {
  const std::vector<std::uint8_t> payload{'g', 'h', 'o', 's', 't', 'l', 'i', 'n', 'k'};
  const auto wire = FrameCodec::encode(FrameType::kDataText, 0x0102030405060708ULL, payload);

  for (std::size_t byte = 0; byte < wire.size(); ++byte) {
    for (int bit = 0; bit < 8; ++bit) {
      auto damaged = wire;
      damaged[byte] ^= static_cast<std::uint8_t>(1U << bit);

      FrameError error{};
      EXPECT_FALSE(FrameCodec::decode(damaged, error).has_value())
          << "byte " << byte << " bit " << bit;
      const bool header_error = error == FrameError::kBadMagic ||
                                error == FrameError::kBadVersion ||
                                error == FrameError::kUnknownType ||
                                error == FrameError::kOversize ||
                                error == FrameError::kLengthMismatch;
      if (byte >= frame::kHeaderSize) {
        EXPECT_EQ(error, FrameError::kBadDigest) << "byte " << byte << " bit " << bit;
      } else {
        EXPECT_TRUE(error == FrameError::kBadDigest || header_error)
            << "byte " << byte << " bit " << bit;
      }
    }
  }
}

TEST(FrameCodecTests, BadMagicRejected) {
  auto wire = FrameCodec::encode(FrameType::kPing, 1, {});
  wire[0] = 'X';

  FrameError error{};
  EXPECT_FALSE(FrameCodec::decode(wire, error).has_value());
  EXPECT_EQ(error, FrameError::kBadMagic);
}

TEST(FrameCodecTests, UnknownVersionRejected) {
  auto wire = FrameCodec::encode(FrameType::kPing, 1, {});
  wire[2] = frame::kProtocolVersion + 1;

  FrameError error{};
  EXPECT_FALSE(FrameCodec::decode(wire, error).has_value());
  EXPECT_EQ(error, FrameError::kBadVersion);
}

TEST(FrameCodecTests, UnknownTypeRejected) {
  auto wire = FrameCodec::encode(FrameType::kPing, 1, {});
  wire[3] = 0x42;

  FrameError error{};
  EXPECT_FALSE(FrameCodec::decode(wire, error).has_value());
  EXPECT_EQ(error, FrameError::kUnknownType);
}

TEST(FrameCodecTests, TruncatedFrameIsLengthMismatch) {
  auto wire = FrameCodec::encode(FrameType::kDataText, 1, std::vector<std::uint8_t>(10, 0x55));
  wire.pop_back();

  FrameError error{};
  EXPECT_FALSE(FrameCodec::decode(wire, error).has_value());
  EXPECT_EQ(error, FrameError::kLengthMismatch);
}

TEST(FrameCodecTests, TrailingBytesAreLengthMismatch) {
  auto wire = FrameCodec::encode(FrameType::kDataText, 1, std::vector<std::uint8_t>(10, 0x55));
  wire.push_back(0x00);

  FrameError error{};
  EXPECT_FALSE(FrameCodec::decode(wire, error).has_value());
  EXPECT_EQ(error, FrameError::kLengthMismatch);
}

TEST(FrameCodecTests, SealedTypeClassification) {
  EXPECT_FALSE(frame::is_sealed_type(FrameType::kHello));
  EXPECT_FALSE(frame::is_sealed_type(FrameType::kHelloAck));
  EXPECT_TRUE(frame::is_sealed_type(FrameType::kDataText));
  EXPECT_TRUE(frame::is_sealed_type(FrameType::kDataChunk));
  EXPECT_TRUE(frame::is_sealed_type(FrameType::kChunkAck));
  EXPECT_TRUE(frame::is_sealed_type(FrameType::kPing));
  EXPECT_TRUE(frame::is_sealed_type(FrameType::kPong));
  EXPECT_TRUE(frame::is_sealed_type(FrameType::kBye));
}

TEST(FrameCodecTests, ChunkBodyRoundTrip) {
  frame::ChunkBody body{};
  body.transfer_id = 0xDEADBEEFCAFEF00DULL;
  body.index = 3;
  body.total = 8;
  body.kind = frame::PayloadKind::kMedia;
  body.data = {1, 2, 3, 4};

  const auto encoded = frame::encode_chunk_body(body);
  EXPECT_EQ(encoded.size(), frame::kChunkBodyHeaderSize + 4);

  const auto decoded = frame::decode_chunk_body(encoded);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->transfer_id, body.transfer_id);
  EXPECT_EQ(decoded->index, 3U);
  EXPECT_EQ(decoded->total, 8U);
  EXPECT_EQ(decoded->kind, frame::PayloadKind::kMedia);
  EXPECT_EQ(decoded->data, body.data);
}

TEST(FrameCodecTests, ChunkBodyRejectsShortOrUnknownKind) {
  EXPECT_FALSE(frame::decode_chunk_body(std::vector<std::uint8_t>(frame::kChunkBodyHeaderSize - 1, 0))
                   .has_value());

  frame::ChunkBody body{};
  body.total = 1;
  auto encoded = frame::encode_chunk_body(body);
  encoded[16] = 0x09;
  EXPECT_FALSE(frame::decode_chunk_body(encoded).has_value());
}

TEST(FrameCodecTests, ChunkAckCarriesCumulativeAck) {
  const frame::ChunkAckBody ack{.transfer_id = 77, .index = 5, .next_recv_seq = 1234};
  const auto encoded = frame::encode_chunk_ack_body(ack);
  ASSERT_EQ(encoded.size(), frame::kChunkAckBodySize);

  const auto decoded = frame::decode_chunk_ack_body(encoded);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->transfer_id, 77U);
  EXPECT_EQ(decoded->index, 5U);
  EXPECT_EQ(decoded->next_recv_seq, 1234U);

  EXPECT_FALSE(frame::decode_chunk_ack_body(std::vector<std::uint8_t>(12, 0)).has_value());
}

TEST(FrameCodecTests, HeartbeatBodyRequiresExactSize) {
  const frame::HeartbeatBody body{.next_recv_seq = 9, .timestamp_ms = 1700000000000ULL};
  auto encoded = frame::encode_heartbeat_body(body);
  const auto decoded = frame::decode_heartbeat_body(encoded);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->next_recv_seq, 9U);
  EXPECT_EQ(decoded->timestamp_ms, 1700000000000ULL);

  encoded.push_back(0);
  EXPECT_FALSE(frame::decode_heartbeat_body(encoded).has_value());
}

}  // namespace ghostlink::tests
