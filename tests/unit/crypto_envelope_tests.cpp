#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "common/crypto/crypto_envelope.h"
#include "transport/frame/frame.h"

namespace ghostlink::tests {

class CryptoEnvelopeTest : public ::testing::Test {
 protected:
  void SetUp() override {
    crypto::SessionKey key{};
    key.fill(0x3C);
    const std::vector<std::uint8_t> context{'c', 't', 'x'};
    host_keys_ = crypto::derive_direction_keys(key, context, true);
    client_keys_ = crypto::derive_direction_keys(key, context, false);
  }

  static constexpr auto kText = static_cast<std::uint8_t>(frame::FrameType::kDataText);

  crypto::DirectionKeys host_keys_;
  crypto::DirectionKeys client_keys_;
};

TEST_F(CryptoEnvelopeTest, SealOpenAcrossDirections) {
  crypto::CryptoEnvelope host(host_keys_);
  crypto::CryptoEnvelope client(client_keys_);

  const std::vector<std::uint8_t> message{'h', 'e', 'l', 'l', 'o'};
  const auto sealed = host.seal(kText, 0, message);
  EXPECT_EQ(sealed.size(), message.size() + crypto::kEnvelopeOverhead);

  CryptoError error{};
  const auto opened = client.open(kText, 0, sealed, error);
  ASSERT_TRUE(opened.has_value());
  EXPECT_EQ(*opened, message);
}

TEST_F(CryptoEnvelopeTest, SenderCannotOpenOwnFrames) {
  crypto::CryptoEnvelope host(host_keys_);
  const auto sealed = host.seal(kText, 1, std::vector<std::uint8_t>{1, 2, 3});

  CryptoError error{};
  EXPECT_FALSE(host.open(kText, 1, sealed, error).has_value());
  EXPECT_EQ(error, CryptoError::kAuthFailure);
}

TEST_F(CryptoEnvelopeTest, NonceEmbedsSequence) {
  crypto::CryptoEnvelope host(host_keys_);
  crypto::CryptoEnvelope client(client_keys_);
  const auto sealed = host.seal(kText, 7, std::vector<std::uint8_t>{1});

  CryptoError error{};
  EXPECT_FALSE(client.open(kText, 8, sealed, error).has_value());
  EXPECT_EQ(error, CryptoError::kMalformed);
}

TEST_F(CryptoEnvelopeTest, FrameTypeIsAuthenticated) {
  crypto::CryptoEnvelope host(host_keys_);
  crypto::CryptoEnvelope client(client_keys_);
  const auto sealed = host.seal(kText, 3, std::vector<std::uint8_t>{1, 2});

  CryptoError error{};
  EXPECT_FALSE(client.open(static_cast<std::uint8_t>(frame::FrameType::kPing), 3, sealed, error)
                   .has_value());
  EXPECT_EQ(error, CryptoError::kAuthFailure);
}

TEST_F(CryptoEnvelopeTest, TamperedCiphertextFails) {
  crypto::CryptoEnvelope host(host_keys_);
  crypto::CryptoEnvelope client(client_keys_);
  auto sealed = host.seal(kText, 0, std::vector<std::uint8_t>(40, 0x61));
  sealed[crypto::kNonceLen + 4] ^= 0x10;

  CryptoError error{};
  EXPECT_FALSE(client.open(kText, 0, sealed, error).has_value());
  EXPECT_EQ(error, CryptoError::kAuthFailure);
}

TEST_F(CryptoEnvelopeTest, ShortInputIsMalformed) {
  crypto::CryptoEnvelope client(client_keys_);
  CryptoError error{};
  EXPECT_FALSE(client.open(kText, 0, std::vector<std::uint8_t>(crypto::kEnvelopeOverhead - 1, 0),
                           error)
                   .has_value());
  EXPECT_EQ(error, CryptoError::kMalformed);
}

TEST_F(CryptoEnvelopeTest, EmptyPlaintextSealsToOverheadOnly) {
  crypto::CryptoEnvelope host(host_keys_);
  crypto::CryptoEnvelope client(client_keys_);
  const auto sealed = host.seal(kText, 0, {});
  EXPECT_EQ(sealed.size(), crypto::kEnvelopeOverhead);

  CryptoError error{};
  const auto opened = client.open(kText, 0, sealed, error);
  ASSERT_TRUE(opened.has_value());
  EXPECT_TRUE(opened->empty());
}

TEST_F(CryptoEnvelopeTest, SameSequenceGivesDifferentCiphertextPerEnvelope) {
  crypto::CryptoEnvelope first(host_keys_);
  crypto::CryptoEnvelope second(host_keys_);
  const std::vector<std::uint8_t> message{9, 9, 9};
  EXPECT_NE(first.seal(kText, 0, message), second.seal(kText, 0, message));
}

TEST(CryptoEnvelopeTests, MaxPlaintextFitsFramePayload) {
  EXPECT_EQ(crypto::CryptoEnvelope::max_plaintext(frame::kMaxPayloadSize),
            frame::kMaxPayloadSize - 28);
  EXPECT_EQ(crypto::CryptoEnvelope::max_plaintext(10), 0U);
}

}  // namespace ghostlink::tests
