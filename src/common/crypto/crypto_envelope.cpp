#include "common/crypto/crypto_envelope.h"

#include <sodium.h>

#include <algorithm>

#include "common/crypto/random.h"

namespace {

std::array<std::uint8_t, 9> build_aad(std::uint8_t frame_type, std::uint64_t sequence) {
  std::array<std::uint8_t, 9> aad{};
  aad[0] = frame_type;
  for (std::size_t i = 0; i < 8; ++i) {
    aad[8 - i] = static_cast<std::uint8_t>((sequence >> (8 * i)) & 0xFF);
  }
  return aad;
}

std::uint64_t nonce_counter(std::span<const std::uint8_t> nonce) {
  std::uint64_t value = 0;
  for (std::size_t i = ghostlink::crypto::kNonceSaltLen; i < ghostlink::crypto::kNonceLen; ++i) {
    value = (value << 8) | nonce[i];
  }
  return value;
}

}  // namespace

namespace ghostlink::crypto {

CryptoEnvelope::CryptoEnvelope(const DirectionKeys& keys) : keys_(keys) {
  random_fill(salt_);
}

CryptoEnvelope::~CryptoEnvelope() {
  // SECURITY: Clear traffic keys on destruction
  sodium_memzero(keys_.send_key.data(), keys_.send_key.size());
  sodium_memzero(keys_.recv_key.data(), keys_.recv_key.size());
}

std::vector<std::uint8_t> CryptoEnvelope::seal(std::uint8_t frame_type, std::uint64_t sequence,
                                               std::span<const std::uint8_t> plaintext) const {
  const auto nonce = make_nonce(salt_, sequence);
  const auto aad = build_aad(frame_type, sequence);
  auto ciphertext = aead_encrypt(keys_.send_key, nonce, aad, plaintext);

  std::vector<std::uint8_t> sealed;
  sealed.reserve(nonce.size() + ciphertext.size());
  sealed.insert(sealed.end(), nonce.begin(), nonce.end());
  sealed.insert(sealed.end(), ciphertext.begin(), ciphertext.end());
  return sealed;
}

std::optional<std::vector<std::uint8_t>> CryptoEnvelope::open(
    std::uint8_t frame_type, std::uint64_t sequence, std::span<const std::uint8_t> sealed,
    CryptoError& error) const {
  if (sealed.size() < kEnvelopeOverhead) {
    error = CryptoError::kMalformed;
    return std::nullopt;
  }
  std::array<std::uint8_t, kNonceLen> nonce{};
  std::copy_n(sealed.begin(), nonce.size(), nonce.begin());
  if (nonce_counter(nonce) != sequence) {
    error = CryptoError::kMalformed;
    return std::nullopt;
  }

  const auto aad = build_aad(frame_type, sequence);
  auto plaintext = aead_decrypt(keys_.recv_key, nonce, aad, sealed.subspan(kNonceLen));
  if (!plaintext) {
    error = CryptoError::kAuthFailure;
    return std::nullopt;
  }
  return plaintext;
}

}  // namespace ghostlink::crypto
