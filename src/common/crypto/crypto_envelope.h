#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "common/crypto/crypto_engine.h"
#include "common/errors/error.h"

namespace ghostlink::crypto {

inline constexpr std::size_t kNonceSaltLen = 4;

// Bytes a sealed payload adds on top of its plaintext: nonce(12) + tag(16).
inline constexpr std::size_t kEnvelopeOverhead = kNonceLen + kAeadTagLen;

/**
 * Authenticated encryption of frame payloads with ChaCha20-Poly1305.
 *
 * Sealed layout: nonce(12) || ciphertext || tag(16). The nonce is a random
 * per-envelope salt followed by the frame sequence, so it never repeats for a
 * given traffic key. Frame type and sequence are bound as associated data,
 * which stops a valid ciphertext from being replayed under another header.
 *
 * The envelope does not know about session state; the session decides which
 * frames are sealed.
 */
class CryptoEnvelope {
 public:
  explicit CryptoEnvelope(const DirectionKeys& keys);

  /// SECURITY: Destructor clears all key material
  ~CryptoEnvelope();

  // Disable copy (contains sensitive data)
  CryptoEnvelope(const CryptoEnvelope&) = delete;
  CryptoEnvelope& operator=(const CryptoEnvelope&) = delete;

  CryptoEnvelope(CryptoEnvelope&&) = default;
  CryptoEnvelope& operator=(CryptoEnvelope&&) = default;

  std::vector<std::uint8_t> seal(std::uint8_t frame_type, std::uint64_t sequence,
                                 std::span<const std::uint8_t> plaintext) const;

  // Returns nullopt and sets error to kMalformed (too short, or the nonce does
  // not carry the frame sequence) or kAuthFailure (tag check failed).
  std::optional<std::vector<std::uint8_t>> open(std::uint8_t frame_type, std::uint64_t sequence,
                                                std::span<const std::uint8_t> sealed,
                                                CryptoError& error) const;

  // Largest plaintext that still fits into a frame payload of max_payload bytes.
  static constexpr std::size_t max_plaintext(std::size_t max_payload) {
    return max_payload > kEnvelopeOverhead ? max_payload - kEnvelopeOverhead : 0;
  }

 private:
  DirectionKeys keys_;
  std::array<std::uint8_t, kNonceSaltLen> salt_{};
};

}  // namespace ghostlink::crypto
