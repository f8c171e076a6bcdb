#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ghostlink::crypto {

inline constexpr std::size_t kX25519PublicKeySize = 32;
inline constexpr std::size_t kX25519SecretKeySize = 32;
inline constexpr std::size_t kSharedSecretSize = 32;
inline constexpr std::size_t kHmacSha256Len = 32;
inline constexpr std::size_t kSha256Len = 32;
inline constexpr std::size_t kSessionKeyLen = 32;
inline constexpr std::size_t kAeadKeyLen = 32;
inline constexpr std::size_t kNonceLen = 12;
inline constexpr std::size_t kAeadTagLen = 16;

using SessionKey = std::array<std::uint8_t, kSessionKeyLen>;
using Sha256Digest = std::array<std::uint8_t, kSha256Len>;

struct KeyPair {
  std::array<std::uint8_t, kX25519PublicKeySize> public_key{};
  std::array<std::uint8_t, kX25519SecretKeySize> secret_key{};
};

// Direction-separated AEAD keys derived from one session key.
// HOST seals with host_to_client and opens with client_to_host; CLIENT does the opposite.
struct DirectionKeys {
  std::array<std::uint8_t, kAeadKeyLen> send_key{};
  std::array<std::uint8_t, kAeadKeyLen> recv_key{};
};

KeyPair generate_x25519_keypair();

// Returns nullopt when the peer public key is a low-order point.
std::optional<std::array<std::uint8_t, kSharedSecretSize>> compute_shared_secret(
    std::span<const std::uint8_t, kX25519SecretKeySize> secret_key,
    std::span<const std::uint8_t, kX25519PublicKeySize> peer_public);

Sha256Digest sha256(std::span<const std::uint8_t> data);

// Incremental SHA-256 over several disjoint buffers.
Sha256Digest sha256(std::span<const std::uint8_t> first, std::span<const std::uint8_t> second);

std::vector<std::uint8_t> hmac_sha256(std::span<const std::uint8_t> key,
                                      std::span<const std::uint8_t> data);

std::array<std::uint8_t, kHmacSha256Len> hkdf_extract(std::span<const std::uint8_t> salt,
                                                      std::span<const std::uint8_t> ikm);
std::vector<std::uint8_t> hkdf_expand(std::span<const std::uint8_t, kHmacSha256Len> prk,
                                      std::span<const std::uint8_t> info, std::size_t length);

// Derive a 32-byte session key from an X25519 shared secret.
// salt is the optional pairing secret, info binds both ephemeral public keys.
SessionKey derive_session_key(std::span<const std::uint8_t, kSharedSecretSize> shared_secret,
                              std::span<const std::uint8_t> salt,
                              std::span<const std::uint8_t> info);

// Split a session key into per-direction traffic keys. context binds the keys
// to one logical session (session id and both handshake nonces); is_host selects
// which half is used to send.
DirectionKeys derive_direction_keys(std::span<const std::uint8_t, kSessionKeyLen> session_key,
                                    std::span<const std::uint8_t> context, bool is_host);

// Nonce layout: salt(4) || counter(8, big-endian).
std::array<std::uint8_t, kNonceLen> make_nonce(std::span<const std::uint8_t, 4> salt,
                                               std::uint64_t counter);

std::vector<std::uint8_t> aead_encrypt(std::span<const std::uint8_t, kAeadKeyLen> key,
                                       std::span<const std::uint8_t, kNonceLen> nonce,
                                       std::span<const std::uint8_t> aad,
                                       std::span<const std::uint8_t> plaintext);
std::optional<std::vector<std::uint8_t>> aead_decrypt(
    std::span<const std::uint8_t, kAeadKeyLen> key, std::span<const std::uint8_t, kNonceLen> nonce,
    std::span<const std::uint8_t> aad, std::span<const std::uint8_t> ciphertext);

inline constexpr std::size_t aead_ciphertext_size(std::size_t plaintext_len) noexcept {
  return plaintext_len + kAeadTagLen;
}

// Constant-time comparison. Buffers of different size compare unequal.
bool constant_time_equal(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b);

// Short hex prefix of SHA-256(key) for logs; never exposes key bytes.
std::string key_fingerprint(std::span<const std::uint8_t> key);

std::string to_hex(std::span<const std::uint8_t> data);
std::optional<std::vector<std::uint8_t>> from_hex(const std::string& hex);

}  // namespace ghostlink::crypto
