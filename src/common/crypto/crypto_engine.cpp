#include "common/crypto/crypto_engine.h"

#include <sodium.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace {
void ensure_sodium_ready() {
  static const bool ready = [] { return sodium_init() >= 0; }();
  if (!ready) {
    throw std::runtime_error("libsodium initialization failed");
  }
}

std::array<std::uint8_t, ghostlink::crypto::kHmacSha256Len> hmac_sha256_array(
    std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
  std::array<std::uint8_t, ghostlink::crypto::kHmacSha256Len> out{};
  crypto_auth_hmacsha256_state state;
  crypto_auth_hmacsha256_init(&state, key.data(), key.size());
  crypto_auth_hmacsha256_update(&state, data.data(), data.size());
  crypto_auth_hmacsha256_final(&state, out.data());
  // SECURITY: Clear HMAC state containing key material
  sodium_memzero(&state, sizeof(state));
  return out;
}

constexpr std::array<std::uint8_t, 14> kSessionKeyLabel{'g', 'h', 'o', 's', 't', 'l', 'i',
                                                        'n', 'k', '-', 'k', 'e', 'y', '1'};
constexpr std::array<std::uint8_t, 14> kHostToClientLabel{'g', 'l', '-', 'h', 'o', 's', 't',
                                                          '-', 't', 'o', '-', 'c', 'l', 'i'};
constexpr std::array<std::uint8_t, 14> kClientToHostLabel{'g', 'l', '-', 'c', 'l', 'i', '-',
                                                          't', 'o', '-', 'h', 'o', 's', 't'};
}  // namespace

namespace ghostlink::crypto {

KeyPair generate_x25519_keypair() {
  ensure_sodium_ready();
  KeyPair kp{};
  randombytes_buf(kp.secret_key.data(), kp.secret_key.size());
  crypto_scalarmult_curve25519_base(kp.public_key.data(), kp.secret_key.data());
  return kp;
}

std::optional<std::array<std::uint8_t, kSharedSecretSize>> compute_shared_secret(
    std::span<const std::uint8_t, kX25519SecretKeySize> secret_key,
    std::span<const std::uint8_t, kX25519PublicKeySize> peer_public) {
  ensure_sodium_ready();
  std::array<std::uint8_t, kSharedSecretSize> shared{};
  if (crypto_scalarmult_curve25519(shared.data(), secret_key.data(), peer_public.data()) != 0) {
    return std::nullopt;
  }
  return shared;
}

Sha256Digest sha256(std::span<const std::uint8_t> data) {
  ensure_sodium_ready();
  Sha256Digest out{};
  crypto_hash_sha256(out.data(), data.data(), data.size());
  return out;
}

Sha256Digest sha256(std::span<const std::uint8_t> first, std::span<const std::uint8_t> second) {
  ensure_sodium_ready();
  Sha256Digest out{};
  crypto_hash_sha256_state state;
  crypto_hash_sha256_init(&state);
  crypto_hash_sha256_update(&state, first.data(), first.size());
  crypto_hash_sha256_update(&state, second.data(), second.size());
  crypto_hash_sha256_final(&state, out.data());
  return out;
}

std::vector<std::uint8_t> hmac_sha256(std::span<const std::uint8_t> key,
                                      std::span<const std::uint8_t> data) {
  ensure_sodium_ready();
  const auto out = hmac_sha256_array(key, data);
  return std::vector<std::uint8_t>(out.begin(), out.end());
}

std::array<std::uint8_t, kHmacSha256Len> hkdf_extract(std::span<const std::uint8_t> salt,
                                                      std::span<const std::uint8_t> ikm) {
  ensure_sodium_ready();
  if (salt.empty()) {
    std::array<std::uint8_t, kHmacSha256Len> zero_salt{};
    return hmac_sha256_array(zero_salt, ikm);
  }
  return hmac_sha256_array(salt, ikm);
}

std::vector<std::uint8_t> hkdf_expand(std::span<const std::uint8_t, kHmacSha256Len> prk,
                                      std::span<const std::uint8_t> info, std::size_t length) {
  ensure_sodium_ready();
  if (length > kHmacSha256Len * 255) {
    throw std::invalid_argument("hkdf_expand length too large");
  }
  std::vector<std::uint8_t> okm(length);
  std::array<std::uint8_t, kHmacSha256Len> previous{};
  bool have_previous = false;
  std::size_t generated = 0;
  std::uint8_t counter = 1;
  while (generated < length) {
    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state, prk.data(), prk.size());
    if (have_previous) {
      crypto_auth_hmacsha256_update(&state, previous.data(), previous.size());
    }
    if (!info.empty()) {
      crypto_auth_hmacsha256_update(&state, info.data(), info.size());
    }
    crypto_auth_hmacsha256_update(&state, &counter, 1);
    crypto_auth_hmacsha256_final(&state, previous.data());
    // SECURITY: Clear HMAC state containing key material
    sodium_memzero(&state, sizeof(state));
    have_previous = true;

    const std::size_t to_copy = std::min<std::size_t>(previous.size(), length - generated);
    std::copy_n(previous.begin(), to_copy, okm.begin() + static_cast<std::ptrdiff_t>(generated));
    generated += to_copy;
    ++counter;
  }

  // SECURITY: Clear last output block
  sodium_memzero(previous.data(), previous.size());
  return okm;
}

SessionKey derive_session_key(std::span<const std::uint8_t, kSharedSecretSize> shared_secret,
                              std::span<const std::uint8_t> salt,
                              std::span<const std::uint8_t> info) {
  auto prk = hkdf_extract(salt, shared_secret);
  std::vector<std::uint8_t> full_info(kSessionKeyLabel.begin(), kSessionKeyLabel.end());
  full_info.insert(full_info.end(), info.begin(), info.end());
  auto material = hkdf_expand(prk, full_info, kSessionKeyLen);

  // SECURITY: Clear PRK immediately after use
  sodium_memzero(prk.data(), prk.size());

  SessionKey key{};
  std::copy_n(material.begin(), key.size(), key.begin());
  sodium_memzero(material.data(), material.size());
  return key;
}

DirectionKeys derive_direction_keys(std::span<const std::uint8_t, kSessionKeyLen> session_key,
                                    std::span<const std::uint8_t> context, bool is_host) {
  auto prk = hkdf_extract(context, session_key);
  auto host_to_client = hkdf_expand(prk, kHostToClientLabel, kAeadKeyLen);
  auto client_to_host = hkdf_expand(prk, kClientToHostLabel, kAeadKeyLen);
  sodium_memzero(prk.data(), prk.size());

  DirectionKeys keys{};
  const auto& send = is_host ? host_to_client : client_to_host;
  const auto& recv = is_host ? client_to_host : host_to_client;
  std::copy_n(send.begin(), kAeadKeyLen, keys.send_key.begin());
  std::copy_n(recv.begin(), kAeadKeyLen, keys.recv_key.begin());

  // SECURITY: Clear expanded material
  sodium_memzero(host_to_client.data(), host_to_client.size());
  sodium_memzero(client_to_host.data(), client_to_host.size());
  return keys;
}

std::array<std::uint8_t, kNonceLen> make_nonce(std::span<const std::uint8_t, 4> salt,
                                               std::uint64_t counter) {
  std::array<std::uint8_t, kNonceLen> nonce{};
  std::copy(salt.begin(), salt.end(), nonce.begin());
  for (std::size_t i = 0; i < 8; ++i) {
    nonce[kNonceLen - 1 - i] = static_cast<std::uint8_t>((counter >> (8 * i)) & 0xFF);
  }
  return nonce;
}

std::vector<std::uint8_t> aead_encrypt(std::span<const std::uint8_t, kAeadKeyLen> key,
                                       std::span<const std::uint8_t, kNonceLen> nonce,
                                       std::span<const std::uint8_t> aad,
                                       std::span<const std::uint8_t> plaintext) {
  ensure_sodium_ready();
  std::vector<std::uint8_t> ciphertext(plaintext.size() + crypto_aead_chacha20poly1305_ietf_ABYTES);
  unsigned long long out_len = 0;
  const auto rc = crypto_aead_chacha20poly1305_ietf_encrypt(
      ciphertext.data(), &out_len, plaintext.data(), plaintext.size(), aad.data(), aad.size(),
      nullptr, nonce.data(), key.data());
  if (rc != 0) {
    throw std::runtime_error("encryption failed");
  }
  ciphertext.resize(out_len);
  return ciphertext;
}

std::optional<std::vector<std::uint8_t>> aead_decrypt(
    std::span<const std::uint8_t, kAeadKeyLen> key, std::span<const std::uint8_t, kNonceLen> nonce,
    std::span<const std::uint8_t> aad, std::span<const std::uint8_t> ciphertext) {
  ensure_sodium_ready();
  if (ciphertext.size() < crypto_aead_chacha20poly1305_ietf_ABYTES) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> plaintext(ciphertext.size() - crypto_aead_chacha20poly1305_ietf_ABYTES);
  unsigned long long out_len = 0;
  const auto rc = crypto_aead_chacha20poly1305_ietf_decrypt(
      plaintext.data(), &out_len, nullptr, ciphertext.data(), ciphertext.size(), aad.data(),
      aad.size(), nonce.data(), key.data());
  if (rc != 0) {
    return std::nullopt;
  }
  plaintext.resize(out_len);
  return plaintext;
}

bool constant_time_equal(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) {
  ensure_sodium_ready();
  if (a.size() != b.size()) {
    return false;
  }
  if (a.empty()) {
    return true;
  }
  return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string key_fingerprint(std::span<const std::uint8_t> key) {
  const auto digest = sha256(key);
  return to_hex(std::span<const std::uint8_t>(digest.data(), 4));
}

std::string to_hex(std::span<const std::uint8_t> data) {
  std::string out(data.size() * 2 + 1, '\0');
  sodium_bin2hex(out.data(), out.size(), data.data(), data.size());
  out.pop_back();
  return out;
}

std::optional<std::vector<std::uint8_t>> from_hex(const std::string& hex) {
  ensure_sodium_ready();
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> out(hex.size() / 2);
  std::size_t decoded = 0;
  const char* end = nullptr;
  if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &decoded, &end) != 0 ||
      decoded != out.size() || end != hex.data() + hex.size()) {
    return std::nullopt;
  }
  return out;
}

}  // namespace ghostlink::crypto
