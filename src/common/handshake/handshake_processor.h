#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "common/crypto/crypto_engine.h"
#include "common/errors/error.h"

namespace ghostlink::handshake {

inline constexpr std::uint8_t kHandshakeVersion = 1;
inline constexpr std::size_t kHandshakeNonceSize = 16;
inline constexpr std::size_t kKeyIdSize = 8;

// version(1) flags(1) session_id(8) host_pub(32) host_nonce(16) key_id(8)
// next_recv_seq(8) proof(32)
inline constexpr std::size_t kHelloSize = 1 + 1 + 8 + 32 + kHandshakeNonceSize + kKeyIdSize + 8 + 32;

// version(1) status(1) mode(1) session_id(8) client_pub(32) client_nonce(16)
// next_recv_seq(8) confirm(32)
inline constexpr std::size_t kHelloAckSize = 1 + 1 + 1 + 8 + 32 + kHandshakeNonceSize + 8 + 32;

// How the two peers agreed to continue.
enum class HelloMode : std::uint8_t {
  // New key from X25519 agreement; counters restart at 0.
  kFresh = 1,
  // Same key and traffic keys; counters continue, unacknowledged frames are replayed.
  kResume = 2,
  // Same pinned key, new traffic keys; counters restart at 0.
  kNewSession = 3,
};

enum class AckStatus : std::uint8_t {
  kAccepted = 0,
  kKeyMismatch = 1,
  kVersionMismatch = 2,
  kBadProof = 3,
};

const char* to_string(HelloMode mode) noexcept;

// What one side remembers about the logical session it wants to continue.
struct ResumeState {
  std::uint64_t session_id{0};
  std::uint64_t next_send_seq{0};
  std::uint64_t next_recv_seq{0};
  // Lowest sequence still held in the retransmit buffer.
  std::uint64_t replay_floor{0};

  // True if every frame the peer is missing can still be replayed.
  bool covers(std::uint64_t peer_next_recv_seq) const {
    return peer_next_recv_seq >= replay_floor && peer_next_recv_seq <= next_send_seq;
  }
};

struct HandshakeParams {
  std::optional<crypto::SessionKey> pinned_key;
  std::optional<ResumeState> resume;
  // Optional shared secret mixed into fresh key derivation as HKDF salt.
  std::vector<std::uint8_t> pairing_secret;
};

struct HandshakeOutcome {
  HelloMode mode{HelloMode::kFresh};
  crypto::SessionKey key{};
  bool key_changed{false};
  std::uint64_t session_id{0};
  // Traffic keys for the new logical session. Not used for kResume, where the
  // existing envelope stays in place.
  crypto::DirectionKeys traffic{};
  // Next sequence the peer expects from us; replay starts here.
  std::uint64_t peer_next_recv_seq{0};
};

// Key id sent in HELLO so the CLIENT can tell whether both sides pinned the same key.
std::array<std::uint8_t, kKeyIdSize> compute_key_id(std::span<const std::uint8_t> key);

// HOST side. Builds HELLO and validates HELLO_ACK.
class HandshakeInitiator {
 public:
  explicit HandshakeInitiator(HandshakeParams params);

  /// SECURITY: Destructor clears all sensitive key material
  ~HandshakeInitiator();

  // Disable copy (contains sensitive data)
  HandshakeInitiator(const HandshakeInitiator&) = delete;
  HandshakeInitiator& operator=(const HandshakeInitiator&) = delete;

  HandshakeInitiator(HandshakeInitiator&&) = default;
  HandshakeInitiator& operator=(HandshakeInitiator&&) = default;

  std::vector<std::uint8_t> create_hello();
  std::optional<HandshakeOutcome> consume_hello_ack(std::span<const std::uint8_t> ack,
                                                    HandshakeError& error);

 private:
  HandshakeParams params_;
  crypto::KeyPair ephemeral_;
  std::array<std::uint8_t, kHandshakeNonceSize> nonce_{};
  std::uint64_t session_id_{0};
  std::vector<std::uint8_t> hello_;
};

// CLIENT side. Answers HELLO with HELLO_ACK.
class HandshakeResponder {
 public:
  struct Result {
    // HELLO_ACK to send back; also sent for rejections so the HOST learns why.
    std::vector<std::uint8_t> response;
    std::optional<HandshakeOutcome> outcome;
    HandshakeError error{};
  };

  explicit HandshakeResponder(HandshakeParams params);

  /// SECURITY: Destructor clears all sensitive key material
  ~HandshakeResponder();

  HandshakeResponder(const HandshakeResponder&) = delete;
  HandshakeResponder& operator=(const HandshakeResponder&) = delete;
  HandshakeResponder(HandshakeResponder&&) = default;
  HandshakeResponder& operator=(HandshakeResponder&&) = default;

  Result handle_hello(std::span<const std::uint8_t> hello);

 private:
  HandshakeParams params_;
};

}  // namespace ghostlink::handshake
