#include "common/handshake/handshake_processor.h"

#include <sodium.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "common/crypto/random.h"
#include "common/logging/logger.h"

namespace {

constexpr std::uint8_t kFlagHasKey = 0x01;
constexpr std::uint8_t kFlagResume = 0x02;

constexpr std::array<std::uint8_t, 9> kKeyIdLabel{'g', 'l', '-', 'k', 'e', 'y', '-', 'i', 'd'};
constexpr std::array<std::uint8_t, 8> kHelloLabel{'g', 'l', '-', 'h', 'e', 'l', 'l', 'o'};
constexpr std::array<std::uint8_t, 6> kAckLabel{'g', 'l', '-', 'a', 'c', 'k'};

// HELLO field offsets.
constexpr std::size_t kHelloFlagsOffset = 1;
constexpr std::size_t kHelloSessionOffset = 2;
constexpr std::size_t kHelloPubOffset = 10;
constexpr std::size_t kHelloNonceOffset = 42;
constexpr std::size_t kHelloKeyIdOffset = 58;
constexpr std::size_t kHelloRecvSeqOffset = 66;
constexpr std::size_t kHelloProofOffset = 74;

// HELLO_ACK field offsets.
constexpr std::size_t kAckStatusOffset = 1;
constexpr std::size_t kAckModeOffset = 2;
constexpr std::size_t kAckSessionOffset = 3;
constexpr std::size_t kAckPubOffset = 11;
constexpr std::size_t kAckNonceOffset = 43;
constexpr std::size_t kAckRecvSeqOffset = 59;
constexpr std::size_t kAckConfirmOffset = 67;

void write_u64(std::vector<std::uint8_t>& out, std::uint64_t value) {
  for (int i = 7; i >= 0; --i) {
    out.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
  }
}

std::uint64_t read_u64(std::span<const std::uint8_t> data, std::size_t offset) {
  std::uint64_t value = 0;
  for (int i = 0; i < 8; ++i) {
    value = (value << 8) | data[offset + static_cast<std::size_t>(i)];
  }
  return value;
}

template <std::size_t N>
std::array<std::uint8_t, N> read_array(std::span<const std::uint8_t> data, std::size_t offset) {
  std::array<std::uint8_t, N> out{};
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), N, out.begin());
  return out;
}

std::vector<std::uint8_t> labeled(std::span<const std::uint8_t> label,
                                  std::span<const std::uint8_t> first,
                                  std::span<const std::uint8_t> second = {}) {
  std::vector<std::uint8_t> out;
  out.reserve(label.size() + first.size() + second.size());
  out.insert(out.end(), label.begin(), label.end());
  out.insert(out.end(), first.begin(), first.end());
  out.insert(out.end(), second.begin(), second.end());
  return out;
}

std::vector<std::uint8_t> traffic_context(std::uint64_t session_id,
                                          std::span<const std::uint8_t> host_nonce,
                                          std::span<const std::uint8_t> client_nonce) {
  std::vector<std::uint8_t> context;
  context.reserve(8 + host_nonce.size() + client_nonce.size());
  write_u64(context, session_id);
  context.insert(context.end(), host_nonce.begin(), host_nonce.end());
  context.insert(context.end(), client_nonce.begin(), client_nonce.end());
  return context;
}

std::optional<ghostlink::crypto::SessionKey> derive_fresh_key(
    std::span<const std::uint8_t, 32> own_secret, std::span<const std::uint8_t, 32> host_pub,
    std::span<const std::uint8_t, 32> client_pub, std::span<const std::uint8_t, 32> peer_pub,
    std::span<const std::uint8_t> pairing_secret) {
  auto shared = ghostlink::crypto::compute_shared_secret(own_secret, peer_pub);
  if (!shared) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> info(host_pub.begin(), host_pub.end());
  info.insert(info.end(), client_pub.begin(), client_pub.end());
  auto key = ghostlink::crypto::derive_session_key(*shared, pairing_secret, info);

  // SECURITY: Clear shared secret immediately after key derivation
  sodium_memzero(shared->data(), shared->size());
  return key;
}

std::vector<std::uint8_t> build_ack(ghostlink::handshake::AckStatus status,
                                    ghostlink::handshake::HelloMode mode, std::uint64_t session_id,
                                    std::span<const std::uint8_t, 32> client_pub,
                                    std::span<const std::uint8_t> client_nonce,
                                    std::uint64_t next_recv_seq) {
  std::vector<std::uint8_t> ack;
  ack.reserve(ghostlink::handshake::kHelloAckSize);
  ack.push_back(ghostlink::handshake::kHandshakeVersion);
  ack.push_back(static_cast<std::uint8_t>(status));
  ack.push_back(static_cast<std::uint8_t>(mode));
  write_u64(ack, session_id);
  ack.insert(ack.end(), client_pub.begin(), client_pub.end());
  ack.insert(ack.end(), client_nonce.begin(), client_nonce.end());
  write_u64(ack, next_recv_seq);
  return ack;
}

std::vector<std::uint8_t> build_reject(ghostlink::handshake::AckStatus status,
                                       std::uint64_t session_id) {
  const std::array<std::uint8_t, 32> zero_pub{};
  const std::array<std::uint8_t, ghostlink::handshake::kHandshakeNonceSize> zero_nonce{};
  auto ack = build_ack(status, ghostlink::handshake::HelloMode::kFresh, session_id, zero_pub,
                       zero_nonce, 0);
  ack.resize(ghostlink::handshake::kHelloAckSize, 0);
  return ack;
}

}  // namespace

namespace ghostlink::handshake {

const char* to_string(HelloMode mode) noexcept {
  switch (mode) {
    case HelloMode::kFresh:
      return "fresh";
    case HelloMode::kResume:
      return "resume";
    case HelloMode::kNewSession:
      return "new-session";
  }
  return "unknown";
}

std::array<std::uint8_t, kKeyIdSize> compute_key_id(std::span<const std::uint8_t> key) {
  const auto mac = crypto::hmac_sha256(key, kKeyIdLabel);
  std::array<std::uint8_t, kKeyIdSize> id{};
  std::copy_n(mac.begin(), id.size(), id.begin());
  return id;
}

HandshakeInitiator::HandshakeInitiator(HandshakeParams params) : params_(std::move(params)) {
  if (params_.resume && !params_.pinned_key) {
    // Resumption is only meaningful with the key the session was built on.
    params_.resume.reset();
  }
}

HandshakeInitiator::~HandshakeInitiator() {
  // SECURITY: Clear all sensitive key material on destruction
  if (params_.pinned_key) {
    sodium_memzero(params_.pinned_key->data(), params_.pinned_key->size());
  }
  if (!params_.pairing_secret.empty()) {
    sodium_memzero(params_.pairing_secret.data(), params_.pairing_secret.size());
  }
  sodium_memzero(ephemeral_.secret_key.data(), ephemeral_.secret_key.size());
}

std::vector<std::uint8_t> HandshakeInitiator::create_hello() {
  ephemeral_ = crypto::generate_x25519_keypair();
  crypto::random_fill(nonce_);
  session_id_ = params_.resume ? params_.resume->session_id : crypto::random_uint64();

  std::uint8_t flags = 0;
  std::array<std::uint8_t, kKeyIdSize> key_id{};
  if (params_.pinned_key) {
    flags |= kFlagHasKey;
    key_id = compute_key_id(*params_.pinned_key);
  }
  if (params_.resume) {
    flags |= kFlagResume;
  }

  hello_.clear();
  hello_.reserve(kHelloSize);
  hello_.push_back(kHandshakeVersion);
  hello_.push_back(flags);
  write_u64(hello_, session_id_);
  hello_.insert(hello_.end(), ephemeral_.public_key.begin(), ephemeral_.public_key.end());
  hello_.insert(hello_.end(), nonce_.begin(), nonce_.end());
  hello_.insert(hello_.end(), key_id.begin(), key_id.end());
  write_u64(hello_, params_.resume ? params_.resume->next_recv_seq : 0);

  if (params_.pinned_key) {
    const auto proof = crypto::hmac_sha256(*params_.pinned_key, labeled(kHelloLabel, hello_));
    hello_.insert(hello_.end(), proof.begin(), proof.end());
  } else {
    hello_.resize(kHelloSize, 0);
  }

  LOG_DEBUG("Created HELLO: session_id={}, has_key={}, resume={}", session_id_,
            params_.pinned_key.has_value(), params_.resume.has_value());
  return hello_;
}

std::optional<HandshakeOutcome> HandshakeInitiator::consume_hello_ack(
    std::span<const std::uint8_t> ack, HandshakeError& error) {
  if (hello_.empty() || ack.empty()) {
    error = HandshakeError::kMalformed;
    return std::nullopt;
  }
  if (ack[0] != kHandshakeVersion) {
    error = HandshakeError::kVersionMismatch;
    return std::nullopt;
  }
  if (ack.size() != kHelloAckSize) {
    error = HandshakeError::kMalformed;
    return std::nullopt;
  }

  switch (static_cast<AckStatus>(ack[kAckStatusOffset])) {
    case AckStatus::kAccepted:
      break;
    case AckStatus::kKeyMismatch:
      error = HandshakeError::kKeyMismatch;
      return std::nullopt;
    case AckStatus::kVersionMismatch:
      error = HandshakeError::kVersionMismatch;
      return std::nullopt;
    case AckStatus::kBadProof:
      error = HandshakeError::kConfirmationFailed;
      return std::nullopt;
    default:
      error = HandshakeError::kMalformed;
      return std::nullopt;
  }

  if (read_u64(ack, kAckSessionOffset) != session_id_) {
    error = HandshakeError::kMalformed;
    return std::nullopt;
  }

  const auto mode = static_cast<HelloMode>(ack[kAckModeOffset]);
  const auto client_pub = read_array<32>(ack, kAckPubOffset);
  const auto client_nonce = ack.subspan(kAckNonceOffset, kHandshakeNonceSize);

  HandshakeOutcome outcome{};
  outcome.mode = mode;
  outcome.session_id = session_id_;
  switch (mode) {
    case HelloMode::kResume:
      if (!params_.resume) {
        error = HandshakeError::kMalformed;
        return std::nullopt;
      }
      outcome.key = *params_.pinned_key;
      outcome.peer_next_recv_seq = read_u64(ack, kAckRecvSeqOffset);
      break;
    case HelloMode::kNewSession:
      if (!params_.pinned_key) {
        error = HandshakeError::kMalformed;
        return std::nullopt;
      }
      outcome.key = *params_.pinned_key;
      break;
    case HelloMode::kFresh: {
      auto key = derive_fresh_key(ephemeral_.secret_key, ephemeral_.public_key, client_pub,
                                  client_pub, params_.pairing_secret);
      if (!key) {
        error = HandshakeError::kMalformed;
        return std::nullopt;
      }
      outcome.key = *key;
      outcome.key_changed = true;
      sodium_memzero(key->data(), key->size());
      break;
    }
    default:
      error = HandshakeError::kMalformed;
      return std::nullopt;
  }

  const auto expected = crypto::hmac_sha256(
      outcome.key, labeled(kAckLabel, hello_, ack.first(kAckConfirmOffset)));
  if (!crypto::constant_time_equal(expected, ack.subspan(kAckConfirmOffset))) {
    LOG_WARN("HELLO_ACK confirmation failed (mode={})", to_string(mode));
    sodium_memzero(outcome.key.data(), outcome.key.size());
    error = HandshakeError::kConfirmationFailed;
    return std::nullopt;
  }

  if (mode != HelloMode::kResume) {
    outcome.traffic = crypto::derive_direction_keys(
        outcome.key, traffic_context(session_id_, nonce_, client_nonce), true);
  }
  return outcome;
}

HandshakeResponder::HandshakeResponder(HandshakeParams params) : params_(std::move(params)) {}

HandshakeResponder::~HandshakeResponder() {
  // SECURITY: Clear all sensitive key material on destruction
  if (params_.pinned_key) {
    sodium_memzero(params_.pinned_key->data(), params_.pinned_key->size());
  }
  if (!params_.pairing_secret.empty()) {
    sodium_memzero(params_.pairing_secret.data(), params_.pairing_secret.size());
  }
}

HandshakeResponder::Result HandshakeResponder::handle_hello(std::span<const std::uint8_t> hello) {
  Result result{};
  if (hello.empty()) {
    result.error = HandshakeError::kMalformed;
    return result;
  }
  if (hello[0] != kHandshakeVersion) {
    LOG_WARN("HELLO with unsupported version {}", hello[0]);
    result.response = build_reject(AckStatus::kVersionMismatch, 0);
    result.error = HandshakeError::kVersionMismatch;
    return result;
  }
  if (hello.size() != kHelloSize) {
    result.error = HandshakeError::kMalformed;
    return result;
  }

  const auto flags = hello[kHelloFlagsOffset];
  const auto session_id = read_u64(hello, kHelloSessionOffset);
  const auto host_pub = read_array<32>(hello, kHelloPubOffset);
  const auto host_nonce = hello.subspan(kHelloNonceOffset, kHandshakeNonceSize);
  const auto host_next_recv = read_u64(hello, kHelloRecvSeqOffset);

  HelloMode mode = HelloMode::kFresh;
  if ((flags & kFlagHasKey) != 0 && params_.pinned_key) {
    const auto own_id = compute_key_id(*params_.pinned_key);
    if (!crypto::constant_time_equal(own_id, hello.subspan(kHelloKeyIdOffset, kKeyIdSize))) {
      LOG_WARN("HELLO key id does not match the pinned key");
      result.response = build_reject(AckStatus::kKeyMismatch, session_id);
      result.error = HandshakeError::kKeyMismatch;
      return result;
    }
    const auto expected =
        crypto::hmac_sha256(*params_.pinned_key, labeled(kHelloLabel, hello.first(kHelloProofOffset)));
    if (!crypto::constant_time_equal(expected, hello.subspan(kHelloProofOffset))) {
      LOG_WARN("HELLO key proof failed");
      result.response = build_reject(AckStatus::kBadProof, session_id);
      result.error = HandshakeError::kConfirmationFailed;
      return result;
    }
    const bool can_resume = (flags & kFlagResume) != 0 && params_.resume &&
                            params_.resume->session_id == session_id &&
                            params_.resume->covers(host_next_recv);
    mode = can_resume ? HelloMode::kResume : HelloMode::kNewSession;
  } else if (params_.pinned_key) {
    LOG_INFO("Peer has no pinned key; negotiating a fresh one");
  }

  auto ephemeral = crypto::generate_x25519_keypair();
  std::array<std::uint8_t, kHandshakeNonceSize> client_nonce{};
  crypto::random_fill(client_nonce);

  HandshakeOutcome outcome{};
  outcome.mode = mode;
  outcome.session_id = session_id;
  if (mode == HelloMode::kFresh) {
    auto key = derive_fresh_key(ephemeral.secret_key, host_pub, ephemeral.public_key, host_pub,
                                params_.pairing_secret);
    if (!key) {
      sodium_memzero(ephemeral.secret_key.data(), ephemeral.secret_key.size());
      result.error = HandshakeError::kMalformed;
      return result;
    }
    outcome.key = *key;
    outcome.key_changed = true;
    sodium_memzero(key->data(), key->size());
  } else {
    outcome.key = *params_.pinned_key;
    if (mode == HelloMode::kResume) {
      outcome.peer_next_recv_seq = host_next_recv;
    }
  }

  // SECURITY: The ephemeral secret is no longer needed once the key is known
  sodium_memzero(ephemeral.secret_key.data(), ephemeral.secret_key.size());

  const std::uint64_t own_next_recv =
      (mode == HelloMode::kResume) ? params_.resume->next_recv_seq : 0;
  auto ack = build_ack(AckStatus::kAccepted, mode, session_id, ephemeral.public_key, client_nonce,
                       own_next_recv);
  const auto confirm = crypto::hmac_sha256(outcome.key, labeled(kAckLabel, hello, ack));
  ack.insert(ack.end(), confirm.begin(), confirm.end());

  if (mode != HelloMode::kResume) {
    outcome.traffic = crypto::derive_direction_keys(
        outcome.key, traffic_context(session_id, host_nonce, client_nonce), false);
  }

  LOG_DEBUG("Answered HELLO: session_id={}, mode={}", session_id, to_string(mode));
  result.response = std::move(ack);
  result.outcome = outcome;
  sodium_memzero(outcome.key.data(), outcome.key.size());
  return result;
}

}  // namespace ghostlink::handshake
