#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

#include "common/session/reconnect_backoff.h"
#include "transport/session/liveness_monitor.h"
#include "transport/session/retransmit_buffer.h"
#include "transport/transfer/transfer_manager.h"

namespace ghostlink::transport {

enum class Role : std::uint8_t { kHost, kClient };

const char* to_string(Role role) noexcept;

struct SessionConfig {
  Role role{Role::kHost};

  // Name under which the peer key is pinned. HOST falls back to the stream's
  // peer address when empty; CLIENT uses the address passed to connect().
  std::string peer_id;

  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds handshake_timeout{5000};

  LivenessConfig heartbeat{};
  session::BackoffConfig reconnect{};
  transfer::TransferConfig transfer{};
  RetransmitConfig retransmit{};

  // JSON file holding pinned keys; empty keeps keys in memory only.
  std::string key_store_path;
  // File whose contents are mixed into fresh key derivation.
  std::string pairing_secret_file;
  std::vector<std::uint8_t> pairing_secret;

  std::string log_level{"info"};
  std::string log_file;
  bool log_console{true};
};

// Apply an INI file on top of config. Sections: [session], [heartbeat],
// [reconnect], [transfer], [keys], [logging]. Unknown keys are ignored.
bool load_config_file(const std::string& path, SessionConfig& config, std::error_code& ec);

// Read the pairing secret file into config.pairing_secret (trailing whitespace trimmed).
bool load_pairing_secret(SessionConfig& config, std::error_code& ec);

bool validate_config(const SessionConfig& config, std::string& error);

}  // namespace ghostlink::transport
