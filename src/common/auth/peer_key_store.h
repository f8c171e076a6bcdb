#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "common/crypto/crypto_engine.h"

namespace ghostlink::auth {

/// Maximum peer id length (a Bluetooth address or host:port fits easily).
inline constexpr std::size_t kMaxPeerIdLength = 128;

/// Peer ids must be non-empty, at most kMaxPeerIdLength chars, and contain
/// only alphanumerics and the separators `-_.:[]`.
bool is_valid_peer_id(const std::string& peer_id);

/// PeerKeyStore remembers the session key agreed with each peer.
///
/// Keys survive restarts through a JSON file:
/// ```json
/// { "peers": { "AA:BB:CC:DD:EE:FF": "<64 hex chars>" } }
/// ```
/// Saving writes a temporary file with mode 0600 and renames it over the
/// target, so a crash never leaves a half-written store.
///
/// Key features:
/// - Thread-safe access via shared_mutex (multiple readers, single writer)
/// - Keys are cleared with sodium_memzero when replaced or removed
/// - Every mutation is persisted immediately when a path is configured
///
/// Usage:
/// ```cpp
/// PeerKeyStore store("/var/lib/ghostlink/peers.json");
/// std::error_code ec;
/// store.load(ec);
/// if (auto key = store.get("AA:BB:CC:DD:EE:FF")) {
///   // resume with *key
/// }
/// ```
class PeerKeyStore {
 public:
  /// In-memory store; nothing is persisted.
  PeerKeyStore() = default;
  explicit PeerKeyStore(std::filesystem::path path);
  ~PeerKeyStore();

  // Non-copyable (contains sensitive data)
  PeerKeyStore(const PeerKeyStore&) = delete;
  PeerKeyStore& operator=(const PeerKeyStore&) = delete;

  /// Read the file. A missing file is an empty store, not an error.
  /// @return false with ec set if the file exists but cannot be read or parsed.
  bool load(std::error_code& ec);

  /// Write the current contents to the file (no-op without a path).
  bool save(std::error_code& ec) const;

  /// Get the key pinned for a peer.
  std::optional<crypto::SessionKey> get(const std::string& peer_id) const;

  /// Pin a key for a peer, replacing any previous one, and persist.
  /// @return false if peer_id is invalid or persisting failed (ec set).
  bool put(const std::string& peer_id, const crypto::SessionKey& key, std::error_code& ec);

  /// Forget the key for a peer and persist.
  /// @return true if a key was removed.
  bool forget(const std::string& peer_id, std::error_code& ec);

  bool contains(const std::string& peer_id) const;
  std::size_t size() const;
  std::vector<std::string> peer_ids() const;

  const std::filesystem::path& path() const { return path_; }

 private:
  bool save_locked(std::error_code& ec) const;
  void clear_locked();

  std::filesystem::path path_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, crypto::SessionKey> keys_;
};

}  // namespace ghostlink::auth
