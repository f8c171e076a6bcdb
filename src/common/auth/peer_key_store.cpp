#include "common/auth/peer_key_store.h"

#include <sodium.h>
#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <utility>

#include "common/logging/logger.h"

namespace ghostlink::auth {

bool is_valid_peer_id(const std::string& peer_id) {
  if (peer_id.empty() || peer_id.size() > kMaxPeerIdLength) {
    return false;
  }
  return std::all_of(peer_id.begin(), peer_id.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_' || c == '.' ||
           c == ':' || c == '[' || c == ']';
  });
}

PeerKeyStore::PeerKeyStore(std::filesystem::path path) : path_(std::move(path)) {}

PeerKeyStore::~PeerKeyStore() {
  // SECURITY: Clear all keys on destruction
  std::unique_lock lock(mutex_);
  clear_locked();
}

void PeerKeyStore::clear_locked() {
  for (auto& [id, key] : keys_) {
    sodium_memzero(key.data(), key.size());
  }
  keys_.clear();
}

bool PeerKeyStore::load(std::error_code& ec) {
  if (path_.empty()) {
    return true;
  }
  std::error_code exists_ec;
  if (!std::filesystem::exists(path_, exists_ec)) {
    LOG_DEBUG("Peer key store {} does not exist yet", path_.string());
    return true;
  }

  std::ifstream file(path_);
  if (!file) {
    ec = std::error_code(errno != 0 ? errno : EIO, std::generic_category());
    LOG_ERROR("Failed to open peer key store {}: {}", path_.string(), ec.message());
    return false;
  }

  nlohmann::json doc;
  try {
    file >> doc;
  } catch (const nlohmann::json::exception& e) {
    ec = std::make_error_code(std::errc::invalid_argument);
    LOG_ERROR("Peer key store {} is not valid JSON: {}", path_.string(), e.what());
    return false;
  }

  if (!doc.is_object() || !doc.contains("peers") || !doc["peers"].is_object()) {
    ec = std::make_error_code(std::errc::invalid_argument);
    LOG_ERROR("Peer key store {} has no \"peers\" object", path_.string());
    return false;
  }

  std::unordered_map<std::string, crypto::SessionKey> loaded;
  for (const auto& [peer_id, value] : doc["peers"].items()) {
    if (!is_valid_peer_id(peer_id) || !value.is_string()) {
      LOG_WARN("Skipping invalid peer key store entry '{}'", peer_id);
      continue;
    }
    auto bytes = crypto::from_hex(value.get<std::string>());
    if (!bytes || bytes->size() != crypto::kSessionKeyLen) {
      LOG_WARN("Skipping peer '{}': key is not {} hex bytes", peer_id, crypto::kSessionKeyLen);
      continue;
    }
    crypto::SessionKey key{};
    std::copy(bytes->begin(), bytes->end(), key.begin());
    sodium_memzero(bytes->data(), bytes->size());
    loaded.emplace(peer_id, key);
    sodium_memzero(key.data(), key.size());
  }

  std::unique_lock lock(mutex_);
  clear_locked();
  keys_ = std::move(loaded);
  LOG_INFO("Loaded {} pinned peer key(s) from {}", keys_.size(), path_.string());
  return true;
}

bool PeerKeyStore::save(std::error_code& ec) const {
  std::shared_lock lock(mutex_);
  return save_locked(ec);
}

bool PeerKeyStore::save_locked(std::error_code& ec) const {
  if (path_.empty()) {
    return true;
  }

  nlohmann::json doc;
  doc["peers"] = nlohmann::json::object();
  for (const auto& [peer_id, key] : keys_) {
    doc["peers"][peer_id] = crypto::to_hex(key);
  }

  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      LOG_ERROR("Failed to create directory for {}: {}", path_.string(), ec.message());
      return false;
    }
  }

  auto tmp = path_;
  tmp += ".tmp";
  {
    // Create with restrictive permissions before any key byte is written.
    const auto old_mask = ::umask(0077);
    std::ofstream out(tmp, std::ios::trunc);
    ::umask(old_mask);
    if (!out) {
      ec = std::error_code(errno != 0 ? errno : EIO, std::generic_category());
      LOG_ERROR("Failed to write {}: {}", tmp.string(), ec.message());
      return false;
    }
    out << doc.dump(2) << '\n';
    out.flush();
    if (!out) {
      ec = std::make_error_code(std::errc::io_error);
      LOG_ERROR("Failed to write {}", tmp.string());
      return false;
    }
  }

  std::filesystem::permissions(tmp,
                               std::filesystem::perms::owner_read |
                                   std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    LOG_ERROR("Failed to restrict permissions on {}: {}", tmp.string(), ec.message());
    return false;
  }

  std::filesystem::rename(tmp, path_, ec);
  if (ec) {
    LOG_ERROR("Failed to replace {}: {}", path_.string(), ec.message());
    return false;
  }
  return true;
}

std::optional<crypto::SessionKey> PeerKeyStore::get(const std::string& peer_id) const {
  std::shared_lock lock(mutex_);
  auto it = keys_.find(peer_id);
  if (it == keys_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool PeerKeyStore::put(const std::string& peer_id, const crypto::SessionKey& key,
                       std::error_code& ec) {
  if (!is_valid_peer_id(peer_id)) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  std::unique_lock lock(mutex_);
  auto [it, inserted] = keys_.try_emplace(peer_id, key);
  if (!inserted) {
    // SECURITY: Clear the replaced key
    sodium_memzero(it->second.data(), it->second.size());
    it->second = key;
  }
  LOG_INFO("Pinned key {} for peer {}", crypto::key_fingerprint(key), peer_id);
  return save_locked(ec);
}

bool PeerKeyStore::forget(const std::string& peer_id, std::error_code& ec) {
  std::unique_lock lock(mutex_);
  auto it = keys_.find(peer_id);
  if (it == keys_.end()) {
    return false;
  }
  // SECURITY: Clear key before removal
  sodium_memzero(it->second.data(), it->second.size());
  keys_.erase(it);
  LOG_INFO("Forgot pinned key for peer {}", peer_id);
  save_locked(ec);
  return true;
}

bool PeerKeyStore::contains(const std::string& peer_id) const {
  std::shared_lock lock(mutex_);
  return keys_.contains(peer_id);
}

std::size_t PeerKeyStore::size() const {
  std::shared_lock lock(mutex_);
  return keys_.size();
}

std::vector<std::string> PeerKeyStore::peer_ids() const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(keys_.size());
  for (const auto& [id, key] : keys_) {
    ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

}  // namespace ghostlink::auth
