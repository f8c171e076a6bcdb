#include "transport/session/session_config.h"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <type_traits>

#include "common/logging/logger.h"
#include "transport/frame/frame.h"
#include "transport/frame/frame_codec.h"

namespace ghostlink::transport {

namespace {
// Helper to safely parse integer with validation
template <typename T>
bool safe_parse_int(const std::string& value, T& out, const std::string& field_name,
                    std::error_code& ec) {
  try {
    if constexpr (std::is_unsigned_v<T>) {
      if (!value.empty() && value[0] == '-') {
        LOG_ERROR("Configuration error: {} value '{}' cannot be negative", field_name, value);
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
      }
      unsigned long long parsed = std::stoull(value);
      if (parsed > std::numeric_limits<T>::max()) {
        LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
      }
      out = static_cast<T>(parsed);
    } else {
      long long parsed = std::stoll(value);
      if (parsed < std::numeric_limits<T>::min() || parsed > std::numeric_limits<T>::max()) {
        LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
      }
      out = static_cast<T>(parsed);
    }
    return true;
  } catch (const std::invalid_argument&) {
    LOG_ERROR("Configuration error: {} value '{}' is not a valid number", field_name, value);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  } catch (const std::out_of_range&) {
    LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
    ec = std::make_error_code(std::errc::result_out_of_range);
    return false;
  }
}

bool parse_millis(const std::string& value, std::chrono::milliseconds& out,
                  const std::string& field_name, std::error_code& ec) {
  std::uint32_t ms = 0;
  if (!safe_parse_int(value, ms, field_name, ec)) {
    return false;
  }
  out = std::chrono::milliseconds(ms);
  return true;
}

bool parse_double(const std::string& value, double& out, const std::string& field_name,
                  std::error_code& ec) {
  try {
    std::size_t used = 0;
    out = std::stod(value, &used);
    if (used != value.size()) {
      throw std::invalid_argument(value);
    }
    return true;
  } catch (const std::exception&) {
    LOG_ERROR("Configuration error: {} value '{}' is not a valid number", field_name, value);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
}

bool parse_bool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes" || value == "on";
}

void trim(std::string& s) {
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
    s.pop_back();
  }
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.erase(0, 1);
  }
}

// Simple INI parser for configuration files.
bool parse_ini_value(const std::string& line, std::string& key, std::string& value) {
  if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
    return false;
  }
  auto pos = line.find('=');
  if (pos == std::string::npos) {
    return false;
  }
  key = line.substr(0, pos);
  value = line.substr(pos + 1);
  trim(key);
  trim(value);
  return !key.empty();
}

std::string get_current_section(std::string line) {
  trim(line);
  if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
    return line.substr(1, line.size() - 2);
  }
  return "";
}

bool apply_value(const std::string& section, const std::string& key, const std::string& value,
                 SessionConfig& config, std::error_code& ec) {
  if (section == "session" || section.empty()) {
    if (key == "role") {
      if (value == "host") {
        config.role = Role::kHost;
      } else if (value == "client") {
        config.role = Role::kClient;
      } else {
        LOG_ERROR("Configuration error: role must be 'host' or 'client', got '{}'", value);
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
      }
    } else if (key == "peer_id") {
      config.peer_id = value;
    } else if (key == "connect_timeout_ms") {
      return parse_millis(value, config.connect_timeout, key, ec);
    } else if (key == "handshake_timeout_ms") {
      return parse_millis(value, config.handshake_timeout, key, ec);
    }
  } else if (section == "heartbeat") {
    if (key == "interval_ms") {
      return parse_millis(value, config.heartbeat.heartbeat_interval, key, ec);
    } else if (key == "degraded_after") {
      return safe_parse_int(value, config.heartbeat.degraded_after, key, ec);
    } else if (key == "reconnect_after") {
      return safe_parse_int(value, config.heartbeat.reconnect_after, key, ec);
    }
  } else if (section == "reconnect") {
    if (key == "base_delay_ms") {
      return parse_millis(value, config.reconnect.base_delay, key, ec);
    } else if (key == "max_delay_ms") {
      return parse_millis(value, config.reconnect.max_delay, key, ec);
    } else if (key == "multiplier") {
      return parse_double(value, config.reconnect.multiplier, key, ec);
    } else if (key == "jitter") {
      return parse_double(value, config.reconnect.jitter, key, ec);
    } else if (key == "max_attempts") {
      return safe_parse_int(value, config.reconnect.max_attempts, key, ec);
    }
  } else if (section == "transfer") {
    if (key == "max_frame_payload") {
      return safe_parse_int(value, config.transfer.max_frame_payload, key, ec);
    } else if (key == "window_chunks") {
      return safe_parse_int(value, config.transfer.window_chunks, key, ec);
    } else if (key == "timeout_ms") {
      return parse_millis(value, config.transfer.transfer_timeout, key, ec);
    } else if (key == "max_transfer_bytes") {
      return safe_parse_int(value, config.transfer.max_transfer_bytes, key, ec);
    } else if (key == "retransmit_buffer_bytes") {
      return safe_parse_int(value, config.retransmit.max_buffer_bytes, key, ec);
    }
  } else if (section == "keys") {
    if (key == "store_path") {
      config.key_store_path = value;
    } else if (key == "pairing_secret_file") {
      config.pairing_secret_file = value;
    }
  } else if (section == "logging") {
    if (key == "level") {
      config.log_level = value;
    } else if (key == "file") {
      config.log_file = value;
    } else if (key == "console") {
      config.log_console = parse_bool(value);
    }
  }
  return true;
}
}  // namespace

const char* to_string(Role role) noexcept {
  return role == Role::kHost ? "host" : "client";
}

bool load_config_file(const std::string& path, SessionConfig& config, std::error_code& ec) {
  std::ifstream file(path);
  if (!file) {
    ec = std::error_code(errno != 0 ? errno : ENOENT, std::generic_category());
    LOG_ERROR("Failed to open config file: {}", path);
    return false;
  }

  std::string line;
  std::string section;
  while (std::getline(file, line)) {
    std::string new_section = get_current_section(line);
    if (!new_section.empty()) {
      section = new_section;
      continue;
    }
    std::string key;
    std::string value;
    if (!parse_ini_value(line, key, value)) {
      continue;
    }
    if (!apply_value(section, key, value, config, ec)) {
      return false;
    }
  }

  LOG_DEBUG("Loaded configuration from {}", path);
  return true;
}

bool load_pairing_secret(SessionConfig& config, std::error_code& ec) {
  if (config.pairing_secret_file.empty()) {
    return true;
  }
  std::ifstream file(config.pairing_secret_file, std::ios::binary);
  if (!file) {
    ec = std::error_code(errno != 0 ? errno : ENOENT, std::generic_category());
    LOG_ERROR("Failed to open pairing secret file: {}", config.pairing_secret_file);
    return false;
  }
  std::vector<std::uint8_t> secret((std::istreambuf_iterator<char>(file)),
                                   std::istreambuf_iterator<char>());
  while (!secret.empty() &&
         (secret.back() == '\n' || secret.back() == '\r' || secret.back() == ' ')) {
    secret.pop_back();
  }
  if (secret.empty()) {
    LOG_ERROR("Pairing secret file {} is empty", config.pairing_secret_file);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  config.pairing_secret = std::move(secret);
  return true;
}

bool validate_config(const SessionConfig& config, std::string& error) {
  if (config.heartbeat.heartbeat_interval.count() <= 0) {
    error = "Heartbeat interval must be positive";
    return false;
  }
  if (config.heartbeat.degraded_after == 0 ||
      config.heartbeat.reconnect_after <= config.heartbeat.degraded_after) {
    error = "heartbeat reconnect_after must be greater than degraded_after (and both non-zero)";
    return false;
  }
  if (config.handshake_timeout.count() <= 0 || config.connect_timeout.count() <= 0) {
    error = "Timeouts must be positive";
    return false;
  }
  if (config.reconnect.base_delay.count() <= 0 ||
      config.reconnect.max_delay < config.reconnect.base_delay) {
    error = "reconnect max_delay must be at least base_delay (and base_delay positive)";
    return false;
  }
  if (config.reconnect.multiplier < 1.0) {
    error = "reconnect multiplier must be at least 1.0";
    return false;
  }
  if (config.reconnect.jitter < 0.0 || config.reconnect.jitter >= 1.0) {
    error = "reconnect jitter must be in [0, 1)";
    return false;
  }
  constexpr std::size_t kMinFramePayload = 256;
  if (config.transfer.max_frame_payload < kMinFramePayload ||
      config.transfer.max_frame_payload > frame::kMaxPayloadSize) {
    error = "max_frame_payload must be between 256 and 65536";
    return false;
  }
  if (config.transfer.window_chunks == 0) {
    error = "window_chunks must be at least 1";
    return false;
  }
  if (config.transfer.transfer_timeout.count() <= 0) {
    error = "Transfer timeout must be positive";
    return false;
  }
  if (config.retransmit.max_buffer_bytes < frame::FrameCodec::encoded_size(frame::kMaxPayloadSize)) {
    error = "retransmit_buffer_bytes must hold at least one full frame";
    return false;
  }
  return true;
}

}  // namespace ghostlink::transport
