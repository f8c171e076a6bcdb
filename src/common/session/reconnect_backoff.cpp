#include "common/session/reconnect_backoff.h"

#include <algorithm>
#include <cmath>

#include "common/crypto/random.h"

namespace ghostlink::session {

ReconnectBackoff::ReconnectBackoff(BackoffConfig config)
    : ReconnectBackoff(config, crypto::random_uint64()) {}

ReconnectBackoff::ReconnectBackoff(BackoffConfig config, std::uint64_t seed)
    : config_(config), rng_(seed) {
  config_.jitter = std::clamp(config_.jitter, 0.0, 0.99);
  config_.multiplier = std::max(config_.multiplier, 1.0);
}

std::chrono::milliseconds ReconnectBackoff::nominal_delay() const {
  const double base_ms = static_cast<double>(config_.base_delay.count());
  const double max_ms = static_cast<double>(config_.max_delay.count());
  // Clamp the exponent so the power cannot overflow for long outages.
  const double exponent = std::min<double>(attempts_, 32.0);
  const double delay = std::min(base_ms * std::pow(config_.multiplier, exponent), max_ms);
  return std::chrono::milliseconds(static_cast<std::int64_t>(delay));
}

std::chrono::milliseconds ReconnectBackoff::next_delay() {
  const double nominal = static_cast<double>(nominal_delay().count());
  ++attempts_;
  if (config_.jitter <= 0.0) {
    return std::chrono::milliseconds(static_cast<std::int64_t>(nominal));
  }
  std::uniform_real_distribution<double> dist(1.0 - config_.jitter, 1.0 + config_.jitter);
  const double jittered = nominal * dist(rng_);
  return std::chrono::milliseconds(static_cast<std::int64_t>(std::max(jittered, 0.0)));
}

}  // namespace ghostlink::session
