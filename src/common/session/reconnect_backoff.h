#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace ghostlink::session {

struct BackoffConfig {
  std::chrono::milliseconds base_delay{2000};
  std::chrono::milliseconds max_delay{30000};
  double multiplier{2.0};
  // Fraction of the nominal delay added or removed at random, in [0, 1).
  double jitter{0.2};
  // Failed attempts allowed before giving up. 0 = unlimited.
  std::uint32_t max_attempts{5};
};

// Exponential reconnect delay with a cap and symmetric jitter.
// Attempt n (starting at 0) waits base * multiplier^n, capped at max_delay,
// then scaled by a random factor in [1 - jitter, 1 + jitter].
class ReconnectBackoff {
 public:
  explicit ReconnectBackoff(BackoffConfig config);
  ReconnectBackoff(BackoffConfig config, std::uint64_t seed);

  // Delay before the next attempt. Counts the attempt.
  std::chrono::milliseconds next_delay();

  bool exhausted() const {
    return config_.max_attempts != 0 && attempts_ >= config_.max_attempts;
  }
  std::uint32_t attempts() const { return attempts_; }
  const BackoffConfig& config() const { return config_; }

  // Called once a connection is re-established.
  void reset() { attempts_ = 0; }

 private:
  std::chrono::milliseconds nominal_delay() const;

  BackoffConfig config_;
  std::uint32_t attempts_{0};
  std::mt19937_64 rng_;
};

}  // namespace ghostlink::session
