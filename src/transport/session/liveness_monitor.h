#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace ghostlink::transport {

struct LivenessConfig {
  std::chrono::milliseconds heartbeat_interval{1000};
  // Missed intervals before the link is reported as degraded.
  std::uint32_t degraded_after{3};
  // Missed intervals before the link is given up and reconnected.
  std::uint32_t reconnect_after{6};
};

enum class Liveness : std::uint8_t { kAlive, kDegraded, kDead };

// Heartbeat scheduling and silence detection for one connection.
// Any valid received frame counts as proof of life, not just PONG.
//
// Thread Safety: not thread-safe; owned by the session control thread.
class LivenessMonitor {
 public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  explicit LivenessMonitor(LivenessConfig config, std::function<TimePoint()> now_fn = Clock::now);

  // Start tracking a freshly established connection.
  void reset();

  void on_frame_received();
  void on_ping_sent();

  [[nodiscard]] bool ping_due() const;
  [[nodiscard]] Liveness status() const;

  // Earliest moment at which ping_due() or status() can change.
  [[nodiscard]] TimePoint next_deadline() const;

  TimePoint last_seen() const { return last_seen_; }
  const LivenessConfig& config() const { return config_; }

 private:
  LivenessConfig config_;
  std::function<TimePoint()> now_fn_;
  TimePoint last_seen_{};
  TimePoint last_ping_{};
};

}  // namespace ghostlink::transport
