#include "transport/session/liveness_monitor.h"

#include <algorithm>

namespace ghostlink::transport {

LivenessMonitor::LivenessMonitor(LivenessConfig config, std::function<TimePoint()> now_fn)
    : config_(config), now_fn_(std::move(now_fn)) {
  if (config_.degraded_after == 0) {
    config_.degraded_after = 1;
  }
  config_.reconnect_after = std::max(config_.reconnect_after, config_.degraded_after + 1);
  reset();
}

void LivenessMonitor::reset() {
  const auto now = now_fn_();
  last_seen_ = now;
  last_ping_ = now;
}

void LivenessMonitor::on_frame_received() { last_seen_ = now_fn_(); }

void LivenessMonitor::on_ping_sent() { last_ping_ = now_fn_(); }

bool LivenessMonitor::ping_due() const {
  return now_fn_() - last_ping_ >= config_.heartbeat_interval;
}

Liveness LivenessMonitor::status() const {
  const auto silence = now_fn_() - last_seen_;
  if (silence >= config_.heartbeat_interval * config_.reconnect_after) {
    return Liveness::kDead;
  }
  if (silence >= config_.heartbeat_interval * config_.degraded_after) {
    return Liveness::kDegraded;
  }
  return Liveness::kAlive;
}

LivenessMonitor::TimePoint LivenessMonitor::next_deadline() const {
  const auto next_ping = last_ping_ + config_.heartbeat_interval;
  const auto degraded_at = last_seen_ + config_.heartbeat_interval * config_.degraded_after;
  const auto dead_at = last_seen_ + config_.heartbeat_interval * config_.reconnect_after;
  const auto now = now_fn_();
  auto deadline = next_ping;
  if (degraded_at > now) {
    deadline = std::min(deadline, degraded_at);
  }
  return std::min(deadline, dead_at);
}

}  // namespace ghostlink::transport
