#include <gtest/gtest.h>

#include <chrono>

#include "transport/session/liveness_monitor.h"

namespace ghostlink::tests {

using namespace std::chrono_literals;
using transport::Liveness;
using transport::LivenessConfig;
using transport::LivenessMonitor;

class LivenessMonitorTest : public ::testing::Test {
 protected:
  void SetUp() override { now_ = LivenessMonitor::Clock::now(); }

  LivenessMonitor make_monitor() {
    LivenessConfig config{};
    config.heartbeat_interval = 1000ms;
    config.degraded_after = 3;
    config.reconnect_after = 6;
    return LivenessMonitor(config, [this] { return now_; });
  }

  LivenessMonitor::TimePoint now_;
};

TEST_F(LivenessMonitorTest, FreshConnectionIsAlive) {
  auto monitor = make_monitor();
  EXPECT_EQ(monitor.status(), Liveness::kAlive);
  EXPECT_FALSE(monitor.ping_due());
}

TEST_F(LivenessMonitorTest, PingDueEveryInterval) {
  auto monitor = make_monitor();
  now_ += 999ms;
  EXPECT_FALSE(monitor.ping_due());
  now_ += 1ms;
  EXPECT_TRUE(monitor.ping_due());
  monitor.on_ping_sent();
  EXPECT_FALSE(monitor.ping_due());
}

TEST_F(LivenessMonitorTest, SilenceDegradesThenKills) {
  auto monitor = make_monitor();
  now_ += 2999ms;
  EXPECT_EQ(monitor.status(), Liveness::kAlive);
  now_ += 1ms;
  EXPECT_EQ(monitor.status(), Liveness::kDegraded);
  now_ += 2999ms;
  EXPECT_EQ(monitor.status(), Liveness::kDegraded);
  now_ += 1ms;
  EXPECT_EQ(monitor.status(), Liveness::kDead);
}

TEST_F(LivenessMonitorTest, AnyFrameRestoresAlive) {
  auto monitor = make_monitor();
  now_ += 4000ms;
  EXPECT_EQ(monitor.status(), Liveness::kDegraded);
  monitor.on_frame_received();
  EXPECT_EQ(monitor.status(), Liveness::kAlive);
}

TEST_F(LivenessMonitorTest, SendingPingsDoesNotCountAsLife) {
  auto monitor = make_monitor();
  for (int i = 0; i < 6; ++i) {
    now_ += 1000ms;
    monitor.on_ping_sent();
  }
  EXPECT_EQ(monitor.status(), Liveness::kDead);
}

TEST_F(LivenessMonitorTest, NextDeadlineIsEarliestEvent) {
  auto monitor = make_monitor();
  const auto start = now_;
  EXPECT_EQ(monitor.next_deadline(), start + 1000ms);

  // Pings keep going out but nothing comes back: the deadline walks to the
  // degraded point, then to the reconnect point.
  now_ = start + 2500ms;
  monitor.on_ping_sent();
  EXPECT_EQ(monitor.next_deadline(), start + 3000ms);

  now_ = start + 3200ms;
  monitor.on_ping_sent();
  EXPECT_EQ(monitor.next_deadline(), start + 4200ms);

  now_ = start + 5500ms;
  monitor.on_ping_sent();
  EXPECT_EQ(monitor.next_deadline(), start + 6000ms);
}

TEST_F(LivenessMonitorTest, ResetRestartsClock) {
  auto monitor = make_monitor();
  now_ += 10000ms;
  EXPECT_EQ(monitor.status(), Liveness::kDead);
  monitor.reset();
  EXPECT_EQ(monitor.status(), Liveness::kAlive);
  EXPECT_FALSE(monitor.ping_due());
}

TEST(LivenessMonitorTests, InconsistentThresholdsAreRepaired) {
  LivenessConfig config{};
  config.degraded_after = 0;
  config.reconnect_after = 0;
  LivenessMonitor monitor(config);
  EXPECT_EQ(monitor.config().degraded_after, 1U);
  EXPECT_EQ(monitor.config().reconnect_after, 2U);
}

}  // namespace ghostlink::tests
