#include "heartbeat.h"
#include "session.h"
#include "test_support.h"

#include <gtest/gtest.h>

namespace {

const int64_t INTERVAL = 60 * 1000;
const int64_t TIMEOUT = 90 * 1000;

}  // namespace

TEST(HeartbeatMonitor, start_is_idempotent) {
    HeartbeatMonitor monitor("doc", INTERVAL, TIMEOUT);
    EXPECT_FALSE(monitor.is_running());

    monitor.start(0);
    EXPECT_TRUE(monitor.is_running());
    EXPECT_EQ(monitor.next_tick_ms(), INTERVAL);

    // A second start does not push the next sweep back
    monitor.start(30 * 1000);
    EXPECT_EQ(monitor.next_tick_ms(), INTERVAL);
}

TEST(HeartbeatMonitor, stop_is_safe_to_repeat) {
    HeartbeatMonitor monitor("doc", INTERVAL, TIMEOUT);
    monitor.stop();
    monitor.start(0);
    monitor.stop();
    monitor.stop();
    EXPECT_FALSE(monitor.is_running());
    EXPECT_FALSE(monitor.is_due(10 * INTERVAL));
}

TEST(HeartbeatMonitor, due_once_interval_elapsed) {
    HeartbeatMonitor monitor("doc", INTERVAL, TIMEOUT);
    monitor.start(1000);
    EXPECT_FALSE(monitor.is_due(1000 + INTERVAL - 1));
    EXPECT_TRUE(monitor.is_due(1000 + INTERVAL));
}

TEST(HeartbeatMonitor, probes_live_sessions) {
    HeartbeatMonitor monitor("doc", INTERVAL, TIMEOUT);
    SessionRegistry registry(10);
    FakeConnection a, b;
    registry.admit(&a, "a", 0);
    registry.admit(&b, "b", 0);
    monitor.start(0);

    EXPECT_EQ(monitor.tick(registry, INTERVAL), 0u);
    EXPECT_EQ(a.count(ENVELOPE_PING), 1u);
    EXPECT_EQ(b.count(ENVELOPE_PING), 1u);
    EXPECT_EQ(registry.count(), 2u);
    EXPECT_EQ(monitor.next_tick_ms(), 2 * INTERVAL);
}

TEST(HeartbeatMonitor, prunes_sessions_silent_past_timeout) {
    HeartbeatMonitor monitor("doc", INTERVAL, TIMEOUT);
    SessionRegistry registry(10);
    FakeConnection silent, chatty;
    registry.admit(&silent, "silent", 0);
    registry.admit(&chatty, "chatty", 0);
    monitor.start(0);

    monitor.tick(registry, INTERVAL);
    registry.touch(&chatty, INTERVAL + 5);

    // 120s since the silent session last answered
    EXPECT_EQ(monitor.tick(registry, 2 * INTERVAL), 1u);
    EXPECT_FALSE(registry.contains(&silent));
    EXPECT_TRUE(silent.closed);
    EXPECT_EQ(silent.close_reason, "heartbeat timeout");
    EXPECT_TRUE(registry.contains(&chatty));
    EXPECT_FALSE(chatty.closed);
    EXPECT_TRUE(monitor.is_running());
}

TEST(HeartbeatMonitor, silence_exactly_at_timeout_is_tolerated) {
    HeartbeatMonitor monitor("doc", INTERVAL, TIMEOUT);
    SessionRegistry registry(10);
    FakeConnection a;
    registry.admit(&a, "a", 0);
    monitor.start(0);

    EXPECT_EQ(monitor.tick(registry, TIMEOUT), 0u);
    EXPECT_TRUE(registry.contains(&a));
}

TEST(HeartbeatMonitor, failed_probe_removes_session) {
    HeartbeatMonitor monitor("doc", INTERVAL, TIMEOUT);
    SessionRegistry registry(10);
    FakeConnection dead, alive;
    registry.admit(&dead, "dead", 0);
    registry.admit(&alive, "alive", 0);
    dead.fail_sends = true;
    monitor.start(0);

    EXPECT_EQ(monitor.tick(registry, INTERVAL), 1u);
    EXPECT_FALSE(registry.contains(&dead));
    EXPECT_TRUE(dead.closed);
    EXPECT_EQ(alive.count(ENVELOPE_PING), 1u);
}

TEST(HeartbeatMonitor, stops_itself_when_registry_empties) {
    HeartbeatMonitor monitor("doc", INTERVAL, TIMEOUT);
    SessionRegistry registry(10);
    FakeConnection a;
    registry.admit(&a, "a", 0);
    monitor.start(0);

    monitor.tick(registry, 2 * INTERVAL);
    EXPECT_TRUE(registry.is_empty());
    EXPECT_FALSE(monitor.is_running());
}
