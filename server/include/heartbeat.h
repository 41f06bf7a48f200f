#ifndef HEARTBEAT_H
#define HEARTBEAT_H

#include <stddef.h>
#include <stdint.h>
#include <string>

class SessionRegistry;

// Periodic liveness sweep for one room.
//   idle (stopped) -> active (start) -> idle (stop, or registry empty after a sweep)
class HeartbeatMonitor {
public:
    HeartbeatMonitor(const std::string& room_id, int64_t interval_ms, int64_t timeout_ms);

    // Arm the first sweep one interval from now. No-op when already running.
    void start(int64_t now_ms);

    // Safe to call any number of times
    void stop();

    bool is_running() const { return m_running; }
    bool is_due(int64_t now_ms) const { return m_running && now_ms >= m_next_tick_ms; }
    int64_t next_tick_ms() const { return m_next_tick_ms; }

    // Close and remove every session silent for longer than the timeout,
    // probe the rest. Stops itself when the registry ends up empty.
    // Returns the number of sessions removed.
    size_t tick(SessionRegistry& registry, int64_t now_ms);

private:
    std::string m_room_id;
    int64_t m_interval_ms;
    int64_t m_timeout_ms;
    bool m_running;
    int64_t m_next_tick_ms;
};

#endif // HEARTBEAT_H
