#include "heartbeat.h"
#include "connection.h"
#include "protocol.h"
#include "session.h"
#include <stdio.h>
#include <vector>

static const uint16_t CLOSE_NORMAL = 1000;

HeartbeatMonitor::HeartbeatMonitor(const std::string& room_id, int64_t interval_ms, int64_t timeout_ms)
    : m_room_id(room_id),
      m_interval_ms(interval_ms),
      m_timeout_ms(timeout_ms),
      m_running(false),
      m_next_tick_ms(0) {}

void HeartbeatMonitor::start(int64_t now_ms) {
    if (m_running) return;

    m_running = true;
    m_next_tick_ms = now_ms + m_interval_ms;
    printf("[Heartbeat] Room %s: started (every %lld ms, timeout %lld ms)\n",
           m_room_id.c_str(), (long long)m_interval_ms, (long long)m_timeout_ms);
}

void HeartbeatMonitor::stop() {
    if (!m_running) return;

    m_running = false;
    m_next_tick_ms = 0;
    printf("[Heartbeat] Room %s: stopped\n", m_room_id.c_str());
}

size_t HeartbeatMonitor::tick(SessionRegistry& registry, int64_t now_ms) {
    if (!m_running) return 0;

    const std::string ping = encode_ping();
    size_t removed = 0;

    std::vector<Session> sessions = registry.snapshot();
    for (size_t i = 0; i < sessions.size(); i++) {
        const Session& s = sessions[i];

        if (now_ms - s.last_pong_ms > m_timeout_ms) {
            printf("[Heartbeat] Room %s: pruning %s (silent for %lld ms)\n",
                   m_room_id.c_str(), s.identity.c_str(), (long long)(now_ms - s.last_pong_ms));
            registry.remove(s.conn);
            s.conn->close(CLOSE_NORMAL, "heartbeat timeout");
            removed++;
            continue;
        }

        if (!s.conn->send(ping)) {
            fprintf(stderr, "[Heartbeat] Room %s: probe to %s failed, removing\n",
                    m_room_id.c_str(), s.identity.c_str());
            registry.remove(s.conn);
            s.conn->close(CLOSE_NORMAL, "send failed");
            removed++;
        }
    }

    m_next_tick_ms = now_ms + m_interval_ms;

    if (registry.is_empty()) {
        stop();
    }
    return removed;
}
