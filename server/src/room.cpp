#include "room.h"
#include "connection.h"
#include "protocol.h"
#include <stdio.h>
#include <vector>

static const uint16_t CLOSE_NORMAL = 1000;
static const uint16_t CLOSE_GOING_AWAY = 1001;

const char* room_state_name(RoomState state) {
    switch (state) {
        case ROOM_UNINITIALIZED: return "uninitialized";
        case ROOM_SERVING: return "serving";
        case ROOM_DRAINING: return "draining";
        case ROOM_EVICTED: return "evicted";
    }
    return "invalid";
}

Room::Room(const std::string& id, Storage* storage, const RoomConfig& config)
    : m_id(id),
      m_config(config),
      m_state(ROOM_UNINITIALIZED),
      m_sessions(config.max_sessions),
      m_heartbeat(id, config.heartbeat_interval_ms, config.heartbeat_timeout_ms),
      m_lifecycle(id, storage, config.idle_timeout_ms) {}

AdmitStatus Room::admit(Connection* conn, const std::string& identity, int64_t now_ms) {
    if (m_state == ROOM_EVICTED) {
        return ADMIT_ROOM_CLOSED;
    }
    if (m_sessions.contains(conn)) {
        // Already admitted and synced
        return ADMIT_OK;
    }
    if (identity.empty()) {
        printf("[Room %s] Rejected connection: %s\n", m_id.c_str(), admit_status_name(ADMIT_MISSING_IDENTITY));
        return ADMIT_MISSING_IDENTITY;
    }
    if (m_sessions.is_full()) {
        printf("[Room %s] Rejected %s: %s (%zu/%zu)\n", m_id.c_str(), identity.c_str(),
               admit_status_name(ADMIT_CAPACITY_EXCEEDED), m_sessions.count(), m_sessions.capacity());
        return ADMIT_CAPACITY_EXCEEDED;
    }

    if (m_state == ROOM_UNINITIALIZED) {
        // Restore must finish before anyone is served
        if (!m_document.init() || !m_lifecycle.restore(m_document)) {
            printf("[Room %s] Rejected %s: %s\n", m_id.c_str(), identity.c_str(),
                   admit_status_name(ADMIT_STORAGE_UNAVAILABLE));
            return ADMIT_STORAGE_UNAVAILABLE;
        }
    }

    AdmitStatus status = m_sessions.admit(conn, identity, now_ms);
    if (status != ADMIT_OK) {
        printf("[Room %s] Rejected %s: %s\n", m_id.c_str(), identity.c_str(), admit_status_name(status));
        return status;
    }

    if (m_state != ROOM_SERVING) {
        printf("[Room %s] %s -> %s\n", m_id.c_str(), room_state_name(m_state), room_state_name(ROOM_SERVING));
        m_lifecycle.cancel_eviction();
    }
    m_state = ROOM_SERVING;
    m_heartbeat.start(now_ms);

    printf("[Room %s] %s connected (total: %zu)\n", m_id.c_str(), identity.c_str(), m_sessions.count());

    // Full snapshot to the new session alone
    std::vector<uint8_t> snapshot = m_document.encode_snapshot();
    if (!conn->send(encode_sync(snapshot))) {
        drop_session(conn, "initial sync failed", now_ms);
        return ADMIT_OK;
    }
    printf("[Room %s] Sent initial state (%zu bytes) to %s\n", m_id.c_str(), snapshot.size(), identity.c_str());

    return ADMIT_OK;
}

void Room::on_message(Connection* conn, const char* data, size_t len, bool binary, int64_t now_ms) {
    if (m_state != ROOM_SERVING || !m_sessions.contains(conn)) {
        return;
    }

    Envelope envelope;
    DecodeStatus status = decode_envelope(data, len, binary, m_config.max_message_size, &envelope);

    if (status == DECODE_TOO_LARGE) {
        fprintf(stderr, "[Room %s] Message too large (%zu bytes), discarded\n", m_id.c_str(), len);
        if (!conn->send(encode_error("Message too large"))) {
            drop_session(conn, "send failed", now_ms);
        }
        return;
    }
    if (status != DECODE_OK) {
        fprintf(stderr, "[Protocol] Room %s: dropped message (%s, %zu bytes)\n",
                m_id.c_str(), decode_status_name(status), len);
        return;
    }

    switch (envelope.type) {
        case ENVELOPE_UPDATE:
            handle_update(conn, envelope, now_ms);
            break;

        case ENVELOPE_AWARENESS:
            // Ephemeral: relay only, never merged or persisted
            broadcast(conn, encode_awareness(envelope.state), now_ms);
            break;

        case ENVELOPE_PING:
            if (!conn->send(encode_pong())) {
                drop_session(conn, "send failed", now_ms);
            }
            break;

        case ENVELOPE_PONG:
            m_sessions.touch(conn, now_ms);
            break;

        default:
            // sync is server-to-client only
            break;
    }
}

void Room::handle_update(Connection* conn, const Envelope& envelope, int64_t now_ms) {
    if (envelope.bytes.empty()) {
        fprintf(stderr, "[Protocol] Room %s: dropped empty update\n", m_id.c_str());
        return;
    }

    if (!m_document.apply_update(&envelope.bytes[0], envelope.bytes.size())) {
        fprintf(stderr, "[Room %s] Failed to apply update (%zu bytes), not relayed\n",
                m_id.c_str(), envelope.bytes.size());
        return;
    }

    size_t count = broadcast(conn, encode_envelope(envelope), now_ms);
    printf("[Room %s] Applied update (%zu bytes), relayed to %zu peer(s)\n",
           m_id.c_str(), envelope.bytes.size(), count);
}

size_t Room::broadcast(Connection* sender, const std::string& message, int64_t now_ms) {
    size_t delivered = 0;

    std::vector<Session> sessions = m_sessions.snapshot();
    for (size_t i = 0; i < sessions.size(); i++) {
        Connection* peer = sessions[i].conn;
        if (peer == sender) continue;

        if (peer->send(message)) {
            delivered++;
        } else {
            drop_session(peer, "send failed", now_ms);
        }
    }
    return delivered;
}

void Room::drop_session(Connection* conn, const char* reason, int64_t now_ms) {
    const Session* session = m_sessions.find(conn);
    if (!session) return;

    printf("[Room %s] Removing %s: %s\n", m_id.c_str(), session->identity.c_str(), reason);
    m_sessions.remove(conn);
    conn->close(CLOSE_NORMAL, reason);

    if (m_sessions.is_empty()) {
        go_idle(now_ms);
    }
}

void Room::on_close(Connection* conn, int64_t now_ms) {
    const Session* session = m_sessions.find(conn);
    if (!session) return;

    printf("[Room %s] %s disconnected (remaining: %zu)\n", m_id.c_str(),
           session->identity.c_str(), m_sessions.count() - 1);
    m_sessions.remove(conn);

    if (m_sessions.is_empty()) {
        go_idle(now_ms);
    }
}

void Room::go_idle(int64_t now_ms) {
    if (m_state != ROOM_SERVING) return;

    m_heartbeat.stop();
    m_state = ROOM_DRAINING;
    m_lifecycle.on_empty(m_document, now_ms);
}

void Room::poll(int64_t now_ms) {
    if (m_state == ROOM_DRAINING && m_lifecycle.unarmed_deadline_passed(now_ms)) {
        // No stored alarm will fire for this room
        on_alarm(now_ms);
        return;
    }
    if (m_state != ROOM_SERVING || !m_heartbeat.is_due(now_ms)) {
        return;
    }

    size_t pruned = m_heartbeat.tick(m_sessions, now_ms);
    if (pruned > 0) {
        printf("[Room %s] Heartbeat pruned %zu session(s) (remaining: %zu)\n",
               m_id.c_str(), pruned, m_sessions.count());
    }

    if (m_sessions.is_empty()) {
        go_idle(now_ms);
    }
}

bool Room::on_alarm(int64_t now_ms) {
    if (m_state == ROOM_EVICTED) return true;
    if (m_state != ROOM_DRAINING) {
        // Sessions came back before the alarm was cancelled
        return m_lifecycle.on_alarm(m_document, false, now_ms);
    }

    if (!m_lifecycle.on_alarm(m_document, m_sessions.is_empty(), now_ms)) {
        return false;
    }

    m_heartbeat.stop();
    m_state = ROOM_EVICTED;
    printf("[Room %s] Evicted\n", m_id.c_str());
    return true;
}

void Room::shutdown() {
    std::vector<Session> sessions = m_sessions.snapshot();
    for (size_t i = 0; i < sessions.size(); i++) {
        m_sessions.remove(sessions[i].conn);
        sessions[i].conn->close(CLOSE_GOING_AWAY, "server shutdown");
    }
    m_heartbeat.stop();

    if (m_state == ROOM_SERVING || m_state == ROOM_DRAINING) {
        m_lifecycle.persist(m_document);
    }
    m_state = ROOM_EVICTED;
}
