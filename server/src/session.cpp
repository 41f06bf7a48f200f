#include "session.h"

const char* admit_status_name(AdmitStatus status) {
    switch (status) {
        case ADMIT_OK: return "ok";
        case ADMIT_CAPACITY_EXCEEDED: return "capacity_exceeded";
        case ADMIT_MISSING_IDENTITY: return "missing_identity";
        case ADMIT_MISSING_ROOM: return "missing_room";
        case ADMIT_STORAGE_UNAVAILABLE: return "storage_unavailable";
        case ADMIT_ROOM_CLOSED: return "room_closed";
    }
    return "invalid";
}

SessionRegistry::SessionRegistry(size_t max_sessions)
    : m_max_sessions(max_sessions) {}

AdmitStatus SessionRegistry::admit(Connection* conn, const std::string& identity, int64_t now_ms) {
    if (identity.empty()) {
        return ADMIT_MISSING_IDENTITY;
    }
    if (contains(conn)) {
        // Same handle admitted twice; keep the existing session
        return ADMIT_OK;
    }
    if (is_full()) {
        return ADMIT_CAPACITY_EXCEEDED;
    }

    Session session;
    session.conn = conn;
    session.identity = identity;
    session.last_pong_ms = now_ms;
    m_sessions.push_back(session);
    return ADMIT_OK;
}

bool SessionRegistry::remove(Connection* conn) {
    for (std::vector<Session>::iterator it = m_sessions.begin(); it != m_sessions.end(); ++it) {
        if (it->conn == conn) {
            m_sessions.erase(it);
            return true;
        }
    }
    return false;
}

bool SessionRegistry::touch(Connection* conn, int64_t now_ms) {
    for (size_t i = 0; i < m_sessions.size(); i++) {
        if (m_sessions[i].conn == conn) {
            m_sessions[i].last_pong_ms = now_ms;
            return true;
        }
    }
    return false;
}

const Session* SessionRegistry::find(Connection* conn) const {
    for (size_t i = 0; i < m_sessions.size(); i++) {
        if (m_sessions[i].conn == conn) {
            return &m_sessions[i];
        }
    }
    return nullptr;
}

std::vector<Session> SessionRegistry::snapshot() const {
    return m_sessions;
}
