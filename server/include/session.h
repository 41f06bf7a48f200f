#ifndef SESSION_H
#define SESSION_H

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

class Connection;

enum AdmitStatus {
    ADMIT_OK = 0,
    ADMIT_CAPACITY_EXCEEDED,
    ADMIT_MISSING_IDENTITY,
    ADMIT_MISSING_ROOM,
    ADMIT_STORAGE_UNAVAILABLE,
    ADMIT_ROOM_CLOSED
};

const char* admit_status_name(AdmitStatus status);

// One live client connection within a room
struct Session {
    Connection* conn;
    std::string identity;
    int64_t last_pong_ms;  // Last liveness acknowledgment (admission counts)
};

// Live sessions of a single room, capped at max_sessions.
// Owned and mutated only by the room's event loop.
class SessionRegistry {
public:
    explicit SessionRegistry(size_t max_sessions);

    AdmitStatus admit(Connection* conn, const std::string& identity, int64_t now_ms);

    // Returns true if the session was present. Removing twice is a no-op.
    bool remove(Connection* conn);

    // Record a liveness acknowledgment. Returns false for unknown sessions.
    bool touch(Connection* conn, int64_t now_ms);

    const Session* find(Connection* conn) const;
    bool contains(Connection* conn) const { return find(conn) != nullptr; }

    bool is_empty() const { return m_sessions.empty(); }
    bool is_full() const { return m_sessions.size() >= m_max_sessions; }
    size_t count() const { return m_sessions.size(); }
    size_t capacity() const { return m_max_sessions; }

    // Copy of the current sessions; safe to iterate while removing
    std::vector<Session> snapshot() const;

private:
    size_t m_max_sessions;
    std::vector<Session> m_sessions;
};

#endif // SESSION_H
