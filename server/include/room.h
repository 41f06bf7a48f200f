#ifndef ROOM_H
#define ROOM_H

#include <stddef.h>
#include <stdint.h>
#include <string>

#include "config.h"
#include "document.h"
#include "heartbeat.h"
#include "lifecycle.h"
#include "session.h"

class Connection;
class Storage;
struct Envelope;

enum RoomState {
    ROOM_UNINITIALIZED = 0,  // Created, document not yet restored
    ROOM_SERVING,            // At least one session
    ROOM_DRAINING,           // No sessions, eviction scheduled
    ROOM_EVICTED             // Terminal
};

const char* room_state_name(RoomState state);

// Coordinator for one shared document. Every call must come from the same
// event loop; the room never locks.
class Room {
public:
    Room(const std::string& id, Storage* storage, const RoomConfig& config);

    // Admit a connection. On the first admission the stored snapshot is
    // restored; every admitted session is sent a full sync.
    AdmitStatus admit(Connection* conn, const std::string& identity, int64_t now_ms);

    // Route one complete inbound message from conn
    void on_message(Connection* conn, const char* data, size_t len, bool binary, int64_t now_ms);

    // Disconnect or transport error. Idempotent.
    void on_close(Connection* conn, int64_t now_ms);

    // Run the heartbeat sweep when due. A draining room whose alarm could
    // not be stored fires its eviction from here instead.
    void poll(int64_t now_ms);

    // Eviction alarm fired. Returns true once the room is evicted.
    bool on_alarm(int64_t now_ms);

    // Persist and close every session, for process shutdown
    void shutdown();

    const std::string& id() const { return m_id; }
    RoomState state() const { return m_state; }
    size_t session_count() const { return m_sessions.count(); }
    bool has_session(Connection* conn) const { return m_sessions.contains(conn); }
    bool is_full() const { return m_sessions.is_full(); }

    Document& document() { return m_document; }
    const HeartbeatMonitor& heartbeat() const { return m_heartbeat; }

private:
    Room(const Room&);
    Room& operator=(const Room&);

    // Send to every session except sender. Failed recipients are dropped.
    size_t broadcast(Connection* sender, const std::string& message, int64_t now_ms);

    // Remove a session after a failed send
    void drop_session(Connection* conn, const char* reason, int64_t now_ms);

    // Registry just became empty
    void go_idle(int64_t now_ms);

    void handle_update(Connection* conn, const Envelope& envelope, int64_t now_ms);

    std::string m_id;
    RoomConfig m_config;
    RoomState m_state;
    Document m_document;
    SessionRegistry m_sessions;
    HeartbeatMonitor m_heartbeat;
    LifecycleManager m_lifecycle;
};

#endif // ROOM_H
