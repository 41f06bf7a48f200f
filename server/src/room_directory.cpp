#include "room_directory.h"
#include "room.h"
#include "storage.h"
#include <stdio.h>
#include <vector>

RoomDirectory::RoomDirectory(Storage* storage, const RoomConfig& config)
    : m_storage(storage), m_config(config) {}

RoomDirectory::~RoomDirectory() {}

Room* RoomDirectory::find(const std::string& room_id) {
    RoomMap::iterator it = m_rooms.find(room_id);
    return it == m_rooms.end() ? nullptr : it->second.get();
}

AdmitStatus RoomDirectory::precheck(const std::string& room_id, const std::string& identity) const {
    if (room_id.empty()) return ADMIT_MISSING_ROOM;
    if (identity.empty()) return ADMIT_MISSING_IDENTITY;

    RoomMap::const_iterator it = m_rooms.find(room_id);
    if (it != m_rooms.end() && it->second->is_full()) {
        return ADMIT_CAPACITY_EXCEEDED;
    }
    return ADMIT_OK;
}

AdmitStatus RoomDirectory::admit(const std::string& room_id, Connection* conn,
                                 const std::string& identity, int64_t now_ms) {
    AdmitStatus status = precheck(room_id, identity);
    if (status != ADMIT_OK) {
        printf("[Server] Rejected connection to '%s': %s\n", room_id.c_str(), admit_status_name(status));
        return status;
    }

    bool created = false;
    Room* room = find(room_id);
    if (!room) {
        room = new Room(room_id, m_storage, m_config);
        m_rooms[room_id].reset(room);
        created = true;
        printf("[Server] Room %s created (active rooms: %zu)\n", room_id.c_str(), m_rooms.size());
    }

    status = room->admit(conn, identity, now_ms);
    if (status != ADMIT_OK && created) {
        // Nothing was served; the next attempt starts over
        m_rooms.erase(room_id);
    }
    return status;
}

void RoomDirectory::dispatch(const std::string& room_id, Connection* conn,
                             const char* data, size_t len, bool binary, int64_t now_ms) {
    Room* room = find(room_id);
    if (room) {
        room->on_message(conn, data, len, binary, now_ms);
    }
}

void RoomDirectory::disconnect(const std::string& room_id, Connection* conn, int64_t now_ms) {
    Room* room = find(room_id);
    if (room) {
        room->on_close(conn, now_ms);
    }
}

void RoomDirectory::poll(int64_t now_ms) {
    RoomMap::iterator room = m_rooms.begin();
    while (room != m_rooms.end()) {
        room->second->poll(now_ms);
        if (room->second->state() == ROOM_EVICTED) {
            printf("[Server] Room %s released (active rooms: %zu)\n", room->first.c_str(), m_rooms.size() - 1);
            m_rooms.erase(room++);
        } else {
            ++room;
        }
    }

    std::vector<std::string> due = m_storage->take_due_alarms(now_ms);
    for (size_t i = 0; i < due.size(); i++) {
        RoomMap::iterator it = m_rooms.find(due[i]);
        if (it == m_rooms.end()) {
            printf("[Server] Eviction alarm for inactive room %s ignored\n", due[i].c_str());
            continue;
        }

        if (it->second->on_alarm(now_ms)) {
            m_rooms.erase(it);
            printf("[Server] Room %s released (active rooms: %zu)\n", due[i].c_str(), m_rooms.size());
        }
    }
}

void RoomDirectory::shutdown() {
    for (RoomMap::iterator it = m_rooms.begin(); it != m_rooms.end(); ++it) {
        it->second->shutdown();
    }
    m_rooms.clear();
}
