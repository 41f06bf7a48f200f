#ifndef ROOM_DIRECTORY_H
#define ROOM_DIRECTORY_H

#include <stddef.h>
#include <stdint.h>
#include <map>
#include <memory>
#include <string>

#include "config.h"
#include "session.h"

class Connection;
class Room;
class Storage;

// Active rooms of this process, keyed by document id. Created at start-up
// and handed to the transport; rooms are added on first admission and
// dropped once evicted.
class RoomDirectory {
public:
    RoomDirectory(Storage* storage, const RoomConfig& config);
    ~RoomDirectory();

    // Admission entry point. identity must already be authenticated and
    // authorized for room_id.
    AdmitStatus admit(const std::string& room_id, Connection* conn,
                      const std::string& identity, int64_t now_ms);

    // Cheap capacity check for the upgrade filter; does not create rooms
    AdmitStatus precheck(const std::string& room_id, const std::string& identity) const;

    void dispatch(const std::string& room_id, Connection* conn,
                  const char* data, size_t len, bool binary, int64_t now_ms);

    void disconnect(const std::string& room_id, Connection* conn, int64_t now_ms);

    // Heartbeats for every room, then due eviction alarms
    void poll(int64_t now_ms);

    // Persist every room and close its sessions
    void shutdown();

    Room* find(const std::string& room_id);
    size_t room_count() const { return m_rooms.size(); }

private:
    RoomDirectory(const RoomDirectory&);
    RoomDirectory& operator=(const RoomDirectory&);

    typedef std::map<std::string, std::unique_ptr<Room> > RoomMap;

    Storage* m_storage;
    RoomConfig m_config;
    RoomMap m_rooms;
};

#endif // ROOM_DIRECTORY_H
