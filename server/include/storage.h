#ifndef STORAGE_H
#define STORAGE_H

#include <stdint.h>
#include <map>
#include <string>
#include <vector>

enum StorageStatus {
    STORAGE_OK = 0,
    STORAGE_NOT_FOUND,
    STORAGE_ERROR
};

// Durable home of room snapshots plus one eviction alarm slot per room.
// All calls happen on the service loop.
class Storage {
public:
    virtual ~Storage() {}

    virtual StorageStatus get(const std::string& room_id, std::vector<uint8_t>* out) = 0;
    virtual bool put(const std::string& room_id, const std::vector<uint8_t>& data) = 0;

    // Replaces any alarm already set for the room
    virtual bool set_alarm(const std::string& room_id, int64_t at_ms) = 0;
    virtual bool delete_alarm(const std::string& room_id) = 0;

    // Collect the rooms whose alarm time has passed and clear those alarms
    std::vector<std::string> take_due_alarms(int64_t now_ms);

    bool has_alarm(const std::string& room_id, int64_t* at_ms) const;

protected:
    std::map<std::string, int64_t> m_alarms;
};

// One snapshot file per room under a directory
class FileStorage : public Storage {
public:
    explicit FileStorage(const std::string& dir);

    // Create the directory if needed
    bool init();

    StorageStatus get(const std::string& room_id, std::vector<uint8_t>* out);
    bool put(const std::string& room_id, const std::vector<uint8_t>& data);
    bool set_alarm(const std::string& room_id, int64_t at_ms);
    bool delete_alarm(const std::string& room_id);

    std::string path_for(const std::string& room_id) const;

private:
    std::string m_dir;
};

// Map-backed storage; failures can be switched on
class MemoryStorage : public Storage {
public:
    MemoryStorage();

    StorageStatus get(const std::string& room_id, std::vector<uint8_t>* out);
    bool put(const std::string& room_id, const std::vector<uint8_t>& data);
    bool set_alarm(const std::string& room_id, int64_t at_ms);
    bool delete_alarm(const std::string& room_id);

    void set_fail_reads(bool fail) { m_fail_reads = fail; }
    void set_fail_writes(bool fail) { m_fail_writes = fail; }

    size_t put_count() const { return m_put_count; }
    size_t get_count() const { return m_get_count; }

private:
    std::map<std::string, std::vector<uint8_t> > m_data;
    bool m_fail_reads;
    bool m_fail_writes;
    size_t m_put_count;
    size_t m_get_count;
};

// Map a room id onto a single safe file name component. Ids whose escaped
// form is too long become an escaped prefix plus '~' and a hash of the id.
std::string escape_room_id(const std::string& room_id);

#endif // STORAGE_H
