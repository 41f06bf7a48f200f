#include "storage.h"
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <fstream>

static const char* SNAPSHOT_SUFFIX = ".ydoc";

// Escaped names longer than this are shortened to a prefix plus a hash, so
// the name with ".ydoc.tmp" appended stays well under NAME_MAX
static const size_t MAX_KEY_LENGTH = 200;
static const size_t HASH_SUFFIX_LENGTH = 17;  // '~' + 16 hex digits

std::vector<std::string> Storage::take_due_alarms(int64_t now_ms) {
    std::vector<std::string> due;

    std::map<std::string, int64_t>::iterator it = m_alarms.begin();
    while (it != m_alarms.end()) {
        if (it->second <= now_ms) {
            due.push_back(it->first);
            m_alarms.erase(it++);
        } else {
            ++it;
        }
    }
    return due;
}

bool Storage::has_alarm(const std::string& room_id, int64_t* at_ms) const {
    std::map<std::string, int64_t>::const_iterator it = m_alarms.find(room_id);
    if (it == m_alarms.end()) return false;
    if (at_ms) *at_ms = it->second;
    return true;
}

// 64-bit FNV-1a
static uint64_t hash_room_id(const std::string& room_id) {
    uint64_t hash = 14695981039346656037ULL;
    for (size_t i = 0; i < room_id.size(); i++) {
        hash ^= (unsigned char)room_id[i];
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::string escape_room_id(const std::string& room_id) {
    static const char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(room_id.size());

    for (size_t i = 0; i < room_id.size(); i++) {
        unsigned char c = (unsigned char)room_id[i];
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '_' || c == '-' ||
                    (c == '.' && i > 0);
        if (safe) {
            out += (char)c;
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }

    if (out.size() <= MAX_KEY_LENGTH) {
        return out;
    }

    // Cut without splitting a %XX sequence; '~' never appears in escaped text
    size_t cut = MAX_KEY_LENGTH - HASH_SUFFIX_LENGTH;
    if (out[cut - 1] == '%') {
        cut -= 1;
    } else if (out[cut - 2] == '%') {
        cut -= 2;
    }
    out.resize(cut);

    uint64_t hash = hash_room_id(room_id);
    out += '~';
    for (int shift = 60; shift >= 0; shift -= 4) {
        out += HEX[(hash >> shift) & 0x0F];
    }
    return out;
}

// ----- FileStorage -----

FileStorage::FileStorage(const std::string& dir) : m_dir(dir) {}

bool FileStorage::init() {
    if (mkdir(m_dir.c_str(), 0755) != 0 && errno != EEXIST) {
        fprintf(stderr, "[Storage] Failed to create %s: %s\n", m_dir.c_str(), strerror(errno));
        return false;
    }

    struct stat st;
    if (stat(m_dir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        fprintf(stderr, "[Storage] %s is not a directory\n", m_dir.c_str());
        return false;
    }

    printf("[Storage] Snapshots in %s\n", m_dir.c_str());
    return true;
}

std::string FileStorage::path_for(const std::string& room_id) const {
    return m_dir + "/" + escape_room_id(room_id) + SNAPSHOT_SUFFIX;
}

StorageStatus FileStorage::get(const std::string& room_id, std::vector<uint8_t>* out) {
    std::string path = path_for(room_id);

    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            return STORAGE_NOT_FOUND;
        }
        fprintf(stderr, "[Storage] Cannot stat %s: %s\n", path.c_str(), strerror(errno));
        return STORAGE_ERROR;
    }

    std::ifstream file(path.c_str(), std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        fprintf(stderr, "[Storage] Failed to open %s\n", path.c_str());
        return STORAGE_ERROR;
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        fprintf(stderr, "[Storage] Failed to size %s\n", path.c_str());
        return STORAGE_ERROR;
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer((size_t)size);
    if (size > 0 && !file.read((char*)&buffer[0], size)) {
        fprintf(stderr, "[Storage] Short read on %s\n", path.c_str());
        return STORAGE_ERROR;
    }

    out->swap(buffer);
    return STORAGE_OK;
}

bool FileStorage::put(const std::string& room_id, const std::vector<uint8_t>& data) {
    std::string path = path_for(room_id);
    std::string tmp_path = path + ".tmp";

    {
        std::ofstream file(tmp_path.c_str(), std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            fprintf(stderr, "[Storage] Failed to open %s for writing\n", tmp_path.c_str());
            return false;
        }
        if (!data.empty()) {
            file.write((const char*)&data[0], (std::streamsize)data.size());
        }
        file.flush();
        if (!file.good()) {
            fprintf(stderr, "[Storage] Failed to write %s\n", tmp_path.c_str());
            file.close();
            remove(tmp_path.c_str());
            return false;
        }
    }

    // Rename into place so readers never see a torn snapshot
    if (rename(tmp_path.c_str(), path.c_str()) != 0) {
        fprintf(stderr, "[Storage] Failed to move snapshot into %s: %s\n", path.c_str(), strerror(errno));
        remove(tmp_path.c_str());
        return false;
    }
    return true;
}

bool FileStorage::set_alarm(const std::string& room_id, int64_t at_ms) {
    m_alarms[room_id] = at_ms;
    return true;
}

bool FileStorage::delete_alarm(const std::string& room_id) {
    m_alarms.erase(room_id);
    return true;
}

// ----- MemoryStorage -----

MemoryStorage::MemoryStorage()
    : m_fail_reads(false), m_fail_writes(false), m_put_count(0), m_get_count(0) {}

StorageStatus MemoryStorage::get(const std::string& room_id, std::vector<uint8_t>* out) {
    m_get_count++;
    if (m_fail_reads) return STORAGE_ERROR;

    std::map<std::string, std::vector<uint8_t> >::const_iterator it = m_data.find(room_id);
    if (it == m_data.end()) return STORAGE_NOT_FOUND;

    *out = it->second;
    return STORAGE_OK;
}

bool MemoryStorage::put(const std::string& room_id, const std::vector<uint8_t>& data) {
    if (m_fail_writes) return false;

    m_put_count++;
    m_data[room_id] = data;
    return true;
}

bool MemoryStorage::set_alarm(const std::string& room_id, int64_t at_ms) {
    if (m_fail_writes) return false;
    m_alarms[room_id] = at_ms;
    return true;
}

bool MemoryStorage::delete_alarm(const std::string& room_id) {
    if (m_fail_writes) return false;
    m_alarms.erase(room_id);
    return true;
}
