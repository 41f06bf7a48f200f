#ifndef LIFECYCLE_H
#define LIFECYCLE_H

#include <stdint.h>
#include <string>

class Document;
class Storage;

// Snapshot persistence and idle-eviction scheduling for one room
class LifecycleManager {
public:
    LifecycleManager(const std::string& room_id, Storage* storage, int64_t idle_timeout_ms);

    // Load the stored snapshot, if any, into a fresh document.
    // Returns false when storage failed or the snapshot would not decode;
    // the room must not serve in that case.
    bool restore(Document& doc);

    // First session arrived while draining: drop the pending eviction
    void cancel_eviction();

    // Last session left: persist, then arm the eviction alarm
    void on_empty(Document& doc, int64_t now_ms);

    // Eviction alarm fired. Returns true when the room may be torn down.
    // With live sessions the fire is a no-op; when the final persist fails
    // the alarm is re-armed and the room stays.
    bool on_alarm(Document& doc, bool registry_empty, int64_t now_ms);

    bool persist(Document& doc);

    // Arming the alarm failed and its intended time has passed
    bool unarmed_deadline_passed(int64_t now_ms) const {
        return !m_eviction_scheduled && m_eviction_at_ms != 0 && now_ms >= m_eviction_at_ms;
    }

    bool eviction_scheduled() const { return m_eviction_scheduled; }
    int64_t eviction_at_ms() const { return m_eviction_at_ms; }
    size_t persist_failures() const { return m_persist_failures; }

private:
    void schedule_eviction(int64_t now_ms);

    std::string m_room_id;
    Storage* m_storage;
    int64_t m_idle_timeout_ms;
    bool m_eviction_scheduled;
    int64_t m_eviction_at_ms;
    size_t m_persist_failures;
};

#endif // LIFECYCLE_H
