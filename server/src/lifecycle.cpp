#include "lifecycle.h"
#include "document.h"
#include "storage.h"
#include <stdio.h>
#include <vector>

LifecycleManager::LifecycleManager(const std::string& room_id, Storage* storage, int64_t idle_timeout_ms)
    : m_room_id(room_id),
      m_storage(storage),
      m_idle_timeout_ms(idle_timeout_ms),
      m_eviction_scheduled(false),
      m_eviction_at_ms(0),
      m_persist_failures(0) {}

bool LifecycleManager::restore(Document& doc) {
    std::vector<uint8_t> snapshot;
    StorageStatus status = m_storage->get(m_room_id, &snapshot);

    if (status == STORAGE_NOT_FOUND) {
        printf("[Lifecycle] Room %s: no saved snapshot (starting fresh)\n", m_room_id.c_str());
        return true;
    }
    if (status != STORAGE_OK) {
        fprintf(stderr, "[Lifecycle] Room %s: failed to read snapshot\n", m_room_id.c_str());
        return false;
    }

    if (!doc.restore(snapshot.empty() ? nullptr : &snapshot[0], snapshot.size())) {
        fprintf(stderr, "[Lifecycle] Room %s: stored snapshot is unreadable (%zu bytes)\n",
                m_room_id.c_str(), snapshot.size());
        return false;
    }

    printf("[Lifecycle] Room %s: restored snapshot (%zu bytes)\n", m_room_id.c_str(), snapshot.size());
    return true;
}

void LifecycleManager::cancel_eviction() {
    if (!m_storage->delete_alarm(m_room_id)) {
        // A stale alarm is harmless: the fire re-checks for live sessions
        fprintf(stderr, "[Lifecycle] Room %s: failed to delete eviction alarm\n", m_room_id.c_str());
    }
    if (m_eviction_scheduled) {
        printf("[Lifecycle] Room %s: eviction cancelled\n", m_room_id.c_str());
    }
    m_eviction_scheduled = false;
    m_eviction_at_ms = 0;
}

bool LifecycleManager::persist(Document& doc) {
    std::vector<uint8_t> snapshot = doc.encode_snapshot();

    if (!m_storage->put(m_room_id, snapshot)) {
        m_persist_failures++;
        fprintf(stderr, "[Lifecycle] Room %s: persist failed (%zu bytes), will retry\n",
                m_room_id.c_str(), snapshot.size());
        return false;
    }

    printf("[Lifecycle] Room %s: persisted snapshot (%zu bytes)\n", m_room_id.c_str(), snapshot.size());
    return true;
}

void LifecycleManager::schedule_eviction(int64_t now_ms) {
    int64_t at_ms = now_ms + m_idle_timeout_ms;

    if (!m_storage->set_alarm(m_room_id, at_ms)) {
        fprintf(stderr, "[Lifecycle] Room %s: failed to set eviction alarm, holding deadline in memory\n",
                m_room_id.c_str());
        m_eviction_scheduled = false;
        m_eviction_at_ms = at_ms;
        return;
    }

    m_eviction_scheduled = true;
    m_eviction_at_ms = at_ms;
    printf("[Lifecycle] Room %s: eviction in %lld ms\n", m_room_id.c_str(), (long long)m_idle_timeout_ms);
}

void LifecycleManager::on_empty(Document& doc, int64_t now_ms) {
    persist(doc);
    schedule_eviction(now_ms);
}

bool LifecycleManager::on_alarm(Document& doc, bool registry_empty, int64_t now_ms) {
    m_eviction_scheduled = false;

    if (!registry_empty) {
        printf("[Lifecycle] Room %s: eviction alarm ignored, sessions present\n", m_room_id.c_str());
        return false;
    }

    if (!persist(doc)) {
        schedule_eviction(now_ms);
        return false;
    }

    printf("[Lifecycle] Room %s: ready for eviction\n", m_room_id.c_str());
    return true;
}
