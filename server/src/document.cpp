#include "document.h"
#include <stdio.h>

Document::Document() : m_doc(nullptr) {}

Document::~Document() {
    if (m_doc) {
        ydoc_destroy(m_doc);
        m_doc = nullptr;
    }
}

bool Document::init() {
    if (m_doc) return true;

    m_doc = ydoc_new();
    if (!m_doc) {
        fprintf(stderr, "[Document] Failed to create YDoc\n");
        return false;
    }
    return true;
}

bool Document::apply_update(const uint8_t* update, size_t len) {
    if (!m_doc || !update || len == 0) {
        return false;
    }

    // Try V1 format first
    YTransaction* txn = ydoc_write_transaction(m_doc, 0, nullptr);
    uint8_t err_v1 = ytransaction_apply(txn, (const char*)update, (uint32_t)len);
    ytransaction_commit(txn);

    if (err_v1 == 0) {
        return true;
    }

    // V1 failed, try V2
    txn = ydoc_write_transaction(m_doc, 0, nullptr);
    uint8_t err_v2 = ytransaction_apply_v2(txn, (const char*)update, (uint32_t)len);
    ytransaction_commit(txn);

    if (err_v2 != 0) {
        fprintf(stderr, "[Document] Failed to apply update (%zu bytes): V1 error=%d, V2 error=%d\n",
                len, err_v1, err_v2);
        return false;
    }
    return true;
}

bool Document::restore(const uint8_t* snapshot, size_t len) {
    if (!m_doc && !init()) {
        return false;
    }
    if (len == 0) {
        return true;
    }

    if (!apply_update(snapshot, len)) {
        fprintf(stderr, "[Document] Snapshot could not be restored (%zu bytes)\n", len);
        return false;
    }

    printf("[Document] Restored snapshot (%zu bytes)\n", len);
    return true;
}

std::vector<uint8_t> Document::encode_snapshot() {
    return encode_diff(nullptr, 0);
}

std::vector<uint8_t> Document::state_vector() {
    std::vector<uint8_t> result;
    if (!m_doc) return result;

    YTransaction* txn = ydoc_read_transaction(m_doc);
    uint32_t sv_len = 0;
    char* sv = ytransaction_state_vector_v1(txn, &sv_len);
    ytransaction_commit(txn);

    if (sv) {
        result.assign((const uint8_t*)sv, (const uint8_t*)sv + sv_len);
        ybinary_destroy(sv, sv_len);
    }
    return result;
}

std::vector<uint8_t> Document::encode_diff(const uint8_t* client_sv, size_t sv_len) {
    std::vector<uint8_t> result;
    if (!m_doc) return result;

    YTransaction* txn = ydoc_read_transaction(m_doc);
    uint32_t diff_len = 0;
    char* diff = ytransaction_state_diff_v1(txn, (const char*)client_sv, (uint32_t)sv_len, &diff_len);
    ytransaction_commit(txn);

    if (diff) {
        result.assign((const uint8_t*)diff, (const uint8_t*)diff + diff_len);
        ybinary_destroy(diff, diff_len);
    }
    return result;
}
