#ifndef DOCUMENT_H
#define DOCUMENT_H

#include <stddef.h>
#include <stdint.h>
#include <vector>

extern "C" {
#include <libyrs.h>
}

// Opaque mergeable canvas state backed by a Yrs document. The coordinator
// never looks inside; it only merges deltas and encodes snapshots.
class Document {
public:
    Document();
    ~Document();

    bool init();
    bool is_initialized() const { return m_doc != nullptr; }

    // Merge an update delta (v1, falling back to v2). Duplicate and
    // out-of-order deltas are accepted; returns false only when the bytes
    // cannot be decoded as an update.
    bool apply_update(const uint8_t* update, size_t len);

    // Initialize from a previously encoded snapshot, before serving
    bool restore(const uint8_t* snapshot, size_t len);

    // Full state as a single update, enough to build a replica from empty
    std::vector<uint8_t> encode_snapshot();

    // What we have, for differential sync
    std::vector<uint8_t> state_vector();

    // Everything a replica at client_sv is missing
    std::vector<uint8_t> encode_diff(const uint8_t* client_sv, size_t sv_len);

private:
    Document(const Document&);
    Document& operator=(const Document&);

    YDoc* m_doc;
};

#endif // DOCUMENT_H
