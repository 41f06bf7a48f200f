#ifndef TEST_SUPPORT_H
#define TEST_SUPPORT_H

#include <stdint.h>
#include <string>
#include <vector>

#include "connection.h"
#include "protocol.h"

extern "C" {
#include <libyrs.h>
}

// Records everything the room sends; can be told to refuse sends
class FakeConnection : public Connection {
public:
    FakeConnection() : closed(false), close_code(0), fail_sends(false) {}

    bool send(const std::string& message) {
        if (closed || fail_sends) return false;
        sent.push_back(message);
        return true;
    }

    void close(uint16_t code, const std::string& reason) {
        if (closed) return;
        closed = true;
        close_code = code;
        close_reason = reason;
    }

    // Decoded envelopes of the given type, in send order
    std::vector<Envelope> received(EnvelopeType type) const {
        std::vector<Envelope> out;
        for (size_t i = 0; i < sent.size(); i++) {
            Envelope env;
            if (decode_raw(sent[i], &env) && env.type == type) out.push_back(env);
        }
        return out;
    }

    size_t count(EnvelopeType type) const { return received(type).size(); }

    // Outbound "error" envelopes are not accepted by the inbound decoder
    size_t error_count() const {
        size_t n = 0;
        for (size_t i = 0; i < sent.size(); i++) {
            if (sent[i].find("\"type\":\"error\"") != std::string::npos) n++;
        }
        return n;
    }

    std::vector<std::string> sent;
    bool closed;
    uint16_t close_code;
    std::string close_reason;
    bool fail_sends;

private:
    static bool decode_raw(const std::string& raw, Envelope* env) {
        return decode_envelope(raw.data(), raw.size(), false, raw.size() + 1, env) == DECODE_OK;
    }
};

// Client-side Yrs replica with a shared text, producing real update deltas
class TextReplica {
public:
    explicit TextReplica(uint64_t client_id) {
        YOptions options = yoptions();
        options.id = client_id;
        m_doc = ydoc_new_with_options(options);
        m_text = ytext(m_doc, "canvas");
    }

    ~TextReplica() { ydoc_destroy(m_doc); }

    // Insert and return the delta describing just this change
    std::vector<uint8_t> insert(uint32_t index, const std::string& value) {
        std::vector<uint8_t> before = state_vector();

        YTransaction* txn = ydoc_write_transaction(m_doc, 0, nullptr);
        ytext_insert(m_text, txn, index, value.c_str(), nullptr);
        ytransaction_commit(txn);

        YTransaction* read = ydoc_read_transaction(m_doc);
        uint32_t len = 0;
        char* diff = ytransaction_state_diff_v1(read, (const char*)before.data(),
                                                (uint32_t)before.size(), &len);
        ytransaction_commit(read);
        return take(diff, len);
    }

    bool apply(const std::vector<uint8_t>& update) {
        if (update.empty()) return true;
        YTransaction* txn = ydoc_write_transaction(m_doc, 0, nullptr);
        uint8_t err = ytransaction_apply(txn, (const char*)update.data(), (uint32_t)update.size());
        ytransaction_commit(txn);
        return err == 0;
    }

    std::string text() {
        YTransaction* txn = ydoc_read_transaction(m_doc);
        char* content = ytext_string(m_text, txn);
        std::string result = content ? content : "";
        if (content) ystring_destroy(content);
        ytransaction_commit(txn);
        return result;
    }

    std::vector<uint8_t> state_vector() {
        YTransaction* txn = ydoc_read_transaction(m_doc);
        uint32_t len = 0;
        char* sv = ytransaction_state_vector_v1(txn, &len);
        ytransaction_commit(txn);
        return take(sv, len);
    }

private:
    TextReplica(const TextReplica&);
    TextReplica& operator=(const TextReplica&);

    static std::vector<uint8_t> take(char* data, uint32_t len) {
        std::vector<uint8_t> out;
        if (data) {
            out.assign((const uint8_t*)data, (const uint8_t*)data + len);
            ybinary_destroy(data, len);
        }
        return out;
    }

    YDoc* m_doc;
    Branch* m_text;
};

// Text held by a snapshot, read through a fresh replica
inline std::string snapshot_text(const std::vector<uint8_t>& snapshot) {
    TextReplica reader(999);
    reader.apply(snapshot);
    return reader.text();
}

#endif // TEST_SUPPORT_H
