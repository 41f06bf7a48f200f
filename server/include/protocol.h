#ifndef PROTOCOL_H
#define PROTOCOL_H

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>
#include <json/json.h>

// Envelope discriminants. ENVELOPE_ERROR is outbound only.
enum EnvelopeType {
    ENVELOPE_SYNC = 0,       // Full snapshot, server -> client on admission
    ENVELOPE_UPDATE = 1,     // CRDT delta
    ENVELOPE_AWARENESS = 2,  // Ephemeral presence, relayed verbatim
    ENVELOPE_PING = 3,
    ENVELOPE_PONG = 4,
    ENVELOPE_ERROR = 5
};

enum DecodeStatus {
    DECODE_OK = 0,
    DECODE_TOO_LARGE,     // Exceeds the size limit
    DECODE_NOT_TEXT,      // Binary frame
    DECODE_MALFORMED,     // Not a JSON object
    DECODE_MISSING_TYPE,  // No string "type" field
    DECODE_UNKNOWN_TYPE,  // "type" outside the closed set
    DECODE_BAD_PAYLOAD    // Payload shape does not match the type
};

struct Envelope {
    EnvelopeType type;
    std::vector<uint8_t> bytes;  // "state" for sync, "update" for update
    Json::Value state;           // Opaque awareness state
    std::string message;         // Error text

    Envelope() : type(ENVELOPE_PING) {}
};

// Parse and validate a raw inbound message. Size is checked before anything
// else; *out is only filled on DECODE_OK.
DecodeStatus decode_envelope(const char* data, size_t len, bool binary,
                             size_t max_size, Envelope* out);

// Serialize an envelope to compact JSON text
std::string encode_envelope(const Envelope& envelope);

std::string encode_sync(const std::vector<uint8_t>& state);
std::string encode_update(const std::vector<uint8_t>& update);
std::string encode_awareness(const Json::Value& state);
std::string encode_ping();
std::string encode_pong();
std::string encode_error(const std::string& message);

// Room id from a request path: leading '/' and any query string removed
std::string room_id_from_path(const std::string& path);

const char* envelope_type_name(EnvelopeType type);
const char* decode_status_name(DecodeStatus status);

#endif // PROTOCOL_H
