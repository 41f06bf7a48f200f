#include "protocol.h"
#include <stdio.h>
#include <string.h>
#include <memory>

// Closed set of inbound/outbound type names, indexed by EnvelopeType
static const char* const TYPE_NAMES[] = {
    "sync", "update", "awareness", "ping", "pong", "error"
};

const char* envelope_type_name(EnvelopeType type) {
    if (type < ENVELOPE_SYNC || type > ENVELOPE_ERROR) return "invalid";
    return TYPE_NAMES[type];
}

const char* decode_status_name(DecodeStatus status) {
    switch (status) {
        case DECODE_OK: return "ok";
        case DECODE_TOO_LARGE: return "too_large";
        case DECODE_NOT_TEXT: return "not_text";
        case DECODE_MALFORMED: return "malformed";
        case DECODE_MISSING_TYPE: return "missing_type";
        case DECODE_UNKNOWN_TYPE: return "unknown_type";
        case DECODE_BAD_PAYLOAD: return "bad_payload";
    }
    return "invalid";
}

// Only the five client-visible types are accepted inbound; "error" is ours
static bool parse_type(const std::string& name, EnvelopeType* type) {
    for (int t = ENVELOPE_SYNC; t <= ENVELOPE_PONG; t++) {
        if (name == TYPE_NAMES[t]) {
            *type = (EnvelopeType)t;
            return true;
        }
    }
    return false;
}

// JSON array of integers 0..255 -> bytes
static bool decode_byte_array(const Json::Value& value, std::vector<uint8_t>* out) {
    if (!value.isArray()) return false;

    std::vector<uint8_t> bytes;
    bytes.reserve(value.size());

    for (Json::ArrayIndex i = 0; i < value.size(); i++) {
        const Json::Value& item = value[i];
        // isUInt is false for negatives, fractions and anything past 32 bits
        if (!item.isUInt() || item.asUInt() > 255) return false;
        bytes.push_back((uint8_t)item.asUInt());
    }

    out->swap(bytes);
    return true;
}

static Json::Value encode_byte_array(const std::vector<uint8_t>& bytes) {
    Json::Value array(Json::arrayValue);
    array.resize((Json::ArrayIndex)bytes.size());
    for (size_t i = 0; i < bytes.size(); i++) {
        array[(Json::ArrayIndex)i] = (Json::UInt)bytes[i];
    }
    return array;
}

DecodeStatus decode_envelope(const char* data, size_t len, bool binary,
                             size_t max_size, Envelope* out) {
    if (len > max_size) return DECODE_TOO_LARGE;
    if (binary) return DECODE_NOT_TEXT;
    if (!data || len == 0) return DECODE_MALFORMED;

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    try {
        if (!reader->parse(data, data + len, &root, &errors)) {
            return DECODE_MALFORMED;
        }
    } catch (const Json::Exception& e) {
        // Nesting past the reader's stack limit
        fprintf(stderr, "[Protocol] Parse aborted: %s\n", e.what());
        return DECODE_MALFORMED;
    }
    if (!root.isObject()) return DECODE_MALFORMED;

    const Json::Value& type_field = root["type"];
    if (!type_field.isString()) return DECODE_MISSING_TYPE;

    Envelope envelope;
    if (!parse_type(type_field.asString(), &envelope.type)) {
        return DECODE_UNKNOWN_TYPE;
    }

    try {
        switch (envelope.type) {
            case ENVELOPE_SYNC:
                if (!decode_byte_array(root["state"], &envelope.bytes)) return DECODE_BAD_PAYLOAD;
                break;
            case ENVELOPE_UPDATE:
                if (!decode_byte_array(root["update"], &envelope.bytes)) return DECODE_BAD_PAYLOAD;
                break;
            case ENVELOPE_AWARENESS:
                if (root["state"].isNull()) return DECODE_BAD_PAYLOAD;
                envelope.state = root["state"];
                break;
            default:
                break;
        }
    } catch (const Json::Exception& e) {
        fprintf(stderr, "[Protocol] Bad payload: %s\n", e.what());
        return DECODE_BAD_PAYLOAD;
    }

    *out = envelope;
    return DECODE_OK;
}

std::string encode_envelope(const Envelope& envelope) {
    Json::Value root(Json::objectValue);
    root["type"] = envelope_type_name(envelope.type);

    switch (envelope.type) {
        case ENVELOPE_SYNC:
            root["state"] = encode_byte_array(envelope.bytes);
            break;
        case ENVELOPE_UPDATE:
            root["update"] = encode_byte_array(envelope.bytes);
            break;
        case ENVELOPE_AWARENESS:
            root["state"] = envelope.state;
            break;
        case ENVELOPE_ERROR:
            root["message"] = envelope.message;
            break;
        default:
            break;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

std::string encode_sync(const std::vector<uint8_t>& state) {
    Envelope envelope;
    envelope.type = ENVELOPE_SYNC;
    envelope.bytes = state;
    return encode_envelope(envelope);
}

std::string encode_update(const std::vector<uint8_t>& update) {
    Envelope envelope;
    envelope.type = ENVELOPE_UPDATE;
    envelope.bytes = update;
    return encode_envelope(envelope);
}

std::string encode_awareness(const Json::Value& state) {
    Envelope envelope;
    envelope.type = ENVELOPE_AWARENESS;
    envelope.state = state;
    return encode_envelope(envelope);
}

std::string encode_ping() {
    Envelope envelope;
    envelope.type = ENVELOPE_PING;
    return encode_envelope(envelope);
}

std::string encode_pong() {
    Envelope envelope;
    envelope.type = ENVELOPE_PONG;
    return encode_envelope(envelope);
}

std::string encode_error(const std::string& message) {
    Envelope envelope;
    envelope.type = ENVELOPE_ERROR;
    envelope.message = message;
    return encode_envelope(envelope);
}

std::string room_id_from_path(const std::string& path) {
    size_t begin = 0;
    if (!path.empty() && path[0] == '/') begin = 1;

    size_t end = path.find('?', begin);
    if (end == std::string::npos) end = path.size();

    return path.substr(begin, end - begin);
}
