#include "config.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>

static const size_t DEFAULT_MAX_SESSIONS = 50;
static const size_t DEFAULT_MAX_MESSAGE_SIZE = 2 * 1024 * 1024;  // 2 MiB
static const int64_t DEFAULT_HEARTBEAT_INTERVAL_MS = 60 * 1000;
static const int64_t DEFAULT_HEARTBEAT_TIMEOUT_MS = 90 * 1000;
static const int64_t DEFAULT_IDLE_TIMEOUT_MS = 5 * 60 * 1000;
static const size_t DEFAULT_MAX_SEND_BACKLOG = 8 * 1024 * 1024;

RoomConfig::RoomConfig()
    : max_sessions(DEFAULT_MAX_SESSIONS),
      max_message_size(DEFAULT_MAX_MESSAGE_SIZE),
      heartbeat_interval_ms(DEFAULT_HEARTBEAT_INTERVAL_MS),
      heartbeat_timeout_ms(DEFAULT_HEARTBEAT_TIMEOUT_MS),
      idle_timeout_ms(DEFAULT_IDLE_TIMEOUT_MS) {}

ServerConfig::ServerConfig()
    : port(9000),
      data_dir("data"),
      in_memory(false),
      max_send_backlog(DEFAULT_MAX_SEND_BACKLOG) {}

// Parse a positive decimal integer; rejects trailing garbage
static bool parse_positive(const char* text, long long* out) {
    if (!text || !*text) return false;

    errno = 0;
    char* end = nullptr;
    long long value = strtoll(text, &end, 10);
    if (errno != 0 || *end != '\0' || value <= 0) {
        return false;
    }

    *out = value;
    return true;
}

static bool parse_port(const char* text, int* port) {
    long long value = 0;
    if (!parse_positive(text, &value) || value > 65535) {
        fprintf(stderr, "[Config] Invalid port: %s\n", text);
        return false;
    }
    *port = (int)value;
    return true;
}

bool parse_server_args(int argc, char* argv[], ServerConfig* config, bool* show_help) {
    *show_help = false;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
            *show_help = true;
            return true;
        }
        if (strcmp(arg, "--memory") == 0) {
            config->in_memory = true;
            continue;
        }
        if (arg[0] != '-') {
            // Bare positional port
            if (!parse_port(arg, &config->port)) return false;
            continue;
        }

        if (i + 1 >= argc) {
            fprintf(stderr, "[Config] Missing value for %s\n", arg);
            return false;
        }
        const char* value = argv[++i];
        long long number = 0;
        bool valid = true;

        if (strcmp(arg, "--port") == 0) {
            if (!parse_port(value, &config->port)) return false;
        } else if (strcmp(arg, "--data-dir") == 0) {
            if (!*value) {
                fprintf(stderr, "[Config] Empty data directory\n");
                return false;
            }
            config->data_dir = value;
        } else if (strcmp(arg, "--max-sessions") == 0) {
            valid = parse_positive(value, &number);
            if (valid) config->room.max_sessions = (size_t)number;
        } else if (strcmp(arg, "--max-message-size") == 0) {
            valid = parse_positive(value, &number);
            if (valid) config->room.max_message_size = (size_t)number;
        } else if (strcmp(arg, "--heartbeat-interval") == 0) {
            valid = parse_positive(value, &number);
            if (valid) config->room.heartbeat_interval_ms = number;
        } else if (strcmp(arg, "--heartbeat-timeout") == 0) {
            valid = parse_positive(value, &number);
            if (valid) config->room.heartbeat_timeout_ms = number;
        } else if (strcmp(arg, "--idle-timeout") == 0) {
            valid = parse_positive(value, &number);
            if (valid) config->room.idle_timeout_ms = number;
        } else if (strcmp(arg, "--max-send-backlog") == 0) {
            valid = parse_positive(value, &number);
            if (valid) config->max_send_backlog = (size_t)number;
        } else {
            fprintf(stderr, "[Config] Unknown option: %s\n", arg);
            return false;
        }

        if (!valid) {
            fprintf(stderr, "[Config] Invalid value for %s: %s\n", arg, value);
            return false;
        }
    }

    return validate_config(*config);
}

bool validate_config(const ServerConfig& config) {
    if (config.port <= 0 || config.port > 65535) {
        fprintf(stderr, "[Config] Port out of range: %d\n", config.port);
        return false;
    }
    if (config.room.max_sessions == 0 || config.room.max_message_size == 0 ||
        config.max_send_backlog == 0) {
        fprintf(stderr, "[Config] Limits must be greater than zero\n");
        return false;
    }
    if (config.room.heartbeat_interval_ms <= 0 || config.room.idle_timeout_ms <= 0) {
        fprintf(stderr, "[Config] Durations must be greater than zero\n");
        return false;
    }
    if (config.room.heartbeat_timeout_ms < config.room.heartbeat_interval_ms) {
        fprintf(stderr, "[Config] Heartbeat timeout (%lld ms) is shorter than the interval (%lld ms)\n",
                (long long)config.room.heartbeat_timeout_ms,
                (long long)config.room.heartbeat_interval_ms);
        return false;
    }
    if (!config.in_memory && config.data_dir.empty()) {
        fprintf(stderr, "[Config] Data directory required unless --memory is set\n");
        return false;
    }
    return true;
}

void print_usage(const char* argv0) {
    fprintf(stderr,
            "Usage: %s [port] [options]\n"
            "  --port N                  Listen port (default 9000)\n"
            "  --data-dir DIR            Snapshot directory (default ./data)\n"
            "  --memory                  Keep snapshots in memory only\n"
            "  --max-sessions N          Connections per room (default 50)\n"
            "  --max-message-size BYTES  Largest inbound message (default 2097152)\n"
            "  --heartbeat-interval MS   Liveness probe period (default 60000)\n"
            "  --heartbeat-timeout MS    Silence before pruning (default 90000)\n"
            "  --idle-timeout MS         Eviction delay once a room empties (default 300000)\n"
            "  --max-send-backlog BYTES  Pending bytes per connection (default 8388608)\n",
            argv0);
}
