#ifndef CONFIG_H
#define CONFIG_H

#include <stddef.h>
#include <stdint.h>
#include <string>

// Per-room limits and timings
struct RoomConfig {
    size_t max_sessions;            // Connection cap per room
    size_t max_message_size;        // Largest inbound envelope in bytes
    int64_t heartbeat_interval_ms;  // Probe period
    int64_t heartbeat_timeout_ms;   // Silence before a session is pruned
    int64_t idle_timeout_ms;        // Delay between last departure and eviction

    RoomConfig();
};

struct ServerConfig {
    int port;
    std::string data_dir;
    bool in_memory;            // Keep snapshots in process memory only
    size_t max_send_backlog;   // Bytes queued per connection before sends fail
    RoomConfig room;

    ServerConfig();
};

// Parse command line into config. Prints the problem and returns false on
// invalid input. Sets *show_help when --help was given.
bool parse_server_args(int argc, char* argv[], ServerConfig* config, bool* show_help);

// Check ranges and the relation between heartbeat interval and timeout
bool validate_config(const ServerConfig& config);

void print_usage(const char* argv0);

#endif // CONFIG_H
