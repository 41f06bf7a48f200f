#include "config.h"

#include <gtest/gtest.h>

#include <vector>

namespace {

bool parse(std::vector<const char*> args, ServerConfig* config, bool* help) {
    args.insert(args.begin(), "canvas_room_server");
    return parse_server_args((int)args.size(), const_cast<char**>(args.data()), config, help);
}

}  // namespace

TEST(Config, defaults_match_room_limits) {
    ServerConfig config;
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.room.max_sessions, 50u);
    EXPECT_EQ(config.room.max_message_size, 2u * 1024 * 1024);
    EXPECT_EQ(config.room.heartbeat_interval_ms, 60000);
    EXPECT_EQ(config.room.heartbeat_timeout_ms, 90000);
    EXPECT_EQ(config.room.idle_timeout_ms, 300000);
    EXPECT_TRUE(validate_config(config));
}

TEST(Config, positional_port) {
    ServerConfig config;
    bool help = false;
    ASSERT_TRUE(parse({"8080"}, &config, &help));
    EXPECT_EQ(config.port, 8080);
    EXPECT_FALSE(help);
}

TEST(Config, options) {
    ServerConfig config;
    bool help = false;
    ASSERT_TRUE(parse({"--port", "7000", "--data-dir", "/var/lib/rooms", "--max-sessions", "5",
                       "--heartbeat-interval", "1000", "--heartbeat-timeout", "1500",
                       "--idle-timeout", "2000", "--max-message-size", "1024",
                       "--max-send-backlog", "4096"},
                      &config, &help));
    EXPECT_EQ(config.port, 7000);
    EXPECT_EQ(config.data_dir, "/var/lib/rooms");
    EXPECT_EQ(config.room.max_sessions, 5u);
    EXPECT_EQ(config.room.heartbeat_interval_ms, 1000);
    EXPECT_EQ(config.room.heartbeat_timeout_ms, 1500);
    EXPECT_EQ(config.room.idle_timeout_ms, 2000);
    EXPECT_EQ(config.room.max_message_size, 1024u);
    EXPECT_EQ(config.max_send_backlog, 4096u);
}

TEST(Config, memory_flag_and_help) {
    ServerConfig config;
    bool help = false;
    ASSERT_TRUE(parse({"--memory"}, &config, &help));
    EXPECT_TRUE(config.in_memory);

    ASSERT_TRUE(parse({"--help"}, &config, &help));
    EXPECT_TRUE(help);
}

TEST(Config, rejects_bad_values) {
    ServerConfig config;
    bool help = false;
    EXPECT_FALSE(parse({"70000"}, &config, &help));
    EXPECT_FALSE(parse({"--port", "abc"}, &config, &help));
    EXPECT_FALSE(parse({"--max-sessions", "0"}, &config, &help));
    EXPECT_FALSE(parse({"--idle-timeout", "-5"}, &config, &help));
    EXPECT_FALSE(parse({"--port"}, &config, &help));
    EXPECT_FALSE(parse({"--unknown", "1"}, &config, &help));
}

TEST(Config, heartbeat_timeout_must_cover_interval) {
    ServerConfig config;
    bool help = false;
    EXPECT_FALSE(parse({"--heartbeat-interval", "5000", "--heartbeat-timeout", "1000"}, &config, &help));
}
