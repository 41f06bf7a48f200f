#include "server.h"
#include "lws_connection.h"
#include "protocol.h"
#include "room_directory.h"
#include "storage.h"
#include <libwebsockets.h>
#include <stdio.h>
#include <string.h>
#include <signal.h>
#include <chrono>
#include <memory>
#include <string>

static volatile sig_atomic_t g_running = 1;

// Forwarded by the authenticating proxy in front of us
static const char IDENTITY_HEADER[] = "x-ws-user-id:";

static const size_t MAX_ROOM_ID = 255;
static const size_t MAX_IDENTITY = 255;

// Per-connection state kept by libwebsockets
struct SessionData {
    LwsConnection* conn;
    char room_id[MAX_ROOM_ID + 1];
    char identity[MAX_IDENTITY + 1];
};

// Reached through the context user pointer
struct ServerState {
    RoomDirectory* directory;
    const ServerConfig* config;
};

static int64_t now_ms() {
    return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void signal_handler(int sig) {
    (void)sig;
    g_running = 0;
}

static ServerState* server_state(struct lws* wsi) {
    return (ServerState*)lws_context_user(lws_get_context(wsi));
}

// Validate the upgrade before it is accepted. Fills room id and identity.
static int filter_connection(struct lws* wsi, SessionData* pss) {
    ServerState* state = server_state(wsi);
    memset(pss, 0, sizeof(*pss));

    char uri[1024];
    int uri_len = lws_hdr_copy(wsi, uri, sizeof(uri), WSI_TOKEN_GET_URI);
    std::string room_id = uri_len > 0 ? room_id_from_path(uri) : std::string();

    int id_len = lws_hdr_custom_copy(wsi, pss->identity, sizeof(pss->identity),
                                     IDENTITY_HEADER, (int)strlen(IDENTITY_HEADER));
    if (id_len < 0) {
        pss->identity[0] = '\0';
    }

    if (room_id.size() > MAX_ROOM_ID) {
        printf("[Server] Rejected upgrade: room id too long (%zu bytes)\n", room_id.size());
        return -1;
    }

    AdmitStatus status = state->directory->precheck(room_id, pss->identity);
    if (status != ADMIT_OK) {
        printf("[Server] Rejected upgrade for '%s': %s\n", room_id.c_str(), admit_status_name(status));
        return -1;
    }

    memcpy(pss->room_id, room_id.c_str(), room_id.size() + 1);
    return 0;
}

static int callback_canvas(struct lws* wsi, enum lws_callback_reasons reason,
                           void* user, void* in, size_t len) {
    SessionData* pss = (SessionData*)user;

    switch (reason) {
        case LWS_CALLBACK_FILTER_PROTOCOL_CONNECTION:
            return filter_connection(wsi, pss);

        case LWS_CALLBACK_ESTABLISHED: {
            ServerState* state = server_state(wsi);
            pss->conn = new LwsConnection(wsi, state->config->max_send_backlog);

            AdmitStatus status = state->directory->admit(pss->room_id, pss->conn, pss->identity, now_ms());
            if (status != ADMIT_OK) {
                const char* name = admit_status_name(status);
                lws_close_reason(wsi, LWS_CLOSE_STATUS_POLICY_VIOLATION,
                                 (unsigned char*)name, strlen(name));
                delete pss->conn;
                pss->conn = nullptr;
                return -1;
            }
            break;
        }

        case LWS_CALLBACK_RECEIVE: {
            if (!pss || !pss->conn) break;

            ServerState* state = server_state(wsi);
            bool final = lws_is_final_fragment(wsi) != 0;
            bool binary = lws_frame_is_binary(wsi) != 0;

            if (pss->conn->on_fragment((const char*)in, len, final, binary,
                                       state->config->room.max_message_size)) {
                const std::string& msg = pss->conn->message();
                state->directory->dispatch(pss->room_id, pss->conn, msg.data(), msg.size(),
                                           pss->conn->message_is_binary(), now_ms());
            }
            break;
        }

        case LWS_CALLBACK_SERVER_WRITEABLE:
            if (!pss || !pss->conn) break;
            return pss->conn->on_writable();

        case LWS_CALLBACK_CLOSED: {
            if (!pss || !pss->conn) break;

            ServerState* state = server_state(wsi);
            state->directory->disconnect(pss->room_id, pss->conn, now_ms());
            delete pss->conn;
            pss->conn = nullptr;
            break;
        }

        default:
            break;
    }

    return 0;
}

static struct lws_protocols protocols[] = {
    {
        "canvas-room",
        callback_canvas,
        sizeof(SessionData),
        4096,
        0, nullptr, 0
    },
    { nullptr, nullptr, 0, 0, 0, nullptr, 0 }
};

int server_run(const ServerConfig& config) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    lws_set_log_level(LLL_ERR | LLL_WARN, nullptr);

    // Snapshot storage
    std::unique_ptr<Storage> storage;
    if (config.in_memory) {
        storage.reset(new MemoryStorage());
        printf("[Server] Snapshots kept in memory only\n");
    } else {
        FileStorage* files = new FileStorage(config.data_dir);
        storage.reset(files);
        if (!files->init()) {
            fprintf(stderr, "[Server] Failed to initialize storage\n");
            return 1;
        }
    }

    RoomDirectory directory(storage.get(), config.room);
    ServerState state;
    state.directory = &directory;
    state.config = &config;

    // Create WebSocket context
    struct lws_context_creation_info info;
    memset(&info, 0, sizeof(info));
    info.port = config.port;
    info.protocols = protocols;
    info.gid = -1;
    info.uid = -1;
    info.user = &state;
    // No UTF-8 validation: malformed text must reach the codec, not close the socket
    info.options = LWS_SERVER_OPTION_EXPLICIT_VHOSTS;

    struct lws_context* context = lws_create_context(&info);
    if (!context) {
        fprintf(stderr, "[Server] Failed to create context\n");
        return 1;
    }

    struct lws_vhost* vhost = lws_create_vhost(context, &info);
    if (!vhost) {
        fprintf(stderr, "[Server] Failed to create vhost\n");
        lws_context_destroy(context);
        return 1;
    }

    printf("[Server] Listening on port %d\n", config.port);
    printf("[Server] Limits: %zu sessions/room, %zu byte messages, heartbeat %lld/%lld ms, idle eviction %lld ms\n",
           config.room.max_sessions, config.room.max_message_size,
           (long long)config.room.heartbeat_interval_ms, (long long)config.room.heartbeat_timeout_ms,
           (long long)config.room.idle_timeout_ms);

    // Main event loop
    while (g_running) {
        lws_service(context, 50);
        directory.poll(now_ms());
    }

    printf("\n[Server] Shutting down (%zu active room(s))...\n", directory.room_count());

    // Persist before the sockets go away; closes arriving later find no room
    directory.shutdown();
    lws_context_destroy(context);

    printf("[Server] Shutdown complete\n");
    return 0;
}
