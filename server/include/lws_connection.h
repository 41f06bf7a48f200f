#ifndef LWS_CONNECTION_H
#define LWS_CONNECTION_H

#include <libwebsockets.h>
#include <omp.h>
#include <stddef.h>
#include <stdint.h>
#include <deque>
#include <string>

#include "connection.h"

// Connection over a libwebsockets socket. Outbound text is queued under a
// lock and written from the writable callback, one message per callback.
class LwsConnection : public Connection {
public:
    LwsConnection(struct lws* wsi, size_t max_backlog);
    ~LwsConnection();

    bool send(const std::string& message);
    void close(uint16_t code, const std::string& reason);

    // LWS_CALLBACK_SERVER_WRITEABLE. Returns -1 when lws should close.
    int on_writable();

    // Feed one received chunk. Returns true when a whole message is ready
    // in message(). At most limit + 1 bytes are kept, which is enough for
    // the size check to reject it.
    bool on_fragment(const char* data, size_t len, bool final, bool binary, size_t limit);

    const std::string& message() const { return m_rx; }
    bool message_is_binary() const { return m_rx_binary; }

private:
    LwsConnection(const LwsConnection&);
    LwsConnection& operator=(const LwsConnection&);

    struct lws* m_wsi;
    size_t m_max_backlog;

    omp_lock_t m_lock;  // Guards everything below up to m_rx
    std::deque<std::string> m_pending;
    size_t m_pending_bytes;
    bool m_closing;
    uint16_t m_close_code;
    std::string m_close_reason;

    std::string m_rx;
    bool m_rx_binary;
    bool m_rx_done;  // Previous message was handed out
};

#endif // LWS_CONNECTION_H
