#include "lws_connection.h"
#include <stdio.h>
#include <string.h>
#include <vector>

LwsConnection::LwsConnection(struct lws* wsi, size_t max_backlog)
    : m_wsi(wsi),
      m_max_backlog(max_backlog),
      m_pending_bytes(0),
      m_closing(false),
      m_close_code(LWS_CLOSE_STATUS_NORMAL),
      m_rx_binary(false),
      m_rx_done(true) {
    omp_init_lock(&m_lock);
}

LwsConnection::~LwsConnection() {
    omp_destroy_lock(&m_lock);
}

bool LwsConnection::send(const std::string& message) {
    omp_set_lock(&m_lock);

    if (m_closing) {
        omp_unset_lock(&m_lock);
        return false;
    }
    if (m_pending_bytes + message.size() > m_max_backlog) {
        omp_unset_lock(&m_lock);
        fprintf(stderr, "[Server] Peer backlog full (%zu bytes pending), send refused\n", m_pending_bytes);
        return false;
    }

    m_pending.push_back(message);
    m_pending_bytes += message.size();

    omp_unset_lock(&m_lock);

    // Request writable callback
    lws_callback_on_writable(m_wsi);
    return true;
}

void LwsConnection::close(uint16_t code, const std::string& reason) {
    omp_set_lock(&m_lock);

    if (m_closing) {
        omp_unset_lock(&m_lock);
        return;
    }
    m_closing = true;
    m_close_code = code;
    m_close_reason = reason;

    // Nothing else goes out once closing
    m_pending.clear();
    m_pending_bytes = 0;

    omp_unset_lock(&m_lock);

    lws_callback_on_writable(m_wsi);
}

int LwsConnection::on_writable() {
    omp_set_lock(&m_lock);

    if (m_closing) {
        uint16_t code = m_close_code;
        std::string reason = m_close_reason;
        omp_unset_lock(&m_lock);

        // Close reason payload is limited to 123 bytes
        if (reason.size() > 123) reason.resize(123);
        lws_close_reason(m_wsi, (enum lws_close_status)code,
                         (unsigned char*)&reason[0], reason.size());
        return -1;
    }

    if (m_pending.empty()) {
        omp_unset_lock(&m_lock);
        return 0;
    }

    std::string msg;
    msg.swap(m_pending.front());
    m_pending.pop_front();
    m_pending_bytes -= msg.size();
    bool more = !m_pending.empty();

    omp_unset_lock(&m_lock);

    // Allocate buffer with LWS_PRE space
    std::vector<unsigned char> buf(LWS_PRE + msg.size());
    if (!msg.empty()) {
        memcpy(&buf[LWS_PRE], msg.data(), msg.size());
    }

    int written = lws_write(m_wsi, &buf[LWS_PRE], msg.size(), LWS_WRITE_TEXT);
    if (written < (int)msg.size()) {
        fprintf(stderr, "[Server] Write failed (%d of %zu bytes)\n", written, msg.size());
        return -1;
    }

    // Check for more pending messages
    if (more) {
        lws_callback_on_writable(m_wsi);
    }
    return 0;
}

bool LwsConnection::on_fragment(const char* data, size_t len, bool final,
                                bool binary, size_t limit) {
    if (m_rx_done) {
        m_rx.clear();
        m_rx_binary = binary;
        m_rx_done = false;
    }

    size_t keep_max = limit + 1;
    if (m_rx.size() < keep_max) {
        size_t room = keep_max - m_rx.size();
        m_rx.append(data, len < room ? len : room);
    }

    m_rx_done = final;
    return final;
}
