#ifndef CONNECTION_H
#define CONNECTION_H

#include <stdint.h>
#include <string>

// Opaque handle to one client channel. The room only queues text messages
// and requests closes; the transport decides how and when they hit the wire.
class Connection {
public:
    virtual ~Connection() {}

    // Queue a text message. Returns false when the peer can no longer take
    // it (closing, or too far behind); the caller drops the session.
    virtual bool send(const std::string& message) = 0;

    // Close with a WebSocket close code and reason. Safe to call twice.
    virtual void close(uint16_t code, const std::string& reason) = 0;
};

#endif // CONNECTION_H
