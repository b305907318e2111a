#pragma once

#include "protocol/protocol_frame.hpp"
#include "protocol/session_protocol_handler.hpp"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace parley {

/**
 * Open sockets of the websocket server, keyed by fd. Every open gets a
 * connection id that is never reused, and the connection's sink writes
 * only while its fd still belongs to that id. A session task holding the
 * sink of a closed socket therefore cannot reach a later client that was
 * given the same fd.
 */
class ConnectionTable {
public:
    using SendFunction = std::function<void(int fd, const ProtocolFrame& frame)>;

    explicit ConnectionTable(SendFunction send);
    ~ConnectionTable();

    ConnectionTable(const ConnectionTable&) = delete;
    ConnectionTable& operator=(const ConnectionTable&) = delete;

    // Registers fd, replacing any stale entry for it
    Connection open(int fd);

    bool find(int fd, Connection& out) const;

    // Keeps the session binding made by the handler, unless the fd has
    // since been given to another connection
    void bind_session(int fd, int connection_id, const std::string& session_id);

    bool close(int fd, Connection& out);
    std::vector<Connection> close_all();

    bool is_current(int fd, int connection_id) const;
    size_t size() const;

private:
    SendFunction send_;
    std::map<int, Connection> connections_;
    mutable SemaphoreHandle_t mutex_;
    int next_id_;
};

} // namespace parley
