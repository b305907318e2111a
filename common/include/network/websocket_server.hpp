#pragma once

#include "core/types.hpp"
#include "protocol/protocol_frame.hpp"
#include "network/connection_table.hpp"
#include "protocol/session_protocol_handler.hpp"
#include "esp_http_server.h"
#include <string>
#include <vector>

namespace parley {

/**
 * Websocket endpoint of the hub (esp_http_server).
 * Every socket becomes a Connection whose sink writes JSON text frames
 * back to that socket. Socket close ends the bound session.
 */
class WebSocketServer {
public:
    WebSocketServer(SessionProtocolHandler& handler,
                    const ServerConfig& config);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    ErrorCode start();
    void stop();
    bool is_running() const { return server_ != nullptr; }

    // Thread-safe; callable from session tasks. Connection sinks reach it
    // only while their connection is open.
    ErrorCode send_frame(int fd, const ProtocolFrame& frame);

    size_t client_count() const;

    // Statistics
    uint32_t get_bytes_sent() const { return bytes_sent_; }
    uint32_t get_bytes_received() const { return bytes_received_; }
    uint32_t get_message_count() const { return message_count_; }
    uint32_t get_error_count() const { return error_count_; }

private:
    static esp_err_t ws_handler(httpd_req_t* req);
    static void on_socket_close(httpd_handle_t handle, int sockfd);
    static void free_global_ctx(void* ctx);

    esp_err_t handle_request(httpd_req_t* req);
    void handle_open(int fd);
    void handle_close(int fd);

    SessionProtocolHandler& handler_;
    ServerConfig config_;
    httpd_handle_t server_;

    ConnectionTable connections_;

    // Statistics
    uint32_t bytes_sent_;
    uint32_t bytes_received_;
    uint32_t message_count_;
    uint32_t error_count_;
};

} // namespace parley
