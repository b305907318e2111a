#include "network/websocket_server.hpp"
#include "protocol/frame_codec.hpp"
#include "esp_log.h"
#include <sys/socket.h>
#include <unistd.h>
#include <cstring>

static const char* TAG = "WebSocketServer";

namespace parley {

WebSocketServer::WebSocketServer(SessionProtocolHandler& handler,
                                 const ServerConfig& config)
    : handler_(handler)
    , config_(config)
    , server_(nullptr)
    , connections_([this](int fd, const ProtocolFrame& frame) { send_frame(fd, frame); })
    , bytes_sent_(0)
    , bytes_received_(0)
    , message_count_(0)
    , error_count_(0) {
}

WebSocketServer::~WebSocketServer() {
    stop();
}

ErrorCode WebSocketServer::start() {
    if (server_) {
        ESP_LOGW(TAG, "Server already running");
        return ErrorCode::SUCCESS;
    }
    httpd_config_t cfg = HTTPD_DEFAULT_CONFIG();
    cfg.server_port = config_.port;
    cfg.max_open_sockets = config_.max_open_sockets;
    cfg.lru_purge_enable = true;
    cfg.close_fn = on_socket_close;
    cfg.global_user_ctx = this;
    cfg.global_user_ctx_free_fn = free_global_ctx;

    ESP_LOGI(TAG, "Starting websocket server on port %u", static_cast<unsigned>(config_.port));
    esp_err_t err = httpd_start(&server_, &cfg);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start server: %s", esp_err_to_name(err));
        server_ = nullptr;
        return ErrorCode::SERVER_FAILED;
    }

    httpd_uri_t ws_uri = {};
    ws_uri.uri = config_.ws_path.c_str();
    ws_uri.method = HTTP_GET;
    ws_uri.handler = ws_handler;
    ws_uri.user_ctx = this;
    ws_uri.is_websocket = true;

    err = httpd_register_uri_handler(server_, &ws_uri);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to register %s: %s", config_.ws_path.c_str(), esp_err_to_name(err));
        httpd_stop(server_);
        server_ = nullptr;
        return ErrorCode::SERVER_FAILED;
    }

    ESP_LOGI(TAG, "Websocket endpoint ready at %s", config_.ws_path.c_str());
    return ErrorCode::SUCCESS;
}

void WebSocketServer::stop() {
    if (!server_) return;

    httpd_stop(server_);
    server_ = nullptr;

    for (auto& connection : connections_.close_all()) {
        handler_.handle_disconnect(connection);
    }
    ESP_LOGI(TAG, "Server stopped");
}

ErrorCode WebSocketServer::send_frame(int fd, const ProtocolFrame& frame) {
    httpd_handle_t server = server_;
    if (!server) {
        return ErrorCode::SERVER_FAILED;
    }

    std::string text = FrameCodec::encode(frame);

    httpd_ws_frame_t pkt;
    memset(&pkt, 0, sizeof(pkt));
    pkt.final = true;
    pkt.type = HTTPD_WS_TYPE_TEXT;
    pkt.payload = reinterpret_cast<uint8_t*>(&text[0]);
    pkt.len = text.size();

    esp_err_t err = httpd_ws_send_frame_async(server, fd, &pkt);
    if (err != ESP_OK) {
        error_count_++;
        ESP_LOGW(TAG, "Send of %s to fd %d failed: %s",
                 frame.type_name.c_str(), fd, esp_err_to_name(err));
        return ErrorCode::SERVER_FAILED;
    }

    bytes_sent_ += text.size();
    return ErrorCode::SUCCESS;
}

size_t WebSocketServer::client_count() const {
    return connections_.size();
}

esp_err_t WebSocketServer::ws_handler(httpd_req_t* req) {
    WebSocketServer* self = static_cast<WebSocketServer*>(req->user_ctx);
    return self->handle_request(req);
}

void WebSocketServer::on_socket_close(httpd_handle_t handle, int sockfd) {
    WebSocketServer* self = static_cast<WebSocketServer*>(httpd_get_global_user_ctx(handle));
    if (self) {
        self->handle_close(sockfd);
    }
    close(sockfd);
}

void WebSocketServer::free_global_ctx(void* ctx) {
    // Owned by the caller of start()
    (void)ctx;
}

esp_err_t WebSocketServer::handle_request(httpd_req_t* req) {
    int fd = httpd_req_to_sockfd(req);

    if (req->method == HTTP_GET) {
        handle_open(fd);
        return ESP_OK;
    }

    httpd_ws_frame_t pkt;
    memset(&pkt, 0, sizeof(pkt));

    // Length first; the payload is read only when it fits the ceiling
    esp_err_t err = httpd_ws_recv_frame(req, &pkt, 0);
    if (err != ESP_OK) {
        error_count_++;
        ESP_LOGW(TAG, "Frame header read failed on fd %d: %s", fd, esp_err_to_name(err));
        return err;
    }

    Connection connection;
    if (!connections_.find(fd, connection)) {
        ESP_LOGW(TAG, "Frame on unknown fd %d", fd);
        return ESP_FAIL;
    }

    if (!handler_.admit_frame_size(connection, pkt.len)) {
        // Unread payload leaves the stream unusable
        return ESP_FAIL;
    }

    std::vector<uint8_t> buffer(pkt.len + 1, 0);
    if (pkt.len > 0) {
        pkt.payload = buffer.data();
        err = httpd_ws_recv_frame(req, &pkt, pkt.len);
        if (err != ESP_OK) {
            error_count_++;
            ESP_LOGW(TAG, "Frame payload read failed on fd %d: %s", fd, esp_err_to_name(err));
            return err;
        }
    }

    bytes_received_ += pkt.len;
    message_count_++;

    if (pkt.type == HTTPD_WS_TYPE_TEXT) {
        handler_.handle_text(connection, std::string(reinterpret_cast<const char*>(buffer.data()),
                                                     pkt.len));
    } else if (pkt.type == HTTPD_WS_TYPE_BINARY) {
        handler_.handle_binary(connection, buffer.data(), pkt.len);
    } else {
        ESP_LOGD(TAG, "Ignoring frame type %d on fd %d", static_cast<int>(pkt.type), fd);
    }

    connections_.bind_session(fd, connection.id, connection.session_id);

    return ESP_OK;
}

void WebSocketServer::handle_open(int fd) {
    Connection connection = connections_.open(fd);
    ESP_LOGI(TAG, "Client %d connected on fd %d (%u clients)", connection.id, fd,
             static_cast<unsigned>(connections_.size()));
}

void WebSocketServer::handle_close(int fd) {
    Connection connection;
    if (connections_.close(fd, connection)) {
        ESP_LOGI(TAG, "Client %d on fd %d disconnected", connection.id, fd);
        handler_.handle_disconnect(connection);
    }
}

} // namespace parley
