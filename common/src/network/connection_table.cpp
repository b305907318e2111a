#include "network/connection_table.hpp"
#include "esp_log.h"
#include <stdexcept>

static const char* TAG = "ConnectionTable";

namespace parley {

ConnectionTable::ConnectionTable(SendFunction send)
    : send_(send)
    , mutex_(nullptr)
    , next_id_(0) {

    mutex_ = xSemaphoreCreateMutex();
    if (!mutex_) {
        ESP_LOGE(TAG, "Failed to create connections mutex");
        throw std::runtime_error("Failed to create mutex");
    }
}

ConnectionTable::~ConnectionTable() {
    vSemaphoreDelete(mutex_);
}

Connection ConnectionTable::open(int fd) {
    xSemaphoreTake(mutex_, portMAX_DELAY);
    Connection connection;
    connection.id = ++next_id_;
    int id = connection.id;
    connection.sink = [this, fd, id](const ProtocolFrame& frame) {
        if (!is_current(fd, id)) {
            ESP_LOGD(TAG, "Dropping %s for closed connection %d", frame.type_name.c_str(), id);
            return;
        }
        send_(fd, frame);
    };
    auto it = connections_.find(fd);
    if (it != connections_.end()) {
        ESP_LOGW(TAG, "fd %d reopened before close, replacing connection %d", fd, it->second.id);
    }
    connections_[fd] = connection;
    xSemaphoreGive(mutex_);
    return connection;
}

bool ConnectionTable::find(int fd, Connection& out) const {
    xSemaphoreTake(mutex_, portMAX_DELAY);
    auto it = connections_.find(fd);
    bool found = it != connections_.end();
    if (found) out = it->second;
    xSemaphoreGive(mutex_);
    return found;
}

void ConnectionTable::bind_session(int fd, int connection_id, const std::string& session_id) {
    xSemaphoreTake(mutex_, portMAX_DELAY);
    auto it = connections_.find(fd);
    if (it != connections_.end() && it->second.id == connection_id) {
        it->second.session_id = session_id;
    }
    xSemaphoreGive(mutex_);
}

bool ConnectionTable::close(int fd, Connection& out) {
    xSemaphoreTake(mutex_, portMAX_DELAY);
    auto it = connections_.find(fd);
    bool found = it != connections_.end();
    if (found) {
        out = it->second;
        connections_.erase(it);
    }
    xSemaphoreGive(mutex_);
    return found;
}

std::vector<Connection> ConnectionTable::close_all() {
    xSemaphoreTake(mutex_, portMAX_DELAY);
    std::vector<Connection> remaining;
    for (auto& entry : connections_) {
        remaining.push_back(entry.second);
    }
    connections_.clear();
    xSemaphoreGive(mutex_);
    return remaining;
}

bool ConnectionTable::is_current(int fd, int connection_id) const {
    xSemaphoreTake(mutex_, portMAX_DELAY);
    auto it = connections_.find(fd);
    bool current = it != connections_.end() && it->second.id == connection_id;
    xSemaphoreGive(mutex_);
    return current;
}

size_t ConnectionTable::size() const {
    xSemaphoreTake(mutex_, portMAX_DELAY);
    size_t count = connections_.size();
    xSemaphoreGive(mutex_);
    return count;
}

} // namespace parley
