#pragma once

#include "core/types.hpp"
#include "esp_event.h"
#include "esp_netif.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"
#include <functional>
#include <string>

namespace parley {

/**
 * WiFi station bring-up for the hub, with bounded automatic reconnection.
 */
class WiFiManager {
public:
    using StatusCallback = std::function<void(bool connected)>;

    WiFiManager();
    ~WiFiManager();

    ErrorCode initialize(const NetworkConfig& config);

    // Connection management
    ErrorCode connect();
    ErrorCode wait_for_connection(uint32_t timeout_ms);
    void disconnect();

    // Status
    bool is_connected() const { return connected_; }
    int get_rssi() const;
    std::string get_ip_address() const;

    void set_status_callback(StatusCallback callback);

    // Statistics
    uint32_t get_connection_count() const { return connection_count_; }
    uint32_t get_disconnection_count() const { return disconnection_count_; }
    uint32_t get_retry_count() const { return retry_count_; }

private:
    static void wifi_event_handler(void* arg, esp_event_base_t event_base,
                                   int32_t event_id, void* event_data);
    static void reconnect_timer_cb(void* arg);
    void handle_wifi_event(int32_t event_id, void* event_data);
    void handle_ip_event(int32_t event_id, void* event_data);

    NetworkConfig config_;
    esp_netif_t* netif_;
    EventGroupHandle_t event_group_;
    esp_timer_handle_t reconnect_timer_;
    bool initialized_;
    volatile bool connected_;

    StatusCallback status_callback_;

    // Statistics
    uint32_t connection_count_;
    uint32_t disconnection_count_;
    uint32_t retry_count_;
};

} // namespace parley
