#include "network/wifi_manager.hpp"
#include "esp_log.h"
#include "esp_wifi.h"
#include <cstring>

static const char* TAG = "WiFiManager";

// WiFi event bits
#define WIFI_CONNECTED_BIT BIT0
#define WIFI_FAIL_BIT BIT1

namespace parley {

WiFiManager::WiFiManager()
    : netif_(nullptr)
    , event_group_(nullptr)
    , reconnect_timer_(nullptr)
    , initialized_(false)
    , connected_(false)
    , connection_count_(0)
    , disconnection_count_(0)
    , retry_count_(0) {
}

WiFiManager::~WiFiManager() {
    disconnect();

    if (reconnect_timer_) {
        esp_timer_delete(reconnect_timer_);
    }
    if (event_group_) {
        vEventGroupDelete(event_group_);
    }
}

ErrorCode WiFiManager::initialize(const NetworkConfig& config) {
    if (initialized_) {
        ESP_LOGW(TAG, "WiFi manager already initialized");
        return ErrorCode::SUCCESS;
    }
    if (config.ssid.empty()) {
        ESP_LOGE(TAG, "No SSID configured");
        return ErrorCode::WIFI_FAILED;
    }

    config_ = config;

    event_group_ = xEventGroupCreate();
    if (!event_group_) {
        return ErrorCode::MEMORY_ERROR;
    }

    esp_timer_create_args_t timer_args = {};
    timer_args.callback = reconnect_timer_cb;
    timer_args.arg = this;
    timer_args.name = "wifi_retry";
    if (esp_timer_create(&timer_args, &reconnect_timer_) != ESP_OK) {
        return ErrorCode::INIT_FAILED;
    }

    esp_err_t err = esp_netif_init();
    if (err == ESP_OK) {
        err = esp_event_loop_create_default();
        // Someone else may already own the default loop
        if (err == ESP_ERR_INVALID_STATE) err = ESP_OK;
    }
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Network stack init failed: %s", esp_err_to_name(err));
        return ErrorCode::WIFI_FAILED;
    }

    netif_ = esp_netif_create_default_wifi_sta();
    if (netif_ && !config_.hostname.empty()) {
        esp_netif_set_hostname(netif_, config_.hostname.c_str());
    }

    wifi_init_config_t cfg = WIFI_INIT_CONFIG_DEFAULT();
    err = esp_wifi_init(&cfg);
    if (err == ESP_OK) {
        err = esp_event_handler_register(WIFI_EVENT, ESP_EVENT_ANY_ID, &wifi_event_handler, this);
    }
    if (err == ESP_OK) {
        err = esp_event_handler_register(IP_EVENT, IP_EVENT_STA_GOT_IP, &wifi_event_handler, this);
    }
    if (err == ESP_OK) {
        err = esp_wifi_set_mode(WIFI_MODE_STA);
    }
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "WiFi init failed: %s", esp_err_to_name(err));
        return ErrorCode::WIFI_FAILED;
    }

    initialized_ = true;
    ESP_LOGI(TAG, "WiFi manager initialized for SSID: %s", config_.ssid.c_str());
    return ErrorCode::SUCCESS;
}

ErrorCode WiFiManager::connect() {
    if (!initialized_) {
        ESP_LOGE(TAG, "WiFi manager not initialized");
        return ErrorCode::WIFI_FAILED;
    }
    if (connected_) {
        return ErrorCode::SUCCESS;
    }

    ESP_LOGI(TAG, "Connecting to WiFi: %s", config_.ssid.c_str());

    wifi_config_t wifi_config = {};
    std::strncpy(reinterpret_cast<char*>(wifi_config.sta.ssid),
                 config_.ssid.c_str(), sizeof(wifi_config.sta.ssid) - 1);
    std::strncpy(reinterpret_cast<char*>(wifi_config.sta.password),
                 config_.password.c_str(), sizeof(wifi_config.sta.password) - 1);
    wifi_config.sta.threshold.authmode = config_.password.empty() ? WIFI_AUTH_OPEN
                                                                  : WIFI_AUTH_WPA2_PSK;

    xEventGroupClearBits(event_group_, WIFI_CONNECTED_BIT | WIFI_FAIL_BIT);
    retry_count_ = 0;

    esp_err_t err = esp_wifi_set_config(WIFI_IF_STA, &wifi_config);
    if (err == ESP_OK) err = esp_wifi_start();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "WiFi start failed: %s", esp_err_to_name(err));
        return ErrorCode::WIFI_FAILED;
    }

    connection_count_++;
    return ErrorCode::SUCCESS;
}

ErrorCode WiFiManager::wait_for_connection(uint32_t timeout_ms) {
    if (!event_group_) return ErrorCode::WIFI_FAILED;

    EventBits_t bits = xEventGroupWaitBits(event_group_, WIFI_CONNECTED_BIT | WIFI_FAIL_BIT,
                                           pdFALSE, pdFALSE, pdMS_TO_TICKS(timeout_ms));
    if (bits & WIFI_CONNECTED_BIT) {
        return ErrorCode::SUCCESS;
    }
    if (bits & WIFI_FAIL_BIT) {
        return ErrorCode::WIFI_FAILED;
    }
    return ErrorCode::TIMEOUT_ERROR;
}

void WiFiManager::disconnect() {
    if (!initialized_) return;

    if (reconnect_timer_) {
        esp_timer_stop(reconnect_timer_);
    }
    connected_ = false;
    esp_wifi_disconnect();
    esp_wifi_stop();
    ESP_LOGI(TAG, "WiFi disconnected");
}

int WiFiManager::get_rssi() const {
    wifi_ap_record_t ap_info;
    if (connected_ && esp_wifi_sta_get_ap_info(&ap_info) == ESP_OK) {
        return ap_info.rssi;
    }
    return -100;
}

std::string WiFiManager::get_ip_address() const {
    if (!connected_ || !netif_) {
        return "0.0.0.0";
    }

    esp_netif_ip_info_t ip_info;
    if (esp_netif_get_ip_info(netif_, &ip_info) == ESP_OK) {
        char ip_str[16];
        snprintf(ip_str, sizeof(ip_str), IPSTR, IP2STR(&ip_info.ip));
        return std::string(ip_str);
    }
    return "0.0.0.0";
}

void WiFiManager::set_status_callback(StatusCallback callback) {
    status_callback_ = callback;
}

void WiFiManager::wifi_event_handler(void* arg, esp_event_base_t event_base,
                                     int32_t event_id, void* event_data) {
    WiFiManager* manager = static_cast<WiFiManager*>(arg);
    if (event_base == WIFI_EVENT) {
        manager->handle_wifi_event(event_id, event_data);
    } else if (event_base == IP_EVENT) {
        manager->handle_ip_event(event_id, event_data);
    }
}

void WiFiManager::reconnect_timer_cb(void* arg) {
    WiFiManager* manager = static_cast<WiFiManager*>(arg);
    ESP_LOGI(TAG, "Reconnect attempt %u/%u", static_cast<unsigned>(manager->retry_count_),
             static_cast<unsigned>(manager->config_.max_retry_count));
    esp_wifi_connect();
}

void WiFiManager::handle_wifi_event(int32_t event_id, void* event_data) {
    switch (event_id) {
        case WIFI_EVENT_STA_START:
            ESP_LOGI(TAG, "WiFi station started");
            esp_wifi_connect();
            break;

        case WIFI_EVENT_STA_DISCONNECTED: {
            wifi_event_sta_disconnected_t* event =
                static_cast<wifi_event_sta_disconnected_t*>(event_data);
            ESP_LOGW(TAG, "WiFi disconnected, reason: %d", event->reason);

            bool was_connected = connected_;
            connected_ = false;
            if (was_connected) {
                disconnection_count_++;
                if (status_callback_) status_callback_(false);
            }

            if (retry_count_ < config_.max_retry_count) {
                retry_count_++;
                esp_timer_start_once(reconnect_timer_,
                                     static_cast<uint64_t>(config_.reconnect_delay_ms) * 1000);
            } else {
                ESP_LOGE(TAG, "Max reconnection attempts reached");
                xEventGroupSetBits(event_group_, WIFI_FAIL_BIT);
            }
            break;
        }

        default:
            ESP_LOGD(TAG, "Unhandled WiFi event: %d", static_cast<int>(event_id));
            break;
    }
}

void WiFiManager::handle_ip_event(int32_t event_id, void* event_data) {
    if (event_id != IP_EVENT_STA_GOT_IP) return;

    ip_event_got_ip_t* event = static_cast<ip_event_got_ip_t*>(event_data);
    ESP_LOGI(TAG, "Got IP address: " IPSTR, IP2STR(&event->ip_info.ip));

    connected_ = true;
    retry_count_ = 0;
    xEventGroupSetBits(event_group_, WIFI_CONNECTED_BIT);

    if (status_callback_) {
        status_callback_(true);
    }
}

} // namespace parley
