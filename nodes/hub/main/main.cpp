#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "esp_log.h"
#include "esp_system.h"

#include "core/config_manager.hpp"
#include "core/task_manager.hpp"
#include "network/websocket_server.hpp"
#include "network/wifi_manager.hpp"
#include "pipeline/provider_factory.hpp"
#include "protocol/session_protocol_handler.hpp"
#include "session/session_registry.hpp"
#include "storage/conversation_store.hpp"
#include "node_config.h"

static const char* TAG = "hub_node";

extern "C" void app_main() {
    ESP_LOGI(TAG, "Starting Parley voice hub");
    ESP_LOGI(TAG, "Firmware Version: %s", NODE_FIRMWARE_VERSION);
    ESP_LOGI(TAG, "Build Date: %s %s", __DATE__, __TIME__);

    static parley::ConfigManager config_manager;
    if (config_manager.initialize() != parley::ErrorCode::SUCCESS) {
        ESP_LOGW(TAG, "NVS unavailable, running on defaults");
    }

    parley::HubConfig config;
    config_manager.load_hub_config(config);
    if (config.network.ssid.empty()) {
        config.network.ssid = WIFI_SSID;
        config.network.password = WIFI_PASSWORD;
    }

    static parley::WiFiManager wifi;
    parley::ErrorCode result = wifi.initialize(config.network);
    if (result == parley::ErrorCode::SUCCESS) {
        result = wifi.connect();
    }
    if (result == parley::ErrorCode::SUCCESS) {
        result = wifi.wait_for_connection(WIFI_CONNECT_TIMEOUT_MS);
    }
    if (result != parley::ErrorCode::SUCCESS) {
        ESP_LOGE(TAG, "WiFi bring-up failed: %s", parley::to_string(result));
        esp_restart();
    }
    ESP_LOGI(TAG, "Network up: %s", wifi.get_ip_address().c_str());

    static parley::TaskManager tasks;

    parley::ProviderSet providers;
    result = parley::build_providers(config.provider, config.turn, &tasks, providers);
    if (result != parley::ErrorCode::SUCCESS) {
        ESP_LOGE(TAG, "Collaborator setup failed: %s", parley::to_string(result));
        esp_restart();
    }

    static parley::InMemoryConversationStore store(config.store);

    parley::SessionWorker::Dependencies deps;
    deps.store = &store;
    deps.transcription = providers.transcription;
    deps.ai = providers.ai;
    deps.vad = config.vad;
    deps.silence = config.silence;
    deps.turn = config.turn;
    deps.protocol = config.protocol;
    deps.clock = parley::system_clock_ms;

    parley::SessionRegistry::TaskSettings task_settings;
    task_settings.stack_size = SESSION_TASK_STACK;
    task_settings.priority = SESSION_TASK_PRIORITY;

    static parley::SessionRegistry registry(deps, config.protocol, &tasks, task_settings);
    static parley::SessionProtocolHandler handler(registry, config.protocol);
    static parley::WebSocketServer server(handler, config.server);

    result = server.start();
    if (result != parley::ErrorCode::SUCCESS) {
        ESP_LOGE(TAG, "Websocket server failed to start");
        esp_restart();
    }

    ESP_LOGI(TAG, "Initialization complete. Listening on ws://%s:%u%s",
             wifi.get_ip_address().c_str(), static_cast<unsigned>(config.server.port),
             config.server.ws_path.c_str());

    uint64_t last_sweep_ms = parley::system_clock_ms();
    uint64_t last_stats_ms = last_sweep_ms;

    // Housekeeping loop
    while (true) {
        uint64_t now = parley::system_clock_ms();

        if (now - last_sweep_ms >= config.server.sweep_interval_ms) {
            size_t closed = registry.sweep_idle(now);
            if (closed > 0) {
                ESP_LOGI(TAG, "Closed %u idle sessions", static_cast<unsigned>(closed));
            }
            last_sweep_ms = now;
        }

        if (now - last_stats_ms >= HUB_STATS_INTERVAL_MS) {
            const parley::SessionProtocolHandler::Stats& stats = handler.stats();
            ESP_LOGI(TAG, "Sessions=%u clients=%u tasks=%u messages=%u (evicted %u)",
                     static_cast<unsigned>(registry.active_count()),
                     static_cast<unsigned>(server.client_count()),
                     static_cast<unsigned>(tasks.active_task_count()),
                     static_cast<unsigned>(store.message_count()),
                     static_cast<unsigned>(store.evicted_messages()));
            ESP_LOGI(TAG, "Frames rx=%u rejected=%u rate_limited=%u dropped=%u",
                     static_cast<unsigned>(stats.frames_received),
                     static_cast<unsigned>(stats.frames_rejected),
                     static_cast<unsigned>(stats.frames_rate_limited),
                     static_cast<unsigned>(stats.frames_dropped));
            tasks.print_task_list();
            tasks.print_heap_stats();
            last_stats_ms = now;
        }

        vTaskDelay(pdMS_TO_TICKS(HUB_LOOP_INTERVAL_MS));
    }
}
