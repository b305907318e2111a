#include "core/config_manager.hpp"
#include "esp_log.h"
#include <algorithm>

static const char* TAG = "ConfigManager";

namespace parley {

ConfigManager::ConfigManager()
    : nvs_handle_(0)
    , initialized_(false)
    , namespace_("parley") {
}

ConfigManager::~ConfigManager() {
    close_nvs();
}

ErrorCode ConfigManager::initialize() {
    ESP_LOGI(TAG, "Initializing configuration manager...");

    esp_err_t ret = nvs_flash_init();
    if (ret == ESP_ERR_NVS_NO_FREE_PAGES || ret == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_LOGW(TAG, "NVS partition truncated, erasing...");
        ret = nvs_flash_erase();
        if (ret == ESP_OK) {
            ret = nvs_flash_init();
        }
    }

    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to initialize NVS: %s", esp_err_to_name(ret));
        return ErrorCode::INIT_FAILED;
    }

    ErrorCode result = open_nvs();
    if (result != ErrorCode::SUCCESS) {
        return result;
    }

    initialized_ = true;
    ESP_LOGI(TAG, "Configuration manager initialized");
    return ErrorCode::SUCCESS;
}

ErrorCode ConfigManager::set_string(const std::string& key, const std::string& value) {
    if (!initialized_) return ErrorCode::INIT_FAILED;

    esp_err_t err = nvs_set_str(nvs_handle_, key.c_str(), value.c_str());
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to set string '%s': %s", key.c_str(), esp_err_to_name(err));
        return ErrorCode::INIT_FAILED;
    }
    return ErrorCode::SUCCESS;
}

std::string ConfigManager::get_string(const std::string& key, const std::string& default_value) {
    if (!initialized_) return default_value;

    size_t required_size = 0;
    esp_err_t err = nvs_get_str(nvs_handle_, key.c_str(), nullptr, &required_size);
    if (err == ESP_ERR_NVS_NOT_FOUND) {
        return default_value;
    }
    if (err != ESP_OK || required_size == 0) {
        ESP_LOGW(TAG, "Failed to get string size for '%s': %s", key.c_str(), esp_err_to_name(err));
        return default_value;
    }

    std::string value(required_size - 1, '\0');
    err = nvs_get_str(nvs_handle_, key.c_str(), &value[0], &required_size);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Failed to get string '%s': %s", key.c_str(), esp_err_to_name(err));
        return default_value;
    }
    return value;
}

ErrorCode ConfigManager::set_uint32(const std::string& key, uint32_t value) {
    if (!initialized_) return ErrorCode::INIT_FAILED;

    esp_err_t err = nvs_set_u32(nvs_handle_, key.c_str(), value);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to set uint32 '%s': %s", key.c_str(), esp_err_to_name(err));
        return ErrorCode::INIT_FAILED;
    }
    return ErrorCode::SUCCESS;
}

uint32_t ConfigManager::get_uint32(const std::string& key, uint32_t default_value) {
    if (!initialized_) return default_value;

    uint32_t value;
    esp_err_t err = nvs_get_u32(nvs_handle_, key.c_str(), &value);
    if (err == ESP_ERR_NVS_NOT_FOUND) {
        return default_value;
    }
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Failed to get uint32 '%s': %s", key.c_str(), esp_err_to_name(err));
        return default_value;
    }
    return value;
}

ErrorCode ConfigManager::set_float(const std::string& key, float value) {
    return set_blob(key, &value, sizeof(float));
}

float ConfigManager::get_float(const std::string& key, float default_value) {
    float value;
    if (get_blob(key, &value, sizeof(float)) != sizeof(float)) {
        return default_value;
    }
    return value;
}

ErrorCode ConfigManager::set_bool(const std::string& key, bool value) {
    return set_uint32(key, value ? 1 : 0);
}

bool ConfigManager::get_bool(const std::string& key, bool default_value) {
    return get_uint32(key, default_value ? 1 : 0) != 0;
}

ErrorCode ConfigManager::set_blob(const std::string& key, const void* data, size_t length) {
    if (!initialized_ || !data || length == 0) return ErrorCode::INIT_FAILED;

    esp_err_t err = nvs_set_blob(nvs_handle_, key.c_str(), data, length);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to set blob '%s': %s", key.c_str(), esp_err_to_name(err));
        return ErrorCode::INIT_FAILED;
    }
    return ErrorCode::SUCCESS;
}

size_t ConfigManager::get_blob(const std::string& key, void* data, size_t max_length) {
    if (!initialized_ || !data || max_length == 0) return 0;

    size_t required_size = 0;
    esp_err_t err = nvs_get_blob(nvs_handle_, key.c_str(), nullptr, &required_size);
    if (err == ESP_ERR_NVS_NOT_FOUND) {
        return 0;
    }
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Failed to get blob size for '%s': %s", key.c_str(), esp_err_to_name(err));
        return 0;
    }
    if (required_size > max_length) {
        ESP_LOGW(TAG, "Blob '%s' too large: %u > %u", key.c_str(),
                 static_cast<unsigned>(required_size), static_cast<unsigned>(max_length));
        return 0;
    }

    err = nvs_get_blob(nvs_handle_, key.c_str(), data, &required_size);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Failed to get blob '%s': %s", key.c_str(), esp_err_to_name(err));
        return 0;
    }
    return required_size;
}

bool ConfigManager::has_key(const std::string& key) {
    if (!initialized_) return false;

    nvs_type_t type;
    return nvs_find_key(nvs_handle_, key.c_str(), &type) == ESP_OK;
}

ErrorCode ConfigManager::remove_key(const std::string& key) {
    if (!initialized_) return ErrorCode::INIT_FAILED;

    esp_err_t err = nvs_erase_key(nvs_handle_, key.c_str());
    if (err != ESP_OK && err != ESP_ERR_NVS_NOT_FOUND) {
        ESP_LOGE(TAG, "Failed to remove key '%s': %s", key.c_str(), esp_err_to_name(err));
        return ErrorCode::INIT_FAILED;
    }
    return ErrorCode::SUCCESS;
}

ErrorCode ConfigManager::clear_all() {
    if (!initialized_) return ErrorCode::INIT_FAILED;

    esp_err_t err = nvs_erase_all(nvs_handle_);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to clear all keys: %s", esp_err_to_name(err));
        return ErrorCode::INIT_FAILED;
    }
    return commit();
}

ErrorCode ConfigManager::commit() {
    if (!initialized_) return ErrorCode::INIT_FAILED;

    esp_err_t err = nvs_commit(nvs_handle_);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to commit changes: %s", esp_err_to_name(err));
        return ErrorCode::INIT_FAILED;
    }
    return ErrorCode::SUCCESS;
}

// NVS keys are limited to 15 characters

ErrorCode ConfigManager::load_vad_config(VadConfig& config) {
    const VadConfig defaults;
    config.energy_threshold = std::max(0.0f, get_float("vad.energy", defaults.energy_threshold));
    return ErrorCode::SUCCESS;
}

ErrorCode ConfigManager::save_vad_config(const VadConfig& config) {
    set_float("vad.energy", config.energy_threshold);
    return commit();
}

ErrorCode ConfigManager::load_silence_config(SilenceConfig& config) {
    const SilenceConfig defaults;
    config.medium_ms = get_uint32("sil.medium", defaults.medium_ms);
    config.long_ms = get_uint32("sil.long", defaults.long_ms);
    config.min_speech_ms = get_uint32("sil.min_speech", defaults.min_speech_ms);

    if (config.long_ms < config.medium_ms) {
        ESP_LOGW(TAG, "sil.long (%u) below sil.medium (%u), raising it",
                 static_cast<unsigned>(config.long_ms), static_cast<unsigned>(config.medium_ms));
        config.long_ms = config.medium_ms;
    }
    return ErrorCode::SUCCESS;
}

ErrorCode ConfigManager::save_silence_config(const SilenceConfig& config) {
    set_uint32("sil.medium", config.medium_ms);
    set_uint32("sil.long", config.long_ms);
    set_uint32("sil.min_speech", config.min_speech_ms);
    return commit();
}

ErrorCode ConfigManager::load_turn_config(TurnConfig& config) {
    const TurnConfig defaults;
    config.transcription_timeout_ms = get_uint32("turn.stt_to", defaults.transcription_timeout_ms);
    config.ai_timeout_ms = get_uint32("turn.ai_to", defaults.ai_timeout_ms);
    config.max_turn_audio_ms = get_uint32("turn.max_audio", defaults.max_turn_audio_ms);
    config.max_turn_audio_bytes = get_uint32("turn.max_bytes", defaults.max_turn_audio_bytes);
    config.context_window = get_uint32("turn.ctx", defaults.context_window);
    config.turn_history = get_uint32("turn.history", defaults.turn_history);
    config.stream_ai_response = get_bool("turn.stream", defaults.stream_ai_response);
    config.confidence_gate = get_bool("turn.gate", defaults.confidence_gate);
    config.min_response_confidence = get_float("turn.min_conf", defaults.min_response_confidence);

    if (config.max_turn_audio_ms == 0) {
        config.max_turn_audio_ms = defaults.max_turn_audio_ms;
    }
    if (config.max_turn_audio_bytes == 0) {
        config.max_turn_audio_bytes = defaults.max_turn_audio_bytes;
    }
    return ErrorCode::SUCCESS;
}

ErrorCode ConfigManager::save_turn_config(const TurnConfig& config) {
    set_uint32("turn.stt_to", config.transcription_timeout_ms);
    set_uint32("turn.ai_to", config.ai_timeout_ms);
    set_uint32("turn.max_audio", config.max_turn_audio_ms);
    set_uint32("turn.max_bytes", config.max_turn_audio_bytes);
    set_uint32("turn.ctx", config.context_window);
    set_uint32("turn.history", config.turn_history);
    set_bool("turn.stream", config.stream_ai_response);
    set_bool("turn.gate", config.confidence_gate);
    set_float("turn.min_conf", config.min_response_confidence);
    return commit();
}

ErrorCode ConfigManager::load_protocol_config(ProtocolConfig& config) {
    const ProtocolConfig defaults;
    config.max_frame_bytes = get_uint32("proto.max_frame", static_cast<uint32_t>(defaults.max_frame_bytes));
    config.max_audio_chunk_bytes = get_uint32("proto.max_chunk", static_cast<uint32_t>(defaults.max_audio_chunk_bytes));
    config.session_idle_timeout_ms = get_uint32("proto.idle_to", defaults.session_idle_timeout_ms);
    config.emit_vad_events = get_bool("proto.vad_evt", defaults.emit_vad_events);
    config.min_sample_rate = get_uint32("proto.min_rate", defaults.min_sample_rate);
    config.max_sample_rate = get_uint32("proto.max_rate", defaults.max_sample_rate);
    config.max_channels = static_cast<uint8_t>(get_uint32("proto.max_chan", defaults.max_channels));
    config.audio_chunks_per_minute = get_uint32("proto.audio_rpm", defaults.audio_chunks_per_minute);
    config.control_messages_per_minute = get_uint32("proto.ctrl_rpm", defaults.control_messages_per_minute);
    config.rate_limit_burst = get_uint32("proto.burst", defaults.rate_limit_burst);
    config.session_queue_depth = get_uint32("proto.queue", defaults.session_queue_depth);

    if (config.max_sample_rate < config.min_sample_rate) {
        ESP_LOGW(TAG, "proto.max_rate (%u) below proto.min_rate (%u), using defaults",
                 static_cast<unsigned>(config.max_sample_rate),
                 static_cast<unsigned>(config.min_sample_rate));
        config.min_sample_rate = defaults.min_sample_rate;
        config.max_sample_rate = defaults.max_sample_rate;
    }
    if (config.max_channels == 0) {
        config.max_channels = defaults.max_channels;
    }
    if (config.session_queue_depth == 0) {
        config.session_queue_depth = defaults.session_queue_depth;
    }
    return ErrorCode::SUCCESS;
}

ErrorCode ConfigManager::save_protocol_config(const ProtocolConfig& config) {
    set_uint32("proto.max_frame", static_cast<uint32_t>(config.max_frame_bytes));
    set_uint32("proto.max_chunk", static_cast<uint32_t>(config.max_audio_chunk_bytes));
    set_uint32("proto.idle_to", config.session_idle_timeout_ms);
    set_bool("proto.vad_evt", config.emit_vad_events);
    set_uint32("proto.min_rate", config.min_sample_rate);
    set_uint32("proto.max_rate", config.max_sample_rate);
    set_uint32("proto.max_chan", config.max_channels);
    set_uint32("proto.audio_rpm", config.audio_chunks_per_minute);
    set_uint32("proto.ctrl_rpm", config.control_messages_per_minute);
    set_uint32("proto.burst", config.rate_limit_burst);
    set_uint32("proto.queue", config.session_queue_depth);
    return commit();
}

ErrorCode ConfigManager::load_store_config(StoreConfig& config) {
    const StoreConfig defaults;
    config.max_messages = get_uint32("store.max_msg", defaults.max_messages);
    config.max_closed_sessions = get_uint32("store.closed", defaults.max_closed_sessions);
    return ErrorCode::SUCCESS;
}

ErrorCode ConfigManager::save_store_config(const StoreConfig& config) {
    set_uint32("store.max_msg", config.max_messages);
    set_uint32("store.closed", config.max_closed_sessions);
    return commit();
}

ErrorCode ConfigManager::load_provider_config(ProviderConfig& config) {
    const ProviderConfig defaults;
    config.kind = get_string("prov.kind", defaults.kind);
    config.transcription_url = get_string("prov.stt_url", defaults.transcription_url);
    config.ai_url = get_string("prov.ai_url", defaults.ai_url);
    config.api_key = get_string("prov.api_key", defaults.api_key);
    config.audio_format = get_string("prov.format", defaults.audio_format);
    return ErrorCode::SUCCESS;
}

ErrorCode ConfigManager::save_provider_config(const ProviderConfig& config) {
    set_string("prov.kind", config.kind);
    set_string("prov.stt_url", config.transcription_url);
    set_string("prov.ai_url", config.ai_url);
    set_string("prov.api_key", config.api_key);
    set_string("prov.format", config.audio_format);
    return commit();
}

ErrorCode ConfigManager::load_server_config(ServerConfig& config) {
    const ServerConfig defaults;
    config.port = static_cast<uint16_t>(get_uint32("srv.port", defaults.port));
    config.ws_path = get_string("srv.path", defaults.ws_path);
    config.max_open_sockets = static_cast<uint16_t>(get_uint32("srv.sockets", defaults.max_open_sockets));
    config.sweep_interval_ms = get_uint32("srv.sweep_ms", defaults.sweep_interval_ms);
    return ErrorCode::SUCCESS;
}

ErrorCode ConfigManager::save_server_config(const ServerConfig& config) {
    set_uint32("srv.port", config.port);
    set_string("srv.path", config.ws_path);
    set_uint32("srv.sockets", config.max_open_sockets);
    set_uint32("srv.sweep_ms", config.sweep_interval_ms);
    return commit();
}

ErrorCode ConfigManager::load_network_config(NetworkConfig& config) {
    const NetworkConfig defaults;
    config.ssid = get_string("net.ssid", defaults.ssid);
    config.password = get_string("net.password", defaults.password);
    config.hostname = get_string("net.hostname", defaults.hostname);
    config.reconnect_delay_ms = get_uint32("net.retry_ms", defaults.reconnect_delay_ms);
    config.max_retry_count = get_uint32("net.max_retry", defaults.max_retry_count);
    return ErrorCode::SUCCESS;
}

ErrorCode ConfigManager::save_network_config(const NetworkConfig& config) {
    set_string("net.ssid", config.ssid);
    set_string("net.password", config.password);
    set_string("net.hostname", config.hostname);
    set_uint32("net.retry_ms", config.reconnect_delay_ms);
    set_uint32("net.max_retry", config.max_retry_count);
    return commit();
}

ErrorCode ConfigManager::load_hub_config(HubConfig& config) {
    load_vad_config(config.vad);
    load_silence_config(config.silence);
    load_turn_config(config.turn);
    load_protocol_config(config.protocol);
    load_store_config(config.store);
    load_provider_config(config.provider);
    load_server_config(config.server);
    load_network_config(config.network);

    ESP_LOGI(TAG, "Loaded config (%s): provider=%s vad=%.3f silence=%u/%u ms",
             initialized_ ? "nvs" : "defaults", config.provider.kind.c_str(),
             config.vad.energy_threshold,
             static_cast<unsigned>(config.silence.medium_ms),
             static_cast<unsigned>(config.silence.long_ms));
    return ErrorCode::SUCCESS;
}

ErrorCode ConfigManager::open_nvs() {
    esp_err_t err = nvs_open(namespace_.c_str(), NVS_READWRITE, &nvs_handle_);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to open NVS namespace '%s': %s",
                 namespace_.c_str(), esp_err_to_name(err));
        return ErrorCode::INIT_FAILED;
    }
    return ErrorCode::SUCCESS;
}

void ConfigManager::close_nvs() {
    if (nvs_handle_ != 0) {
        nvs_close(nvs_handle_);
        nvs_handle_ = 0;
    }
    initialized_ = false;
}

} // namespace parley
