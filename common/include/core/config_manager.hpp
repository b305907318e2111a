#pragma once

#include "core/types.hpp"
#include "nvs_flash.h"
#include "nvs.h"
#include <string>

namespace parley {

/**
 * Persistent hub settings in NVS.
 * Every getter falls back to its default when the key is missing or the
 * manager was never initialized, so load_* always yields a usable config.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Initialize NVS and open the parley namespace
    ErrorCode initialize();
    bool is_initialized() const { return initialized_; }

    // String configuration
    ErrorCode set_string(const std::string& key, const std::string& value);
    std::string get_string(const std::string& key, const std::string& default_value = "");

    // Integer configuration
    ErrorCode set_uint32(const std::string& key, uint32_t value);
    uint32_t get_uint32(const std::string& key, uint32_t default_value = 0);

    // Stored as a 4-byte blob
    ErrorCode set_float(const std::string& key, float value);
    float get_float(const std::string& key, float default_value = 0.0f);

    ErrorCode set_bool(const std::string& key, bool value);
    bool get_bool(const std::string& key, bool default_value = false);

    ErrorCode set_blob(const std::string& key, const void* data, size_t length);
    size_t get_blob(const std::string& key, void* data, size_t max_length);

    // Key management
    bool has_key(const std::string& key);
    ErrorCode remove_key(const std::string& key);
    ErrorCode clear_all();

    ErrorCode commit();

    // Configuration presets
    ErrorCode load_vad_config(VadConfig& config);
    ErrorCode save_vad_config(const VadConfig& config);

    ErrorCode load_silence_config(SilenceConfig& config);
    ErrorCode save_silence_config(const SilenceConfig& config);

    ErrorCode load_turn_config(TurnConfig& config);
    ErrorCode save_turn_config(const TurnConfig& config);

    ErrorCode load_protocol_config(ProtocolConfig& config);
    ErrorCode save_protocol_config(const ProtocolConfig& config);

    ErrorCode load_store_config(StoreConfig& config);
    ErrorCode save_store_config(const StoreConfig& config);

    ErrorCode load_provider_config(ProviderConfig& config);
    ErrorCode save_provider_config(const ProviderConfig& config);

    ErrorCode load_server_config(ServerConfig& config);
    ErrorCode save_server_config(const ServerConfig& config);

    ErrorCode load_network_config(NetworkConfig& config);
    ErrorCode save_network_config(const NetworkConfig& config);

    ErrorCode load_hub_config(HubConfig& config);

private:
    nvs_handle_t nvs_handle_;
    bool initialized_;
    std::string namespace_;

    ErrorCode open_nvs();
    void close_nvs();
};

} // namespace parley
