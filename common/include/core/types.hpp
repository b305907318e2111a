#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace parley {

// Session lifecycle
enum class SessionState {
    INIT,
    LISTENING,
    PROCESSING,
    CLOSED
};

// Per-session turn pipeline
enum class TurnState {
    IDLE,
    TRANSCRIBING,
    PERSISTING_USER,
    GENERATING,
    PERSISTING_ASSISTANT,
    FAILED
};

// Voice activity configuration
struct VadConfig {
    float energy_threshold = 0.01f;  // RMS on [-1, 1] scale
};

// Silence tier thresholds
struct SilenceConfig {
    uint32_t medium_ms = 700;
    uint32_t long_ms = 2000;
    uint32_t min_speech_ms = 200;  // speech needed before a trigger may fire
};

// Turn pipeline configuration
struct TurnConfig {
    uint32_t transcription_timeout_ms = 10000;
    uint32_t ai_timeout_ms = 30000;
    uint32_t max_turn_audio_ms = 30000;
    uint32_t max_turn_audio_bytes = 1024 * 1024;  // caps max_turn_audio_ms at high rates
    uint32_t context_window = 15;
    uint32_t turn_history = 32;  // finished turns kept on the session
    bool stream_ai_response = true;
    bool confidence_gate = false;
    float min_response_confidence = 0.5f;
};

// Protocol limits
struct ProtocolConfig {
    size_t max_frame_bytes = 500 * 1024;
    size_t max_audio_chunk_bytes = 64 * 1024;
    uint32_t session_idle_timeout_ms = 300000;
    bool emit_vad_events = false;

    // Accepted SESSION_START audio formats
    uint32_t min_sample_rate = 8000;
    uint32_t max_sample_rate = 48000;
    uint8_t max_channels = 2;

    // Per-connection token buckets; 0 disables a limit. Heartbeats are exempt.
    uint32_t audio_chunks_per_minute = 1200;
    uint32_t control_messages_per_minute = 60;
    uint32_t rate_limit_burst = 10;

    uint32_t session_queue_depth = 64;  // worker mailbox slots
};

// Conversation store bounds
struct StoreConfig {
    uint32_t max_messages = 2000;
    uint32_t max_closed_sessions = 32;
};

// Collaborator selection
struct ProviderConfig {
    std::string kind = "mock";  // "mock" or "http"
    std::string transcription_url;
    std::string ai_url;
    std::string api_key;
    std::string audio_format = "pcm16";
};

// Websocket server configuration
struct ServerConfig {
    uint16_t port = 80;
    std::string ws_path = "/ws";
    uint16_t max_open_sockets = 7;
    uint32_t sweep_interval_ms = 10000;
};

// Network configuration
struct NetworkConfig {
    std::string ssid;
    std::string password;
    std::string hostname = "parley-hub";
    uint32_t reconnect_delay_ms = 5000;
    uint32_t max_retry_count = 10;
};

// Everything the hub reads from NVS
struct HubConfig {
    VadConfig vad;
    SilenceConfig silence;
    TurnConfig turn;
    ProtocolConfig protocol;
    StoreConfig store;
    ProviderConfig provider;
    ServerConfig server;
    NetworkConfig network;
};

// Error codes
enum class ErrorCode {
    SUCCESS = 0,
    INIT_FAILED,
    WIFI_FAILED,
    SERVER_FAILED,
    INVALID_FRAME,
    INVALID_STATE,
    NOT_FOUND,
    SESSION_CLOSED,
    TURN_IN_FLIGHT,
    PERSISTENCE_FAILED,
    MEMORY_ERROR,
    TIMEOUT_ERROR
};

// Millisecond clock, injectable for tests
using Clock = std::function<uint64_t()>;

// Milliseconds since boot (esp_timer)
uint64_t system_clock_ms();

const char* to_string(SessionState state);
const char* to_string(TurnState state);
const char* to_string(ErrorCode code);

} // namespace parley
