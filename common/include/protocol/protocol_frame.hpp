#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace parley {

enum class FrameType {
    // Inbound
    AUDIO_DATA,
    SESSION_START,
    SESSION_END,
    HEARTBEAT,
    // Outbound
    SESSION_READY,
    SESSION_CLOSED,
    PONG,
    TRANSCRIPT_PARTIAL,
    TRANSCRIPT_FINAL,
    ASSISTANT_DELTA,
    ASSISTANT_DONE,
    VAD_STATE,
    ERROR,
    UNKNOWN
};

// Wire name, e.g. "AUDIO_DATA" or "transcript.final"
const char* wire_name(FrameType type);
FrameType frame_type_from_wire(const std::string& name);
bool is_inbound(FrameType type);

// Wire error codes
namespace error_codes {
extern const char* const VALIDATION_ERROR;
extern const char* const TRANSCRIPTION_FAILED;
extern const char* const TRANSCRIPTION_TIMEOUT;
extern const char* const NO_SPEECH;
extern const char* const AI_GENERATION_FAILED;
extern const char* const AI_TIMEOUT;
extern const char* const PERSISTENCE_FAILED;
} // namespace error_codes

/**
 * Type-dependent payload. Only the fields of the frame's type are
 * meaningful; the codec reads and writes exactly those.
 */
struct FramePayload {
    // AUDIO_DATA
    std::vector<uint8_t> audio;
    float energy = -1.0f;

    // SESSION_START, SESSION_READY
    std::string language;
    bool auto_detect = false;
    uint32_t sample_rate = 0;
    uint8_t channels = 0;

    // transcript.*, assistant.*
    std::string text;
    float confidence = 0.0f;
    bool is_final = false;
    std::string model;
    uint32_t tokens_used = 0;
    uint32_t processing_time_ms = 0;

    // error, SESSION_CLOSED
    std::string message;
    std::string code;
    std::string message_id;

    // vad.state
    std::string silence_type;
    uint32_t silence_ms = 0;
    uint32_t speech_ms = 0;
};

struct ProtocolFrame {
    FrameType type = FrameType::UNKNOWN;
    std::string type_name;  // as received
    std::string session_id;
    bool has_payload = false;
    FramePayload payload;
    uint64_t timestamp_ms = 0;
    std::map<std::string, std::string> metadata;
};

// Delivers outbound frames to whatever carries them (socket, test capture)
using FrameSink = std::function<void(const ProtocolFrame&)>;

// Outbound frame builders
ProtocolFrame make_session_ready(const std::string& session_id, const std::string& language,
                                 bool auto_detect, uint32_t sample_rate, uint8_t channels);
ProtocolFrame make_session_closed(const std::string& session_id, const std::string& reason);
ProtocolFrame make_pong(const std::string& session_id);
ProtocolFrame make_transcript(const std::string& session_id, const std::string& text,
                              float confidence, bool is_final, const std::string& language);
ProtocolFrame make_assistant_delta(const std::string& session_id, const std::string& delta);
ProtocolFrame make_assistant_done(const std::string& session_id, const std::string& content,
                                  const std::string& model, uint32_t tokens_used,
                                  uint32_t processing_time_ms, const std::string& message_id);
ProtocolFrame make_vad_state(const std::string& session_id, const std::string& silence_type,
                             uint32_t silence_ms, uint32_t speech_ms);
ProtocolFrame make_error(const std::string& session_id, const std::string& message,
                         const std::string& code, const std::string& message_id = "");

} // namespace parley
