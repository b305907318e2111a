#include "protocol/protocol_frame.hpp"

namespace parley {

namespace error_codes {
const char* const VALIDATION_ERROR = "VALIDATION_ERROR";
const char* const TRANSCRIPTION_FAILED = "TRANSCRIPTION_FAILED";
const char* const TRANSCRIPTION_TIMEOUT = "TRANSCRIPTION_TIMEOUT";
const char* const NO_SPEECH = "NO_SPEECH";
const char* const AI_GENERATION_FAILED = "AI_GENERATION_FAILED";
const char* const AI_TIMEOUT = "AI_TIMEOUT";
const char* const PERSISTENCE_FAILED = "PERSISTENCE_FAILED";
} // namespace error_codes

namespace {

struct WireName {
    FrameType type;
    const char* name;
};

const WireName kWireNames[] = {
    {FrameType::AUDIO_DATA,         "AUDIO_DATA"},
    {FrameType::SESSION_START,      "SESSION_START"},
    {FrameType::SESSION_END,        "SESSION_END"},
    {FrameType::HEARTBEAT,          "HEARTBEAT"},
    {FrameType::SESSION_READY,      "SESSION_READY"},
    {FrameType::SESSION_CLOSED,     "SESSION_CLOSED"},
    {FrameType::PONG,               "PONG"},
    {FrameType::TRANSCRIPT_PARTIAL, "transcript.partial"},
    {FrameType::TRANSCRIPT_FINAL,   "transcript.final"},
    {FrameType::ASSISTANT_DELTA,    "assistant.delta"},
    {FrameType::ASSISTANT_DONE,     "assistant.done"},
    {FrameType::VAD_STATE,          "vad.state"},
    {FrameType::ERROR,              "error"},
};

ProtocolFrame outbound(FrameType type, const std::string& session_id) {
    ProtocolFrame frame;
    frame.type = type;
    frame.type_name = wire_name(type);
    frame.session_id = session_id;
    frame.has_payload = true;
    return frame;
}

} // namespace

const char* wire_name(FrameType type) {
    for (const auto& entry : kWireNames) {
        if (entry.type == type) return entry.name;
    }
    return "UNKNOWN";
}

FrameType frame_type_from_wire(const std::string& name) {
    for (const auto& entry : kWireNames) {
        if (name == entry.name) return entry.type;
    }
    return FrameType::UNKNOWN;
}

bool is_inbound(FrameType type) {
    return type == FrameType::AUDIO_DATA ||
           type == FrameType::SESSION_START ||
           type == FrameType::SESSION_END ||
           type == FrameType::HEARTBEAT;
}

ProtocolFrame make_session_ready(const std::string& session_id, const std::string& language,
                                 bool auto_detect, uint32_t sample_rate, uint8_t channels) {
    ProtocolFrame frame = outbound(FrameType::SESSION_READY, session_id);
    frame.payload.language = language;
    frame.payload.auto_detect = auto_detect;
    frame.payload.sample_rate = sample_rate;
    frame.payload.channels = channels;
    return frame;
}

ProtocolFrame make_session_closed(const std::string& session_id, const std::string& reason) {
    ProtocolFrame frame = outbound(FrameType::SESSION_CLOSED, session_id);
    frame.payload.message = reason;
    return frame;
}

ProtocolFrame make_pong(const std::string& session_id) {
    ProtocolFrame frame = outbound(FrameType::PONG, session_id);
    frame.has_payload = false;
    return frame;
}

ProtocolFrame make_transcript(const std::string& session_id, const std::string& text,
                              float confidence, bool is_final, const std::string& language) {
    ProtocolFrame frame = outbound(is_final ? FrameType::TRANSCRIPT_FINAL
                                            : FrameType::TRANSCRIPT_PARTIAL, session_id);
    frame.payload.text = text;
    frame.payload.confidence = confidence;
    frame.payload.is_final = is_final;
    frame.payload.language = language;
    return frame;
}

ProtocolFrame make_assistant_delta(const std::string& session_id, const std::string& delta) {
    ProtocolFrame frame = outbound(FrameType::ASSISTANT_DELTA, session_id);
    frame.payload.text = delta;
    return frame;
}

ProtocolFrame make_assistant_done(const std::string& session_id, const std::string& content,
                                  const std::string& model, uint32_t tokens_used,
                                  uint32_t processing_time_ms, const std::string& message_id) {
    ProtocolFrame frame = outbound(FrameType::ASSISTANT_DONE, session_id);
    frame.payload.text = content;
    frame.payload.model = model;
    frame.payload.tokens_used = tokens_used;
    frame.payload.processing_time_ms = processing_time_ms;
    frame.payload.message_id = message_id;
    return frame;
}

ProtocolFrame make_vad_state(const std::string& session_id, const std::string& silence_type,
                             uint32_t silence_ms, uint32_t speech_ms) {
    ProtocolFrame frame = outbound(FrameType::VAD_STATE, session_id);
    frame.payload.silence_type = silence_type;
    frame.payload.silence_ms = silence_ms;
    frame.payload.speech_ms = speech_ms;
    return frame;
}

ProtocolFrame make_error(const std::string& session_id, const std::string& message,
                         const std::string& code, const std::string& message_id) {
    ProtocolFrame frame = outbound(FrameType::ERROR, session_id);
    frame.payload.message = message;
    frame.payload.code = code;
    frame.payload.message_id = message_id;
    return frame;
}

} // namespace parley
