#include "protocol/frame_validator.hpp"
#include "utils/uuid.hpp"

namespace parley {

FrameValidator::FrameValidator(const ProtocolConfig& config)
    : config_(config) {
}

ValidationResult FrameValidator::validate_size(size_t raw_bytes) const {
    if (raw_bytes > config_.max_frame_bytes) {
        return ValidationResult::fail("Frame exceeds maximum size (" + std::to_string(raw_bytes) +
                                      " > " + std::to_string(config_.max_frame_bytes) + " bytes)");
    }
    return ValidationResult::ok();
}

ValidationResult FrameValidator::validate(const ProtocolFrame& frame) const {
    if (frame.type_name.empty()) {
        return ValidationResult::fail("Message type is required");
    }
    if (!is_inbound(frame.type)) {
        return ValidationResult::fail("Unsupported message type: " + frame.type_name);
    }

    // SESSION_START may omit the id and let the server issue one
    if (!(frame.type == FrameType::SESSION_START && frame.session_id.empty())) {
        ValidationResult id_result = validate_session_id(frame.session_id);
        if (!id_result.valid) return id_result;
    }

    if (frame.type == FrameType::AUDIO_DATA) {
        return validate_audio(frame);
    }
    if (frame.type == FrameType::SESSION_START) {
        return validate_session_start(frame);
    }
    return ValidationResult::ok();
}

ValidationResult FrameValidator::validate_session_id(const std::string& session_id) const {
    if (session_id.empty()) {
        return ValidationResult::fail("Session ID is required");
    }
    if (session_id.size() > MAX_SESSION_ID_LENGTH) {
        return ValidationResult::fail("Session ID exceeds maximum length of 36 characters");
    }
    if (!is_canonical_uuid(session_id)) {
        return ValidationResult::fail("Session ID must be a valid UUID");
    }
    return ValidationResult::ok();
}

ValidationResult FrameValidator::validate_audio(const ProtocolFrame& frame) const {
    if (!frame.has_payload) {
        return ValidationResult::fail("Audio data payload is required");
    }
    if (frame.payload.audio.empty()) {
        return ValidationResult::fail("Audio data cannot be empty");
    }
    if (frame.payload.audio.size() > config_.max_audio_chunk_bytes) {
        return ValidationResult::fail("Audio chunk exceeds maximum size (" +
                                      std::to_string(frame.payload.audio.size()) + " > " +
                                      std::to_string(config_.max_audio_chunk_bytes) + " bytes)");
    }
    return ValidationResult::ok();
}

ValidationResult FrameValidator::validate_session_start(const ProtocolFrame& frame) const {
    uint32_t rate = frame.payload.sample_rate;
    if (rate != 0 && (rate < config_.min_sample_rate || rate > config_.max_sample_rate)) {
        return ValidationResult::fail("Sample rate must be between " +
                                      std::to_string(config_.min_sample_rate) + " and " +
                                      std::to_string(config_.max_sample_rate) + " Hz (got " +
                                      std::to_string(rate) + ")");
    }

    unsigned channels = frame.payload.channels;
    if (channels > config_.max_channels) {
        return ValidationResult::fail("Channels must be between 1 and " +
                                      std::to_string(config_.max_channels) + " (got " +
                                      std::to_string(channels) + ")");
    }
    return ValidationResult::ok();
}

} // namespace parley
