#include "protocol/session_protocol_handler.hpp"
#include "protocol/frame_codec.hpp"
#include "utils/uuid.hpp"
#include "esp_log.h"

static const char* TAG = "ProtocolHandler";

namespace parley {

SessionProtocolHandler::SessionProtocolHandler(SessionRegistry& registry,
                                               const ProtocolConfig& config,
                                               Clock clock)
    : registry_(registry)
    , config_(config)
    , validator_(config)
    , clock_(clock ? clock : Clock(system_clock_ms)) {
}

void SessionProtocolHandler::handle_text(Connection& connection, const std::string& raw) {
    stats_.frames_received++;

    // Ceiling first, so oversized input is never parsed
    ValidationResult size_check = validator_.validate_size(raw.size());
    if (!size_check.valid) {
        reject(connection, connection.session_id, size_check.error_message);
        return;
    }

    ProtocolFrame frame;
    std::string error;
    if (FrameCodec::decode(raw, frame, error) != ErrorCode::SUCCESS) {
        reject(connection, connection.session_id, error);
        return;
    }

    if (!admit_rate(connection, frame.type,
                    frame.session_id.empty() ? connection.session_id : frame.session_id)) {
        return;
    }

    ValidationResult result = validate(frame);
    if (!result.valid) {
        reject(connection, frame.session_id.empty() ? connection.session_id : frame.session_id,
               result.error_message);
        return;
    }

    ErrorCode dispatched = dispatch(connection, frame);
    if (dispatched != ErrorCode::SUCCESS) {
        ESP_LOGD(TAG, "%s for %s not applied: %s", frame.type_name.c_str(),
                 frame.session_id.c_str(), to_string(dispatched));
    }
}

bool SessionProtocolHandler::admit_frame_size(Connection& connection, size_t length) {
    ValidationResult size_check = validator_.validate_size(length);
    if (!size_check.valid) {
        stats_.frames_received++;
        reject(connection, connection.session_id, size_check.error_message);
        return false;
    }
    return true;
}

void SessionProtocolHandler::handle_binary(Connection& connection, const uint8_t* data,
                                           size_t length) {
    stats_.frames_received++;

    if (connection.session_id.empty()) {
        reject(connection, "", "Binary audio requires a started session");
        return;
    }

    if (!admit_rate(connection, FrameType::AUDIO_DATA, connection.session_id)) {
        return;
    }

    ValidationResult size_check = validator_.validate_size(length);
    if (!size_check.valid) {
        reject(connection, connection.session_id, size_check.error_message);
        return;
    }

    ProtocolFrame frame;
    frame.type = FrameType::AUDIO_DATA;
    frame.type_name = wire_name(FrameType::AUDIO_DATA);
    frame.session_id = connection.session_id;
    frame.has_payload = data != nullptr;
    if (data && length > 0) {
        frame.payload.audio.assign(data, data + length);
    }

    ValidationResult result = validator_.validate_audio(frame);
    if (!result.valid) {
        reject(connection, connection.session_id, result.error_message);
        return;
    }

    forward_audio(frame.session_id, std::move(frame.payload.audio), -1.0f);
}

void SessionProtocolHandler::handle_disconnect(Connection& connection) {
    {
        std::lock_guard<std::mutex> lock(limits_mutex_);
        limits_.erase(connection.id);
    }

    if (connection.session_id.empty()) return;

    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(owners_mutex_);
        auto it = owners_.find(connection.session_id);
        if (it != owners_.end() && it->second == connection.id) {
            owners_.erase(it);
            owner = true;
        }
    }

    if (owner) {
        ESP_LOGI(TAG, "Connection %d dropped, closing session %s",
                 connection.id, connection.session_id.c_str());
        registry_.close(connection.session_id, "connection closed", false);
    }
    connection.session_id.clear();
}

bool SessionProtocolHandler::admit_rate(Connection& connection, FrameType type,
                                        const std::string& session_id) {
    if (type == FrameType::HEARTBEAT) return true;

    const bool audio = type == FrameType::AUDIO_DATA;
    uint64_t now = clock_();
    bool allowed;
    {
        std::lock_guard<std::mutex> lock(limits_mutex_);
        auto it = limits_.find(connection.id);
        if (it == limits_.end()) {
            RateLimits fresh;
            fresh.audio = TokenBucket(config_.audio_chunks_per_minute, config_.rate_limit_burst, now);
            fresh.control = TokenBucket(config_.control_messages_per_minute,
                                        config_.rate_limit_burst, now);
            it = limits_.emplace(connection.id, fresh).first;
        }
        allowed = audio ? it->second.audio.try_take(now) : it->second.control.try_take(now);
    }

    if (!allowed) {
        stats_.frames_rate_limited++;
        reject(connection, session_id,
               audio ? "Rate limit exceeded for audio chunks"
                     : "Rate limit exceeded for control messages");
    }
    return allowed;
}

ValidationResult SessionProtocolHandler::validate(const ProtocolFrame& frame) const {
    return validator_.validate(frame);
}

ErrorCode SessionProtocolHandler::dispatch(Connection& connection, ProtocolFrame& frame) {
    switch (frame.type) {
        case FrameType::SESSION_START:
            return start_session(connection, frame);
        case FrameType::SESSION_END:
            return end_session(connection, frame);
        case FrameType::HEARTBEAT:
            return heartbeat(connection, frame);
        case FrameType::AUDIO_DATA:
            return forward_audio(frame.session_id, std::move(frame.payload.audio),
                                 frame.payload.energy);
        default:
            reject(connection, frame.session_id, "Unsupported message type: " + frame.type_name);
            return ErrorCode::INVALID_FRAME;
    }
}

ErrorCode SessionProtocolHandler::start_session(Connection& connection, ProtocolFrame& frame) {
    if (frame.session_id.empty()) {
        frame.session_id = generate_uuid();
        ESP_LOGI(TAG, "Issued session id %s", frame.session_id.c_str());
    }

    // A connection carries one session at a time
    if (!connection.session_id.empty() && connection.session_id != frame.session_id) {
        handle_disconnect(connection);
    }

    SessionOptions options;
    if (!frame.payload.language.empty()) options.language = frame.payload.language;
    options.auto_detect = frame.payload.auto_detect;
    if (frame.payload.sample_rate > 0) options.sample_rate = frame.payload.sample_rate;
    if (frame.payload.channels > 0) options.channels = frame.payload.channels;

    std::shared_ptr<SessionWorker> worker;
    bool created = false;
    ErrorCode result = registry_.find_or_create(frame.session_id, options, connection.sink,
                                                worker, &created);
    if (result != ErrorCode::SUCCESS) {
        reject(connection, frame.session_id, "Session could not be started");
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(owners_mutex_);
        owners_[frame.session_id] = connection.id;
    }
    connection.session_id = frame.session_id;
    if (created) stats_.sessions_started++;
    return ErrorCode::SUCCESS;
}

ErrorCode SessionProtocolHandler::end_session(Connection& connection, const ProtocolFrame& frame) {
    {
        std::lock_guard<std::mutex> lock(owners_mutex_);
        owners_.erase(frame.session_id);
    }
    if (connection.session_id == frame.session_id) {
        connection.session_id.clear();
    }

    ErrorCode result = registry_.close(frame.session_id, "client ended session", true);
    if (result == ErrorCode::NOT_FOUND) {
        stats_.frames_dropped++;
    }
    return result;
}

ErrorCode SessionProtocolHandler::heartbeat(Connection& connection, const ProtocolFrame& frame) {
    ErrorCode result = registry_.touch(frame.session_id, clock_());
    if (result != ErrorCode::SUCCESS) {
        stats_.frames_dropped++;
        return result;
    }
    send(connection, make_pong(frame.session_id));
    return ErrorCode::SUCCESS;
}

ErrorCode SessionProtocolHandler::forward_audio(const std::string& session_id,
                                                std::vector<uint8_t> audio, float energy) {
    std::shared_ptr<SessionWorker> worker = registry_.find(session_id);
    if (!worker) {
        stats_.frames_dropped++;
        ESP_LOGD(TAG, "Audio for unknown or closed session %s dropped", session_id.c_str());
        return ErrorCode::NOT_FOUND;
    }

    if (!worker->post(SessionEvent::audio_chunk(std::move(audio), energy))) {
        stats_.frames_dropped++;
        return ErrorCode::SESSION_CLOSED;
    }
    return ErrorCode::SUCCESS;
}

void SessionProtocolHandler::reject(Connection& connection, const std::string& session_id,
                                    const std::string& message) {
    stats_.frames_rejected++;
    ESP_LOGW(TAG, "Frame rejected on connection %d: %s", connection.id, message.c_str());
    send(connection, make_error(session_id, message, error_codes::VALIDATION_ERROR));
}

void SessionProtocolHandler::send(Connection& connection, const ProtocolFrame& frame) {
    if (!connection.sink) return;

    ProtocolFrame stamped = frame;
    stamped.timestamp_ms = clock_();
    connection.sink(stamped);
}

} // namespace parley
