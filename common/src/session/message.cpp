#include "session/message.hpp"
#include "utils/encoding.hpp"
#include "utils/uuid.hpp"
#include "esp_log.h"
#include <algorithm>

static const char* TAG = "Message";

namespace parley {

const char* to_string(MessageRole role) {
    switch (role) {
        case MessageRole::USER:      return "user";
        case MessageRole::ASSISTANT: return "assistant";
        case MessageRole::SYSTEM:    return "system";
    }
    return "unknown";
}

const char* to_string(ProcessingStatus status) {
    switch (status) {
        case ProcessingStatus::PENDING:    return "PENDING";
        case ProcessingStatus::PROCESSING: return "PROCESSING";
        case ProcessingStatus::COMPLETED:  return "COMPLETED";
        case ProcessingStatus::FAILED:     return "FAILED";
    }
    return "UNKNOWN";
}

bool is_valid_transition(ProcessingStatus from, ProcessingStatus to) {
    switch (from) {
        case ProcessingStatus::PENDING:
            return to == ProcessingStatus::PROCESSING || to == ProcessingStatus::FAILED;
        case ProcessingStatus::PROCESSING:
            return to == ProcessingStatus::COMPLETED || to == ProcessingStatus::FAILED;
        case ProcessingStatus::COMPLETED:
        case ProcessingStatus::FAILED:
            return false;
    }
    return false;
}

Message::Message()
    : role_(MessageRole::USER)
    , created_at_ms_(0)
    , has_confidence_(false)
    , confidence_(0.0f)
    , tokens_used_(0)
    , processing_time_ms_(0)
    , status_(ProcessingStatus::PENDING) {
}

ErrorCode Message::create_user(const std::string& session_id,
                               const std::string& content,
                               float confidence,
                               const std::string& language,
                               const std::string& audio_hash,
                               Message& out) {
    ErrorCode result = validate_content(content);
    if (result != ErrorCode::SUCCESS) return result;

    out = make(session_id, MessageRole::USER, content);
    out.has_confidence_ = true;
    out.confidence_ = std::max(0.0f, std::min(1.0f, confidence));
    out.language_ = language;
    out.audio_hash_ = audio_hash;
    return ErrorCode::SUCCESS;
}

ErrorCode Message::create_assistant(const std::string& session_id,
                                    const std::string& content,
                                    const std::string& model,
                                    uint32_t tokens_used,
                                    uint32_t processing_time_ms,
                                    const std::string& parent_message_id,
                                    Message& out) {
    ErrorCode result = validate_content(content);
    if (result != ErrorCode::SUCCESS) return result;

    out = make(session_id, MessageRole::ASSISTANT, content);
    out.model_ = model;
    out.tokens_used_ = tokens_used;
    out.processing_time_ms_ = processing_time_ms;
    out.parent_message_id_ = parent_message_id;
    return ErrorCode::SUCCESS;
}

ErrorCode Message::create_system(const std::string& session_id,
                                 const std::string& content,
                                 Message& out) {
    ErrorCode result = validate_content(content);
    if (result != ErrorCode::SUCCESS) return result;

    out = make(session_id, MessageRole::SYSTEM, content);
    return ErrorCode::SUCCESS;
}

bool Message::mark_processing() {
    return transition_to(ProcessingStatus::PROCESSING);
}

bool Message::mark_completed() {
    return transition_to(ProcessingStatus::COMPLETED);
}

bool Message::mark_failed(const std::string& error) {
    return transition_to(ProcessingStatus::FAILED, error);
}

bool Message::transition_to(ProcessingStatus status, const std::string& error) {
    if (!is_valid_transition(status_, status)) {
        ESP_LOGW(TAG, "Rejected status change %s -> %s for message %s",
                 to_string(status_), to_string(status), id_.c_str());
        return false;
    }

    status_ = status;
    error_message_ = (status == ProcessingStatus::FAILED) ? error : std::string();
    return true;
}

ErrorCode Message::validate_content(const std::string& content) {
    if (is_blank(content)) {
        return ErrorCode::INVALID_FRAME;
    }
    if (trim(content).size() > MAX_CONTENT_LENGTH) {
        return ErrorCode::INVALID_FRAME;
    }
    return ErrorCode::SUCCESS;
}

Message Message::make(const std::string& session_id, MessageRole role,
                      const std::string& content) {
    Message message;
    message.id_ = generate_uuid();
    message.session_id_ = session_id;
    message.role_ = role;
    message.content_ = trim(content);
    message.created_at_ms_ = system_clock_ms();
    message.status_ = ProcessingStatus::PENDING;
    return message;
}

} // namespace parley
