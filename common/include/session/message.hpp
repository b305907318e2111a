#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>

namespace parley {

enum class MessageRole {
    USER,
    ASSISTANT,
    SYSTEM
};

enum class ProcessingStatus {
    PENDING,
    PROCESSING,
    COMPLETED,
    FAILED
};

const char* to_string(MessageRole role);
const char* to_string(ProcessingStatus status);

// True when from -> to is a forward step of the status machine
bool is_valid_transition(ProcessingStatus from, ProcessingStatus to);

/**
 * One conversation message. Content and metadata are fixed at creation;
 * only the processing status moves, and only forward:
 * PENDING -> PROCESSING -> {COMPLETED, FAILED}.
 */
class Message {
public:
    static const size_t MAX_CONTENT_LENGTH = 10000;

    Message();

    // Factories validate content (non-blank, bounded) and trim it
    static ErrorCode create_user(const std::string& session_id,
                                 const std::string& content,
                                 float confidence,
                                 const std::string& language,
                                 const std::string& audio_hash,
                                 Message& out);

    static ErrorCode create_assistant(const std::string& session_id,
                                      const std::string& content,
                                      const std::string& model,
                                      uint32_t tokens_used,
                                      uint32_t processing_time_ms,
                                      const std::string& parent_message_id,
                                      Message& out);

    static ErrorCode create_system(const std::string& session_id,
                                   const std::string& content,
                                   Message& out);

    // Status transitions; false when the step would go backward
    bool mark_processing();
    bool mark_completed();
    bool mark_failed(const std::string& error);
    bool transition_to(ProcessingStatus status, const std::string& error = "");

    const std::string& id() const { return id_; }
    const std::string& session_id() const { return session_id_; }
    MessageRole role() const { return role_; }
    const std::string& content() const { return content_; }
    uint64_t created_at_ms() const { return created_at_ms_; }
    bool has_confidence() const { return has_confidence_; }
    float confidence() const { return confidence_; }
    bool low_confidence() const { return has_confidence_ && confidence_ <= 0.5f; }
    const std::string& language() const { return language_; }
    const std::string& audio_hash() const { return audio_hash_; }
    const std::string& model() const { return model_; }
    uint32_t tokens_used() const { return tokens_used_; }
    uint32_t processing_time_ms() const { return processing_time_ms_; }
    const std::string& parent_message_id() const { return parent_message_id_; }
    ProcessingStatus status() const { return status_; }
    const std::string& error_message() const { return error_message_; }

private:
    static ErrorCode validate_content(const std::string& content);
    static Message make(const std::string& session_id, MessageRole role,
                        const std::string& content);

    std::string id_;
    std::string session_id_;
    MessageRole role_;
    std::string content_;
    uint64_t created_at_ms_;
    bool has_confidence_;
    float confidence_;
    std::string language_;
    std::string audio_hash_;
    std::string model_;
    uint32_t tokens_used_;
    uint32_t processing_time_ms_;
    std::string parent_message_id_;
    ProcessingStatus status_;
    std::string error_message_;
};

} // namespace parley
