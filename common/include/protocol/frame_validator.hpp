#pragma once

#include "core/types.hpp"
#include "protocol/protocol_frame.hpp"
#include <cstddef>
#include <string>

namespace parley {

struct ValidationResult {
    bool valid = true;
    std::string error_message;

    static ValidationResult ok() { return ValidationResult(); }
    static ValidationResult fail(const std::string& message) {
        ValidationResult result;
        result.valid = false;
        result.error_message = message;
        return result;
    }
};

/**
 * Structural checks on inbound frames. Never throws; every rejection
 * carries a human-readable message.
 */
class FrameValidator {
public:
    static const size_t MAX_SESSION_ID_LENGTH = 36;

    explicit FrameValidator(const ProtocolConfig& config);

    // Overall frame ceiling, applied before parsing
    ValidationResult validate_size(size_t raw_bytes) const;

    // Type, session id and payload checks
    ValidationResult validate(const ProtocolFrame& frame) const;

    ValidationResult validate_session_id(const std::string& session_id) const;
    ValidationResult validate_audio(const ProtocolFrame& frame) const;

    // Requested audio format; absent fields take the session defaults
    ValidationResult validate_session_start(const ProtocolFrame& frame) const;

private:
    ProtocolConfig config_;
};

} // namespace parley
