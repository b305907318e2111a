#pragma once

#include "core/types.hpp"
#include "session/message.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace parley {

// Audio and language options chosen by SESSION_START
struct SessionOptions {
    std::string language = "en-US";
    bool auto_detect = false;
    uint32_t sample_rate = 16000;
    uint8_t channels = 1;
};

enum class TurnOutcome {
    IN_FLIGHT,
    COMPLETED,
    FAILED,
    CANCELLED
};

const char* to_string(TurnOutcome outcome);

// Summary of a finished turn, kept on the session in order
struct TurnRecord {
    uint64_t id = 0;
    TurnOutcome outcome = TurnOutcome::IN_FLIGHT;
    std::string user_message_id;
    std::string assistant_message_id;
    std::string error_code;
    uint64_t started_at_ms = 0;
    uint64_t finished_at_ms = 0;
};

/**
 * Conversation session. Owned by exactly one SessionWorker; every
 * mutation happens on that worker's task.
 */
struct Session {
    std::string id;
    SessionState state = SessionState::INIT;
    SessionOptions options;
    uint64_t created_at_ms = 0;
    uint64_t last_activity_ms = 0;
    std::vector<TurnRecord> turns;
    std::vector<Message> messages;

    bool is_closed() const { return state == SessionState::CLOSED; }
};

} // namespace parley
