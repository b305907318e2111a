#pragma once

#include "pipeline/providers.hpp"
#include "session/session.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace parley {

/**
 * The unit of work from end-of-utterance to assistant reply.
 * Lives inside the TurnOrchestrator while in flight.
 */
struct Turn {
    uint64_t id = 0;
    std::vector<uint8_t> audio;
    uint64_t started_at_ms = 0;
    uint64_t stage_deadline_ms = 0;
    uint64_t ai_started_at_ms = 0;

    TranscriptionResult transcription;
    std::string user_message_id;

    std::string streamed_text;  // concatenated assistant deltas
    uint32_t delta_count = 0;
    AIResponse ai_response;
    std::string assistant_message_id;

    TurnRecord to_record(TurnOutcome outcome, const std::string& error_code,
                         uint64_t now_ms) const {
        TurnRecord record;
        record.id = id;
        record.outcome = outcome;
        record.user_message_id = user_message_id;
        record.assistant_message_id = assistant_message_id;
        record.error_code = error_code;
        record.started_at_ms = started_at_ms;
        record.finished_at_ms = now_ms;
        return record;
    }
};

} // namespace parley
