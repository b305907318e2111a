#pragma once

#include "core/types.hpp"
#include "pipeline/providers.hpp"
#include "pipeline/turn.hpp"
#include "protocol/protocol_frame.hpp"
#include "session/session.hpp"
#include "session/session_event.hpp"
#include "storage/conversation_store.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace parley {

/**
 * Drives one session's turns: transcription, user persistence, response
 * generation, assistant persistence.
 *
 * At most one turn is in flight. Collaborator results come back through
 * the session mailbox tagged with the turn id; anything tagged with an
 * older id, or arriving after the session closed, is dropped. Each stage
 * has a deadline checked by check_timeouts().
 *
 * Not thread-safe: all calls come from the owning SessionWorker.
 */
class TurnOrchestrator {
public:
    // Routes a collaborator result back into the session mailbox
    using PostBack = std::function<bool(SessionEvent&&)>;

    struct Dependencies {
        ConversationStore* store = nullptr;
        TranscriptionProvider transcription;
        AIResponder ai;
        TurnConfig config;
        Clock clock;
    };

    struct Stats {
        uint32_t turns_started = 0;
        uint32_t turns_completed = 0;
        uint32_t turns_failed = 0;
        uint32_t triggers_rejected = 0;
        uint32_t stale_results = 0;
    };

    TurnOrchestrator(Session& session, const Dependencies& deps,
                     FrameSink emit, PostBack post_back);
    ~TurnOrchestrator();

    TurnOrchestrator(const TurnOrchestrator&) = delete;
    TurnOrchestrator& operator=(const TurnOrchestrator&) = delete;

    // Starts a turn for the utterance; TURN_IN_FLIGHT if one is running
    ErrorCode on_turn_trigger(const std::string& session_id, std::vector<uint8_t> audio);

    // Collaborator results, delivered through the mailbox
    void on_transcription_partial(uint64_t turn_id, const std::string& text, float confidence);
    void on_transcription_result(uint64_t turn_id, const TranscriptionResult& result);
    void on_ai_delta(uint64_t turn_id, const std::string& delta);
    void on_ai_result(uint64_t turn_id, const AIResponse& response);

    // Fails the in-flight stage if its deadline has passed
    void check_timeouts(uint64_t now_ms);

    // Abandons the in-flight turn without emitting anything (session closing)
    void cancel(const std::string& reason);

    TurnState state() const { return state_; }
    bool in_flight() const { return state_ != TurnState::IDLE; }
    uint64_t current_turn_id() const { return turn_ ? turn_->id : 0; }
    uint64_t stage_deadline_ms() const { return turn_ ? turn_->stage_deadline_ms : 0; }
    const Stats& stats() const { return stats_; }

private:
    bool is_current(uint64_t turn_id, TurnState expected);
    void start_generation();
    void complete_turn();
    void fail_turn(const char* code, const std::string& message,
                   const std::string& message_id = "");
    void finish_turn(TurnOutcome outcome, const std::string& error_code);
    ErrorCode persist_message(Message& message);
    void remember(const Message& message);
    std::vector<ContextMessage> build_context() const;
    void emit(const ProtocolFrame& frame);
    uint64_t now() const;

    Session& session_;
    ConversationStore* store_;
    TranscriptionProvider transcription_;
    AIResponder ai_;
    TurnConfig config_;
    Clock clock_;
    FrameSink emit_;
    PostBack post_back_;

    TurnState state_;
    std::unique_ptr<Turn> turn_;
    uint64_t last_turn_id_;
    Stats stats_;
};

} // namespace parley
