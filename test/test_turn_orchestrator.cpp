#include "pipeline/turn_orchestrator.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <deque>

using namespace parley;

namespace {

// Store whose writes can be made to fail
class FlakyStore : public InMemoryConversationStore {
public:
    bool fail_appends = false;
    int fail_after = -1;  // appends allowed before failing, -1 = never
    int appends = 0;

    ErrorCode append_message(const Message& message) override {
        if (fail_appends || (fail_after >= 0 && appends >= fail_after)) {
            return ErrorCode::PERSISTENCE_FAILED;
        }
        appends++;
        return InMemoryConversationStore::append_message(message);
    }
};

} // namespace

class TurnOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        session_.id = test::SESSION_ID;
        session_.state = SessionState::LISTENING;
        deps_.store = &store_;
        deps_.transcription = make_mock_transcription();
        deps_.ai = make_mock_ai_responder();
        deps_.clock = clock_.clock();
    }

    void build() {
        std::deque<SessionEvent>* queue = &queue_;
        orchestrator_ = std::make_unique<TurnOrchestrator>(
            session_, deps_, capture_.sink(),
            [queue](SessionEvent&& event) {
                queue->push_back(std::move(event));
                return true;
            });
    }

    // Delivers queued collaborator results the way a session worker would
    void pump() {
        while (!queue_.empty()) {
            SessionEvent event = std::move(queue_.front());
            queue_.pop_front();
            switch (event.kind) {
                case SessionEvent::Kind::TRANSCRIPTION_PARTIAL:
                    orchestrator_->on_transcription_partial(event.turn_id, event.text,
                                                            event.confidence);
                    break;
                case SessionEvent::Kind::TRANSCRIPTION_DONE:
                    orchestrator_->on_transcription_result(event.turn_id, event.transcription);
                    break;
                case SessionEvent::Kind::AI_DELTA:
                    orchestrator_->on_ai_delta(event.turn_id, event.text);
                    break;
                case SessionEvent::Kind::AI_DONE:
                    orchestrator_->on_ai_result(event.turn_id, event.ai);
                    break;
                default:
                    break;
            }
        }
    }

    ErrorCode trigger() {
        return orchestrator_->on_turn_trigger(test::SESSION_ID, test::speech_block(500));
    }

    Session session_;
    FlakyStore store_;
    TurnOrchestrator::Dependencies deps_;
    test::FakeClock clock_;
    test::FrameCapture capture_;
    std::deque<SessionEvent> queue_;
    std::unique_ptr<TurnOrchestrator> orchestrator_;
};

TEST_F(TurnOrchestratorTest, CompletesStreamingTurn) {
    build();
    ASSERT_EQ(trigger(), ErrorCode::SUCCESS);
    EXPECT_EQ(orchestrator_->state(), TurnState::TRANSCRIBING);
    EXPECT_EQ(session_.state, SessionState::PROCESSING);

    pump();

    ASSERT_EQ(capture_.count(FrameType::TRANSCRIPT_FINAL), 1u);
    ASSERT_EQ(capture_.count(FrameType::ASSISTANT_DONE), 1u);
    EXPECT_EQ(capture_.count(FrameType::ERROR), 0u);
    EXPECT_GT(capture_.count(FrameType::ASSISTANT_DELTA), 0u);

    // Final transcript first, deltas in order, done last
    std::vector<FrameType> types = capture_.types();
    EXPECT_EQ(types.front(), FrameType::TRANSCRIPT_FINAL);
    EXPECT_EQ(types.back(), FrameType::ASSISTANT_DONE);

    std::string streamed;
    for (const auto& frame : *capture_.frames) {
        if (frame.type == FrameType::ASSISTANT_DELTA) streamed += frame.payload.text;
    }
    const ProtocolFrame* done = capture_.first(FrameType::ASSISTANT_DONE);
    EXPECT_EQ(streamed, MockAIConfig().reply);
    EXPECT_EQ(done->payload.text, MockAIConfig().reply);
    EXPECT_EQ(done->payload.model, "mock-model");
    EXPECT_EQ(done->payload.tokens_used, 12u);

    const ProtocolFrame* transcript = capture_.first(FrameType::TRANSCRIPT_FINAL);
    EXPECT_EQ(transcript->payload.text, "Hello, how are you?");
    EXPECT_NEAR(transcript->payload.confidence, 0.95f, 1e-6);
    EXPECT_TRUE(transcript->payload.is_final);

    std::vector<Message> messages = store_.find_messages(test::SESSION_ID);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].role(), MessageRole::USER);
    EXPECT_EQ(messages[0].status(), ProcessingStatus::COMPLETED);
    EXPECT_EQ(messages[0].audio_hash().size(), 64u);
    EXPECT_EQ(messages[1].role(), MessageRole::ASSISTANT);
    EXPECT_EQ(messages[1].status(), ProcessingStatus::COMPLETED);
    EXPECT_EQ(messages[1].parent_message_id(), messages[0].id());
    EXPECT_EQ(done->payload.message_id, messages[1].id());

    EXPECT_EQ(orchestrator_->state(), TurnState::IDLE);
    EXPECT_EQ(session_.state, SessionState::LISTENING);
    ASSERT_EQ(session_.turns.size(), 1u);
    EXPECT_EQ(session_.turns[0].outcome, TurnOutcome::COMPLETED);
    EXPECT_EQ(orchestrator_->stats().turns_completed, 1u);
}

TEST_F(TurnOrchestratorTest, NonStreamingSendsNoDeltas) {
    deps_.config.stream_ai_response = false;
    build();
    ASSERT_EQ(trigger(), ErrorCode::SUCCESS);
    pump();

    EXPECT_EQ(capture_.count(FrameType::ASSISTANT_DELTA), 0u);
    EXPECT_EQ(capture_.count(FrameType::ASSISTANT_DONE), 1u);
}

TEST_F(TurnOrchestratorTest, PartialTranscriptsPrecedeFinal) {
    MockTranscriptionConfig stt;
    stt.partials = {"Hello", "Hello, how"};
    deps_.transcription = make_mock_transcription(stt);
    build();

    ASSERT_EQ(trigger(), ErrorCode::SUCCESS);
    pump();

    std::vector<FrameType> types = capture_.types();
    ASSERT_GE(types.size(), 3u);
    EXPECT_EQ(types[0], FrameType::TRANSCRIPT_PARTIAL);
    EXPECT_EQ(types[1], FrameType::TRANSCRIPT_PARTIAL);
    EXPECT_EQ(types[2], FrameType::TRANSCRIPT_FINAL);
    EXPECT_FALSE((*capture_.frames)[0].payload.is_final);
}

TEST_F(TurnOrchestratorTest, TranscriptionFailureEmitsOneError) {
    MockTranscriptionConfig stt;
    stt.fail = true;
    stt.error_message = "engine offline";
    deps_.transcription = make_mock_transcription(stt);
    build();

    ASSERT_EQ(trigger(), ErrorCode::SUCCESS);
    pump();

    ASSERT_EQ(capture_.frames->size(), 1u);
    const ProtocolFrame& error = capture_.frames->front();
    EXPECT_EQ(error.type, FrameType::ERROR);
    EXPECT_EQ(error.payload.code, "TRANSCRIPTION_FAILED");
    EXPECT_EQ(error.payload.message, "Transcription failed: engine offline");

    EXPECT_EQ(store_.message_count(), 0u);
    EXPECT_EQ(orchestrator_->state(), TurnState::IDLE);
    EXPECT_EQ(session_.state, SessionState::LISTENING);
    ASSERT_EQ(session_.turns.size(), 1u);
    EXPECT_EQ(session_.turns[0].outcome, TurnOutcome::FAILED);
    EXPECT_EQ(session_.turns[0].error_code, "TRANSCRIPTION_FAILED");
}

TEST_F(TurnOrchestratorTest, BlankTranscriptIsNoSpeech) {
    MockTranscriptionConfig stt;
    stt.text = "   ";
    deps_.transcription = make_mock_transcription(stt);
    build();

    ASSERT_EQ(trigger(), ErrorCode::SUCCESS);
    pump();

    ASSERT_EQ(capture_.frames->size(), 1u);
    EXPECT_EQ(capture_.frames->front().payload.code, "NO_SPEECH");
    EXPECT_EQ(store_.message_count(), 0u);
    EXPECT_EQ(orchestrator_->state(), TurnState::IDLE);
}

TEST_F(TurnOrchestratorTest, TranscriptionTimeoutThenLateResultDropped) {
    MockTranscriptionConfig stt;
    stt.respond = false;
    deps_.transcription = make_mock_transcription(stt);
    build();

    ASSERT_EQ(trigger(), ErrorCode::SUCCESS);
    uint64_t turn_id = orchestrator_->current_turn_id();

    clock_.advance(9999);
    orchestrator_->check_timeouts(*clock_.now);
    EXPECT_TRUE(capture_.frames->empty());

    clock_.advance(1);
    orchestrator_->check_timeouts(*clock_.now);

    ASSERT_EQ(capture_.frames->size(), 1u);
    EXPECT_EQ(capture_.frames->front().payload.code, "TRANSCRIPTION_TIMEOUT");
    EXPECT_EQ(capture_.frames->front().payload.message, "Transcription timed out after 10000 ms");
    EXPECT_EQ(orchestrator_->state(), TurnState::IDLE);

    TranscriptionResult late;
    late.success = true;
    late.text = "too late";
    late.confidence = 0.9f;
    orchestrator_->on_transcription_result(turn_id, late);

    EXPECT_EQ(capture_.frames->size(), 1u);
    EXPECT_EQ(store_.message_count(), 0u);
    EXPECT_EQ(orchestrator_->stats().stale_results, 1u);
}

TEST_F(TurnOrchestratorTest, AIFailureCarriesUserMessageId) {
    MockAIConfig ai;
    ai.fail = true;
    ai.error_message = "model overloaded";
    deps_.ai = make_mock_ai_responder(ai);
    build();

    ASSERT_EQ(trigger(), ErrorCode::SUCCESS);
    pump();

    std::vector<Message> messages = store_.find_messages(test::SESSION_ID);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].role(), MessageRole::USER);

    ASSERT_EQ(capture_.count(FrameType::ERROR), 1u);
    const ProtocolFrame* error = capture_.first(FrameType::ERROR);
    EXPECT_EQ(error->payload.code, "AI_GENERATION_FAILED");
    EXPECT_EQ(error->payload.message, "AI generation failed: model overloaded");
    EXPECT_EQ(error->payload.message_id, messages[0].id());
    EXPECT_EQ(capture_.count(FrameType::ASSISTANT_DELTA), 0u);
    EXPECT_EQ(capture_.count(FrameType::ASSISTANT_DONE), 0u);
    EXPECT_EQ(orchestrator_->state(), TurnState::IDLE);
}

TEST_F(TurnOrchestratorTest, AITimeout) {
    MockAIConfig ai;
    ai.respond = false;
    deps_.ai = make_mock_ai_responder(ai);
    build();

    ASSERT_EQ(trigger(), ErrorCode::SUCCESS);
    pump();
    ASSERT_EQ(orchestrator_->state(), TurnState::GENERATING);
    EXPECT_EQ(orchestrator_->stage_deadline_ms(), *clock_.now + 30000);

    clock_.advance(30000);
    orchestrator_->check_timeouts(*clock_.now);

    ASSERT_EQ(capture_.count(FrameType::ERROR), 1u);
    const ProtocolFrame* error = capture_.first(FrameType::ERROR);
    EXPECT_EQ(error->payload.code, "AI_TIMEOUT");
    EXPECT_FALSE(error->payload.message_id.empty());
    EXPECT_EQ(store_.message_count(), 1u);
    EXPECT_EQ(orchestrator_->state(), TurnState::IDLE);
}

TEST_F(TurnOrchestratorTest, UserPersistenceFailureSkipsGeneration) {
    int generate_calls = 0;
    deps_.ai.generate_streaming = nullptr;
    deps_.ai.generate = [&generate_calls](const AIRequest&, AIResponseCallback) {
        generate_calls++;
    };
    store_.fail_appends = true;
    build();

    ASSERT_EQ(trigger(), ErrorCode::SUCCESS);
    pump();

    EXPECT_EQ(generate_calls, 0);
    ASSERT_EQ(capture_.count(FrameType::ERROR), 1u);
    EXPECT_EQ(capture_.first(FrameType::ERROR)->payload.code, "PERSISTENCE_FAILED");
    EXPECT_EQ(capture_.first(FrameType::ERROR)->payload.message, "Failed to persist user message");
    EXPECT_EQ(orchestrator_->state(), TurnState::IDLE);
}

TEST_F(TurnOrchestratorTest, AssistantPersistenceFailure) {
    store_.fail_after = 1;
    build();

    ASSERT_EQ(trigger(), ErrorCode::SUCCESS);
    pump();

    EXPECT_EQ(capture_.count(FrameType::ASSISTANT_DONE), 0u);
    ASSERT_EQ(capture_.count(FrameType::ERROR), 1u);
    const ProtocolFrame* error = capture_.first(FrameType::ERROR);
    EXPECT_EQ(error->payload.code, "PERSISTENCE_FAILED");
    EXPECT_FALSE(error->payload.message_id.empty());
    EXPECT_EQ(store_.message_count(), 1u);
}

TEST_F(TurnOrchestratorTest, AtMostOneTurnInFlight) {
    MockTranscriptionConfig stt;
    stt.respond = false;
    deps_.transcription = make_mock_transcription(stt);
    build();

    ASSERT_EQ(trigger(), ErrorCode::SUCCESS);
    EXPECT_EQ(trigger(), ErrorCode::TURN_IN_FLIGHT);
    EXPECT_EQ(orchestrator_->stats().turns_started, 1u);
    EXPECT_EQ(orchestrator_->stats().triggers_rejected, 1u);
}

TEST_F(TurnOrchestratorTest, RejectsTriggerForClosedOrForeignSession) {
    build();
    EXPECT_EQ(orchestrator_->on_turn_trigger("other", test::speech_block(100)),
              ErrorCode::SESSION_CLOSED);

    session_.state = SessionState::CLOSED;
    EXPECT_EQ(trigger(), ErrorCode::SESSION_CLOSED);
    EXPECT_EQ(orchestrator_->stats().turns_started, 0u);
}

TEST_F(TurnOrchestratorTest, EmptyAudioDoesNotStartTurn) {
    build();
    EXPECT_EQ(orchestrator_->on_turn_trigger(test::SESSION_ID, std::vector<uint8_t>()),
              ErrorCode::INVALID_STATE);
    EXPECT_FALSE(orchestrator_->in_flight());
}

TEST_F(TurnOrchestratorTest, CancelDropsLaterResults) {
    MockTranscriptionConfig stt;
    stt.respond = false;
    deps_.transcription = make_mock_transcription(stt);
    build();

    ASSERT_EQ(trigger(), ErrorCode::SUCCESS);
    uint64_t turn_id = orchestrator_->current_turn_id();

    orchestrator_->cancel("client left");
    EXPECT_FALSE(orchestrator_->in_flight());
    EXPECT_TRUE(capture_.frames->empty());
    ASSERT_EQ(session_.turns.size(), 1u);
    EXPECT_EQ(session_.turns[0].outcome, TurnOutcome::CANCELLED);

    TranscriptionResult late;
    late.success = true;
    late.text = "ignored";
    orchestrator_->on_transcription_result(turn_id, late);
    EXPECT_TRUE(capture_.frames->empty());
}

TEST_F(TurnOrchestratorTest, ConfidenceGateSkipsResponse) {
    MockTranscriptionConfig stt;
    stt.confidence = 0.4f;
    deps_.transcription = make_mock_transcription(stt);
    deps_.config.confidence_gate = true;
    build();

    ASSERT_EQ(trigger(), ErrorCode::SUCCESS);
    pump();

    EXPECT_EQ(capture_.count(FrameType::TRANSCRIPT_FINAL), 1u);
    EXPECT_EQ(capture_.count(FrameType::ASSISTANT_DONE), 0u);
    EXPECT_EQ(capture_.count(FrameType::ERROR), 0u);
    EXPECT_EQ(store_.message_count(), 1u);
    EXPECT_EQ(session_.turns.back().outcome, TurnOutcome::COMPLETED);
}

TEST_F(TurnOrchestratorTest, ContextCarriesEarlierTurns) {
    std::vector<AIRequest> requests;
    deps_.ai.generate_streaming = nullptr;
    deps_.ai.generate = [&requests](const AIRequest& request, AIResponseCallback done) {
        requests.push_back(request);
        AIResponse response;
        response.success = true;
        response.content = "reply " + std::to_string(requests.size());
        response.model = "ctx";
        done(response);
    };
    deps_.config.context_window = 3;
    build();

    for (int i = 0; i < 3; i++) {
        ASSERT_EQ(trigger(), ErrorCode::SUCCESS);
        pump();
    }

    ASSERT_EQ(requests.size(), 3u);
    EXPECT_TRUE(requests[0].context.empty());
    ASSERT_EQ(requests[1].context.size(), 2u);
    EXPECT_EQ(requests[1].context[0].role, MessageRole::USER);
    EXPECT_EQ(requests[1].context[1].content, "reply 1");

    // Window keeps the newest three
    ASSERT_EQ(requests[2].context.size(), 3u);
    EXPECT_EQ(requests[2].context[0].content, "reply 1");
    EXPECT_EQ(requests[2].context[2].content, "reply 2");
    EXPECT_EQ(requests[2].text, "Hello, how are you?");
}

TEST_F(TurnOrchestratorTest, ResultForOlderTurnIgnored) {
    build();
    ASSERT_EQ(trigger(), ErrorCode::SUCCESS);
    queue_.clear();

    TranscriptionResult stale;
    stale.success = true;
    stale.text = "stale";
    orchestrator_->on_transcription_result(orchestrator_->current_turn_id() + 7, stale);

    EXPECT_TRUE(capture_.frames->empty());
    EXPECT_EQ(orchestrator_->state(), TurnState::TRANSCRIBING);
}
