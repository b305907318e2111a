#include "protocol/session_protocol_handler.hpp"
#include "protocol/frame_codec.hpp"
#include "storage/conversation_store.hpp"
#include "utils/encoding.hpp"
#include "utils/uuid.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace parley;

namespace {

std::string start_frame(const std::string& session_id) {
    ProtocolFrame frame;
    frame.type = FrameType::SESSION_START;
    frame.session_id = session_id;
    frame.has_payload = true;
    frame.payload.language = "en-US";
    frame.payload.sample_rate = 16000;
    frame.payload.channels = 1;
    return FrameCodec::encode(frame);
}

std::string audio_frame(const std::string& session_id, const std::vector<uint8_t>& pcm) {
    ProtocolFrame frame;
    frame.type = FrameType::AUDIO_DATA;
    frame.session_id = session_id;
    frame.has_payload = true;
    frame.payload.audio = pcm;
    return FrameCodec::encode(frame);
}

std::string bare_frame(const char* type, const std::string& session_id) {
    return std::string("{\"type\":\"") + type + "\",\"sessionId\":\"" + session_id + "\"}";
}

} // namespace

class SessionProtocolHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        TranscriptionProvider stt = make_mock_transcription();
        int* calls = &transcription_calls_;
        TranscriptionProvider counted;
        counted.name = "counted";
        counted.transcribe = [stt, calls](const TranscriptionRequest& request,
                                          TranscriptionCallback done) {
            (*calls)++;
            stt.transcribe(request, done);
        };

        SessionWorker::Dependencies deps;
        deps.store = &store_;
        deps.transcription = counted;
        deps.ai = make_mock_ai_responder();
        deps.clock = clock_.clock();

        registry_ = std::make_unique<SessionRegistry>(deps, config_);
        handler_ = std::make_unique<SessionProtocolHandler>(*registry_, config_, clock_.clock());

        connection_.id = 1;
        connection_.sink = capture_.sink();
    }

    void TearDown() override {
        handler_.reset();
        registry_.reset();
    }

    void stream(Connection& connection, const std::string& session_id,
                uint32_t speech_ms, uint32_t silence_ms) {
        for (uint32_t t = 0; t < speech_ms; t += 100) {
            clock_.advance(100);
            handler_->handle_text(connection, audio_frame(session_id, test::speech_block(100)));
        }
        for (uint32_t t = 0; t < silence_ms; t += 100) {
            clock_.advance(100);
            handler_->handle_text(connection, audio_frame(session_id, test::silence_block(100)));
        }
    }

    ProtocolConfig config_;
    InMemoryConversationStore store_;
    test::FakeClock clock_;
    test::FrameCapture capture_;
    Connection connection_;
    int transcription_calls_ = 0;
    std::unique_ptr<SessionRegistry> registry_;
    std::unique_ptr<SessionProtocolHandler> handler_;
};

TEST_F(SessionProtocolHandlerTest, ConversationTurnEndToEnd) {
    handler_->handle_text(connection_, start_frame(test::SESSION_ID));
    ASSERT_EQ(capture_.count(FrameType::SESSION_READY), 1u);
    EXPECT_EQ(connection_.session_id, test::SESSION_ID);

    stream(connection_, test::SESSION_ID, 3000, 1000);

    ASSERT_EQ(capture_.count(FrameType::TRANSCRIPT_FINAL), 1u);
    ASSERT_EQ(capture_.count(FrameType::ASSISTANT_DONE), 1u);
    EXPECT_EQ(capture_.count(FrameType::ERROR), 0u);
    EXPECT_EQ(transcription_calls_, 1);

    const ProtocolFrame* transcript = capture_.first(FrameType::TRANSCRIPT_FINAL);
    EXPECT_EQ(transcript->session_id, test::SESSION_ID);
    EXPECT_NEAR(transcript->payload.confidence, 0.95f, 1e-6);

    const ProtocolFrame* done = capture_.first(FrameType::ASSISTANT_DONE);
    EXPECT_FALSE(done->payload.text.empty());

    std::vector<Message> messages = store_.find_messages(test::SESSION_ID);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].role(), MessageRole::USER);
    EXPECT_EQ(messages[1].role(), MessageRole::ASSISTANT);
    EXPECT_EQ(handler_->stats().sessions_started, 1u);
}

TEST_F(SessionProtocolHandlerTest, PrecomputedEnergyDrivesTurnTaking) {
    handler_->handle_text(connection_, start_frame(test::SESSION_ID));

    const std::string data = base64_encode(test::silence_block(100).data(), 3200);
    auto energy_frame = [&data](float energy) {
        return std::string("{\"type\":\"AUDIO_DATA\",\"sessionId\":\"") + test::SESSION_ID +
               "\",\"payload\":{\"data\":\"" + data + "\",\"energy\":" +
               std::to_string(energy) + "}}";
    };

    // 3 s at energy 0.5, then 2.5 s at energy 0.0, 100 ms per frame
    for (int i = 0; i < 30; i++) {
        clock_.advance(100);
        handler_->handle_text(connection_, energy_frame(0.5f));
    }
    for (int i = 0; i < 25; i++) {
        clock_.advance(100);
        handler_->handle_text(connection_, energy_frame(0.0f));
    }

    EXPECT_EQ(transcription_calls_, 1);
    EXPECT_EQ(capture_.count(FrameType::TRANSCRIPT_FINAL), 1u);
    ASSERT_EQ(capture_.count(FrameType::ASSISTANT_DONE), 1u);
    EXPECT_FALSE(capture_.first(FrameType::ASSISTANT_DONE)->payload.text.empty());
}

TEST_F(SessionProtocolHandlerTest, OversizedChunkNeverReachesProviders) {
    handler_->handle_text(connection_, start_frame(test::SESSION_ID));
    capture_.clear();

    handler_->handle_text(connection_, audio_frame(test::SESSION_ID,
                                                   std::vector<uint8_t>(70 * 1024, 0x40)));

    ASSERT_EQ(capture_.frames->size(), 1u);
    const ProtocolFrame& error = capture_.frames->front();
    EXPECT_EQ(error.type, FrameType::ERROR);
    EXPECT_EQ(error.payload.code, "VALIDATION_ERROR");
    EXPECT_NE(error.payload.message.find("exceeds maximum size"), std::string::npos);
    EXPECT_EQ(transcription_calls_, 0);
    EXPECT_EQ(registry_->find(test::SESSION_ID)->buffered_audio_bytes(), 0u);
    EXPECT_EQ(handler_->stats().frames_rejected, 1u);
}

TEST_F(SessionProtocolHandlerTest, FrameCeilingCheckedBeforeParsing) {
    std::string huge(config_.max_frame_bytes + 1, ' ');

    handler_->handle_text(connection_, huge);

    ASSERT_EQ(capture_.frames->size(), 1u);
    EXPECT_EQ(capture_.frames->front().payload.message,
              "Frame exceeds maximum size (512001 > 512000 bytes)");
    EXPECT_FALSE(handler_->admit_frame_size(connection_, config_.max_frame_bytes + 1));
    EXPECT_TRUE(handler_->admit_frame_size(connection_, 10));
}

TEST_F(SessionProtocolHandlerTest, MalformedFramesAnsweredWithErrors) {
    handler_->handle_text(connection_, "not json");
    handler_->handle_text(connection_, "{\"sessionId\":\"x\"}");
    handler_->handle_text(connection_, bare_frame("HEARTBEAT", "abc"));
    handler_->handle_text(connection_, bare_frame("transcript.final", test::SESSION_ID));

    ASSERT_EQ(capture_.frames->size(), 4u);
    EXPECT_EQ((*capture_.frames)[0].payload.message, "Frame is not valid JSON");
    EXPECT_EQ((*capture_.frames)[1].payload.message, "Message type is required");
    EXPECT_EQ((*capture_.frames)[2].payload.message, "Session ID must be a valid UUID");
    EXPECT_EQ((*capture_.frames)[3].payload.message, "Unsupported message type: transcript.final");
    for (const auto& frame : *capture_.frames) {
        EXPECT_EQ(frame.payload.code, "VALIDATION_ERROR");
    }
    EXPECT_EQ(registry_->active_count(), 0u);
}

TEST_F(SessionProtocolHandlerTest, StartWithoutIdIssuesOne) {
    handler_->handle_text(connection_, "{\"type\":\"SESSION_START\"}");

    ASSERT_EQ(capture_.count(FrameType::SESSION_READY), 1u);
    const std::string& issued = capture_.first(FrameType::SESSION_READY)->session_id;
    EXPECT_TRUE(is_canonical_uuid(issued));
    EXPECT_EQ(connection_.session_id, issued);
    EXPECT_NE(registry_->find(issued), nullptr);
}

TEST_F(SessionProtocolHandlerTest, HeartbeatAnsweredWithPong) {
    handler_->handle_text(connection_, start_frame(test::SESSION_ID));
    capture_.clear();

    handler_->handle_text(connection_, bare_frame("HEARTBEAT", test::SESSION_ID));

    ASSERT_EQ(capture_.frames->size(), 1u);
    EXPECT_EQ(capture_.frames->front().type, FrameType::PONG);
    EXPECT_EQ(capture_.frames->front().session_id, test::SESSION_ID);
}

TEST_F(SessionProtocolHandlerTest, HeartbeatForUnknownSessionDropped) {
    handler_->handle_text(connection_, bare_frame("HEARTBEAT", test::SESSION_ID));

    EXPECT_TRUE(capture_.frames->empty());
    EXPECT_EQ(handler_->stats().frames_dropped, 1u);
}

TEST_F(SessionProtocolHandlerTest, EndClosesSessionAndLaterAudioIsDropped) {
    handler_->handle_text(connection_, start_frame(test::SESSION_ID));
    handler_->handle_text(connection_, bare_frame("SESSION_END", test::SESSION_ID));

    ASSERT_EQ(capture_.count(FrameType::SESSION_CLOSED), 1u);
    EXPECT_TRUE(connection_.session_id.empty());
    EXPECT_EQ(registry_->active_count(), 0u);

    capture_.clear();
    handler_->handle_text(connection_, audio_frame(test::SESSION_ID, test::speech_block(100)));

    EXPECT_TRUE(capture_.frames->empty());
    EXPECT_EQ(handler_->stats().frames_dropped, 1u);
}

TEST_F(SessionProtocolHandlerTest, DisconnectClosesOwnedSessionOnly) {
    handler_->handle_text(connection_, start_frame(test::SESSION_ID));

    test::FrameCapture other_capture;
    Connection other;
    other.id = 2;
    other.sink = other_capture.sink();
    handler_->handle_text(other, start_frame(test::SESSION_ID));
    ASSERT_EQ(other_capture.count(FrameType::SESSION_READY), 1u);

    // The first connection lost ownership when the second reattached
    handler_->handle_disconnect(connection_);
    EXPECT_NE(registry_->find(test::SESSION_ID), nullptr);

    handler_->handle_disconnect(other);
    EXPECT_EQ(registry_->find(test::SESSION_ID), nullptr);
    EXPECT_EQ(other_capture.count(FrameType::SESSION_CLOSED), 0u);
}

TEST_F(SessionProtocolHandlerTest, BinaryAudioNeedsSession) {
    std::vector<uint8_t> pcm = test::speech_block(100);

    handler_->handle_binary(connection_, pcm.data(), pcm.size());
    ASSERT_EQ(capture_.count(FrameType::ERROR), 1u);
    EXPECT_EQ(capture_.first(FrameType::ERROR)->payload.message,
              "Binary audio requires a started session");

    handler_->handle_text(connection_, start_frame(test::SESSION_ID));
    handler_->handle_binary(connection_, pcm.data(), pcm.size());

    EXPECT_EQ(capture_.count(FrameType::ERROR), 1u);
    EXPECT_EQ(registry_->find(test::SESSION_ID)->buffered_audio_bytes(), pcm.size());
}

TEST_F(SessionProtocolHandlerTest, AudioForUnknownSessionSilentlyDropped) {
    handler_->handle_text(connection_, audio_frame(test::SESSION_ID, test::speech_block(100)));

    EXPECT_TRUE(capture_.frames->empty());
    EXPECT_EQ(handler_->stats().frames_dropped, 1u);
    EXPECT_EQ(transcription_calls_, 0);
}

TEST_F(SessionProtocolHandlerTest, UnsupportedAudioFormatRejectedBeforeSessionExists) {
    std::string huge_rate = std::string("{\"type\":\"SESSION_START\",\"sessionId\":\"") +
                            test::SESSION_ID +
                            "\",\"payload\":{\"sampleRate\":4000000000,\"channels\":255}}";

    handler_->handle_text(connection_, huge_rate);

    ASSERT_EQ(capture_.frames->size(), 1u);
    const ProtocolFrame& error = capture_.frames->front();
    EXPECT_EQ(error.type, FrameType::ERROR);
    EXPECT_EQ(error.payload.code, "VALIDATION_ERROR");
    EXPECT_NE(error.payload.message.find("Sample rate must be between"), std::string::npos);
    EXPECT_EQ(registry_->active_count(), 0u);
    EXPECT_TRUE(connection_.session_id.empty());
    EXPECT_EQ(handler_->stats().sessions_started, 0u);

    capture_.clear();
    handler_->handle_text(connection_, std::string("{\"type\":\"SESSION_START\",\"sessionId\":\"") +
                                       test::SESSION_ID + "\",\"payload\":{\"channels\":6}}");
    ASSERT_EQ(capture_.count(FrameType::ERROR), 1u);
    EXPECT_EQ(capture_.first(FrameType::ERROR)->payload.message,
              "Channels must be between 1 and 2 (got 6)");
    EXPECT_EQ(registry_->active_count(), 0u);
}

TEST_F(SessionProtocolHandlerTest, ControlFloodIsRateLimited) {
    config_.control_messages_per_minute = 60;
    config_.rate_limit_burst = 3;
    handler_ = std::make_unique<SessionProtocolHandler>(*registry_, config_, clock_.clock());

    handler_->handle_text(connection_, start_frame(test::SESSION_ID));
    handler_->handle_text(connection_, start_frame(test::SESSION_ID));
    handler_->handle_text(connection_, start_frame(test::SESSION_ID));
    ASSERT_EQ(capture_.count(FrameType::SESSION_READY), 3u);

    capture_.clear();
    handler_->handle_text(connection_, start_frame(test::SESSION_ID));
    ASSERT_EQ(capture_.frames->size(), 1u);
    EXPECT_EQ(capture_.frames->front().payload.code, "VALIDATION_ERROR");
    EXPECT_EQ(capture_.frames->front().payload.message,
              "Rate limit exceeded for control messages");
    EXPECT_EQ(handler_->stats().frames_rate_limited, 1u);

    // Heartbeats are never limited
    capture_.clear();
    for (int i = 0; i < 5; i++) {
        handler_->handle_text(connection_, bare_frame("HEARTBEAT", test::SESSION_ID));
    }
    EXPECT_EQ(capture_.count(FrameType::PONG), 5u);

    // One token per second at 60 per minute
    clock_.advance(1000);
    capture_.clear();
    handler_->handle_text(connection_, start_frame(test::SESSION_ID));
    EXPECT_EQ(capture_.count(FrameType::SESSION_READY), 1u);
}

TEST_F(SessionProtocolHandlerTest, AudioFloodIsRateLimitedPerConnection) {
    config_.audio_chunks_per_minute = 600;
    config_.rate_limit_burst = 4;
    handler_ = std::make_unique<SessionProtocolHandler>(*registry_, config_, clock_.clock());

    handler_->handle_text(connection_, start_frame(test::SESSION_ID));
    capture_.clear();

    std::vector<uint8_t> pcm = test::speech_block(100);
    for (int i = 0; i < 6; i++) {
        handler_->handle_binary(connection_, pcm.data(), pcm.size());
    }

    EXPECT_EQ(capture_.count(FrameType::ERROR), 2u);
    EXPECT_EQ(capture_.first(FrameType::ERROR)->payload.message,
              "Rate limit exceeded for audio chunks");
    EXPECT_EQ(registry_->find(test::SESSION_ID)->buffered_audio_bytes(), 4u * pcm.size());
    EXPECT_EQ(handler_->stats().frames_rate_limited, 2u);

    // Real-time audio at ten chunks per second stays under the limit
    capture_.clear();
    stream(connection_, test::SESSION_ID, 2000, 0);
    EXPECT_EQ(capture_.count(FrameType::ERROR), 0u);

    // A new connection starts with a full bucket
    Connection other;
    other.id = 2;
    other.sink = capture_.sink();
    handler_->handle_text(other, start_frame(test::SESSION_ID));
    capture_.clear();
    for (int i = 0; i < 4; i++) {
        handler_->handle_binary(other, pcm.data(), pcm.size());
    }
    EXPECT_EQ(capture_.count(FrameType::ERROR), 0u);
}

TEST_F(SessionProtocolHandlerTest, ZeroRateDisablesLimit) {
    config_.audio_chunks_per_minute = 0;
    config_.rate_limit_burst = 1;
    handler_ = std::make_unique<SessionProtocolHandler>(*registry_, config_, clock_.clock());

    handler_->handle_text(connection_, start_frame(test::SESSION_ID));
    capture_.clear();

    std::vector<uint8_t> pcm = test::speech_block(100);
    for (int i = 0; i < 50; i++) {
        handler_->handle_binary(connection_, pcm.data(), pcm.size());
    }
    EXPECT_EQ(capture_.count(FrameType::ERROR), 0u);
    EXPECT_EQ(handler_->stats().frames_rate_limited, 0u);
}
