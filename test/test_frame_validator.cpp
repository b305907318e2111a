#include "protocol/frame_validator.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace parley;

namespace {

ProtocolFrame audio_frame(size_t bytes) {
    ProtocolFrame frame;
    frame.type = FrameType::AUDIO_DATA;
    frame.type_name = "AUDIO_DATA";
    frame.session_id = test::SESSION_ID;
    frame.has_payload = true;
    frame.payload.audio.assign(bytes, 0x10);
    return frame;
}

} // namespace

class FrameValidatorTest : public ::testing::Test {
protected:
    ProtocolConfig config_;
    FrameValidator validator_{config_};
};

TEST_F(FrameValidatorTest, AcceptsWellFormedAudio) {
    ValidationResult result = validator_.validate(audio_frame(3200));
    EXPECT_TRUE(result.valid) << result.error_message;
}

TEST_F(FrameValidatorTest, TypeIsRequired) {
    ProtocolFrame frame = audio_frame(10);
    frame.type_name.clear();
    frame.type = FrameType::UNKNOWN;

    ValidationResult result = validator_.validate(frame);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error_message, "Message type is required");
}

TEST_F(FrameValidatorTest, OutboundAndUnknownTypesRejected) {
    ProtocolFrame frame = audio_frame(10);
    frame.type = FrameType::UNKNOWN;
    frame.type_name = "BOGUS";
    EXPECT_EQ(validator_.validate(frame).error_message, "Unsupported message type: BOGUS");

    frame.type = FrameType::TRANSCRIPT_FINAL;
    frame.type_name = "transcript.final";
    EXPECT_FALSE(validator_.validate(frame).valid);
}

TEST_F(FrameValidatorTest, SessionIdMustBeUuid) {
    EXPECT_TRUE(validator_.validate_session_id(test::SESSION_ID).valid);
    EXPECT_TRUE(validator_.validate_session_id("123E4567-E89B-12D3-A456-426614174000").valid);

    EXPECT_EQ(validator_.validate_session_id("").error_message, "Session ID is required");
    EXPECT_EQ(validator_.validate_session_id("not-a-uuid").error_message,
              "Session ID must be a valid UUID");
    EXPECT_EQ(validator_.validate_session_id("123e4567e89b12d3a456426614174000").error_message,
              "Session ID must be a valid UUID");
    EXPECT_EQ(validator_.validate_session_id(std::string(37, 'a')).error_message,
              "Session ID exceeds maximum length of 36 characters");
    EXPECT_FALSE(validator_.validate_session_id("123e4567-e89b-12d3-a456-42661417400g").valid);
}

TEST_F(FrameValidatorTest, SessionStartMayOmitId) {
    ProtocolFrame frame;
    frame.type = FrameType::SESSION_START;
    frame.type_name = "SESSION_START";
    EXPECT_TRUE(validator_.validate(frame).valid);

    frame.session_id = "bogus";
    EXPECT_FALSE(validator_.validate(frame).valid);
}

TEST_F(FrameValidatorTest, SessionStartAudioFormatBounds) {
    ProtocolFrame frame;
    frame.type = FrameType::SESSION_START;
    frame.type_name = "SESSION_START";
    frame.session_id = test::SESSION_ID;
    frame.has_payload = true;

    // Absent fields fall back to the session defaults
    EXPECT_TRUE(validator_.validate(frame).valid);

    frame.payload.sample_rate = 8000;
    frame.payload.channels = 2;
    EXPECT_TRUE(validator_.validate(frame).valid);
    frame.payload.sample_rate = 48000;
    EXPECT_TRUE(validator_.validate(frame).valid);

    frame.payload.sample_rate = 48001;
    ValidationResult result = validator_.validate(frame);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error_message, "Sample rate must be between 8000 and 48000 Hz (got 48001)");

    frame.payload.sample_rate = 7999;
    EXPECT_FALSE(validator_.validate(frame).valid);

    frame.payload.sample_rate = 16000;
    frame.payload.channels = 3;
    result = validator_.validate(frame);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error_message, "Channels must be between 1 and 2 (got 3)");
}

TEST_F(FrameValidatorTest, HeartbeatNeedsSessionId) {
    ProtocolFrame frame;
    frame.type = FrameType::HEARTBEAT;
    frame.type_name = "HEARTBEAT";
    EXPECT_EQ(validator_.validate(frame).error_message, "Session ID is required");
}

TEST_F(FrameValidatorTest, AudioPayloadChecks) {
    ProtocolFrame missing = audio_frame(0);
    missing.has_payload = false;
    EXPECT_EQ(validator_.validate(missing).error_message, "Audio data payload is required");

    EXPECT_EQ(validator_.validate(audio_frame(0)).error_message, "Audio data cannot be empty");
}

TEST_F(FrameValidatorTest, OversizedChunkRejectedWithSize) {
    ValidationResult result = validator_.validate(audio_frame(70 * 1024));
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error_message, "Audio chunk exceeds maximum size (71680 > 65536 bytes)");

    EXPECT_TRUE(validator_.validate(audio_frame(64 * 1024)).valid);
}

TEST_F(FrameValidatorTest, FrameCeiling) {
    EXPECT_TRUE(validator_.validate_size(500 * 1024).valid);

    ValidationResult result = validator_.validate_size(500 * 1024 + 1);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error_message, "Frame exceeds maximum size (512001 > 512000 bytes)");
}

TEST(FrameValidatorConfigTest, LimitsFollowConfig) {
    ProtocolConfig config;
    config.max_audio_chunk_bytes = 100;
    config.max_frame_bytes = 1000;
    FrameValidator validator(config);

    EXPECT_FALSE(validator.validate(audio_frame(101)).valid);
    EXPECT_TRUE(validator.validate(audio_frame(100)).valid);
    EXPECT_FALSE(validator.validate_size(1001).valid);
}
