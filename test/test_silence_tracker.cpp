#include "audio/silence_tracker.hpp"
#include <gtest/gtest.h>

using namespace parley;

namespace {

VoiceActivityResult frame(bool speech, uint32_t duration_ms) {
    VoiceActivityResult vad;
    vad.is_speech = speech;
    vad.energy = speech ? 0.2f : 0.0f;
    vad.duration_ms = duration_ms;
    return vad;
}

} // namespace

TEST(SilenceTrackerTest, ClassifiesTiers) {
    SilenceTracker tracker;

    EXPECT_EQ(tracker.classify_duration(0), SilenceType::NONE);
    EXPECT_EQ(tracker.classify_duration(1), SilenceType::SHORT);
    EXPECT_EQ(tracker.classify_duration(699), SilenceType::SHORT);
    EXPECT_EQ(tracker.classify_duration(700), SilenceType::MEDIUM);
    EXPECT_EQ(tracker.classify_duration(1999), SilenceType::MEDIUM);
    EXPECT_EQ(tracker.classify_duration(2000), SilenceType::LONG);
}

TEST(SilenceTrackerTest, LongTierNeverBelowMedium) {
    SilenceConfig config;
    config.medium_ms = 1000;
    config.long_ms = 500;
    SilenceTracker tracker(config);

    EXPECT_EQ(tracker.config().long_ms, 1000u);
    EXPECT_EQ(tracker.classify_duration(999), SilenceType::SHORT);
    EXPECT_EQ(tracker.classify_duration(1000), SilenceType::LONG);
}

TEST(SilenceTrackerTest, RejectsZeroLengthFrame) {
    SilenceTracker tracker;
    SilenceClassification out;

    EXPECT_EQ(tracker.update(frame(true, 0), out), ErrorCode::INVALID_FRAME);
    EXPECT_EQ(tracker.get_speech_duration_ms(), 0u);
}

TEST(SilenceTrackerTest, SpeechResetsSilence) {
    SilenceTracker tracker;
    SilenceClassification out;

    ASSERT_EQ(tracker.update(frame(false, 300), out), ErrorCode::SUCCESS);
    EXPECT_EQ(out.type, SilenceType::SHORT);
    EXPECT_EQ(out.silence_duration_ms, 300u);

    ASSERT_EQ(tracker.update(frame(true, 100), out), ErrorCode::SUCCESS);
    EXPECT_EQ(out.type, SilenceType::NONE);
    EXPECT_EQ(out.silence_duration_ms, 0u);
    EXPECT_EQ(out.speech_duration_ms, 100u);
}

TEST(SilenceTrackerTest, TriggersOncePerSilenceEpisode) {
    SilenceTracker tracker;
    SilenceClassification out;
    int triggers = 0;

    // 3 s of speech, then 2.5 s of silence, in 100 ms frames
    for (int i = 0; i < 30; i++) {
        ASSERT_EQ(tracker.update(frame(true, 100), out), ErrorCode::SUCCESS);
        EXPECT_FALSE(out.should_trigger_processing);
    }
    for (int i = 0; i < 25; i++) {
        ASSERT_EQ(tracker.update(frame(false, 100), out), ErrorCode::SUCCESS);
        if (out.should_trigger_processing) {
            triggers++;
            EXPECT_EQ(out.silence_duration_ms, 700u);
            EXPECT_EQ(out.type, SilenceType::MEDIUM);
            EXPECT_EQ(out.speech_duration_ms, 3000u);
        }
    }

    EXPECT_EQ(triggers, 1);
    EXPECT_EQ(tracker.get_last_type(), SilenceType::LONG);
    EXPECT_TRUE(tracker.has_triggered_this_episode());
}

TEST(SilenceTrackerTest, NoTriggerWithoutEnoughSpeech) {
    SilenceTracker tracker;
    SilenceClassification out;

    ASSERT_EQ(tracker.update(frame(true, 100), out), ErrorCode::SUCCESS);
    for (int i = 0; i < 30; i++) {
        ASSERT_EQ(tracker.update(frame(false, 100), out), ErrorCode::SUCCESS);
        EXPECT_FALSE(out.should_trigger_processing);
    }
}

TEST(SilenceTrackerTest, LeadingSilenceNeverTriggers) {
    SilenceTracker tracker;
    SilenceClassification out;

    for (int i = 0; i < 50; i++) {
        ASSERT_EQ(tracker.update(frame(false, 100), out), ErrorCode::SUCCESS);
        EXPECT_FALSE(out.should_trigger_processing);
    }
    EXPECT_EQ(out.type, SilenceType::LONG);
}

TEST(SilenceTrackerTest, NewUtteranceCanTriggerAgain) {
    SilenceTracker tracker;
    SilenceClassification out;
    int triggers = 0;

    for (int round = 0; round < 2; round++) {
        for (int i = 0; i < 5; i++) {
            tracker.update(frame(true, 100), out);
        }
        for (int i = 0; i < 10; i++) {
            tracker.update(frame(false, 100), out);
            if (out.should_trigger_processing) triggers++;
        }
    }

    EXPECT_EQ(triggers, 2);
}

TEST(SilenceTrackerTest, ReportsTierChanges) {
    SilenceTracker tracker;
    SilenceClassification out;

    tracker.update(frame(true, 500), out);
    EXPECT_FALSE(out.state_changed);

    tracker.update(frame(false, 100), out);
    EXPECT_TRUE(out.state_changed);
    EXPECT_EQ(out.type, SilenceType::SHORT);

    tracker.update(frame(false, 100), out);
    EXPECT_FALSE(out.state_changed);

    tracker.update(frame(false, 500), out);
    EXPECT_TRUE(out.state_changed);
    EXPECT_EQ(out.type, SilenceType::MEDIUM);
}

TEST(SilenceTrackerTest, ResetForgetsEverything) {
    SilenceTracker tracker;
    SilenceClassification out;

    tracker.update(frame(true, 1000), out);
    tracker.update(frame(false, 800), out);
    ASSERT_TRUE(tracker.has_triggered_this_episode());

    tracker.reset();

    EXPECT_EQ(tracker.get_silence_duration_ms(), 0u);
    EXPECT_EQ(tracker.get_speech_duration_ms(), 0u);
    EXPECT_EQ(tracker.get_last_type(), SilenceType::NONE);
    EXPECT_FALSE(tracker.has_triggered_this_episode());
}
