#pragma once

#include "audio/audio_frame.hpp"
#include "core/types.hpp"
#include <cstdint>

namespace parley {

enum class SilenceType {
    NONE = 0,
    SHORT,
    MEDIUM,
    LONG
};

const char* to_string(SilenceType type);

struct SilenceClassification {
    uint32_t silence_duration_ms = 0;
    uint32_t speech_duration_ms = 0;
    SilenceType type = SilenceType::NONE;
    bool should_trigger_processing = false;
    bool state_changed = false;
};

/**
 * Per-session turn-end detector.
 * Accumulates contiguous silence/speech and classifies the running silence
 * into tiers. A silence episode fires at most one trigger, and only after
 * enough speech preceded it.
 */
class SilenceTracker {
public:
    SilenceTracker();
    explicit SilenceTracker(const SilenceConfig& config);
    ~SilenceTracker();

    // Feed one VAD decision. Zero-length frames are rejected.
    ErrorCode update(const VoiceActivityResult& vad, SilenceClassification& out);

    // Forget all accumulated state
    void reset();

    // Tier for a given contiguous silence duration
    SilenceType classify_duration(uint32_t silence_ms) const;

    // Status
    uint32_t get_silence_duration_ms() const { return silence_duration_ms_; }
    uint32_t get_speech_duration_ms() const { return speech_duration_ms_; }
    SilenceType get_last_type() const { return last_type_; }
    bool has_triggered_this_episode() const { return triggered_for_this_episode_; }

    const SilenceConfig& config() const { return config_; }

private:
    SilenceConfig config_;

    uint32_t silence_duration_ms_;
    uint32_t speech_duration_ms_;
    SilenceType last_type_;
    bool triggered_for_this_episode_;

    // Statistics
    uint32_t trigger_count_;
};

} // namespace parley
