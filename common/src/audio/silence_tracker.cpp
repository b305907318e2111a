#include "audio/silence_tracker.hpp"
#include "esp_log.h"
#include <algorithm>

static const char* TAG = "SilenceTracker";

namespace parley {

const char* to_string(SilenceType type) {
    switch (type) {
        case SilenceType::NONE:   return "none";
        case SilenceType::SHORT:  return "short";
        case SilenceType::MEDIUM: return "medium";
        case SilenceType::LONG:   return "long";
    }
    return "unknown";
}

SilenceTracker::SilenceTracker()
    : SilenceTracker(SilenceConfig()) {
}

SilenceTracker::SilenceTracker(const SilenceConfig& config)
    : config_(config)
    , silence_duration_ms_(0)
    , speech_duration_ms_(0)
    , last_type_(SilenceType::NONE)
    , triggered_for_this_episode_(false)
    , trigger_count_(0) {

    // Long tier can never start before the medium tier
    config_.long_ms = std::max(config_.long_ms, config_.medium_ms);
}

SilenceTracker::~SilenceTracker() = default;

ErrorCode SilenceTracker::update(const VoiceActivityResult& vad, SilenceClassification& out) {
    if (vad.duration_ms == 0) {
        ESP_LOGW(TAG, "Rejecting zero-length frame");
        return ErrorCode::INVALID_FRAME;
    }

    out = SilenceClassification();

    if (vad.is_speech) {
        speech_duration_ms_ += vad.duration_ms;
        silence_duration_ms_ = 0;
        triggered_for_this_episode_ = false;
        out.type = SilenceType::NONE;
        out.speech_duration_ms = speech_duration_ms_;
    } else {
        silence_duration_ms_ += vad.duration_ms;
        out.type = classify_duration(silence_duration_ms_);
        out.speech_duration_ms = speech_duration_ms_;

        if (out.type >= SilenceType::MEDIUM &&
            !triggered_for_this_episode_ &&
            speech_duration_ms_ > config_.min_speech_ms) {
            out.should_trigger_processing = true;
            triggered_for_this_episode_ = true;
            trigger_count_++;

            // The utterance is handed to the turn; the next one starts fresh
            speech_duration_ms_ = 0;

            ESP_LOGI(TAG, "Turn end after %u ms silence (%u ms speech), trigger #%u",
                     silence_duration_ms_, out.speech_duration_ms, trigger_count_);
        }
    }

    out.silence_duration_ms = silence_duration_ms_;
    out.state_changed = (out.type != last_type_);

    if (out.state_changed) {
        ESP_LOGD(TAG, "Silence tier: %s -> %s", to_string(last_type_), to_string(out.type));
    }
    last_type_ = out.type;

    return ErrorCode::SUCCESS;
}

void SilenceTracker::reset() {
    silence_duration_ms_ = 0;
    speech_duration_ms_ = 0;
    last_type_ = SilenceType::NONE;
    triggered_for_this_episode_ = false;
    ESP_LOGD(TAG, "Silence tracker reset");
}

SilenceType SilenceTracker::classify_duration(uint32_t silence_ms) const {
    if (silence_ms == 0) return SilenceType::NONE;
    if (silence_ms < config_.medium_ms) return SilenceType::SHORT;
    if (silence_ms < config_.long_ms) return SilenceType::MEDIUM;
    return SilenceType::LONG;
}

} // namespace parley
