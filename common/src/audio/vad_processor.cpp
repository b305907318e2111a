#include "audio/vad_processor.hpp"
#include "esp_log.h"
#include <algorithm>
#include <cmath>

static const char* TAG = "VADProcessor";

namespace parley {

AudioFrame AudioFrame::from_pcm16le(const uint8_t* data, size_t length,
                                    uint32_t sample_rate, uint8_t channels,
                                    uint64_t timestamp_ms) {
    AudioFrame frame;
    frame.sample_rate = sample_rate;
    frame.channels = channels;
    frame.timestamp_ms = timestamp_ms;

    if (!data) return frame;

    size_t count = length / 2;
    frame.samples.resize(count);
    for (size_t i = 0; i < count; i++) {
        uint16_t lo = data[2 * i];
        uint16_t hi = data[2 * i + 1];
        frame.samples[i] = static_cast<int16_t>(lo | (hi << 8));
    }
    return frame;
}

VADProcessor::VADProcessor()
    : energy_threshold_(VadConfig().energy_threshold) {
}

VADProcessor::VADProcessor(const VadConfig& config)
    : energy_threshold_(std::max(0.0f, config.energy_threshold)) {
}

VADProcessor::~VADProcessor() = default;

VoiceActivityResult VADProcessor::classify(const AudioFrame& frame) const {
    VoiceActivityResult result;
    result.timestamp_ms = frame.timestamp_ms;
    result.duration_ms = frame.duration_ms();

    if (frame.has_energy()) {
        result.energy = frame.energy;
    } else {
        result.energy = calculate_energy(frame.samples.data(), frame.samples.size());
    }

    result.is_speech = result.energy > energy_threshold_;

    ESP_LOGV(TAG, "energy=%.4f threshold=%.4f speech=%d",
             result.energy, energy_threshold_, result.is_speech);

    return result;
}

void VADProcessor::set_energy_threshold(float threshold) {
    energy_threshold_ = std::max(0.0f, threshold);
    ESP_LOGD(TAG, "Energy threshold set to: %.6f", energy_threshold_);
}

float VADProcessor::calculate_energy(const int16_t* audio_data, size_t samples) {
    if (!audio_data || samples == 0) return 0.0f;

    int64_t sum_squares = 0;
    for (size_t i = 0; i < samples; i++) {
        int32_t sample = audio_data[i];
        sum_squares += static_cast<int64_t>(sample) * sample;
    }

    // Normalize by sample count and max value
    float rms = sqrtf(static_cast<float>(sum_squares) / samples) / 32768.0f;
    return rms;
}

} // namespace parley
