#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace parley {

/**
 * One block of PCM16 samples handed to the VAD.
 * energy < 0 means "not precomputed".
 */
struct AudioFrame {
    std::vector<int16_t> samples;
    uint32_t sample_rate = 16000;
    uint8_t channels = 1;
    uint64_t timestamp_ms = 0;
    float energy = -1.0f;

    bool has_energy() const { return energy >= 0.0f; }

    // Duration in ms of the frame across all channels
    uint32_t duration_ms() const {
        if (sample_rate == 0 || channels == 0) return 0;
        uint64_t per_channel = samples.size() / channels;
        return static_cast<uint32_t>((per_channel * 1000) / sample_rate);
    }

    // Build a frame from little-endian PCM16 bytes
    static AudioFrame from_pcm16le(const uint8_t* data, size_t length,
                                   uint32_t sample_rate, uint8_t channels,
                                   uint64_t timestamp_ms);
};

struct VoiceActivityResult {
    bool is_speech = false;
    float energy = 0.0f;
    uint64_t timestamp_ms = 0;
    uint32_t duration_ms = 0;
};

} // namespace parley
