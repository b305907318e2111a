#pragma once

#include "audio/audio_frame.hpp"
#include "core/types.hpp"
#include <cstdint>

namespace parley {

/**
 * Voice Activity Detection processor
 * Energy-threshold speech/silence decision for a single frame.
 * Stateless: the same frame always yields the same result.
 */
class VADProcessor {
public:
    VADProcessor();
    explicit VADProcessor(const VadConfig& config);
    ~VADProcessor();

    // Classify one frame; uses the precomputed energy when present
    VoiceActivityResult classify(const AudioFrame& frame) const;

    // Configuration
    void set_energy_threshold(float threshold);
    float get_energy_threshold() const { return energy_threshold_; }

    // RMS of PCM16 samples normalised to [0, 1]
    static float calculate_energy(const int16_t* audio_data, size_t samples);

private:
    float energy_threshold_;
};

} // namespace parley
