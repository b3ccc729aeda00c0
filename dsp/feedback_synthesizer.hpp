#pragma once

#include <complex>
#include <cstdint>
#include <deque>
#include <map>
#include <vector>

#include "config.hpp"
#include "magnitude_map.hpp"
#include "fft/fft_utils.hpp"

namespace heartlight {

// Renders the beacon audibly: each ultrasonic target is mapped to a note
// (C6, D6, E6, F6, G6) whose level follows the target's magnitude above the
// running noise level. One fft_size PCM block per MagnitudeMap.
class FeedbackSynthesizer {
public:
    explicit FeedbackSynthesizer(const Config& cfg);

    std::vector<int16_t> synthesize(const MagnitudeMap& magnitudes);

    void set_gain(float gain) { gain_ = gain; }
    float gain() const { return gain_; }

    // Mean of the recent per-block noise levels
    float noise_threshold() const;

    static const std::map<int, float>& audible_frequencies();

private:
    int sample_rate_;
    int fft_size_;
    float gain_;
    size_t noise_history_size_;
    std::deque<float> noise_levels_;

    fft::FftPlan plan_;
    std::vector<std::complex<float>> spectrum_;
};

} // namespace heartlight
