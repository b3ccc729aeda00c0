#pragma once

#include "color.hpp"
#include <string>
#include <vector>

namespace heartlight {

// Runtime options shared by the capture, decode and animation stages.
// Passed by value into each component at construction.
struct Config {
    int sample_rate = 44100;
    int fft_size = 1024;
    int fft_neighbor_count = 2;     // bins averaged on each side of the nominal bin
    std::vector<int> target_frequencies = {18500, 18750, 19000, 19250, 19500};

    int frame_interval_ms = 50;
    Color off_color = colors::kBlack;

    float dominant_floor = 500.0f;  // absolute magnitude a symbol must reach
    float dominant_ratio = 3.0f;    // ... and how far above the mean of the others

    // Capture / playback
    std::string device_name = "default";
    std::string playback_device_name = "default";
    bool use_realtime_priority = false;
    bool feedback_enabled = false;
    float feedback_gain = 2.0f;
};

// Nominal FFT bin of a frequency: round(f * N / fs)
int frequency_to_bin(int frequency_hz, int sample_rate, int fft_size);

// Eager validation of the whole configuration. On failure, writes the reason
// to *error (if given) and returns false; nothing should be started then.
bool validate_config(const Config& cfg, std::string* error);

// Number of symbols kept by the decoder (~1 second of blocks)
int history_capacity(const Config& cfg);

} // namespace heartlight
