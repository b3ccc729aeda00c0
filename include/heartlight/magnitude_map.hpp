#pragma once

#include <vector>

namespace heartlight {

struct FrequencyMagnitude {
    int frequency_hz = 0;
    float magnitude = 0.0f;
};

// One entry per target frequency, in configuration order. Recomputed per block.
using MagnitudeMap = std::vector<FrequencyMagnitude>;

} // namespace heartlight
