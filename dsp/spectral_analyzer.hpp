#pragma once

#include <complex>
#include <cstdint>
#include <memory>
#include <vector>

#include "config.hpp"
#include "magnitude_map.hpp"
#include "fft/fft_utils.hpp"

namespace heartlight {

// Converts one block of fft_size mono samples into the magnitude at each
// target frequency: Hann window, forward FFT, then per target the mean of the
// amplitude-normalized magnitudes of the 2*neighbors+1 bins around its
// nominal bin.
class SpectralAnalyzer {
public:
    // Returns nullptr (and logs why) when the configuration would address a
    // bin outside [0, N/2).
    static std::unique_ptr<SpectralAnalyzer> create(const Config& cfg);

    // num_samples must equal fft_size; anything else yields an empty map,
    // which downstream treats as "no symbol".
    MagnitudeMap analyze(const int16_t* samples, int num_samples);

private:
    explicit SpectralAnalyzer(const Config& cfg);

    int sample_rate_;
    int fft_size_;
    int neighbor_count_;
    std::vector<int> target_frequencies_;
    std::vector<int> target_bins_;

    fft::FftPlan plan_;
    std::vector<float> window_;
    std::vector<std::complex<float>> buffer_;

    float bin_magnitude(int bin) const;
};

} // namespace heartlight
