#include "spectral_analyzer.hpp"

#include <cmath>
#include <iostream>
#include <string>

namespace heartlight {

std::unique_ptr<SpectralAnalyzer> SpectralAnalyzer::create(const Config& cfg) {
    std::string error;
    if (!validate_config(cfg, &error)) {
        std::cerr << "[analyzer] invalid configuration: " << error << std::endl;
        return nullptr;
    }
    return std::unique_ptr<SpectralAnalyzer>(new SpectralAnalyzer(cfg));
}

SpectralAnalyzer::SpectralAnalyzer(const Config& cfg)
    : sample_rate_(cfg.sample_rate),
      fft_size_(cfg.fft_size),
      neighbor_count_(cfg.fft_neighbor_count),
      target_frequencies_(cfg.target_frequencies),
      plan_(cfg.fft_size),
      window_(fft::make_hann_window(cfg.fft_size)),
      buffer_(cfg.fft_size) {
    target_bins_.reserve(target_frequencies_.size());
    for (int f : target_frequencies_) {
        target_bins_.push_back(frequency_to_bin(f, sample_rate_, fft_size_));
    }
}

float SpectralAnalyzer::bin_magnitude(int bin) const {
    // Scaled back to the amplitude of the windowed sinusoid:
    // |X| / (N/2) for the one-sided spectrum, x2 for the Hann coherent gain.
    const auto& v = buffer_[bin];
    const float half = static_cast<float>(fft_size_) * 0.5f;
    return std::hypot(v.real(), v.imag()) / half * 2.0f;
}

MagnitudeMap SpectralAnalyzer::analyze(const int16_t* samples, int num_samples) {
    MagnitudeMap out;
    if (!samples || num_samples != fft_size_) return out;

    for (int i = 0; i < fft_size_; ++i) {
        buffer_[i] = std::complex<float>(static_cast<float>(samples[i]) * window_[i], 0.0f);
    }
    plan_.forward(buffer_);

    out.reserve(target_frequencies_.size());
    const float span = static_cast<float>(2 * neighbor_count_ + 1);
    for (size_t t = 0; t < target_frequencies_.size(); ++t) {
        const int center = target_bins_[t];
        float sum = 0.0f;
        for (int k = center - neighbor_count_; k <= center + neighbor_count_; ++k) {
            sum += bin_magnitude(k);
        }
        out.push_back(FrequencyMagnitude{target_frequencies_[t], sum / span});
    }
    return out;
}

} // namespace heartlight
