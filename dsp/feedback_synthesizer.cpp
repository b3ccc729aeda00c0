#include "feedback_synthesizer.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace heartlight {

const std::map<int, float>& FeedbackSynthesizer::audible_frequencies() {
    static const std::map<int, float> table = {
        {18500, 1046.502f},
        {18750, 1174.659f},
        {19000, 1318.510f},
        {19250, 1396.913f},
        {19500, 1567.982f},
    };
    return table;
}

FeedbackSynthesizer::FeedbackSynthesizer(const Config& cfg)
    : sample_rate_(cfg.sample_rate),
      fft_size_(cfg.fft_size),
      gain_(cfg.feedback_gain),
      noise_history_size_(static_cast<size_t>(std::max(1, 2 * cfg.sample_rate / std::max(1, cfg.fft_size)))),
      noise_levels_(noise_history_size_, 0.0f),
      plan_(cfg.fft_size),
      spectrum_(cfg.fft_size) {}

float FeedbackSynthesizer::noise_threshold() const {
    if (noise_levels_.empty()) return 0.0f;
    const double sum = std::accumulate(noise_levels_.begin(), noise_levels_.end(), 0.0);
    return static_cast<float>(sum / noise_levels_.size());
}

std::vector<int16_t> FeedbackSynthesizer::synthesize(const MagnitudeMap& magnitudes) {
    std::vector<int16_t> pcm(fft_size_, 0);
    if (magnitudes.size() < 2) return pcm;

    // Noise level of this block: mean of everything but the strongest entry
    size_t max_idx = 0;
    for (size_t i = 1; i < magnitudes.size(); ++i) {
        if (magnitudes[i].magnitude > magnitudes[max_idx].magnitude) max_idx = i;
    }
    double others = 0.0;
    for (size_t i = 0; i < magnitudes.size(); ++i) {
        if (i != max_idx) others += magnitudes[i].magnitude;
    }
    noise_levels_.push_back(static_cast<float>(others / (magnitudes.size() - 1)));
    while (noise_levels_.size() > noise_history_size_) noise_levels_.pop_front();
    const float threshold = noise_threshold();

    std::fill(spectrum_.begin(), spectrum_.end(), std::complex<float>(0.0f, 0.0f));
    const auto& audible = audible_frequencies();
    for (const auto& fm : magnitudes) {
        auto it = audible.find(fm.frequency_hz);
        if (it == audible.end()) continue;
        const int index = static_cast<int>(it->second * fft_size_ / sample_rate_);
        if (index <= 0 || index >= fft_size_) continue;
        spectrum_[index] = std::complex<float>(std::max(0.0f, fm.magnitude - threshold) * gain_, 0.0f);
    }

    plan_.inverse(spectrum_);

    for (int i = 0; i < fft_size_; ++i) {
        const float v = std::max(-1.0f, std::min(1.0f, spectrum_[i].real()));
        pcm[i] = static_cast<int16_t>(v * 32767.0f);
    }
    return pcm;
}

} // namespace heartlight
