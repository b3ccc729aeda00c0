#include "fft/fft_utils.hpp"
#include <cmath>

namespace heartlight::fft {

FftPlan::FftPlan(int size) : size_(size) {
    if (size_ <= 1) return;

    int bits = 0; while ((1 << bits) < size_) ++bits;
    bitrev_.resize(size_);
    for (int i = 0; i < size_; ++i) {
        unsigned int v = static_cast<unsigned int>(i);
        unsigned int r = 0;
        for (int b = 0; b < bits; ++b) { r = (r << 1) | (v & 1u); v >>= 1; }
        bitrev_[i] = static_cast<int>(r);
    }

    const double two_pi = 6.28318530717958647692;
    for (int len = 2; len <= size_; len <<= 1) {
        const int half = len / 2;
        std::vector<std::complex<float>> stage(half);
        // Direct evaluation per twiddle; recurrence drifts at 1024+ points
        for (int k = 0; k < half; ++k) {
            const double angle = -two_pi * k / len;
            stage[k] = std::complex<float>(static_cast<float>(std::cos(angle)),
                                           static_cast<float>(std::sin(angle)));
        }
        stages_.push_back(std::move(stage));
    }
}

void FftPlan::forward(std::vector<std::complex<float>>& data) const {
    transform(data, false);
}

void FftPlan::inverse(std::vector<std::complex<float>>& data) const {
    transform(data, true);
    const float scale = 1.0f / static_cast<float>(size_);
    for (auto& v : data) v *= scale;
}

void FftPlan::transform(std::vector<std::complex<float>>& data, bool invert) const {
    const int n = size_;
    if (n <= 1) return;
    data.resize(n);

    // Bit-reversal
    std::vector<std::complex<float>> tmp(n);
    for (int i = 0; i < n; ++i) tmp[bitrev_[i]] = data[i];
    data.swap(tmp);

    // Iterative radix-2; inverse uses conjugate twiddles
    int stageIndex = 0;
    for (int len = 2; len <= n; len <<= 1, ++stageIndex) {
        const auto& W = stages_[stageIndex];
        for (int i = 0; i < n; i += len) {
            for (int k = 0; k < len / 2; ++k) {
                const auto w = invert ? std::conj(W[k]) : W[k];
                const auto u = data[i + k];
                const auto v = data[i + k + len / 2] * w;
                data[i + k] = u + v;
                data[i + k + len / 2] = u - v;
            }
        }
    }
}

std::vector<float> make_hann_window(int size) {
    std::vector<float> w(size > 0 ? size : 0, 1.0f);
    if (size <= 1) return w;
    const double two_pi = 6.28318530717958647692;
    for (int i = 0; i < size; ++i) {
        w[i] = static_cast<float>(0.5 * (1.0 - std::cos(two_pi * i / (size - 1))));
    }
    return w;
}

} // namespace heartlight::fft
