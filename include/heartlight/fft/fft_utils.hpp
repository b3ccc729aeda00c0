#pragma once

#include <vector>
#include <complex>

namespace heartlight::fft {

// Precomputed bit-reversal table and per-stage twiddles for one transform
// size. Size must be a power of two. A plan is immutable after construction,
// so one instance may be shared by several threads as long as each passes its
// own data buffer.
class FftPlan {
public:
    explicit FftPlan(int size);

    int size() const { return size_; }

    // In-place iterative radix-2 forward transform (no scaling)
    void forward(std::vector<std::complex<float>>& data) const;

    // In-place inverse transform, scaled by 1/N so inverse(forward(x)) == x
    void inverse(std::vector<std::complex<float>>& data) const;

private:
    int size_;
    std::vector<int> bitrev_;
    std::vector<std::vector<std::complex<float>>> stages_;

    void transform(std::vector<std::complex<float>>& data, bool invert) const;
};

// Hann window coefficients: 0.5 * (1 - cos(2*pi*i / (N-1)))
std::vector<float> make_hann_window(int size);

} // namespace heartlight::fft
