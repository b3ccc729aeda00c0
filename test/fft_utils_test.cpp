#include "fft/fft_utils.hpp"
#include "block_assembler.hpp"
#include "test_util.hpp"

#include <algorithm>
#include <complex>
#include <vector>

using namespace heartlight;

static void test_forward_peak() {
    test::section("forward transform of a bin-centred cosine");
    const int n = 64;
    fft::FftPlan plan(n);
    std::vector<std::complex<float>> data(n);
    for (int i = 0; i < n; ++i) data[i] = std::complex<float>(std::cos(2.0 * M_PI * 5 * i / n), 0.0f);
    plan.forward(data);

    int peak = 1;
    for (int k = 1; k < n / 2; ++k) {
        if (std::abs(data[k]) > std::abs(data[peak])) peak = k;
    }
    CHECK(peak == 5);
    CHECK_NEAR(std::abs(data[5]), n / 2.0, 1e-3);
    CHECK_NEAR(std::abs(data[n - 5]), n / 2.0, 1e-3);
    CHECK(std::abs(data[7]) < 1e-3);
}

static void test_inverse_restores_input() {
    test::section("inverse(forward(x)) == x");
    const int n = 256;
    fft::FftPlan plan(n);
    std::vector<std::complex<float>> data(n);
    for (int i = 0; i < n; ++i) {
        data[i] = std::complex<float>(std::sin(0.37 * i) + 0.25f * ((i * 7) % 11), 0.0f);
    }
    const auto original = data;
    plan.forward(data);
    plan.inverse(data);
    float worst = 0.0f;
    for (int i = 0; i < n; ++i) worst = std::max(worst, std::abs(data[i] - original[i]));
    CHECK(worst < 1e-3f);
}

static void test_hann_window() {
    test::section("hann window");
    const auto w = fft::make_hann_window(1024);
    CHECK(w.size() == 1024u);
    CHECK_NEAR(w.front(), 0.0, 1e-6);
    CHECK_NEAR(w.back(), 0.0, 1e-6);
    CHECK_NEAR(w[1023 / 2], 1.0, 1e-4);
    CHECK_NEAR(w[100], w[1023 - 100], 1e-6);
}

static void test_block_assembler() {
    test::section("block assembler regroups periods into exact blocks");
    BlockAssembler assembler(8);
    std::vector<int16_t> seen;
    int calls = 0;
    auto on_block = [&](const int16_t* block, int size) {
        ++calls;
        CHECK(size == 8);
        seen.insert(seen.end(), block, block + size);
    };

    std::vector<int16_t> samples(21);
    for (int i = 0; i < 21; ++i) samples[i] = static_cast<int16_t>(i);

    CHECK(assembler.push(samples.data(), 5, on_block) == 0);
    CHECK(assembler.pending() == 5);
    CHECK(assembler.push(samples.data() + 5, 13, on_block) == 2);
    CHECK(assembler.pending() == 2);
    CHECK(assembler.push(samples.data() + 18, 3, on_block) == 0);
    CHECK(calls == 2);
    CHECK(seen.size() == 16u);
    bool in_order = true;
    for (size_t i = 0; i < seen.size(); ++i) in_order = in_order && seen[i] == static_cast<int16_t>(i);
    CHECK(in_order);

    assembler.clear();
    CHECK(assembler.pending() == 0);
    CHECK(assembler.push(nullptr, 4, on_block) == 0);
}

int main() {
    test_forward_peak();
    test_inverse_restores_input();
    test_hann_window();
    test_block_assembler();
    return test::finish("fft_utils_test");
}
