// Minimal check helpers for the standalone test programs
#pragma once

#include <cmath>
#include <cstdint>
#include <iostream>
#include <vector>

#include "config.hpp"
#include "magnitude_map.hpp"

namespace test {

struct Tally {
    int passed = 0;
    int failed = 0;
};

inline Tally& tally() {
    static Tally t;
    return t;
}

inline bool check(bool ok, const char* what, const char* file, int line) {
    if (ok) {
        tally().passed++;
    } else {
        tally().failed++;
        std::cout << "  FAIL " << file << ":" << line << "  " << what << std::endl;
    }
    return ok;
}

inline bool check_near(double actual, double expected, double tol, const char* what,
                       const char* file, int line) {
    const bool ok = std::fabs(actual - expected) <= tol;
    if (!ok) {
        std::cout << "  FAIL " << file << ":" << line << "  " << what
                  << " (got " << actual << ", expected " << expected << " +/- " << tol << ")" << std::endl;
    }
    tally().passed += ok ? 1 : 0;
    tally().failed += ok ? 0 : 1;
    return ok;
}

inline void section(const char* name) {
    std::cout << "[ " << name << " ]" << std::endl;
}

// Prints the summary; use as the return value of main()
inline int finish(const char* suite) {
    std::cout << suite << ": " << tally().passed << " passed, "
              << tally().failed << " failed" << std::endl;
    return tally().failed == 0 ? 0 : 1;
}

// One analysis block holding a pure tone (frequency_hz == 0 gives silence)
inline std::vector<int16_t> tone_block(const heartlight::Config& cfg, int frequency_hz, float amplitude) {
    std::vector<int16_t> block(cfg.fft_size, 0);
    if (frequency_hz <= 0) return block;
    const double w = 2.0 * M_PI * frequency_hz / cfg.sample_rate;
    for (int i = 0; i < cfg.fft_size; ++i) {
        block[i] = static_cast<int16_t>(std::lround(amplitude * std::sin(w * i)));
    }
    return block;
}

// Magnitude map in which `symbol` stands out clearly (0: nothing stands out)
inline heartlight::MagnitudeMap map_for(int symbol) {
    heartlight::MagnitudeMap m;
    for (int f : {18500, 18750, 19000, 19250, 19500}) {
        m.push_back({f, f == symbol ? 2000.0f : 100.0f});
    }
    return m;
}

} // namespace test

#define CHECK(cond) ::test::check((cond), #cond, __FILE__, __LINE__)
#define CHECK_NEAR(actual, expected, tol) \
    ::test::check_near((actual), (expected), (tol), #actual " ~ " #expected, __FILE__, __LINE__)
