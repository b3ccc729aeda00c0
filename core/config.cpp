#include "config.hpp"
#include <cmath>
#include <sstream>

namespace heartlight {

// The decoder template is 8 symbols wide
static constexpr int kMinHistory = 8;

int frequency_to_bin(int frequency_hz, int sample_rate, int fft_size) {
    if (sample_rate <= 0) return -1;
    const double bin = static_cast<double>(frequency_hz) * fft_size / sample_rate;
    return static_cast<int>(std::lround(bin));
}

static bool is_power_of_two(int n) { return n > 0 && (n & (n - 1)) == 0; }

bool validate_config(const Config& cfg, std::string* error) {
    std::ostringstream why;
    if (cfg.sample_rate <= 0) {
        why << "sample_rate must be positive (got " << cfg.sample_rate << ")";
    } else if (cfg.fft_size < 16 || !is_power_of_two(cfg.fft_size)) {
        why << "fft_size must be a power of two >= 16 (got " << cfg.fft_size << ")";
    } else if (cfg.fft_neighbor_count < 0) {
        why << "fft_neighbor_count must not be negative (got " << cfg.fft_neighbor_count << ")";
    } else if (cfg.frame_interval_ms <= 0) {
        why << "frame_interval_ms must be positive (got " << cfg.frame_interval_ms << ")";
    } else if (cfg.dominant_ratio < 0.0f || cfg.dominant_floor < 0.0f) {
        why << "dominant_floor and dominant_ratio must not be negative";
    } else if (cfg.target_frequencies.empty()) {
        why << "no target frequencies configured";
    } else {
        const int half = cfg.fft_size / 2;
        for (int f : cfg.target_frequencies) {
            const int bin = frequency_to_bin(f, cfg.sample_rate, cfg.fft_size);
            const int lo = bin - cfg.fft_neighbor_count;
            const int hi = bin + cfg.fft_neighbor_count;
            if (lo < 0 || hi >= half) {
                why << "target " << f << " Hz needs bins [" << lo << ", " << hi
                    << "] but only [0, " << half << ") exist at "
                    << cfg.sample_rate << " Hz / " << cfg.fft_size << " points";
                break;
            }
        }
    }
    const std::string msg = why.str();
    if (msg.empty()) return true;
    if (error) *error = msg;
    return false;
}

int history_capacity(const Config& cfg) {
    if (cfg.fft_size <= 0) return kMinHistory;
    const int n = cfg.sample_rate / cfg.fft_size;
    return n < kMinHistory ? kMinHistory : n;
}

} // namespace heartlight
