#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace heartlight {

struct AudioConfig {
    std::string device_name = "default";
    unsigned int sample_rate = 44100;
    unsigned int block_size = 1024;   // samples per delivered block (= fft_size)
    unsigned int period_size = 256;   // ALSA period; blocks are reassembled from periods
    unsigned int num_periods = 4;
    bool use_realtime_priority = false;
};

// Mono S16 capture that delivers exact block_size blocks
class IAudioInput {
public:
    using BlockCallback = std::function<void(const int16_t* samples, int num_samples)>;

    virtual ~IAudioInput() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;

    virtual void set_block_callback(BlockCallback callback) = 0;
    virtual const AudioConfig& get_config() const = 0;

    struct LatencyStats {
        float min_ms;
        float max_ms;
        float avg_ms;
        int xruns;
    };
    virtual LatencyStats get_latency_stats() const = 0;
};

// Factory that returns the active platform backend
std::unique_ptr<IAudioInput> create_audio_input(const AudioConfig& config);

} // namespace heartlight
