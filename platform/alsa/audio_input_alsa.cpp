#include "audio_input.hpp"
#include "block_assembler.hpp"

#include <alsa/asoundlib.h>
#include <algorithm>
#include <atomic>
#include <iostream>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sys/mman.h>
#include <sched.h>
#include <string>
#include <thread>
#include <vector>

namespace heartlight {

class AlsaAudioInput : public IAudioInput {
public:
    explicit AlsaAudioInput(const AudioConfig& cfg)
        : config(cfg), pcm_handle(nullptr), running(false),
          assembler(static_cast<int>(cfg.block_size)), xrun_count(0) {}

    ~AlsaAudioInput() override { stop(); }

    bool start() override {
        if (running.load()) {
            return true;
        }
        if (!setup_alsa()) {
            return false;
        }
        assembler.clear();
        running = true;
        capture_thread = std::thread(&AlsaAudioInput::capture_thread_func, this);
        if (config.use_realtime_priority) {
            set_realtime_priority();
        }
        return true;
    }

    void stop() override {
        if (!running.load() && !capture_thread.joinable()) {
            return;
        }
        running = false;
        if (capture_thread.joinable()) {
            capture_thread.join();
        }
        cleanup_alsa();
    }

    bool is_running() const override { return running.load(); }

    void set_block_callback(BlockCallback callback) override {
        std::lock_guard<std::mutex> lock(callback_mutex);
        block_callback = std::move(callback);
    }

    const AudioConfig& get_config() const override { return config; }

    // Decode cost per block: time spent in the block callback
    LatencyStats get_latency_stats() const override {
        LatencyStats stats{};
        {
            std::lock_guard<std::mutex> lock(stats_mutex);
            stats.min_ms = decoded_blocks > 0 ? fastest_block_ms : 0.0f;
            stats.max_ms = slowest_block_ms;
            stats.avg_ms = decoded_blocks > 0 ? static_cast<float>(total_block_ms / decoded_blocks) : 0.0f;
        }
        stats.xruns = xrun_count.load();
        return stats;
    }

private:
    AudioConfig config;
    snd_pcm_t* pcm_handle;
    std::atomic<bool> running;
    std::thread capture_thread;
    std::mutex callback_mutex;
    BlockCallback block_callback;
    BlockAssembler assembler;

    mutable std::mutex stats_mutex;
    float fastest_block_ms = 0.0f;
    float slowest_block_ms = 0.0f;
    double total_block_ms = 0.0;
    long decoded_blocks = 0;
    std::atomic<int> xrun_count;

    void record_block_time(float ms) {
        std::lock_guard<std::mutex> lock(stats_mutex);
        if (decoded_blocks == 0 || ms < fastest_block_ms) fastest_block_ms = ms;
        if (ms > slowest_block_ms) slowest_block_ms = ms;
        total_block_ms += ms;
        ++decoded_blocks;
    }

    // Opens the configured device, falling back to any capture-capable
    // plughw device; plughw resamples and downmixes when the card can't do
    // 44.1 kHz mono S16 natively.
    bool open_capture_device() {
        const std::vector<std::string> devices = capture_devices(config.device_name);
        int last_err = 0;
        for (const auto& dev : devices) {
            last_err = snd_pcm_open(&pcm_handle, dev.c_str(), SND_PCM_STREAM_CAPTURE, 0);
            if (last_err < 0) continue;
            if (dev != config.device_name) {
                std::cout << "[alsa] " << config.device_name << " unavailable, capturing from " << dev << std::endl;
                config.device_name = dev;
            }
            return true;
        }
        pcm_handle = nullptr;
        std::cerr << "[alsa] no capture device could be opened (" << devices.size() << " tried): "
                  << snd_strerror(last_err) << std::endl;
        return false;
    }

    static std::vector<std::string> capture_devices(const std::string& requested) {
        std::vector<std::string> devices;
        auto add = [&devices](const std::string& name) {
            if (!name.empty() && std::find(devices.begin(), devices.end(), name) == devices.end()) {
                devices.push_back(name);
            }
        };
        add(requested);
        add("default");

        void** hints = nullptr;
        if (snd_device_name_hint(-1, "pcm", &hints) < 0 || !hints) return devices;
        for (void** hint = hints; *hint; ++hint) {
            char* name = snd_device_name_get_hint(*hint, "NAME");
            char* direction = snd_device_name_get_hint(*hint, "IOID");
            const bool can_capture = !direction || std::strcmp(direction, "Input") == 0;
            if (name && can_capture && std::strncmp(name, "plughw:", 7) == 0) add(name);
            std::free(name);
            std::free(direction);
        }
        snd_device_name_free_hint(hints);
        return devices;
    }

    // Logs and closes the device when a configuration step failed
    bool check(int err, const char* step) {
        if (err >= 0) return true;
        std::cerr << "[alsa] " << config.device_name << ": " << step << " failed: " << snd_strerror(err) << std::endl;
        cleanup_alsa();
        return false;
    }

    // 44.1 kHz mono S16 in periods of period_size; the rate must be exact
    // since every target bin is derived from it.
    bool setup_alsa() {
        if (!open_capture_device()) {
            return false;
        }

        snd_pcm_hw_params_t* hw;
        snd_pcm_hw_params_alloca(&hw);
        const unsigned int rate = config.sample_rate;
        snd_pcm_uframes_t period_size = config.period_size;
        unsigned int periods = config.num_periods;

        if (!check(snd_pcm_hw_params_any(pcm_handle, hw), "hw_params_any") ||
            !check(snd_pcm_hw_params_set_access(pcm_handle, hw, SND_PCM_ACCESS_RW_INTERLEAVED), "interleaved access") ||
            !check(snd_pcm_hw_params_set_format(pcm_handle, hw, SND_PCM_FORMAT_S16_LE), "S16_LE format") ||
            !check(snd_pcm_hw_params_set_channels(pcm_handle, hw, 1), "mono") ||
            !check(snd_pcm_hw_params_set_rate(pcm_handle, hw, rate, 0), "exact sample rate") ||
            !check(snd_pcm_hw_params_set_period_size_near(pcm_handle, hw, &period_size, nullptr), "period size") ||
            !check(snd_pcm_hw_params_set_periods_near(pcm_handle, hw, &periods, nullptr), "period count") ||
            !check(snd_pcm_hw_params(pcm_handle, hw), "hw_params") ||
            !check(snd_pcm_prepare(pcm_handle), "prepare")) {
            return false;
        }

        snd_pcm_hw_params_get_period_size(hw, &period_size, nullptr);
        config.period_size = static_cast<unsigned int>(period_size);
        std::cout << "[alsa] capture " << config.device_name << ": " << rate << " Hz, "
                  << period_size << " x " << periods << " frames, "
                  << config.block_size << "-sample blocks (" << (1000.0f * config.block_size / rate) << " ms)"
                  << std::endl;
        return true;
    }

    void cleanup_alsa() {
        if (pcm_handle) {
            snd_pcm_close(pcm_handle);
            pcm_handle = nullptr;
        }
    }

    void capture_thread_func() {
        if (config.use_realtime_priority) {
            mlockall(MCL_CURRENT | MCL_FUTURE);
        }

        std::vector<int16_t> buffer(config.period_size);

        while (running.load()) {
            const snd_pcm_sframes_t frames_read = snd_pcm_readi(pcm_handle, buffer.data(), config.period_size);

            if (frames_read < 0) {
                if (frames_read == -EPIPE) {
                    xrun_count++;
                    snd_pcm_prepare(pcm_handle);
                    assembler.clear();
                } else if (frames_read == -EAGAIN) {
                    continue;
                } else {
                    std::cerr << "[alsa] read error: " << snd_strerror(static_cast<int>(frames_read)) << std::endl;
                    break;
                }
                continue;
            }
            if (frames_read == 0) continue;

            std::lock_guard<std::mutex> lock(callback_mutex);
            assembler.push(buffer.data(), static_cast<int>(frames_read),
                [this](const int16_t* block, int size) {
                    const auto t0 = std::chrono::steady_clock::now();
                    if (block_callback) block_callback(block, size);
                    const std::chrono::duration<float, std::milli> spent = std::chrono::steady_clock::now() - t0;
                    record_block_time(spent.count());
                });
        }

        running = false;
        if (config.use_realtime_priority) {
            munlockall();
        }
    }

    void set_realtime_priority() {
        struct sched_param param;
        param.sched_priority = sched_get_priority_max(SCHED_FIFO) - 1;
        if (pthread_setschedparam(capture_thread.native_handle(), SCHED_FIFO, &param) != 0) {
            std::cerr << "[alsa] warning: could not set realtime priority. Run with sudo or configure limits.conf" << std::endl;
        }
    }
};

std::unique_ptr<IAudioInput> create_audio_input(const AudioConfig& config) {
    return std::make_unique<AlsaAudioInput>(config);
}

} // namespace heartlight
