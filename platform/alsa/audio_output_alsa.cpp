#include "audio_output.hpp"
#include "ring_buffer.hpp"

#include <alsa/asoundlib.h>
#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

namespace heartlight {

class AlsaAudioOutput : public IAudioOutput {
public:
    explicit AlsaAudioOutput(const AudioOutputConfig& cfg)
        : config(cfg), pcm_handle(nullptr), running(false),
          queue(cfg.queue_blocks + 1), underrun_count(0) {}

    ~AlsaAudioOutput() override { stop(); }

    bool start() override {
        if (running.load()) {
            return true;
        }
        if (!setup_alsa()) {
            return false;
        }
        running = true;
        playback_thread = std::thread(&AlsaAudioOutput::playback_thread_func, this);
        return true;
    }

    void stop() override {
        if (!running.load() && !playback_thread.joinable()) {
            return;
        }
        running = false;
        if (playback_thread.joinable()) {
            playback_thread.join();
        }
        queue.clear();
        if (pcm_handle) {
            snd_pcm_drop(pcm_handle);
            snd_pcm_close(pcm_handle);
            pcm_handle = nullptr;
        }
    }

    bool is_running() const override { return running.load(); }

    bool enqueue(std::vector<int16_t> block) override {
        if (!running.load()) return false;
        std::lock_guard<std::mutex> lock(producer_mutex);
        return queue.push(block);
    }

    const AudioOutputConfig& get_config() const override { return config; }
    int underruns() const override { return underrun_count.load(); }

private:
    AudioOutputConfig config;
    snd_pcm_t* pcm_handle;
    std::atomic<bool> running;
    std::thread playback_thread;
    std::mutex producer_mutex;
    RingBuffer<std::vector<int16_t>> queue;
    std::atomic<int> underrun_count;

    bool setup_alsa() {
        int err = snd_pcm_open(&pcm_handle, config.device_name.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
        if (err < 0) {
            std::cerr << "[alsa] cannot open playback device " << config.device_name
                      << ": " << snd_strerror(err) << std::endl;
            pcm_handle = nullptr;
            return false;
        }

        // snd_pcm_set_params picks a buffer around the requested latency
        const unsigned int latency_us = static_cast<unsigned int>(
            1000000.0 * config.period_size * config.num_periods / config.sample_rate);
        err = snd_pcm_set_params(pcm_handle, SND_PCM_FORMAT_S16_LE, SND_PCM_ACCESS_RW_INTERLEAVED,
                                 1, config.sample_rate, 1, latency_us);
        if (err < 0) {
            std::cerr << "[alsa] cannot configure playback: " << snd_strerror(err) << std::endl;
            snd_pcm_close(pcm_handle);
            pcm_handle = nullptr;
            return false;
        }

        std::cout << "[alsa] playback: " << config.device_name << ", " << config.sample_rate
                  << " Hz, ~" << latency_us / 1000 << " ms buffer" << std::endl;
        return true;
    }

    void playback_thread_func() {
        const std::vector<int16_t> silence(config.period_size, 0);
        std::vector<int16_t> block;

        while (running.load()) {
            const std::vector<int16_t>* data = &silence;
            if (queue.pop(block)) data = &block;

            size_t offset = 0;
            while (offset < data->size() && running.load()) {
                const snd_pcm_sframes_t written = snd_pcm_writei(
                    pcm_handle, data->data() + offset, data->size() - offset);
                if (written == -EPIPE) {
                    underrun_count++;
                    snd_pcm_prepare(pcm_handle);
                    continue;
                }
                if (written == -EAGAIN) continue;
                if (written < 0) {
                    std::cerr << "[alsa] write error: " << snd_strerror(static_cast<int>(written)) << std::endl;
                    running = false;
                    break;
                }
                offset += static_cast<size_t>(written);
            }
        }
    }
};

std::unique_ptr<IAudioOutput> create_audio_output(const AudioOutputConfig& config) {
    return std::make_unique<AlsaAudioOutput>(config);
}

} // namespace heartlight
