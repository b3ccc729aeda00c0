#pragma once

#include "audio_input.hpp"
#include "audio_output.hpp"
#include "config.hpp"
#include "magnitude_map.hpp"
#include "ring_buffer.hpp"
#include "dsp/spectral_analyzer.hpp"
#include "dsp/signal_decoder.hpp"
#include "dsp/feedback_synthesizer.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace heartlight::audio {

// Owns the capture backend and runs the decode stage on every block it
// delivers: spectral analysis, then symbol decoding. Blocks can also be
// pushed directly with process_block().
//
// Audible feedback runs on its own thread: decoded blocks hand their
// magnitudes to a short queue and never wait for synthesis or playback.
class BeaconReceiver {
public:
    using MagnitudesCallback = std::function<void(const MagnitudeMap& magnitudes)>;
    using CodeChangedCallback = SignalDecoder::CodeChangedCallback;

    static constexpr size_t kFeedbackQueueBlocks = 4;

    // Returns nullptr when the configuration is rejected
    static std::unique_ptr<BeaconReceiver> create(const Config& cfg);
    ~BeaconReceiver();

    bool start();
    void stop();
    bool is_running() const;

    void set_code_changed_callback(CodeChangedCallback cb);
    void set_magnitudes_callback(MagnitudesCallback cb);

    // Plays feedback through `output` (already started) from now on.
    // start() opens the playback device itself when feedback is enabled.
    void start_feedback(std::unique_ptr<IAudioOutput> output);
    void stop_feedback();

    // Decode one SampleBlock (num_samples == fft_size)
    void process_block(const int16_t* samples, int num_samples);

    const Config& get_config() const { return config_; }
    MagnitudeMap latest_magnitudes() const;
    int current_code() const { return decoder_.current_code(); }
    int last_symbol() const { return decoder_.last_symbol(); }
    IAudioInput::LatencyStats get_latency_stats() const;
    long dropped_feedback_blocks() const { return dropped_feedback_blocks_.load(); }
    int feedback_underruns() const { return feedback_underruns_.load(); }

private:
    explicit BeaconReceiver(const Config& cfg, std::unique_ptr<SpectralAnalyzer> analyzer);
    void feedback_thread_func();

    Config config_;
    std::unique_ptr<SpectralAnalyzer> analyzer_;
    SignalDecoder decoder_;

    std::unique_ptr<IAudioInput> input_;
    std::mutex decode_mutex_;

    mutable std::mutex state_mutex_;
    MagnitudeMap latest_;
    MagnitudesCallback magnitudes_callback_;

    // Feedback stage; the synthesizer and the output belong to feedback_thread_
    FeedbackSynthesizer synthesizer_;
    std::unique_ptr<IAudioOutput> feedback_output_;
    RingBuffer<MagnitudeMap> feedback_queue_;
    std::mutex feedback_mutex_;
    std::condition_variable feedback_wake_;
    bool feedback_running_ = false;
    std::thread feedback_thread_;
    std::atomic<long> dropped_feedback_blocks_{0};
    std::atomic<int> feedback_underruns_{0};
};

} // namespace heartlight::audio
