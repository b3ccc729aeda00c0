#include "beacon_receiver.hpp"

#include <iostream>

namespace heartlight::audio {

std::unique_ptr<BeaconReceiver> BeaconReceiver::create(const Config& cfg) {
    auto analyzer = SpectralAnalyzer::create(cfg);
    if (!analyzer) return nullptr;
    return std::unique_ptr<BeaconReceiver>(new BeaconReceiver(cfg, std::move(analyzer)));
}

BeaconReceiver::BeaconReceiver(const Config& cfg, std::unique_ptr<SpectralAnalyzer> analyzer)
    : config_(cfg),
      analyzer_(std::move(analyzer)),
      decoder_(cfg),
      synthesizer_(cfg),
      feedback_queue_(kFeedbackQueueBlocks + 1) {}

BeaconReceiver::~BeaconReceiver() {
    stop();
}

bool BeaconReceiver::start() {
    // Feedback output exists before the first block arrives
    if (config_.feedback_enabled && !feedback_output_) {
        AudioOutputConfig out;
        out.device_name = config_.playback_device_name;
        out.sample_rate = static_cast<unsigned int>(config_.sample_rate);
        out.period_size = static_cast<unsigned int>(config_.fft_size);
        auto output = create_audio_output(out);
        // Feedback is a side channel; losing it does not stop decoding
        if (output->start()) {
            start_feedback(std::move(output));
        } else {
            std::cerr << "[receiver] audible feedback disabled: playback did not start" << std::endl;
        }
    }

    if (!input_) {
        AudioConfig audio;
        audio.device_name = config_.device_name;
        audio.sample_rate = static_cast<unsigned int>(config_.sample_rate);
        audio.block_size = static_cast<unsigned int>(config_.fft_size);
        audio.use_realtime_priority = config_.use_realtime_priority;
        input_ = create_audio_input(audio);
        input_->set_block_callback([this](const int16_t* samples, int num_samples) {
            process_block(samples, num_samples);
        });
    }
    if (!input_->start()) {
        std::cerr << "[receiver] failed to start capture on " << config_.device_name << std::endl;
        return false;
    }
    return true;
}

void BeaconReceiver::stop() {
    if (input_) input_->stop();
    stop_feedback();
}

bool BeaconReceiver::is_running() const {
    return input_ && input_->is_running();
}

void BeaconReceiver::start_feedback(std::unique_ptr<IAudioOutput> output) {
    stop_feedback();
    if (!output) return;
    feedback_output_ = std::move(output);
    std::lock_guard<std::mutex> lock(feedback_mutex_);
    feedback_queue_.clear();
    feedback_running_ = true;
    feedback_thread_ = std::thread(&BeaconReceiver::feedback_thread_func, this);
}

void BeaconReceiver::stop_feedback() {
    {
        std::lock_guard<std::mutex> lock(feedback_mutex_);
        feedback_running_ = false;
    }
    feedback_wake_.notify_all();
    if (feedback_thread_.joinable()) {
        feedback_thread_.join();
    }
    if (feedback_output_) {
        feedback_underruns_ = feedback_output_->underruns();
        feedback_output_->stop();
        feedback_output_.reset();
    }
}

void BeaconReceiver::feedback_thread_func() {
    MagnitudeMap magnitudes;
    std::unique_lock<std::mutex> lock(feedback_mutex_);
    while (feedback_running_) {
        if (!feedback_queue_.pop(magnitudes)) {
            feedback_wake_.wait(lock, [this] { return !feedback_running_ || !feedback_queue_.empty(); });
            continue;
        }
        lock.unlock();
        if (!feedback_output_->enqueue(synthesizer_.synthesize(magnitudes))) {
            ++dropped_feedback_blocks_;
        }
        feedback_underruns_ = feedback_output_->underruns();
        lock.lock();
    }
}

void BeaconReceiver::set_code_changed_callback(CodeChangedCallback cb) {
    decoder_.set_code_changed_callback(std::move(cb));
}

void BeaconReceiver::set_magnitudes_callback(MagnitudesCallback cb) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    magnitudes_callback_ = std::move(cb);
}

void BeaconReceiver::process_block(const int16_t* samples, int num_samples) {
    // The analyzer keeps per-block scratch state
    std::lock_guard<std::mutex> decode_lock(decode_mutex_);
    MagnitudeMap magnitudes = analyzer_->analyze(samples, num_samples);
    decoder_.update(magnitudes);

    {
        std::lock_guard<std::mutex> lock(feedback_mutex_);
        if (feedback_running_) {
            if (feedback_queue_.push(magnitudes)) {
                feedback_wake_.notify_one();
            } else {
                ++dropped_feedback_blocks_;
            }
        }
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    latest_ = std::move(magnitudes);
    if (magnitudes_callback_) magnitudes_callback_(latest_);
}

MagnitudeMap BeaconReceiver::latest_magnitudes() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return latest_;
}

IAudioInput::LatencyStats BeaconReceiver::get_latency_stats() const {
    return input_ ? input_->get_latency_stats() : IAudioInput::LatencyStats{};
}

} // namespace heartlight::audio
