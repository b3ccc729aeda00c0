#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace heartlight {

struct AudioOutputConfig {
    std::string device_name = "default";
    unsigned int sample_rate = 44100;
    unsigned int period_size = 1024;
    unsigned int num_periods = 4;
    unsigned int queue_blocks = 4;   // blocks waiting for the device
};

// Mono S16 playback fed one block at a time
class IAudioOutput {
public:
    virtual ~IAudioOutput() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;

    // Never blocks. Returns false (block dropped) when the queue is full or
    // playback is not running.
    virtual bool enqueue(std::vector<int16_t> block) = 0;

    virtual const AudioOutputConfig& get_config() const = 0;
    virtual int underruns() const = 0;
};

std::unique_ptr<IAudioOutput> create_audio_output(const AudioOutputConfig& config);

} // namespace heartlight
