#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "config.hpp"
#include "color.hpp"
#include "light_pattern.hpp"
#include "animation_player.hpp"

namespace heartlight {

// Drives the animation bound to the most recently decoded code.
//
// A single animation thread owns the active AnimationPlayer and is the only
// caller of the render callback. on_code_changed() only posts the new code;
// the animation thread retires the old player between two frames and starts
// the new one, so colors from two animations are never interleaved.
class AnimationEngine {
public:
    using RenderCallback = std::function<void(const Color& color)>;

    // The table is copied; actions are looked up in the engine's own copy
    AnimationEngine(const Config& cfg, const LightActionTable& table);
    ~AnimationEngine();

    AnimationEngine(const AnimationEngine&) = delete;
    AnimationEngine& operator=(const AnimationEngine&) = delete;

    // Must be set before start()
    void set_render_callback(RenderCallback callback) { render_callback = std::move(callback); }

    bool start();
    void stop();
    bool is_running() const;

    // Non-blocking. Unknown codes are recorded but leave the animation alone;
    // re-sending the active code does not restart it.
    void on_code_changed(int code);

    int active_code() const;
    int detected_code() const;
    std::string active_name() const;
    Color last_color() const;
    long frames_emitted() const;

    static constexpr int kNoCode = -1;

private:
    const Color off_color;
    const std::chrono::milliseconds frame_interval;
    const LightActionTable table;
    RenderCallback render_callback;

    mutable std::mutex mutex;
    std::condition_variable wake;
    std::thread animation_thread;
    bool running = false;
    bool stop_requested = false;

    // Point into `table`
    const LightAction* pending = nullptr;  // posted, not yet started
    const LightAction* active = nullptr;   // bound to the player
    int detected = kNoCode;
    Color last_emitted;
    long emitted_count = 0;

    void animation_thread_func();
    void emit(const Color& color);
};

} // namespace heartlight
