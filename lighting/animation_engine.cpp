#include "animation_engine.hpp"

#include <iostream>

namespace heartlight {

AnimationEngine::AnimationEngine(const Config& cfg, const LightActionTable& actions)
    : off_color(cfg.off_color),
      frame_interval(cfg.frame_interval_ms > 0 ? cfg.frame_interval_ms : 50),
      table(actions),
      last_emitted(cfg.off_color) {}

AnimationEngine::~AnimationEngine() {
    stop();
}

bool AnimationEngine::start() {
    std::lock_guard<std::mutex> lock(mutex);
    if (running) {
        return true;
    }
    stop_requested = false;
    running = true;
    animation_thread = std::thread(&AnimationEngine::animation_thread_func, this);
    return true;
}

void AnimationEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!running) {
            return;
        }
        stop_requested = true;
    }
    wake.notify_all();
    if (animation_thread.joinable()) {
        animation_thread.join();
    }
    std::lock_guard<std::mutex> lock(mutex);
    running = false;
    active = nullptr;
    pending = nullptr;
}

bool AnimationEngine::is_running() const {
    std::lock_guard<std::mutex> lock(mutex);
    return running;
}

void AnimationEngine::on_code_changed(int code) {
    const LightAction* action = find_light_action(table, code);
    {
        std::lock_guard<std::mutex> lock(mutex);
        detected = code;
        if (!action) {
            std::cout << "[engine] undefined code: " << code << std::endl;
            return;
        }
        const LightAction* current = pending ? pending : active;
        if (current && current->code == action->code) {
            return;
        }
        std::cout << "[engine] change action: " << action->code << ": " << action->name
                  << " (" << describe_behavior(action->behavior) << ")" << std::endl;
        pending = action;
    }
    wake.notify_all();
}

void AnimationEngine::emit(const Color& color) {
    if (render_callback) {
        render_callback(color);
    }
    std::lock_guard<std::mutex> lock(mutex);
    last_emitted = color;
    ++emitted_count;
}

void AnimationEngine::animation_thread_func() {
    using clock = std::chrono::steady_clock;

    std::unique_ptr<AnimationPlayer> player;
    clock::time_point started{};
    clock::time_point next_frame{};

    std::unique_lock<std::mutex> lock(mutex);
    while (!stop_requested) {
        if (pending) {
            // The previous player emitted its last frame before we got here
            active = pending;
            pending = nullptr;
            player = std::make_unique<AnimationPlayer>(active->behavior, off_color);
            started = clock::now();
            next_frame = started;
        }

        if (!player) {
            wake.wait(lock, [this] { return stop_requested || pending != nullptr; });
            continue;
        }

        const clock::time_point now = clock::now();
        const Color color = player->sample(std::chrono::duration_cast<std::chrono::milliseconds>(now - started));
        lock.unlock();
        emit(color);
        lock.lock();

        if (player->is_steady()) {
            // Renderer holds the last value; sleep until something changes
            wake.wait(lock, [this] { return stop_requested || pending != nullptr; });
            player.reset();
            continue;
        }

        next_frame += frame_interval;
        if (next_frame <= now) {
            next_frame = now + frame_interval;
        }
        wake.wait_until(lock, next_frame, [this] { return stop_requested || pending != nullptr; });
    }
}

int AnimationEngine::active_code() const {
    std::lock_guard<std::mutex> lock(mutex);
    if (pending) return pending->code;
    return active ? active->code : kNoCode;
}

int AnimationEngine::detected_code() const {
    std::lock_guard<std::mutex> lock(mutex);
    return detected;
}

std::string AnimationEngine::active_name() const {
    std::lock_guard<std::mutex> lock(mutex);
    const LightAction* a = pending ? pending : active;
    return a ? a->name : std::string();
}

Color AnimationEngine::last_color() const {
    std::lock_guard<std::mutex> lock(mutex);
    return last_emitted;
}

long AnimationEngine::frames_emitted() const {
    std::lock_guard<std::mutex> lock(mutex);
    return emitted_count;
}

} // namespace heartlight
