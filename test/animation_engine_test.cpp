#include "lighting/animation_engine.hpp"
#include "test_util.hpp"

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace heartlight;
using clock_type = std::chrono::steady_clock;

namespace {

struct Frame {
    clock_type::time_point at;
    Color color;
};

// Thread-safe log of everything the engine rendered
class FrameLog {
public:
    void add(const Color& c) {
        std::lock_guard<std::mutex> lock(mutex_);
        frames_.push_back({clock_type::now(), c});
    }
    std::vector<Frame> frames() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_;
    }
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Frame> frames_;
};

const LightActionTable& test_actions() {
    static const LightActionTable table = {
        {10, "Blue blink", Blinking{colors::kBlue, 400}},
        {11, "Red", Lighting{colors::kRed}},
        {12, "Green to blue", make_gradation({colors::kGreen, colors::kBlue}, 200)},
        {13, "Off", TurnOff{}},
        {14, "Slow blue blink", Blinking{colors::kBlue, 2100}},
    };
    return table;
}

Config fast_config() {
    Config cfg;
    cfg.frame_interval_ms = 10;
    return cfg;
}

void sleep_ms(int ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); }

} // namespace

static void test_switch_is_atomic() {
    test::section("switching animations never interleaves colors");
    FrameLog log;
    AnimationEngine engine(fast_config(), test_actions());
    engine.set_render_callback([&](const Color& c) { log.add(c); });
    if (!CHECK(engine.start())) return;

    engine.on_code_changed(10);
    sleep_ms(150);
    engine.on_code_changed(11);
    sleep_ms(150);
    engine.stop();

    const auto frames = log.frames();
    size_t first_red = frames.size();
    for (size_t i = 0; i < frames.size(); ++i) {
        if (frames[i].color == colors::kRed) { first_red = i; break; }
    }
    if (!CHECK(first_red < frames.size())) return;

    bool blue_after_red = false;
    for (size_t i = first_red; i < frames.size(); ++i) {
        blue_after_red = blue_after_red || frames[i].color.b != 0;
    }
    CHECK(!blue_after_red);

    // Blinking frames came before the switch
    CHECK(first_red > 3);
    CHECK(engine.last_color() == colors::kRed);
}

static void test_change_within_one_frame() {
    test::section("a change is observed within one frame interval");
    // Default 50 ms frames and a long pulse, so the engine is mid-sleep
    Config cfg;
    const auto interval = std::chrono::milliseconds(cfg.frame_interval_ms);
    const auto slack = std::chrono::milliseconds(10);

    FrameLog log;
    AnimationEngine engine(cfg, test_actions());
    engine.set_render_callback([&](const Color& c) { log.add(c); });
    if (!CHECK(engine.start())) return;

    engine.on_code_changed(14);
    sleep_ms(120);
    const auto before = log.frames();
    if (!CHECK(!before.empty())) return;

    // Next frame is due at last + 50 ms; change shortly after the last one
    std::this_thread::sleep_until(before.back().at + std::chrono::milliseconds(5));
    const auto switched_at = clock_type::now();
    engine.on_code_changed(11);
    sleep_ms(100);

    const auto frames = log.frames();
    const Frame* first_red = nullptr;
    for (const auto& f : frames) {
        if (f.color == colors::kRed) { first_red = &f; break; }
    }
    if (CHECK(first_red != nullptr)) {
        CHECK(first_red->at - switched_at <= interval + slack);
    }

    // stop() while an animation is sleeping between frames
    engine.on_code_changed(14);
    sleep_ms(70);
    const auto stop_started = clock_type::now();
    engine.stop();
    CHECK(clock_type::now() - stop_started <= interval + slack);
    CHECK(!engine.is_running());
}

static void test_table_is_owned() {
    test::section("engine keeps its own copy of the table");
    FrameLog log;
    AnimationEngine engine(fast_config(), LightActionTable{{7, "Yellow", Lighting{colors::kYellow}}});
    engine.set_render_callback([&](const Color& c) { log.add(c); });
    if (!CHECK(engine.start())) return;

    engine.on_code_changed(7);
    sleep_ms(50);
    CHECK(engine.active_name() == "Yellow");
    CHECK(engine.last_color() == colors::kYellow);
    CHECK(log.size() == 1u);
    engine.stop();
}

static void test_steady_behaviors_emit_once() {
    test::section("steady behaviors render once");
    FrameLog log;
    AnimationEngine engine(fast_config(), test_actions());
    engine.set_render_callback([&](const Color& c) { log.add(c); });
    if (!CHECK(engine.start())) return;

    engine.on_code_changed(11);
    sleep_ms(100);
    CHECK(log.size() == 1u);

    // Re-sending the active code does not restart it
    engine.on_code_changed(11);
    sleep_ms(50);
    CHECK(log.size() == 1u);
    CHECK(engine.active_code() == 11);

    // Unknown codes are recorded and ignored
    engine.on_code_changed(99);
    sleep_ms(50);
    CHECK(log.size() == 1u);
    CHECK(engine.active_code() == 11);
    CHECK(engine.detected_code() == 99);
    CHECK(engine.active_name() == "Red");

    engine.on_code_changed(13);
    sleep_ms(50);
    CHECK(log.size() == 2u);
    CHECK(engine.last_color() == colors::kBlack);
    engine.stop();
    CHECK(!engine.is_running());
}

static void test_animated_behaviors_keep_running() {
    test::section("animations render every frame");
    FrameLog log;
    AnimationEngine engine(fast_config(), test_actions());
    engine.set_render_callback([&](const Color& c) { log.add(c); });
    if (!CHECK(engine.start())) return;
    CHECK(engine.active_code() == AnimationEngine::kNoCode);

    engine.on_code_changed(12);
    sleep_ms(300);
    engine.stop();

    const auto frames = log.frames();
    // ~30 frames at 10 ms; allow for a slow scheduler
    CHECK(frames.size() >= 10u);
    CHECK(frames.size() <= 40u);

    bool saw_green = false;
    bool saw_blue = false;
    for (const auto& f : frames) {
        saw_green = saw_green || f.color == colors::kGreen;
        saw_blue = saw_blue || f.color == colors::kBlue;
    }
    CHECK(saw_green);
    CHECK(saw_blue);

    // Nothing is rendered after stop()
    const size_t count = log.size();
    sleep_ms(50);
    CHECK(log.size() == count);
    CHECK(engine.frames_emitted() == static_cast<long>(count));
}

static void test_restart() {
    test::section("stop and start again");
    FrameLog log;
    AnimationEngine engine(fast_config(), test_actions());
    engine.set_render_callback([&](const Color& c) { log.add(c); });
    CHECK(engine.start());
    CHECK(engine.start());
    engine.on_code_changed(11);
    sleep_ms(50);
    engine.stop();
    engine.stop();

    CHECK(engine.start());
    CHECK(engine.active_code() == AnimationEngine::kNoCode);
    engine.on_code_changed(11);
    sleep_ms(50);
    CHECK(log.size() == 2u);
}

int main() {
    test_switch_is_atomic();
    test_change_within_one_frame();
    test_table_is_owned();
    test_steady_behaviors_emit_once();
    test_animated_behaviors_keep_running();
    test_restart();
    return test::finish("animation_engine_test");
}
