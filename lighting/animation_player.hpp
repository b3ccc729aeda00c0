#pragma once

#include <chrono>

#include "color.hpp"
#include "light_pattern.hpp"

namespace heartlight {

// Evaluates one Behavior as a function of the time elapsed since it started.
// Colors depend on wall-clock elapsed time, not on how many frames were
// drawn, so a late frame shows the right color rather than a lagging one.
// Time may only move forward between calls.
class AnimationPlayer {
public:
    AnimationPlayer(const Behavior& behavior, const Color& off_color);

    Color sample(std::chrono::milliseconds elapsed);

    // Lighting and TurnOff: one emission is enough
    bool is_steady() const;

    // Gradation progress: index into colors of the transition in flight,
    // and how many transitions have completed so far.
    int target_index() const { return target_index_; }
    long completed_transitions() const { return segment_; }

private:
    Behavior behavior_;
    Color off_color_;

    // Gradation state
    long segment_ = 0;
    long long segment_start_ms_ = 0;
    Color from_;
    int target_index_ = 0;

    Color sample_blink(const Blinking& b, long long t_ms) const;
    Color sample_gradation(const Gradation& g, long long t_ms);
    int segment_duration(const Gradation& g, long segment) const;
};

} // namespace heartlight
