#include "animation_player.hpp"

#include "easing.hpp"

namespace heartlight {

AnimationPlayer::AnimationPlayer(const Behavior& behavior, const Color& off_color)
    : behavior_(behavior), off_color_(off_color), from_(off_color) {}

bool AnimationPlayer::is_steady() const {
    return std::holds_alternative<Lighting>(behavior_) || std::holds_alternative<TurnOff>(behavior_);
}

Color AnimationPlayer::sample(std::chrono::milliseconds elapsed) {
    const long long t_ms = elapsed.count() < 0 ? 0 : static_cast<long long>(elapsed.count());

    if (const auto* l = std::get_if<Lighting>(&behavior_)) return l->color;
    if (std::holds_alternative<TurnOff>(behavior_)) return off_color_;
    if (const auto* b = std::get_if<Blinking>(&behavior_)) return sample_blink(*b, t_ms);
    if (auto* g = std::get_if<Gradation>(&behavior_)) return sample_gradation(*g, t_ms);
    return off_color_;
}

Color AnimationPlayer::sample_blink(const Blinking& b, long long t_ms) const {
    if (b.duration_ms <= 0) return off_color_;
    const long long phase = t_ms % b.duration_ms;
    const float progress = static_cast<float>(phase) / static_cast<float>(b.duration_ms);
    return lerp(off_color_, b.color, easing::blink(progress));
}

int AnimationPlayer::segment_duration(const Gradation& g, long segment) const {
    const long n = static_cast<long>(g.colors.size());
    if (segment == 0) return g.first_duration_ms;
    if (segment < n) return g.duration_ms;
    return g.repeat_duration_ms;
}

Color AnimationPlayer::sample_gradation(const Gradation& g, long long t_ms) {
    if (g.colors.empty()) return off_color_;
    const long n = static_cast<long>(g.colors.size());

    // Advance over every transition that has fully elapsed. Zero-length
    // transitions complete instantly; a zero repeat duration would never
    // let time pass, so the cycle then holds the color it reached last.
    for (;;) {
        const int d = segment_duration(g, segment_);
        if (d <= 0 && segment_ >= n && g.repeat_duration_ms <= 0) {
            return from_;
        }
        if (t_ms < segment_start_ms_ + d) break;
        from_ = g.colors[target_index_];
        segment_start_ms_ += d;
        ++segment_;
        target_index_ = static_cast<int>(segment_ % n);
    }

    const int d = segment_duration(g, segment_);
    const float progress = static_cast<float>(t_ms - segment_start_ms_) / static_cast<float>(d);
    return lerp(from_, g.colors[target_index_], easing::transition(progress));
}

} // namespace heartlight
