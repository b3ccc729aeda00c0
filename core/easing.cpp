#include "easing.hpp"
#include <cmath>

namespace heartlight::easing {

static inline float clamp01(float v) { return v < 0.0f ? 0.0f : (v > 1.0f ? 1.0f : v); }

static constexpr float kPi = 3.14159265358979323846f;

float normal_blink(float progress) {
    return clamp01(std::sin(clamp01(progress) * kPi));
}

float blink(float progress) {
    if (progress < 0.25f) {
        return normal_blink(progress * 2.0f);
    } else if (progress < 0.5f) {
        return 1.0f;
    } else if (progress < 0.75f) {
        return normal_blink((progress - 0.5f) * 2.0f + 0.5f);
    }
    return 0.0f;
}

// Cubic bezier through (0,0), (x1,y1), (x2,y2), (1,1), solved for x
static float cubic_bezier(float x1, float y1, float x2, float y2, float x) {
    auto coord = [](float a1, float a2, float t) {
        const float u = 1.0f - t;
        return 3.0f * u * u * t * a1 + 3.0f * u * t * t * a2 + t * t * t;
    };
    auto slope = [](float a1, float a2, float t) {
        const float u = 1.0f - t;
        return 3.0f * u * u * a1 + 6.0f * u * t * (a2 - a1) + 3.0f * t * t * (1.0f - a2);
    };

    // Newton first, bisection if the slope flattens out
    float t = x;
    for (int i = 0; i < 8; ++i) {
        const float err = coord(x1, x2, t) - x;
        if (std::fabs(err) < 1e-6f) return coord(y1, y2, t);
        const float d = slope(x1, x2, t);
        if (std::fabs(d) < 1e-6f) break;
        t -= err / d;
    }
    float lo = 0.0f, hi = 1.0f;
    t = x;
    for (int i = 0; i < 32; ++i) {
        const float cx = coord(x1, x2, t);
        if (std::fabs(cx - x) < 1e-6f) break;
        if (cx < x) lo = t; else hi = t;
        t = 0.5f * (lo + hi);
    }
    return coord(y1, y2, t);
}

float ease_out(float progress) {
    const float p = clamp01(progress);
    if (p <= 0.0f) return 0.0f;
    if (p >= 1.0f) return 1.0f;
    return clamp01(cubic_bezier(0.0f, 0.0f, 0.58f, 1.0f, p));
}

float transition(float progress) {
    return ease_out(clamp01(progress * 2.0f));
}

} // namespace heartlight::easing
