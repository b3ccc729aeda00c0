#pragma once

namespace heartlight::easing {

// All curves take progress in [0,1] and return a blend fraction in [0,1].

// Half-period sine: 0 -> 1 -> 0 over the whole progress range
float normal_blink(float progress);

// Sharp pulse built from normal_blink:
//   0-25% fade in, 25-50% hold on, 50-75% fade out, 75-100% hold off
float blink(float progress);

// Standard ease-out, cubic-bezier(0, 0, 0.58, 1)
float ease_out(float progress);

// Ease-out at double speed: completes at 50% and holds at 1 afterwards
float transition(float progress);

} // namespace heartlight::easing
