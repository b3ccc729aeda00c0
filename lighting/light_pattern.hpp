#pragma once

#include <string>
#include <variant>
#include <vector>

#include "color.hpp"

namespace heartlight {

struct Lighting {
    Color color;
};

struct TurnOff {};

struct Blinking {
    Color color;
    int duration_ms = 0;  // one full pulse
};

// Cycles colors[0] -> colors[1] -> ... -> colors[n-1] -> colors[0] ...
// starting from the off color.
struct Gradation {
    std::vector<Color> colors;
    int duration_ms = 0;         // transitions 2..n of the first loop
    int first_duration_ms = 0;   // off color -> colors[0]
    int repeat_duration_ms = 0;  // every transition after the first loop
};

using Behavior = std::variant<Lighting, TurnOff, Blinking, Gradation>;

// first = d/2, repeats = d
Gradation make_gradation(std::vector<Color> colors, int duration_ms);
// first = d/2, rest of first loop = d, repeats = repeat_ms
Gradation make_gradation(std::vector<Color> colors, int duration_ms, int repeat_ms);

struct LightAction {
    int code = 0;
    std::string name;
    Behavior behavior;
};

using LightActionTable = std::vector<LightAction>;

// Actions bound to the beacon codes used by the show
const LightActionTable& default_light_actions();

// nullptr when the code has no action
const LightAction* find_light_action(const LightActionTable& table, int code);

// Short human-readable summary, e.g. "blink #0000FF 2100ms"
std::string describe_behavior(const Behavior& behavior);

} // namespace heartlight
