#include "light_pattern.hpp"

#include <sstream>
#include <utility>

namespace heartlight {

Gradation make_gradation(std::vector<Color> colors, int duration_ms) {
    return make_gradation(std::move(colors), duration_ms, duration_ms);
}

Gradation make_gradation(std::vector<Color> colors, int duration_ms, int repeat_ms) {
    Gradation g;
    g.colors = std::move(colors);
    g.duration_ms = duration_ms;
    g.first_duration_ms = duration_ms / 2;
    g.repeat_duration_ms = repeat_ms;
    return g;
}

const LightActionTable& default_light_actions() {
    using namespace colors;
    static const LightActionTable table = {
        {1, "Long yellow, short green", make_gradation({kYellow, kYellow, kGreen}, 1050)},
        {5, "Yellow", Lighting{kYellow}},
        {21, "Pale pink blink", Blinking{kPalePink, 1800}},
        {22, "Blue blink", Blinking{kBlue, 2100}},
        {23, "Orange blink", Blinking{kOrange, 1800}},
        {25, "Red orange pink yellow green blue purple",
         make_gradation({kRed, kOrange, kPink, kYellow, kGreen, kBlue, kPurple}, 1200)},
        {26, "Light blue blink", Blinking{kLightBlue, 2100}},
        {27, "Green blink", Blinking{kGreen, 1800}},
        {32, "Purple blue", make_gradation({kPurple, kBlue}, 1500, 950)},
        {35, "Pink yellow green light-blue blue purple red orange",
         make_gradation({kPink, kYellow, kGreen, kLightBlue, kBlue, kPurple, kRed, kOrange}, 1100)},
        {42, "Pink yellow light blue", make_gradation({kPink, kYellow, kLightBlue}, 1100)},
        {52, "Light blue", Lighting{kLightBlue}},
        {57, "Purple blue fast", make_gradation({kPurple, kBlue}, 650, 550)},
        {61, "Long pale pink, green", make_gradation({kPalePink, kPalePink, kGreen}, 1050)},
        {62, "Off", TurnOff{}},
        {66, "Pale pink", Lighting{kPalePink}},
        {67, "Long light blue, short yellow", make_gradation({kLightBlue, kLightBlue, kYellow}, 1050, 900)},
        {70, "Off", TurnOff{}},
        {76, "Orange", Lighting{kOrange}},
        {78, "Green blink", Blinking{kGreen, 2100}},
        {90, "Pink yellow light blue", make_gradation({kPink, kYellow, kLightBlue}, 1000, 850)},
        {95, "Pale pink blink", Blinking{kPalePink, 2100}},
        {99, "Long pink, short red", make_gradation({kPink, kPink, kRed}, 1100, 850)},
        {101, "Yellow blink", Blinking{kYellow, 1800}},
        {103, "Light blue blink", Blinking{kLightBlue, 1800}},
        {105, "Fast red orange pink yellow green light-blue purple",
         make_gradation({kRed, kOrange, kPink, kYellow, kGreen, kLightBlue, kPurple}, 600)},
        {107, "Red blink", Blinking{kRed, 2100}},
        {111, "Pink blink", Blinking{kPink, 1800}},
        {113, "Purple", Lighting{kPurple}},
        {120, "Blue", Lighting{kBlue}},
        {123, "Pink blink", Blinking{kPink, 2100}},
        {124, "Pink", Lighting{kPink}},
    };
    return table;
}

const LightAction* find_light_action(const LightActionTable& table, int code) {
    for (const auto& action : table) {
        if (action.code == code) return &action;
    }
    return nullptr;
}

namespace {

struct Describer {
    std::ostringstream& os;

    void operator()(const Lighting& b) const { os << "light " << to_hex(b.color); }
    void operator()(const TurnOff&) const { os << "off"; }
    void operator()(const Blinking& b) const {
        os << "blink " << to_hex(b.color) << " " << b.duration_ms << "ms";
    }
    void operator()(const Gradation& b) const {
        os << "gradation";
        for (const auto& c : b.colors) os << " " << to_hex(c);
        os << " " << b.first_duration_ms << "/" << b.duration_ms << "/" << b.repeat_duration_ms << "ms";
    }
};

} // namespace

std::string describe_behavior(const Behavior& behavior) {
    std::ostringstream os;
    std::visit(Describer{os}, behavior);
    return os.str();
}

} // namespace heartlight
