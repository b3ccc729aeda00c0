#pragma once

#include <cstdint>
#include <string>

namespace heartlight {

// 8-bit sRGB color as handed to the renderer
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

namespace colors {
constexpr Color kBlack{0, 0, 0};
constexpr Color kRed{255, 0, 0};
constexpr Color kGreen{0, 255, 0};
constexpr Color kBlue{0, 0, 255};
constexpr Color kYellow{255, 255, 0};
constexpr Color kPink{0xEA, 0x91, 0x98};
constexpr Color kPalePink{0xFF, 0xC0, 0xCB};
constexpr Color kPurple{0xA7, 0x57, 0xA8};
constexpr Color kLightBlue{0x9D, 0xCC, 0xE0};
constexpr Color kOrange{0xFF, 0xA5, 0x00};
} // namespace colors

// Per-channel linear interpolation; fraction is clamped to [0,1]
Color lerp(const Color& from, const Color& to, float fraction);

// Parses "#RRGGBB" (leading '#' optional). Returns false on malformed input.
bool parse_hex_color(const char* text, Color& out);
std::string to_hex(const Color& c);

// Perceived brightness in [0,1] (Rec. 601 luma)
float luminance(const Color& c);

} // namespace heartlight
