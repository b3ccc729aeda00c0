#include "color.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace heartlight {

static uint8_t mix_channel(uint8_t a, uint8_t b, float t) {
    const float v = static_cast<float>(a) + (static_cast<float>(b) - static_cast<float>(a)) * t;
    const long r = std::lround(v);
    return static_cast<uint8_t>(r < 0 ? 0 : (r > 255 ? 255 : r));
}

Color lerp(const Color& from, const Color& to, float fraction) {
    const float t = fraction < 0.0f ? 0.0f : (fraction > 1.0f ? 1.0f : fraction);
    return Color{mix_channel(from.r, to.r, t), mix_channel(from.g, to.g, t), mix_channel(from.b, to.b, t)};
}

bool parse_hex_color(const char* text, Color& out) {
    if (!text) return false;
    if (*text == '#') ++text;
    if (std::strlen(text) < 6) return false;
    char buf[7];
    std::memcpy(buf, text, 6);
    buf[6] = '\0';
    char* end = nullptr;
    const unsigned long v = std::strtoul(buf, &end, 16);
    if (end != buf + 6) return false;
    out.r = static_cast<uint8_t>((v >> 16) & 0xFFu);
    out.g = static_cast<uint8_t>((v >> 8) & 0xFFu);
    out.b = static_cast<uint8_t>(v & 0xFFu);
    return true;
}

std::string to_hex(const Color& c) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", c.r, c.g, c.b);
    return std::string(buf);
}

float luminance(const Color& c) {
    return (0.299f * c.r + 0.587f * c.g + 0.114f * c.b) / 255.0f;
}

} // namespace heartlight
