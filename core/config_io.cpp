#include "config.hpp"
#include "config_io.hpp"
#include <string>
#include <cstdlib>
#include <cstdio>
#include <cstring>

namespace heartlight {

// Flat JSON object, hand-parsed. Expects a file shaped like the one we write;
// keys that are absent keep their current values.
static const char* find_value(const char* s, const char* key) {
    const char* p = std::strstr(s, key);
    if (!p) return nullptr;
    p = std::strchr(p, ':');
    return p ? p + 1 : nullptr;
}

static bool parse_key_value(const char* s, const char* key, float& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    out = std::strtof(p, nullptr);
    return true;
}
static bool parse_key_value(const char* s, const char* key, int& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    out = static_cast<int>(std::strtol(p, nullptr, 10));
    return true;
}
static bool parse_key_value(const char* s, const char* key, bool& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    while (*p == ' ' || *p == '\t') ++p;
    if (std::strncmp(p, "true", 4) == 0) { out = true; return true; }
    if (std::strncmp(p, "false", 5) == 0) { out = false; return true; }
    return false;
}
static bool parse_key_value(const char* s, const char* key, std::string& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    while (*p == ' ' || *p == '\t') ++p;
    if (*p != '"') return false;
    ++p;
    std::string value;
    while (*p && *p != '"' && *p != '\n' && *p != '\r') {
        if (*p == '\\' && (p[1] == '"' || p[1] == '\\')) ++p;
        value += *p++;
    }
    if (*p != '"') return false;
    out.swap(value);
    return true;
}

// Escapes the characters that would end or corrupt a quoted value
static std::string quoted_value(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

static bool parse_key_value(const char* s, const char* key, std::vector<int>& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    p = std::strchr(p, '[');
    if (!p) return false;
    ++p;
    std::vector<int> values;
    while (*p && *p != ']') {
        char* end = nullptr;
        const long v = std::strtol(p, &end, 10);
        if (end == p) { ++p; continue; }
        values.push_back(static_cast<int>(v));
        p = end;
    }
    if (*p != ']') return false;
    out.swap(values);
    return true;
}

bool load_config(const char* path, Config& cfg) {
    FILE* f = std::fopen(path, "rb");
    if (!f) return false;
    std::fseek(f, 0, SEEK_END);
    long sz = std::ftell(f);
    std::fseek(f, 0, SEEK_SET);
    if (sz <= 0 || sz > 1<<20) { std::fclose(f); return false; }
    std::string buf; buf.resize((size_t)sz);
    size_t n = std::fread(&buf[0], 1, (size_t)sz, f);
    std::fclose(f);
    if (n != (size_t)sz) return false;

    const char* s = buf.c_str();
    parse_key_value(s, "\"sample_rate\"", cfg.sample_rate);
    parse_key_value(s, "\"fft_size\"", cfg.fft_size);
    parse_key_value(s, "\"fft_neighbor_count\"", cfg.fft_neighbor_count);
    parse_key_value(s, "\"target_frequencies\"", cfg.target_frequencies);
    parse_key_value(s, "\"frame_interval_ms\"", cfg.frame_interval_ms);
    parse_key_value(s, "\"dominant_floor\"", cfg.dominant_floor);
    parse_key_value(s, "\"dominant_ratio\"", cfg.dominant_ratio);
    parse_key_value(s, "\"device_name\"", cfg.device_name);
    parse_key_value(s, "\"playback_device_name\"", cfg.playback_device_name);
    parse_key_value(s, "\"use_realtime_priority\"", cfg.use_realtime_priority);
    parse_key_value(s, "\"feedback_enabled\"", cfg.feedback_enabled);
    parse_key_value(s, "\"feedback_gain\"", cfg.feedback_gain);

    std::string off_hex;
    if (parse_key_value(s, "\"off_color\"", off_hex)) {
        Color c;
        if (parse_hex_color(off_hex.c_str(), c)) cfg.off_color = c;
    }
    return true;
}

bool save_config(const char* path, const Config& cfg) {
    FILE* f = std::fopen(path, "wb");
    if (!f) return false;

    std::string targets;
    for (size_t i = 0; i < cfg.target_frequencies.size(); ++i) {
        if (i) targets += ", ";
        targets += std::to_string(cfg.target_frequencies[i]);
    }

    std::fprintf(f,
        "{\n"
        "  \"sample_rate\": %d,\n"
        "  \"fft_size\": %d,\n"
        "  \"fft_neighbor_count\": %d,\n"
        "  \"target_frequencies\": [%s],\n"
        "  \"frame_interval_ms\": %d,\n"
        "  \"off_color\": \"%s\",\n"
        "  \"dominant_floor\": %.3f,\n"
        "  \"dominant_ratio\": %.3f,\n"
        "  \"device_name\": \"%s\",\n"
        "  \"playback_device_name\": \"%s\",\n"
        "  \"use_realtime_priority\": %s,\n"
        "  \"feedback_enabled\": %s,\n"
        "  \"feedback_gain\": %.3f\n"
        "}\n",
        cfg.sample_rate,
        cfg.fft_size,
        cfg.fft_neighbor_count,
        targets.c_str(),
        cfg.frame_interval_ms,
        to_hex(cfg.off_color).c_str(),
        cfg.dominant_floor,
        cfg.dominant_ratio,
        quoted_value(cfg.device_name).c_str(),
        quoted_value(cfg.playback_device_name).c_str(),
        cfg.use_realtime_priority ? "true" : "false",
        cfg.feedback_enabled ? "true" : "false",
        cfg.feedback_gain);
    const bool ok = std::ferror(f) == 0;
    std::fclose(f);
    return ok;
}

} // namespace heartlight
