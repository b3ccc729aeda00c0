#include "signal_decoder.hpp"

#include <iostream>

namespace heartlight {

const std::array<SignalDecoder::TemplateSlot, SignalDecoder::kPatternLength>&
SignalDecoder::pattern_template() {
    static const std::array<TemplateSlot, kPatternLength> slots = {{
        {{18500, 0}, 1},
        {{18750, 19250}, 2},
        {{19000, 19500}, 2},
        {{18750, 19250}, 2},
        {{19000, 19500}, 2},
        {{18750, 19250}, 2},
        {{19000, 19500}, 2},
        {{18750, 19250}, 2},
    }};
    return slots;
}

SignalDecoder::SignalDecoder(const Config& cfg)
    : floor_(cfg.dominant_floor),
      ratio_(cfg.dominant_ratio),
      capacity_(heartlight::history_capacity(cfg)) {}

void SignalDecoder::set_code_changed_callback(CodeChangedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    code_changed_ = std::move(callback);
}

int SignalDecoder::dominant_symbol(const MagnitudeMap& magnitudes, float floor, float ratio) {
    // Need at least one other entry to estimate the noise level
    if (magnitudes.size() < 2) return kNoSymbol;

    size_t max_idx = 0;
    for (size_t i = 1; i < magnitudes.size(); ++i) {
        if (magnitudes[i].magnitude > magnitudes[max_idx].magnitude) max_idx = i;
    }

    double others = 0.0;
    for (size_t i = 0; i < magnitudes.size(); ++i) {
        if (i != max_idx) others += magnitudes[i].magnitude;
    }
    const double noise = others / static_cast<double>(magnitudes.size() - 1);

    const double peak = magnitudes[max_idx].magnitude;
    if (peak >= floor && peak > noise * ratio) {
        return magnitudes[max_idx].frequency_hz;
    }
    return kNoSymbol;
}

std::vector<int> SignalDecoder::edge_sequence(const std::vector<int>& symbols) {
    std::vector<int> edges;
    edges.reserve(symbols.size());
    for (int s : symbols) {
        if (s == kNoSymbol) continue;
        if (!edges.empty() && edges.back() == s) continue;
        edges.push_back(s);
    }
    return edges;
}

int SignalDecoder::decode_window(const std::vector<int>& edges, size_t start) {
    const auto& slots = pattern_template();
    int code = 0;
    for (int i = 0; i < kPatternLength; ++i) {
        const TemplateSlot& slot = slots[i];
        const int symbol = edges[start + i];
        int bit = -1;
        for (int k = 0; k < slot.count; ++k) {
            if (slot.options[k] == symbol) { bit = k; break; }
        }
        if (bit < 0) return kNoCode;
        if (slot.count > 1) code = (code << 1) | bit;
    }
    return code;
}

int SignalDecoder::find_code(const std::vector<int>& edges) {
    if (edges.size() < static_cast<size_t>(kPatternLength)) return kNoCode;
    // Newest window first
    for (size_t start = edges.size() - kPatternLength + 1; start-- > 0;) {
        const int code = decode_window(edges, start);
        if (code != kNoCode) return code;
    }
    return kNoCode;
}

bool SignalDecoder::update(const MagnitudeMap& magnitudes) {
    const int symbol = dominant_symbol(magnitudes, floor_, ratio_);

    std::lock_guard<std::mutex> lock(mutex_);
    last_symbol_ = symbol;
    history_.push_back(symbol);
    while (static_cast<int>(history_.size()) > capacity_) history_.pop_front();

    const std::vector<int> edges = edge_sequence(std::vector<int>(history_.begin(), history_.end()));
    const int code = find_code(edges);
    if (code == kNoCode || code == current_code_) return false;

    std::cout << "[decoder] code " << current_code_ << " -> " << code << std::endl;
    current_code_ = code;
    if (code_changed_) code_changed_(code);
    return true;
}

int SignalDecoder::current_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_code_;
}

int SignalDecoder::last_symbol() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_symbol_;
}

std::vector<int> SignalDecoder::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<int>(history_.begin(), history_.end());
}

void SignalDecoder::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
    current_code_ = kNoCode;
    last_symbol_ = kNoSymbol;
}

} // namespace heartlight
