#pragma once

#include <array>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

#include "config.hpp"
#include "magnitude_map.hpp"

namespace heartlight {

// Tracks the dominant target frequency of each block over the last ~second
// and decodes the 8-symbol beacon sequence into a 7-bit code.
//
// Sequence layout (slot: allowed symbols, in bit order):
//   0: 18500                  (sync, carries no bit)
//   1,3,5,7: 18750 | 19250
//   2,4,6:   19000 | 19500
// Each two-option slot contributes the index of the observed symbol, MSB first.
class SignalDecoder {
public:
    using CodeChangedCallback = std::function<void(int code)>;

    static constexpr int kNoSymbol = 0;
    static constexpr int kNoCode = -1;
    static constexpr int kPatternLength = 8;

    struct TemplateSlot {
        int options[2];
        int count;
    };
    static const std::array<TemplateSlot, kPatternLength>& pattern_template();

    explicit SignalDecoder(const Config& cfg);

    // Invoked from update() with the decoder lock held; keep it cheap.
    void set_code_changed_callback(CodeChangedCallback callback);

    // Feed one block's magnitudes. Returns true when the stored code changed.
    // Safe to call from several threads; updates are serialized.
    bool update(const MagnitudeMap& magnitudes);

    int current_code() const;
    int last_symbol() const;
    std::vector<int> history() const;
    int history_capacity() const { return capacity_; }

    // Forget the history and the held code
    void reset();

    // Dominant target of one block, or kNoSymbol when no entry reaches
    // `floor` and exceeds `ratio` times the mean of the remaining entries.
    static int dominant_symbol(const MagnitudeMap& magnitudes, float floor, float ratio);

    // Drops kNoSymbol entries, then collapses runs of equal symbols
    static std::vector<int> edge_sequence(const std::vector<int>& symbols);

    // Most recent template match in the edge sequence, decoded; kNoCode if none
    static int find_code(const std::vector<int>& edges);

private:
    const float floor_;
    const float ratio_;
    const int capacity_;

    mutable std::mutex mutex_;
    std::deque<int> history_;
    int current_code_ = kNoCode;
    int last_symbol_ = kNoSymbol;
    CodeChangedCallback code_changed_;

    static int decode_window(const std::vector<int>& edges, size_t start);
};

} // namespace heartlight
