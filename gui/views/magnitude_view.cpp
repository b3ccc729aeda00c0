#include "magnitude_view.hpp"
#include <cmath>
#include <cstdio>

namespace gui {

static inline float clamp01(float v) { return v < 0.0f ? 0.0f : (v > 1.0f ? 1.0f : v); }

float MagnitudeView::to_height01(float magnitude) const {
    if (magnitude <= 0.0f || full_scale <= 0.0f) return 0.0f;
    if (!log_scale) return clamp01(magnitude / full_scale);
    // 60 dB of range below full scale
    const float db = 20.0f * std::log10(magnitude / full_scale);
    return clamp01((db + 60.0f) / 60.0f);
}

void MagnitudeView::draw(ImDrawList* dl,
                         const ImVec2& canvas_pos,
                         float width,
                         float height,
                         const heartlight::MagnitudeMap& magnitudes,
                         int dominant_frequency_hz,
                         float floor) const {
    if (!dl || width <= 0 || height <= 0) return;

    dl->AddRectFilled(canvas_pos, ImVec2(canvas_pos.x + width, canvas_pos.y + height), IM_COL32(20,20,20,200));
    dl->AddRect(canvas_pos, ImVec2(canvas_pos.x + width, canvas_pos.y + height), IM_COL32(60,60,60,255));
    if (magnitudes.empty()) return;

    const float label_h = ImGui::GetTextLineHeight() + 4.0f;
    const float plot_h = height - label_h;
    const float base_y = canvas_pos.y + plot_h;
    const int n = static_cast<int>(magnitudes.size());
    const float slot_w = width / static_cast<float>(n);

    for (int i = 0; i < n; ++i) {
        const auto& fm = magnitudes[i];
        const float x0 = canvas_pos.x + slot_w * i + slot_w * 0.15f;
        const float x1 = canvas_pos.x + slot_w * (i + 1) - slot_w * 0.15f;
        const float top = base_y - to_height01(fm.magnitude) * plot_h;
        const ImVec4& c = fm.frequency_hz == dominant_frequency_hz ? color_dominant : color_bar;
        dl->AddRectFilled(ImVec2(x0, top), ImVec2(x1, base_y), ImGui::ColorConvertFloat4ToU32(c));

        char label[32];
        std::snprintf(label, sizeof(label), "%.2fk", fm.frequency_hz / 1000.0f);
        const ImVec2 ts = ImGui::CalcTextSize(label);
        dl->AddText(ImVec2(canvas_pos.x + slot_w * (i + 0.5f) - ts.x * 0.5f, base_y + 2.0f),
                    IM_COL32(220,220,220,255), label);
    }

    if (show_floor_line && floor > 0.0f) {
        const float y = base_y - to_height01(floor) * plot_h;
        dl->AddLine(ImVec2(canvas_pos.x, y), ImVec2(canvas_pos.x + width, y),
                    ImGui::ColorConvertFloat4ToU32(color_floor), 1.5f);
    }
}

} // namespace gui
