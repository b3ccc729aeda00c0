// Bar view of the per-target magnitudes for ImGui
#pragma once

#include <imgui.h>
#include <vector>

#include "magnitude_map.hpp"

namespace gui {

class MagnitudeView {
public:
    bool show_floor_line = true;
    bool log_scale = true;
    float full_scale = 8000.0f;   // magnitude at the top of the canvas

    ImVec4 color_bar = ImVec4(0.36f, 0.62f, 0.90f, 1.00f);
    ImVec4 color_dominant = ImVec4(1.00f, 0.75f, 0.25f, 1.00f);
    ImVec4 color_floor = ImVec4(0.90f, 0.20f, 0.20f, 0.85f);

    // Draws one bar per target frequency; the dominant symbol (if any) is
    // highlighted and the detection floor is drawn as a horizontal line.
    void draw(ImDrawList* dl,
              const ImVec2& canvas_pos,
              float width,
              float height,
              const heartlight::MagnitudeMap& magnitudes,
              int dominant_frequency_hz,
              float floor) const;

private:
    float to_height01(float magnitude) const;
};

} // namespace gui
