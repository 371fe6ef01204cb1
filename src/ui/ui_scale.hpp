/// @file ui_scale.hpp
/// @brief Responsive UI metrics derived from the window size once per frame.

#pragma once

namespace algoscope {

struct UIScale {
    float factor = 1.0f;    ///< screen_h / 720, blended with width
    float panel_w = 340.0f; ///< Right-side panel column width
    float margin = 10.0f;

    int font_normal = 16;
    int font_small = 14;
    int font_big = 21;
    int font_tiny = 12;

    float padding = 10.0f;
    float row_gap = 8.0f;
    float label_height = 16.0f;
    float field_height = 30.0f;
    float button_height = 30.0f;
    float slider_height = 20.0f;

    // Scene viewport
    float scene_padding = 40.0f; ///< Pixels kept clear around the drawn structure
    float max_ppu = 40.0f;       ///< Upper bound for pixels per logical unit
    int scene_font = 16;         ///< Node and bar labels
    int title_font = 24;
    int hud_font = 14;
};

/// Recomputes the metrics. Call once per frame before drawing any panel.
void update_ui_scale(int screen_w, int screen_h);

const UIScale& ui_scale();

} // namespace algoscope
