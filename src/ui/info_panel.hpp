/// @file info_panel.hpp
/// @brief Information panel: algorithm description, complexity, step narration and notices.

#pragma once

#include "algorithms/algorithm_catalog.hpp"
#include "rendering/view_state.hpp"
#include "session/notice.hpp"

namespace algoscope {

/// Draws the information panel showing:
/// - Name and description of the selected algorithm with its complexity
/// - Step counter and the narrative of the latest step
/// - A one-line summary of the final artifact once playback completes
/// - The message of the last operation, with its instruction on failure
/// @param info    Catalogue entry of the selected algorithm
/// @param view    Visual state of the running or finished playback
/// @param notice  Outcome of the last workbench operation
/// @param panel_x Left edge of panel in screen coords
/// @param panel_y Top edge of panel in screen coords
/// @param panel_w Width of the panel
/// @return Rendered panel height, for dynamic stacking.
float draw_info_panel(const AlgorithmInfo& info, const ViewState& view, const Notice& notice,
                      float panel_x, float panel_y, float panel_w);

} // namespace algoscope
