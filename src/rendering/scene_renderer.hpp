/// @file scene_renderer.hpp
/// @brief Draws the structure currently held by the view state

#pragma once

#include "rendering/view_state.hpp"

#include <raylib.h>

namespace algoscope {

/// Draws the array, graph, tree or list of `view`, scaled to fit `area`.
/// Colors follow the latest step and everything accumulated before it.
void draw_scene(const ViewState& view, Rectangle area);

} // namespace algoscope
