#pragma once

/// @file geometry.hpp
/// @brief Plain 2D value types shared by layout and the A* heuristic

namespace algoscope {

/// A 2D point in logical coordinates
struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;
};

/// An axis-aligned rectangle in logical coordinates
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;
};

} // namespace algoscope
