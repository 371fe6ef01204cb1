#pragma once

/// @file layout_engine.hpp
/// @brief Computes positions for arrays, graphs, trees and lists in logical units

#include "core/geometry.hpp"
#include "structures/binary_search_tree.hpp"
#include "structures/graph.hpp"
#include "structures/linked_list.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace algoscope {

/// Graph node centres keyed by label.
/// All coordinates are in logical units; the renderer scales to screen pixels.
struct GraphLayout {
    std::unordered_map<std::string, Vec2> positions;
    Rect bounding_box;
};

/// Tree or list node centres keyed by arena id
struct NodeLayout {
    std::map<NodeId, Vec2> positions;
    Rect bounding_box;
};

/// One bar per element, heights proportional to the value's magnitude.
/// Bars stand on y = bounding_box.h; negative values are drawn at the minimum height.
[[nodiscard]] std::vector<Rect> compute_bar_layout(const std::vector<double>& values);

/// Places the nodes evenly on a circle in first-seen order, the first node
/// at angle 0. These positions also feed the A* straight-line heuristic.
[[nodiscard]] GraphLayout compute_graph_layout(const Graph& graph);

/// Root at the top centre; the horizontal offset to a child halves at every level
[[nodiscard]] NodeLayout compute_tree_layout(const BinarySearchTree& tree);

/// Linked nodes left to right from the head
[[nodiscard]] NodeLayout compute_list_layout(const LinkedList& list);

} // namespace algoscope
