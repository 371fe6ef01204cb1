/// @file layout_engine.cpp
/// @brief Computes node and bar positions for visualization

#include "rendering/layout_engine.hpp"

#include <algorithm>
#include <cmath>

namespace algoscope {

namespace {

// --- Layout constants (logical units) ---
constexpr float BAR_WIDTH = 1.6f;
constexpr float BAR_GAP = 0.4f;
constexpr float BAR_MAX_HEIGHT = 20.0f;
constexpr float BAR_MIN_HEIGHT = 0.5f;

constexpr float GRAPH_RADIUS = 10.0f;
constexpr float NODE_RADIUS = 1.5f; // Margin added around node centres

constexpr float TREE_LEVEL_HEIGHT = 4.0f;
constexpr float TREE_ROOT_OFFSET = 16.0f; // Horizontal offset of the root's children

constexpr float LIST_NODE_SPACING = 6.0f;

constexpr float PI = 3.14159265358979f;

/// Grows the box to cover a node; the first node starts a new box
void include_node(Rect& box, Vec2 p, bool& first) {
    float left = p.x - NODE_RADIUS;
    float top = p.y - NODE_RADIUS;
    float right = p.x + NODE_RADIUS;
    float bottom = p.y + NODE_RADIUS;
    if (first) {
        box = {left, top, right - left, bottom - top};
        first = false;
        return;
    }
    float min_x = std::min(box.x, left);
    float min_y = std::min(box.y, top);
    float max_x = std::max(box.x + box.w, right);
    float max_y = std::max(box.y + box.h, bottom);
    box = {min_x, min_y, max_x - min_x, max_y - min_y};
}

void place_subtree(const BinarySearchTree& tree, NodeId id, Vec2 at, float offset,
                   NodeLayout& layout) {
    if (id == NO_NODE) {
        return;
    }
    layout.positions[id] = at;
    const TreeNode& node = tree.node(id);
    float child_y = at.y + TREE_LEVEL_HEIGHT;
    place_subtree(tree, node.left, {at.x - offset, child_y}, offset / 2.0f, layout);
    place_subtree(tree, node.right, {at.x + offset, child_y}, offset / 2.0f, layout);
}

} // namespace

std::vector<Rect> compute_bar_layout(const std::vector<double>& values) {
    std::vector<Rect> bars;
    double largest = 0.0;
    for (double v : values) {
        largest = std::max(largest, std::abs(v));
    }

    for (std::size_t i = 0; i < values.size(); i++) {
        float h = BAR_MIN_HEIGHT;
        if (largest > 0.0 && values[i] > 0.0) {
            h = std::max(BAR_MIN_HEIGHT,
                         static_cast<float>(values[i] / largest) * BAR_MAX_HEIGHT);
        }
        float x = static_cast<float>(i) * (BAR_WIDTH + BAR_GAP);
        bars.push_back({x, BAR_MAX_HEIGHT - h, BAR_WIDTH, h});
    }
    return bars;
}

GraphLayout compute_graph_layout(const Graph& graph) {
    GraphLayout layout;
    const auto& nodes = graph.nodes();
    if (nodes.empty()) {
        return layout;
    }

    float step = 2.0f * PI / static_cast<float>(nodes.size());
    bool first = true;
    for (std::size_t i = 0; i < nodes.size(); i++) {
        float angle = step * static_cast<float>(i);
        Vec2 p{GRAPH_RADIUS * std::cos(angle), GRAPH_RADIUS * std::sin(angle)};
        layout.positions[nodes[i]] = p;
        include_node(layout.bounding_box, p, first);
    }
    return layout;
}

NodeLayout compute_tree_layout(const BinarySearchTree& tree) {
    NodeLayout layout;
    place_subtree(tree, tree.root(), {0.0f, 0.0f}, TREE_ROOT_OFFSET, layout);

    bool first = true;
    for (const auto& [id, p] : layout.positions) {
        include_node(layout.bounding_box, p, first);
    }
    return layout;
}

NodeLayout compute_list_layout(const LinkedList& list) {
    NodeLayout layout;
    bool first = true;
    float x = 0.0f;
    for (NodeId id : list.order()) {
        Vec2 p{x, 0.0f};
        layout.positions[id] = p;
        include_node(layout.bounding_box, p, first);
        x += LIST_NODE_SPACING;
    }
    return layout;
}

} // namespace algoscope
