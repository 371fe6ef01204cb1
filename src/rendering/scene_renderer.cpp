/// @file scene_renderer.cpp
/// @brief Raylib drawing of bars, graph nodes, tree nodes and list nodes

#include "rendering/scene_renderer.hpp"

#include "core/value_format.hpp"
#include "rendering/app_font.hpp"
#include "rendering/layout_engine.hpp"
#include "ui/ui_scale.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace algoscope {

namespace {

constexpr float NODE_RADIUS_UNITS = 1.2f;
constexpr float EDGE_THICKNESS = 2.0f;
constexpr float ARROW_SIZE = 8.0f;
constexpr float MIN_PPU = 4.0f;

// --- Colors ---
const Color BAR_COLOR = {90, 130, 200, 255};
const Color NODE_COLOR = {70, 90, 130, 255};
const Color NODE_OUTLINE = {150, 170, 210, 255};
const Color EDGE_COLOR = {90, 90, 110, 255};
const Color TEXT_COLOR = {235, 235, 240, 255};
const Color LABEL_COLOR = {160, 160, 180, 255};
const Color COMPARE_COLOR = {240, 200, 70, 255};
const Color MOVE_COLOR = {230, 90, 80, 255};
const Color FINAL_COLOR = {70, 190, 110, 255};
const Color PIVOT_COLOR = {170, 100, 220, 255};
const Color CANDIDATE_COLOR = {240, 150, 60, 255};
const Color KEY_COLOR = {70, 200, 220, 255};
const Color FOUND_COLOR = {60, 230, 120, 255};
const Color VISITED_COLOR = {60, 150, 110, 255};
const Color SCHEDULED_COLOR = {160, 140, 60, 255};
const Color PATH_COLOR = {240, 110, 180, 255};
const Color REMOVED_COLOR = {120, 60, 60, 255};
const Color DIM_COLOR = {50, 50, 60, 255};

/// Logical-to-screen mapping for one frame
struct Fit {
    float scale = 1.0f;
    Vector2 offset = {0, 0};
};

Fit fit_box(const Rect& box, Rectangle area) {
    const UIScale& s = ui_scale();
    Fit fit;
    float avail_w = area.width - 2.0f * s.scene_padding;
    float avail_h = area.height - 2.0f * s.scene_padding;
    if (box.w <= 0.0f || box.h <= 0.0f) {
        fit.scale = s.max_ppu;
    } else {
        fit.scale = std::max(std::min({avail_w / box.w, avail_h / box.h, s.max_ppu}), MIN_PPU);
    }
    fit.offset = {area.x + (area.width - box.w * fit.scale) / 2.0f - box.x * fit.scale,
                  area.y + (area.height - box.h * fit.scale) / 2.0f - box.y * fit.scale};
    return fit;
}

Vector2 to_screen(Vec2 p, const Fit& fit) {
    return {fit.offset.x + p.x * fit.scale, fit.offset.y + p.y * fit.scale};
}

/// Brightens a color toward white by the flash amount of the latest step
Color flashed(Color c, float flash) {
    auto lift = [&](unsigned char v) {
        return static_cast<unsigned char>(v + (255 - v) * 0.35f * flash);
    };
    return {lift(c.r), lift(c.g), lift(c.b), c.a};
}

void draw_centered_text(const std::string& text, Vector2 center, int font, Color color) {
    int w = MeasureAppText(text.c_str(), font);
    DrawAppText(text.c_str(), static_cast<int>(center.x - static_cast<float>(w) / 2.0f),
                static_cast<int>(center.y - static_cast<float>(font) / 2.0f), font, color);
}

void draw_node(Vector2 center, float radius, Color fill, const std::string& label) {
    DrawCircleV(center, radius, fill);
    DrawCircleLines(static_cast<int>(center.x), static_cast<int>(center.y), radius, NODE_OUTLINE);
    draw_centered_text(label, center, ui_scale().scene_font, TEXT_COLOR);
}

/// Line from the rim of one node to the rim of another, optionally with an arrow head
void draw_link(Vector2 from, Vector2 to, float radius, Color color, bool arrow) {
    float dx = to.x - from.x;
    float dy = to.y - from.y;
    float len = std::sqrt(dx * dx + dy * dy);
    if (len <= 2.0f * radius) {
        return;
    }
    float ux = dx / len;
    float uy = dy / len;
    Vector2 a = {from.x + ux * radius, from.y + uy * radius};
    Vector2 b = {to.x - ux * radius, to.y - uy * radius};
    DrawLineEx(a, b, EDGE_THICKNESS, color);
    if (arrow) {
        Vector2 left = {b.x - ux * ARROW_SIZE - uy * ARROW_SIZE * 0.5f,
                        b.y - uy * ARROW_SIZE + ux * ARROW_SIZE * 0.5f};
        Vector2 right = {b.x - ux * ARROW_SIZE + uy * ARROW_SIZE * 0.5f,
                         b.y - uy * ARROW_SIZE - ux * ARROW_SIZE * 0.5f};
        DrawLineEx(b, left, EDGE_THICKNESS, color);
        DrawLineEx(b, right, EDGE_THICKNESS, color);
    }
}

Color bar_color(const ViewState& view, std::size_t i) {
    const auto& found = view.found();
    if (found && found->type == SubjectType::INDEX && found->id == i) {
        return FOUND_COLOR;
    }
    if (view.is_active_index(i)) {
        StepKind kind = view.current_kind().value_or(StepKind::COMPARE);
        bool moving = kind == StepKind::SWAP || kind == StepKind::SHIFT ||
                      kind == StepKind::OVERWRITE;
        return flashed(moving ? MOVE_COLOR : COMPARE_COLOR, view.flash());
    }
    if (view.is_finalized(i)) {
        return FINAL_COLOR;
    }
    if (auto mark = view.mark_at(i)) {
        switch (*mark) {
        case MarkRole::PIVOT:
            return PIVOT_COLOR;
        case MarkRole::CANDIDATE:
            return CANDIDATE_COLOR;
        case MarkRole::KEY:
            return KEY_COLOR;
        }
    }
    // Outside the active binary search range
    if (const auto& range = view.range()) {
        long pos = static_cast<long>(i);
        if (pos < range->low || pos > range->high) {
            return DIM_COLOR;
        }
    }
    return BAR_COLOR;
}

void draw_array(const ViewState& view, Rectangle area) {
    const std::vector<double>& values = view.values();
    if (values.empty()) {
        draw_centered_text("Load an array to begin", {area.x + area.width / 2.0f,
                                                      area.y + area.height / 2.0f},
                           ui_scale().title_font, LABEL_COLOR);
        return;
    }

    std::vector<Rect> bars = compute_bar_layout(values);
    Rect box{0.0f, 0.0f, 0.0f, 0.0f};
    for (const Rect& r : bars) {
        box.w = std::max(box.w, r.x + r.w);
        box.h = std::max(box.h, r.y + r.h);
    }
    Fit fit = fit_box(box, area);
    int font = ui_scale().scene_font;

    for (std::size_t i = 0; i < bars.size(); i++) {
        Vector2 top_left = to_screen({bars[i].x, bars[i].y}, fit);
        Rectangle rect = {top_left.x, top_left.y, bars[i].w * fit.scale, bars[i].h * fit.scale};
        DrawRectangleRec(rect, bar_color(view, i));

        Vector2 below = {rect.x + rect.width / 2.0f, rect.y + rect.height + 4.0f + font / 2.0f};
        draw_centered_text(format_value(values[i]), below, font, TEXT_COLOR);
        Vector2 index_pos = {below.x, below.y + static_cast<float>(font) + 2.0f};
        draw_centered_text(std::to_string(i), index_pos, ui_scale().font_tiny, LABEL_COLOR);
    }
}

Color graph_node_color(const ViewState& view, const std::string& label) {
    if (view.on_path(label)) {
        return PATH_COLOR;
    }
    if (view.is_active_label(label)) {
        return flashed(COMPARE_COLOR, view.flash());
    }
    if (view.is_settled(label) || view.is_visited(label)) {
        return VISITED_COLOR;
    }
    if (view.is_scheduled(label) || view.score(label)) {
        return SCHEDULED_COLOR;
    }
    return NODE_COLOR;
}

void draw_graph(const ViewState& view, Rectangle area) {
    if (!view.graph()) {
        return;
    }
    const Graph& graph = *view.graph();
    GraphLayout layout = compute_graph_layout(graph);
    Fit fit = fit_box(layout.bounding_box, area);
    float radius = NODE_RADIUS_UNITS * fit.scale;
    int font = ui_scale().font_small;

    // Each undirected edge once, from the endpoint that comes first
    for (const std::string& u : graph.nodes()) {
        Vector2 pu = to_screen(layout.positions.at(u), fit);
        for (const std::string& v : graph.neighbors(u)) {
            if (v < u) {
                continue;
            }
            Vector2 pv = to_screen(layout.positions.at(v), fit);
            bool path_edge = view.on_path(u) && view.on_path(v);
            draw_link(pu, pv, radius, path_edge ? PATH_COLOR : EDGE_COLOR, false);
            if (auto w = graph.weight(u, v)) {
                draw_centered_text(format_value(*w), {(pu.x + pv.x) / 2.0f, (pu.y + pv.y) / 2.0f},
                                   font, LABEL_COLOR);
            }
        }
    }

    for (const std::string& label : graph.nodes()) {
        Vector2 p = to_screen(layout.positions.at(label), fit);
        draw_node(p, radius, graph_node_color(view, label), label);
        if (auto score = view.score(label)) {
            draw_centered_text("d=" + format_value(score->cost),
                               {p.x, p.y + radius + static_cast<float>(font)}, font, LABEL_COLOR);
        }
        if (label == view.start_node()) {
            draw_centered_text("start", {p.x, p.y - radius - static_cast<float>(font)}, font,
                               LABEL_COLOR);
        }
    }
}

Color structure_node_color(const ViewState& view, NodeId id) {
    const auto& found = view.found();
    if (found && found->type == SubjectType::NODE && found->id == id) {
        return FOUND_COLOR;
    }
    if (view.is_removed(id)) {
        return REMOVED_COLOR;
    }
    if (view.is_active_node(id)) {
        bool moving = view.current_kind() == StepKind::INSERT ||
                      view.current_kind() == StepKind::APPEND ||
                      view.current_kind() == StepKind::UNLINK;
        return flashed(moving ? MOVE_COLOR : COMPARE_COLOR, view.flash());
    }
    if (view.is_node_visited(id)) {
        return VISITED_COLOR;
    }
    return NODE_COLOR;
}

void draw_tree(const ViewState& view, Rectangle area) {
    const BinarySearchTree& tree = view.tree();
    NodeLayout layout = compute_tree_layout(tree);
    Fit fit = fit_box(layout.bounding_box, area);
    float radius = NODE_RADIUS_UNITS * fit.scale;

    for (const auto& [id, pos] : layout.positions) {
        if (view.is_hidden(id)) {
            continue;
        }
        const TreeNode& node = tree.node(id);
        for (NodeId child : {node.left, node.right}) {
            if (child != NO_NODE && !view.is_hidden(child)) {
                draw_link(to_screen(pos, fit), to_screen(layout.positions.at(child), fit), radius,
                          EDGE_COLOR, false);
            }
        }
    }
    for (const auto& [id, pos] : layout.positions) {
        if (!view.is_hidden(id)) {
            draw_node(to_screen(pos, fit), radius, structure_node_color(view, id),
                      format_value(tree.node(id).value));
        }
    }
}

void draw_list(const ViewState& view, Rectangle area) {
    const LinkedList& list = view.list();
    NodeLayout layout = compute_list_layout(list);
    Fit fit = fit_box(layout.bounding_box, area);
    float radius = NODE_RADIUS_UNITS * fit.scale;
    bool doubly = list.kind() == ListKind::DOUBLY;

    std::vector<NodeId> order = list.order();
    for (std::size_t i = 0; i + 1 < order.size(); i++) {
        if (view.is_hidden(order[i + 1])) {
            break;
        }
        Vector2 a = to_screen(layout.positions.at(order[i]), fit);
        Vector2 b = to_screen(layout.positions.at(order[i + 1]), fit);
        float lane = doubly ? radius * 0.3f : 0.0f;
        draw_link({a.x, a.y - lane}, {b.x, b.y - lane}, radius, EDGE_COLOR, true);
        if (doubly) {
            draw_link({b.x, b.y + lane}, {a.x, a.y + lane}, radius, EDGE_COLOR, true);
        }
    }

    for (std::size_t i = 0; i < order.size(); i++) {
        NodeId id = order[i];
        if (view.is_hidden(id)) {
            continue;
        }
        Vector2 p = to_screen(layout.positions.at(id), fit);
        draw_node(p, radius, structure_node_color(view, id), format_value(list.node(id).value));
        if (i == 0) {
            draw_centered_text("head", {p.x, p.y - radius - 12.0f}, ui_scale().font_small,
                               LABEL_COLOR);
        }
    }
}

} // namespace

void draw_scene(const ViewState& view, Rectangle area) {
    switch (view.mode()) {
    case ViewMode::ARRAY:
        draw_array(view, area);
        break;
    case ViewMode::GRAPH:
        draw_graph(view, area);
        break;
    case ViewMode::TREE:
        draw_tree(view, area);
        break;
    case ViewMode::LIST:
        draw_list(view, area);
        break;
    case ViewMode::NONE:
        break;
    }
}

} // namespace algoscope
