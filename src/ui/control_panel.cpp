/// @file control_panel.cpp
/// @brief Implements the control panel with custom-drawn raylib widgets

#include "ui/control_panel.hpp"

#include "algorithms/graph_traversal.hpp"
#include "algorithms/pathfinding.hpp"
#include "algorithms/searching.hpp"
#include "algorithms/sorting.hpp"
#include "algorithms/tree_operations.hpp"
#include "rendering/app_font.hpp"
#include "ui/ui_scale.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace algoscope {

namespace {

constexpr std::size_t MAX_FIELD_CHARS = 200;
constexpr float BUTTON_GAP = 4.0f;

// --- Colors ---
const Color BG_COLOR = {35, 35, 42, 230};
const Color BORDER_COLOR = {70, 70, 85, 255};
const Color FIELD_BG = {25, 25, 32, 255};
const Color FIELD_BG_ACTIVE = {30, 30, 50, 255};
const Color FIELD_BORDER = {90, 90, 110, 255};
const Color FIELD_BORDER_ACTIVE = {100, 140, 255, 255};
const Color TEXT_COLOR = {220, 220, 230, 255};
const Color LABEL_COLOR = {160, 160, 180, 255};
const Color BUTTON_BG = {50, 50, 65, 255};
const Color BUTTON_BG_HOVER = {65, 65, 85, 255};
const Color BUTTON_RUN = {40, 120, 60, 255};
const Color BUTTON_CANCEL = {140, 50, 50, 255};
const Color TAB_ACTIVE = {60, 90, 150, 255};
const Color SLIDER_TRACK = {50, 50, 60, 255};
const Color SLIDER_FILL = {60, 140, 200, 255};
const Color SLIDER_HANDLE = {180, 180, 200, 255};

constexpr const char* SCREEN_TABS[] = {"Sort", "Search", "Graph", "Tree", "List"};

/// Rows below the tabs, used to size the panel before drawing it
struct ScreenRows {
    int fields;
    int button_rows;
};

ScreenRows rows_for(Screen screen) {
    switch (screen) {
    case Screen::SORTING:
        return {1, 4};
    case Screen::SEARCHING:
        return {2, 3};
    case Screen::GRAPH:
        return {4, 3};
    case Screen::TREE:
        return {2, 4};
    case Screen::LIST:
        return {2, 3};
    }
    return {0, 0};
}

float field_row_height() {
    const UIScale& s = ui_scale();
    return s.label_height + s.field_height + s.row_gap;
}

float button_row_height() {
    const UIScale& s = ui_scale();
    return s.button_height + s.row_gap;
}

/// Draws a labelled single-line text field. Returns true when Enter is pressed in it.
bool draw_text_field(const char* label, std::string& text, TextField id, TextField& editing,
                     float x, float y, float w) {
    const UIScale& s = ui_scale();
    DrawAppText(label, static_cast<int>(x), static_cast<int>(y), s.font_small, LABEL_COLOR);

    float fy = y + s.label_height;
    Rectangle field = {x, fy, w, s.field_height};
    bool hovered = CheckCollisionPointRec(GetMousePosition(), field);
    if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
        if (hovered) {
            editing = id;
        } else if (editing == id) {
            editing = TextField::NONE;
        }
    }
    bool active = (editing == id);

    DrawRectangleRec(field, active ? FIELD_BG_ACTIVE : FIELD_BG);
    DrawRectangleLinesEx(field, 1.0f, active ? FIELD_BORDER_ACTIVE : FIELD_BORDER);

    bool submitted = false;
    if (active) {
        int key = GetCharPressed();
        while (key > 0) {
            if (key >= 32 && key <= 126 && text.size() < MAX_FIELD_CHARS) {
                text.push_back(static_cast<char>(key));
            }
            key = GetCharPressed();
        }
        if (IsKeyPressed(KEY_BACKSPACE) && !text.empty()) {
            text.pop_back();
        }
        if (IsKeyPressed(KEY_ENTER) || IsKeyPressed(KEY_KP_ENTER)) {
            editing = TextField::NONE;
            submitted = true;
        }
    }

    // Show the tail of text that does not fit
    float text_room = w - 12.0f;
    std::string shown = text;
    while (!shown.empty() &&
           static_cast<float>(MeasureAppText(shown.c_str(), s.font_normal)) > text_room) {
        shown.erase(shown.begin());
    }
    int text_y = static_cast<int>(fy + (s.field_height - static_cast<float>(s.font_normal)) / 2.0f);
    DrawAppText(shown.c_str(), static_cast<int>(x + 6), text_y, s.font_normal, TEXT_COLOR);

    if (active && static_cast<int>(GetTime() * 2.0) % 2 == 0) {
        float cx = x + 6.0f + static_cast<float>(MeasureAppText(shown.c_str(), s.font_normal));
        DrawLine(static_cast<int>(cx), static_cast<int>(fy + 5), static_cast<int>(cx),
                 static_cast<int>(fy + s.field_height - 5), TEXT_COLOR);
    }
    return submitted;
}

/// Draw a button. Returns true if clicked this frame.
bool draw_button(const char* text, float x, float y, float w, Color bg_normal) {
    const UIScale& s = ui_scale();
    Rectangle rect = {x, y, w, s.button_height};
    bool hovered = CheckCollisionPointRec(GetMousePosition(), rect);
    bool clicked = hovered && IsMouseButtonPressed(MOUSE_BUTTON_LEFT);

    DrawRectangleRec(rect, hovered ? BUTTON_BG_HOVER : bg_normal);
    DrawRectangleLinesEx(rect, 1.0f, BORDER_COLOR);

    int tw = MeasureAppText(text, s.font_small);
    DrawAppText(text, static_cast<int>(x + (w - static_cast<float>(tw)) / 2.0f),
                static_cast<int>(y + (s.button_height - static_cast<float>(s.font_small)) / 2.0f),
                s.font_small, TEXT_COLOR);
    return clicked;
}

/// "< name >" selector cycling through `count` choices. Returns true if changed.
bool draw_selector(const char* name, int& choice, int count, float x, float y, float w) {
    const UIScale& s = ui_scale();
    float arrow_w = s.button_height;
    bool changed = false;
    if (draw_button("<", x, y, arrow_w, BUTTON_BG)) {
        choice = (choice + count - 1) % count;
        changed = true;
    }
    if (draw_button(">", x + w - arrow_w, y, arrow_w, BUTTON_BG)) {
        choice = (choice + 1) % count;
        changed = true;
    }
    int tw = MeasureAppText(name, s.font_small);
    DrawAppText(name, static_cast<int>(x + (w - static_cast<float>(tw)) / 2.0f),
                static_cast<int>(y + (s.button_height - static_cast<float>(s.font_small)) / 2.0f),
                s.font_small, TEXT_COLOR);
    return changed;
}

/// Horizontal slider over integer values. Returns true if the value changed.
bool draw_slider(const char* label, int& value, int min_val, int max_val, bool& dragging,
                 float x, float y, float w) {
    const UIScale& s = ui_scale();
    DrawAppText(label, static_cast<int>(x), static_cast<int>(y), s.font_small, LABEL_COLOR);

    float track_y = y + s.label_height;
    float track_w = w - 50.0f;
    Rectangle track = {x, track_y, track_w, s.slider_height};
    float span = static_cast<float>(max_val - min_val);
    float norm = std::clamp(static_cast<float>(value - min_val) / span, 0.0f, 1.0f);

    Vector2 mouse = GetMousePosition();
    if (CheckCollisionPointRec(mouse, track) && IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
        dragging = true;
    }
    if (!IsMouseButtonDown(MOUSE_BUTTON_LEFT)) {
        dragging = false;
    }

    bool changed = false;
    if (dragging) {
        norm = std::clamp((mouse.x - x) / track_w, 0.0f, 1.0f);
        int new_val = min_val + static_cast<int>(std::round(norm * span));
        if (new_val != value) {
            value = new_val;
            changed = true;
        }
    }

    DrawRectangleRec(track, SLIDER_TRACK);
    DrawRectangleRec({x, track_y, track_w * norm, s.slider_height}, SLIDER_FILL);
    DrawRectangleRec({x + track_w * norm - 4.0f, track_y - 2.0f, 8.0f, s.slider_height + 4.0f},
                     SLIDER_HANDLE);

    char val_str[16];
    std::snprintf(val_str, sizeof(val_str), "%d", value);
    DrawAppText(val_str, static_cast<int>(x + track_w + 8.0f), static_cast<int>(track_y + 2.0f),
                s.font_small, TEXT_COLOR);
    return changed;
}

/// Two buttons sharing a row; returns which one was clicked (0 none, 1 left, 2 right)
int draw_button_pair(const char* left, Color left_bg, const char* right, Color right_bg,
                     float x, float y, float w) {
    float half = (w - BUTTON_GAP) / 2.0f;
    int clicked = 0;
    if (draw_button(left, x, y, half, left_bg)) {
        clicked = 1;
    }
    if (draw_button(right, x + half + BUTTON_GAP, y, half, right_bg)) {
        clicked = 2;
    }
    return clicked;
}

/// Run, or Cancel while a playback is running
void draw_run_button(const char* run_label, bool running, UIAction& action, float x, float y,
                     float w) {
    if (running) {
        action.cancel_pressed = draw_button("Cancel", x, y, w, BUTTON_CANCEL);
    } else {
        action.run_pressed = draw_button(run_label, x, y, w, BUTTON_RUN);
    }
}

} // namespace

const char* selected_algorithm_name(const UIState& state) {
    constexpr SortAlgorithm SORTS[] = {SortAlgorithm::BUBBLE, SortAlgorithm::SELECTION,
                                       SortAlgorithm::INSERTION, SortAlgorithm::QUICK,
                                       SortAlgorithm::MERGE, SortAlgorithm::HEAP};
    constexpr SearchAlgorithm SEARCHES[] = {SearchAlgorithm::LINEAR, SearchAlgorithm::BINARY};
    constexpr TreeTraversal TRAVERSALS[] = {TreeTraversal::IN_ORDER, TreeTraversal::PRE_ORDER,
                                            TreeTraversal::POST_ORDER};

    switch (state.screen) {
    case Screen::SORTING:
        return sort_algorithm_name(SORTS[state.sort_choice]).data();
    case Screen::SEARCHING:
        return search_algorithm_name(SEARCHES[state.search_choice]).data();
    case Screen::GRAPH:
        switch (state.graph_choice) {
        case 0:
            return traversal_algorithm_name(TraversalAlgorithm::BFS).data();
        case 1:
            return traversal_algorithm_name(TraversalAlgorithm::DFS).data();
        case 2:
            return path_algorithm_name(PathAlgorithm::DIJKSTRA).data();
        default:
            return path_algorithm_name(PathAlgorithm::A_STAR).data();
        }
    case Screen::TREE:
        return tree_traversal_name(TRAVERSALS[state.traversal_choice]).data();
    case Screen::LIST:
        return list_kind_name(state.doubly ? ListKind::DOUBLY : ListKind::SINGLY).data();
    }
    return "";
}

ControlPanelResult draw_control_panel(UIState& state, bool running, float panel_x,
                                      float panel_y, float panel_w) {
    const UIScale& s = ui_scale();
    ControlPanelResult result;
    UIAction& action = result.action;

    ScreenRows rows = rows_for(state.screen);
    float height = s.padding;
    height += static_cast<float>(s.font_normal) + s.row_gap; // Title
    height += button_row_height();                           // Tabs
    height += static_cast<float>(rows.fields) * field_row_height();
    height += static_cast<float>(rows.button_rows) * button_row_height();
    height += s.label_height + s.slider_height + s.row_gap; // Speed
    result.panel_height = height + s.padding;

    float content_w = panel_w - 2.0f * s.padding;
    float cx = panel_x + s.padding;
    float cy = panel_y + s.padding;

    DrawRectangleRec({panel_x, panel_y, panel_w, result.panel_height}, BG_COLOR);
    DrawRectangleLinesEx({panel_x, panel_y, panel_w, result.panel_height}, 1.0f, BORDER_COLOR);

    DrawAppText("CONTROLS", static_cast<int>(cx), static_cast<int>(cy), s.font_normal, TEXT_COLOR);
    cy += static_cast<float>(s.font_normal) + s.row_gap;

    // Tabs
    constexpr int TAB_COUNT = 5;
    float tab_w = (content_w - BUTTON_GAP * (TAB_COUNT - 1)) / TAB_COUNT;
    for (int i = 0; i < TAB_COUNT; i++) {
        Screen screen = static_cast<Screen>(i);
        Color bg = (screen == state.screen) ? TAB_ACTIVE : BUTTON_BG;
        if (draw_button(SCREEN_TABS[i], cx + static_cast<float>(i) * (tab_w + BUTTON_GAP), cy,
                        tab_w, bg) &&
            screen != state.screen) {
            state.screen = screen;
            state.editing = TextField::NONE;
            action.screen_changed = true;
        }
    }
    cy += button_row_height();

    auto field = [&](const char* label, std::string& text, TextField id) {
        bool submitted = draw_text_field(label, text, id, state.editing, cx, cy, content_w);
        cy += field_row_height();
        return submitted;
    };
    auto next_row = [&]() { cy += button_row_height(); };

    switch (state.screen) {
    case Screen::SORTING: {
        if (field("Elements (comma separated)", state.elements, TextField::ELEMENTS)) {
            action.load_pressed = true;
        }
        int clicked = draw_button_pair("Load", BUTTON_BG, "Clear", BUTTON_BG, cx, cy, content_w);
        action.load_pressed = action.load_pressed || clicked == 1;
        action.clear_pressed = clicked == 2;
        next_row();
        draw_selector(selected_algorithm_name(state), state.sort_choice, SORT_CHOICES, cx, cy,
                      content_w);
        next_row();
        if (draw_button(state.descending ? "Order: Descending" : "Order: Ascending", cx, cy,
                        content_w, BUTTON_BG)) {
            state.descending = !state.descending;
        }
        next_row();
        draw_run_button("Sort", running, action, cx, cy, content_w);
        next_row();
        break;
    }
    case Screen::SEARCHING:
        if (field("Elements (comma separated)", state.elements, TextField::ELEMENTS)) {
            action.load_pressed = true;
        }
        if (draw_button("Load", cx, cy, content_w, BUTTON_BG)) {
            action.load_pressed = true;
        }
        next_row();
        field("Target value", state.target, TextField::TARGET);
        draw_selector(selected_algorithm_name(state), state.search_choice, SEARCH_CHOICES, cx,
                      cy, content_w);
        next_row();
        draw_run_button("Search", running, action, cx, cy, content_w);
        next_row();
        break;
    case Screen::GRAPH:
        field("Edges (A-B, A-C)", state.edges, TextField::EDGES);
        field("Weights (A-B:5, optional)", state.weights, TextField::WEIGHTS);
        field("Start node", state.start, TextField::START);
        if (draw_button("Load Graph", cx, cy, content_w, BUTTON_BG)) {
            action.load_pressed = true;
        }
        next_row();
        field("End node (pathfinding)", state.end, TextField::END);
        draw_selector(selected_algorithm_name(state), state.graph_choice, GRAPH_CHOICES, cx, cy,
                      content_w);
        next_row();
        draw_run_button("Run", running, action, cx, cy, content_w);
        next_row();
        break;
    case Screen::TREE: {
        field("Tree values", state.tree_values, TextField::TREE_VALUES);
        field("Value", state.tree_value, TextField::TREE_VALUE);
        int clicked = draw_button_pair("Build", BUTTON_BG, "Insert", BUTTON_BG, cx, cy, content_w);
        action.load_pressed = clicked == 1;
        action.insert_pressed = clicked == 2;
        next_row();
        action.search_pressed = draw_button("Search", cx, cy, content_w, BUTTON_BG);
        next_row();
        draw_selector(selected_algorithm_name(state), state.traversal_choice, TRAVERSAL_CHOICES,
                      cx, cy, content_w);
        next_row();
        draw_run_button("Traverse", running, action, cx, cy, content_w);
        next_row();
        break;
    }
    case Screen::LIST: {
        field("List values", state.list_values, TextField::LIST_VALUES);
        if (draw_button(state.doubly ? "Kind: Doubly" : "Kind: Singly", cx, cy, content_w,
                        BUTTON_BG)) {
            state.doubly = !state.doubly;
        }
        next_row();
        if (draw_button("Build", cx, cy, content_w, BUTTON_BG)) {
            action.load_pressed = true;
        }
        next_row();
        field("Value", state.list_value, TextField::LIST_VALUE);
        if (running) {
            action.cancel_pressed = draw_button("Cancel", cx, cy, content_w, BUTTON_CANCEL);
        } else {
            int clicked =
                draw_button_pair("Search", BUTTON_BG, "Delete", BUTTON_BG, cx, cy, content_w);
            action.search_pressed = clicked == 1;
            action.delete_pressed = clicked == 2;
        }
        next_row();
        break;
    }
    }

    if (draw_slider("Speed", state.speed, MIN_DELAY_MS, MAX_DELAY_MS, state.dragging_speed, cx,
                    cy, content_w)) {
        action.speed_changed = true;
    }
    return result;
}

} // namespace algoscope
