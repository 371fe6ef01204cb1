/// @file main.cpp
/// @brief Algoscope entry point: interactive algorithm visualizer
///
/// Loads arrays, graphs, trees and linked lists from the control panel,
/// plays the trace of the selected algorithm step by step, and narrates
/// every step. Supports both native desktop and Emscripten/WASM builds.

#include "algorithms/algorithm_catalog.hpp"
#include "rendering/app_font.hpp"
#include "rendering/layout_engine.hpp"
#include "rendering/scene_renderer.hpp"
#include "rendering/view_state.hpp"
#include "session/workbench.hpp"
#include "ui/control_panel.hpp"
#include "ui/info_panel.hpp"
#include "ui/ui_scale.hpp"

#include <raylib.h>

#ifdef __EMSCRIPTEN__
#include <emscripten/emscripten.h>
#endif

#include <memory>
#include <string>

namespace {

constexpr int INITIAL_WIDTH = 1280;
constexpr int INITIAL_HEIGHT = 720;
constexpr int MIN_WIDTH = 900;
constexpr int MIN_HEIGHT = 560;
constexpr int TARGET_FPS = 60;
constexpr float TITLE_BAR_HEIGHT = 44.0f;
constexpr float HUD_HEIGHT = 40.0f;

constexpr algoscope::SortAlgorithm SORTS[algoscope::SORT_CHOICES] = {
    algoscope::SortAlgorithm::BUBBLE, algoscope::SortAlgorithm::SELECTION,
    algoscope::SortAlgorithm::INSERTION, algoscope::SortAlgorithm::QUICK,
    algoscope::SortAlgorithm::MERGE, algoscope::SortAlgorithm::HEAP};
constexpr algoscope::SearchAlgorithm SEARCHES[algoscope::SEARCH_CHOICES] = {
    algoscope::SearchAlgorithm::LINEAR, algoscope::SearchAlgorithm::BINARY};
constexpr algoscope::TreeTraversal TRAVERSALS[algoscope::TRAVERSAL_CHOICES] = {
    algoscope::TreeTraversal::IN_ORDER, algoscope::TreeTraversal::PRE_ORDER,
    algoscope::TreeTraversal::POST_ORDER};

// Graph choices 0-1 are traversals, 2-3 shortest paths
constexpr int FIRST_PATH_CHOICE = 2;

/// All mutable state needed by the frame loop, bundled so it can be passed
/// through Emscripten's void* callback.
struct FrameState {
    algoscope::UIState ui;
    algoscope::ViewState view;
    std::unique_ptr<algoscope::Workbench> workbench;
    algoscope::Notice notice;
    float ms_carry = 0.0f; ///< Sub-millisecond remainder of frame time
};

algoscope::ListKind selected_list_kind(const algoscope::UIState& ui) {
    return ui.doubly ? algoscope::ListKind::DOUBLY : algoscope::ListKind::SINGLY;
}

/// Catalogue entry for what the panel currently selects
algoscope::AlgorithmInfo selected_info(const algoscope::UIState& ui) {
    switch (ui.screen) {
    case algoscope::Screen::SORTING:
        return algoscope::algorithm_info(SORTS[ui.sort_choice]);
    case algoscope::Screen::SEARCHING:
        return algoscope::algorithm_info(SEARCHES[ui.search_choice]);
    case algoscope::Screen::GRAPH:
        if (ui.graph_choice < FIRST_PATH_CHOICE) {
            return algoscope::algorithm_info(ui.graph_choice == 0
                                                 ? algoscope::TraversalAlgorithm::BFS
                                                 : algoscope::TraversalAlgorithm::DFS);
        }
        return algoscope::algorithm_info(ui.graph_choice == FIRST_PATH_CHOICE
                                             ? algoscope::PathAlgorithm::DIJKSTRA
                                             : algoscope::PathAlgorithm::A_STAR);
    case algoscope::Screen::TREE:
        return algoscope::algorithm_info(TRAVERSALS[ui.traversal_choice]);
    case algoscope::Screen::LIST:
        return algoscope::algorithm_info(selected_list_kind(ui));
    }
    return algoscope::tree_insertion_info();
}

/// Shows the structure that belongs to the current screen
void sync_view(FrameState& state) {
    const auto& wb = *state.workbench;
    switch (state.ui.screen) {
    case algoscope::Screen::SORTING:
    case algoscope::Screen::SEARCHING:
        state.view.on_array(wb.array());
        break;
    case algoscope::Screen::GRAPH:
        if (wb.graph()) {
            state.view.on_graph(*wb.graph(), wb.start_node());
        }
        break;
    case algoscope::Screen::TREE:
        state.view.on_tree(wb.tree());
        break;
    case algoscope::Screen::LIST:
        state.view.on_list(wb.list());
        break;
    }
}

/// Loads the graph and points A* at the positions it will be drawn at
algoscope::Notice load_graph(FrameState& state) {
    auto& wb = *state.workbench;
    algoscope::Notice notice = wb.load_graph(state.ui.edges, state.ui.weights, state.ui.start);
    if (notice.ok && wb.graph()) {
        wb.set_heuristic(algoscope::straight_line_heuristic(
            algoscope::compute_graph_layout(*wb.graph()).positions));
    }
    return notice;
}

algoscope::Notice run_selected(FrameState& state) {
    auto& ui = state.ui;
    auto& wb = *state.workbench;
    switch (ui.screen) {
    case algoscope::Screen::SORTING:
        return wb.run_sort(SORTS[ui.sort_choice], ui.descending
                                                      ? algoscope::SortOrder::DESCENDING
                                                      : algoscope::SortOrder::ASCENDING);
    case algoscope::Screen::SEARCHING:
        return wb.run_search(SEARCHES[ui.search_choice], ui.target);
    case algoscope::Screen::GRAPH:
        if (ui.graph_choice < FIRST_PATH_CHOICE) {
            return wb.run_traversal(ui.graph_choice == 0 ? algoscope::TraversalAlgorithm::BFS
                                                         : algoscope::TraversalAlgorithm::DFS);
        }
        return wb.run_pathfinding(ui.graph_choice == FIRST_PATH_CHOICE
                                      ? algoscope::PathAlgorithm::DIJKSTRA
                                      : algoscope::PathAlgorithm::A_STAR,
                                  ui.end);
    case algoscope::Screen::TREE:
        return wb.run_tree_traversal(TRAVERSALS[ui.traversal_choice]);
    case algoscope::Screen::LIST:
        return wb.run_list_search(ui.list_value);
    }
    return state.notice;
}

algoscope::Notice load_selected(FrameState& state) {
    auto& ui = state.ui;
    auto& wb = *state.workbench;
    switch (ui.screen) {
    case algoscope::Screen::SORTING:
    case algoscope::Screen::SEARCHING:
        return wb.load_array(ui.elements);
    case algoscope::Screen::GRAPH:
        return load_graph(state);
    case algoscope::Screen::TREE:
        return wb.build_tree(ui.tree_values);
    case algoscope::Screen::LIST:
        return wb.build_list(ui.list_values, selected_list_kind(ui));
    }
    return state.notice;
}

/// Applies the panel's requests. Runs after EndDrawing so they take effect next frame.
void process_actions(FrameState& state, const algoscope::UIAction& action) {
    auto& ui = state.ui;
    auto& wb = *state.workbench;

    if (action.speed_changed) {
        wb.set_speed(ui.speed);
    }
    if (action.screen_changed) {
        wb.cancel();
        sync_view(state);
        state.notice = algoscope::Notice{};
        return;
    }
    if (action.cancel_pressed && wb.cancel()) {
        state.notice = algoscope::Notice::success("Animation cancelled.");
    }
    if (action.clear_pressed) {
        state.notice = wb.clear_array();
    }
    if (action.load_pressed) {
        state.notice = load_selected(state);
    }
    if (action.insert_pressed) {
        state.notice = wb.insert_tree_value(ui.tree_value);
    }
    if (action.search_pressed) {
        state.notice = ui.screen == algoscope::Screen::TREE ? wb.run_tree_search(ui.tree_value)
                                                            : wb.run_list_search(ui.list_value);
    }
    if (action.delete_pressed) {
        state.notice = wb.run_list_delete(ui.list_value);
    }
    if (action.run_pressed) {
        state.notice = run_selected(state);
    }
}

/// One frame of the application: called each tick by the native loop or by
/// emscripten_set_main_loop_arg.
void frame_tick(FrameState& state) {
    auto& ui = state.ui;
    auto& wb = *state.workbench;
    float dt = GetFrameTime();

    // --- Advance playback in whole milliseconds ---
    state.ms_carry += dt * 1000.0f;
    int elapsed_ms = static_cast<int>(state.ms_carry);
    state.ms_carry -= static_cast<float>(elapsed_ms);
    wb.tick(elapsed_ms);
    state.view.update(dt);

    int screen_w = GetScreenWidth();
    int screen_h = GetScreenHeight();
    algoscope::update_ui_scale(screen_w, screen_h);
    const auto& sc = algoscope::ui_scale();

    // --- Keyboard shortcuts (only when not editing a text field) ---
    if (ui.editing == algoscope::TextField::NONE && IsKeyPressed(KEY_ESCAPE) && wb.cancel()) {
        state.notice = algoscope::Notice::success("Animation cancelled.");
    }

    BeginDrawing();
    ClearBackground({25, 25, 30, 255});

    float panel_x = static_cast<float>(screen_w) - sc.panel_w - sc.margin;
    float scene_w = panel_x - sc.margin;
    algoscope::AlgorithmInfo info = selected_info(ui);

    // Scene in the main area (left of the UI panels)
    Rectangle scene_area = {0.0f, TITLE_BAR_HEIGHT, scene_w,
                            static_cast<float>(screen_h) - TITLE_BAR_HEIGHT - HUD_HEIGHT};
    algoscope::draw_scene(state.view, scene_area);

    std::string title(info.name);
    int title_width = algoscope::MeasureAppText(title.c_str(), sc.title_font);
    algoscope::DrawAppText(title.c_str(),
                           static_cast<int>((scene_w - static_cast<float>(title_width)) / 2.0f),
                           12, sc.title_font, {240, 240, 240, 255});

    // --- Right-side UI panels ---
    algoscope::ControlPanelResult controls =
        algoscope::draw_control_panel(ui, wb.is_running(), panel_x, sc.margin, sc.panel_w);
    algoscope::draw_info_panel(info, state.view, state.notice, panel_x,
                               sc.margin + controls.panel_height + sc.margin, sc.panel_w);

    // --- HUD: playback state and delay ---
    const char* mode_str = wb.is_running() ? "PLAYING" : "IDLE";
    algoscope::DrawAppText(mode_str, 10, screen_h - 36, sc.hud_font,
                           wb.is_running() ? Color{80, 220, 100, 255}
                                           : Color{255, 200, 80, 255});
    std::string delay_str = "Step delay: " + std::to_string(wb.scheduler().delay_ms()) + " ms";
    algoscope::DrawAppText(delay_str.c_str(), 10, screen_h - 18, sc.hud_font - 1,
                           {140, 140, 140, 255});

    if (state.view.is_complete()) {
        const char* done = "COMPLETE";
        algoscope::DrawAppText(done,
                               static_cast<int>(scene_w) -
                                   algoscope::MeasureAppText(done, sc.hud_font + 2) - 10,
                               16, sc.hud_font + 2, {80, 220, 100, 255});
    }

    EndDrawing();

    process_actions(state, controls.action);
}

#ifdef __EMSCRIPTEN__
/// Emscripten main loop callback: unwraps the void* to FrameState.
void emscripten_frame(void* arg) {
    auto* state = static_cast<FrameState*>(arg);
    frame_tick(*state);
}
#endif

} // namespace

int main() {
    // --- Initialize Raylib window ---
    SetConfigFlags(FLAG_WINDOW_RESIZABLE);
    InitWindow(INITIAL_WIDTH, INITIAL_HEIGHT, "Algoscope - Algorithm Visualizer");
    SetWindowMinSize(MIN_WIDTH, MIN_HEIGHT);
    SetExitKey(KEY_NULL); // Escape cancels playback instead
    SetTargetFPS(TARGET_FPS);
    algoscope::init_app_font();

    // --- Create all mutable state ---
    FrameState state;
    state.workbench = std::make_unique<algoscope::Workbench>(&state.view);
    state.workbench->set_speed(state.ui.speed);
    state.notice = state.workbench->load_array(state.ui.elements);

#ifdef __EMSCRIPTEN__
    // Emscripten takes ownership of the main loop; state is passed via void*.
    emscripten_set_main_loop_arg(emscripten_frame, &state, 0, 1);
#else
    while (!WindowShouldClose()) {
        frame_tick(state);
    }
#endif

    algoscope::cleanup_app_font();
    CloseWindow();
    return 0;
}
