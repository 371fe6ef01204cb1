/// @file control_panel.hpp
/// @brief UI panel for data entry and playback controls: text fields,
/// selectors, buttons and the speed slider.
///
/// All UI is drawn with raylib primitives. The panel only edits UIState and
/// reports what was clicked; the main loop turns actions into workbench calls.

#pragma once

#include "core/config.hpp"

#include <raylib.h>

#include <string>

namespace algoscope {

/// Which family of algorithms the panel is showing
enum class Screen { SORTING, SEARCHING, GRAPH, TREE, LIST };

/// The text field that currently has keyboard focus
enum class TextField {
    NONE,
    ELEMENTS,
    TARGET,
    EDGES,
    WEIGHTS,
    START,
    END,
    TREE_VALUES,
    TREE_VALUE,
    LIST_VALUES,
    LIST_VALUE,
};

/// Actions the control panel can request from the main loop
struct UIAction {
    bool screen_changed = false;
    bool load_pressed = false;   ///< Load array / graph, build tree / list
    bool clear_pressed = false;  ///< Clear the array
    bool run_pressed = false;    ///< Run the selected algorithm
    bool cancel_pressed = false;
    bool insert_pressed = false; ///< Insert one value into the tree
    bool search_pressed = false; ///< Search the tree or list
    bool delete_pressed = false; ///< Delete from the list
    bool speed_changed = false;
};

struct ControlPanelResult {
    UIAction action;
    float panel_height = 0.0f;
};

/// Persistent UI state, kept across frames
struct UIState {
    Screen screen = Screen::SORTING;

    std::string elements = "64,25,12,22,11,90,45";
    std::string target = "22";
    std::string edges = "A-B, A-C, B-D, C-E";
    std::string weights = "A-B:5, A-C:2, B-D:4, C-E:8";
    std::string start = "A";
    std::string end = "D";
    std::string tree_values = "50,25,75,10,30,60,90";
    std::string tree_value = "30";
    std::string list_values = "10,20,30,40";
    std::string list_value = "30";

    int sort_choice = 0;      ///< Index into the sorting algorithms
    int search_choice = 0;    ///< Linear, binary
    int graph_choice = 0;     ///< BFS, DFS, Dijkstra, A*
    int traversal_choice = 0; ///< In-, pre-, post-order
    bool descending = false;
    bool doubly = false;
    int speed = DEFAULT_SPEED;

    // Interaction state
    TextField editing = TextField::NONE;
    bool dragging_speed = false;
};

constexpr int SORT_CHOICES = 6;
constexpr int SEARCH_CHOICES = 2;
constexpr int GRAPH_CHOICES = 4;
constexpr int TRAVERSAL_CHOICES = 3;

/// Name shown by the algorithm selector for the current screen
[[nodiscard]] const char* selected_algorithm_name(const UIState& state);

/// Draws the control panel and handles mouse/keyboard interaction.
/// @param state   Mutable UI state (persists across frames)
/// @param running Whether a playback is in progress (run becomes cancel)
/// @param panel_x Left edge of the panel in screen coordinates
/// @param panel_y Top edge of the panel in screen coordinates
/// @param panel_w Width of the panel
/// @return Actions and the panel height for stacking the next panel
ControlPanelResult draw_control_panel(UIState& state, bool running, float panel_x,
                                      float panel_y, float panel_w);

} // namespace algoscope
