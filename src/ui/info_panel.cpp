/// @file info_panel.cpp
/// @brief Implements the information panel with narration and notice text

#include "ui/info_panel.hpp"

#include "core/value_format.hpp"
#include "rendering/app_font.hpp"
#include "ui/ui_scale.hpp"

#include <cstdio>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace algoscope {

namespace {

constexpr float LINE_GAP = 2.0f;
constexpr float SECTION_GAP = 6.0f;

const Color BG_COLOR = {35, 35, 42, 230};
const Color BORDER_COLOR = {70, 70, 85, 255};
const Color TEXT_COLOR = {220, 220, 230, 255};
const Color LABEL_COLOR = {160, 160, 180, 255};
const Color DESCRIPTION_COLOR = {190, 190, 205, 255};
const Color NARRATIVE_COLOR = {180, 205, 240, 255};
const Color RESULT_COLOR = {80, 220, 130, 255};
const Color STATUS_COLOR = {180, 180, 100, 255};
const Color ERROR_COLOR = {235, 110, 100, 255};
const Color INSTRUCTION_COLOR = {220, 200, 120, 255};

/// Splits text into lines no wider than max_width.
std::vector<std::string> wrap_lines(const std::string& text, float max_width, int font_size) {
    std::istringstream iss(text);
    std::string word;
    std::string line;
    std::vector<std::string> lines;

    while (iss >> word) {
        std::string candidate = line.empty() ? word : (line + " " + word);
        if (MeasureAppText(candidate.c_str(), font_size) <= static_cast<int>(max_width)) {
            line = std::move(candidate);
        } else {
            if (!line.empty()) {
                lines.push_back(line);
            }
            line = word;
        }
    }
    if (!line.empty()) {
        lines.push_back(line);
    }
    return lines;
}

float wrapped_height(const std::vector<std::string>& lines, int font_size) {
    if (lines.empty()) {
        return 0.0f;
    }
    return static_cast<float>(lines.size()) * (static_cast<float>(font_size) + LINE_GAP) - LINE_GAP;
}

/// Draws pre-wrapped lines and returns consumed height.
float draw_lines(const std::vector<std::string>& lines, float x, float y, int font_size,
                 Color color) {
    float cy = y;
    for (const auto& line : lines) {
        DrawAppText(line.c_str(), static_cast<int>(x), static_cast<int>(cy), font_size, color);
        cy += static_cast<float>(font_size) + LINE_GAP;
    }
    return wrapped_height(lines, font_size);
}

std::string join_values(const std::vector<double>& values) {
    std::string out;
    for (std::size_t i = 0; i < values.size(); i++) {
        if (i > 0) {
            out += ", ";
        }
        out += format_value(values[i]);
    }
    return out;
}

std::string join_labels(const std::vector<std::string>& labels) {
    std::string out;
    for (std::size_t i = 0; i < labels.size(); i++) {
        if (i > 0) {
            out += " -> ";
        }
        out += labels[i];
    }
    return out;
}

/// One-line summary of the result of a finished playback
std::string artifact_summary(const FinalArtifact& artifact) {
    if (const auto* sorted = std::get_if<SortedArray>(&artifact)) {
        return "Sorted: " + join_values(sorted->values);
    }
    if (const auto* search = std::get_if<SearchOutcome>(&artifact)) {
        return search->found ? "Target found" : "Target not found";
    }
    if (const auto* path = std::get_if<PathOutcome>(&artifact)) {
        return "Path: " + join_labels(path->path) + " (weight " +
               format_value(path->total_weight) + ")";
    }
    if (const auto* order = std::get_if<VisitOrder>(&artifact)) {
        return "Visit order: " + join_labels(order->labels);
    }
    if (const auto* sequence = std::get_if<ValueSequence>(&artifact)) {
        return "Result: " + join_values(sequence->values);
    }
    return "";
}

} // namespace

float draw_info_panel(const AlgorithmInfo& info, const ViewState& view, const Notice& notice,
                      float panel_x, float panel_y, float panel_w) {
    const auto& sc = ui_scale();
    float text_w = panel_w - 2.0f * sc.padding;

    std::string title(info.name);
    auto description = wrap_lines(std::string(info.description), text_w, sc.font_small);

    char complexity[96];
    std::snprintf(complexity, sizeof(complexity), "Time %.*s   Space %.*s",
                  static_cast<int>(info.time_complexity.size()), info.time_complexity.data(),
                  static_cast<int>(info.space_complexity.size()), info.space_complexity.data());

    char progress[64];
    if (view.total_steps() == 0) {
        std::snprintf(progress, sizeof(progress), "Ready");
    } else {
        std::snprintf(progress, sizeof(progress), "Step %zu / %zu%s", view.steps_shown(),
                      view.total_steps(), view.is_complete() ? " (complete)" : "");
    }

    auto narrative = wrap_lines(view.narrative(), text_w, sc.font_small);
    auto summary = view.is_complete()
                       ? wrap_lines(artifact_summary(view.artifact()), text_w, sc.font_small)
                       : std::vector<std::string>{};
    auto message = wrap_lines(notice.message, text_w, sc.font_small);
    auto instruction = wrap_lines(notice.instruction, text_w, sc.font_small);

    // --- Pre-compute panel height so background can be drawn first ---
    float panel_h = sc.padding;
    panel_h += static_cast<float>(sc.font_normal) + SECTION_GAP; // title
    panel_h += wrapped_height(description, sc.font_small) + SECTION_GAP;
    panel_h += static_cast<float>(sc.font_small) + SECTION_GAP; // complexity
    panel_h += static_cast<float>(sc.font_small) + SECTION_GAP; // progress
    if (!narrative.empty()) {
        panel_h += wrapped_height(narrative, sc.font_small) + SECTION_GAP;
    }
    if (!summary.empty()) {
        panel_h += wrapped_height(summary, sc.font_small) + SECTION_GAP;
    }
    if (!message.empty()) {
        panel_h += wrapped_height(message, sc.font_small) + SECTION_GAP;
    }
    if (!instruction.empty()) {
        panel_h += wrapped_height(instruction, sc.font_small) + SECTION_GAP;
    }
    panel_h += sc.padding;

    DrawRectangleRec({panel_x, panel_y, panel_w, panel_h}, BG_COLOR);
    DrawRectangleLinesEx({panel_x, panel_y, panel_w, panel_h}, 1.0f, BORDER_COLOR);

    float cx = panel_x + sc.padding;
    float cy = panel_y + sc.padding;

    DrawAppText(title.c_str(), static_cast<int>(cx), static_cast<int>(cy), sc.font_normal,
                TEXT_COLOR);
    cy += static_cast<float>(sc.font_normal) + SECTION_GAP;

    cy += draw_lines(description, cx, cy, sc.font_small, DESCRIPTION_COLOR) + SECTION_GAP;

    DrawAppText(complexity, static_cast<int>(cx), static_cast<int>(cy), sc.font_small,
                LABEL_COLOR);
    cy += static_cast<float>(sc.font_small) + SECTION_GAP;

    DrawAppText(progress, static_cast<int>(cx), static_cast<int>(cy), sc.font_small,
                STATUS_COLOR);
    cy += static_cast<float>(sc.font_small) + SECTION_GAP;

    if (!narrative.empty()) {
        cy += draw_lines(narrative, cx, cy, sc.font_small, NARRATIVE_COLOR) + SECTION_GAP;
    }
    if (!summary.empty()) {
        cy += draw_lines(summary, cx, cy, sc.font_small, RESULT_COLOR) + SECTION_GAP;
    }
    if (!message.empty()) {
        Color color = notice.ok ? TEXT_COLOR : ERROR_COLOR;
        cy += draw_lines(message, cx, cy, sc.font_small, color) + SECTION_GAP;
    }
    if (!instruction.empty()) {
        draw_lines(instruction, cx, cy, sc.font_small, INSTRUCTION_COLOR);
    }

    return panel_h;
}

} // namespace algoscope
