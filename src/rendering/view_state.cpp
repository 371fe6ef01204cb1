/// @file view_state.cpp
/// @brief Applies playback steps to the visible state

#include "rendering/view_state.hpp"

#include "trace/array_replay.hpp"

#include <algorithm>
#include <iterator>
#include <variant>

namespace algoscope {

namespace {

constexpr float FLASH_DECAY = 3.0f; ///< Flash units per second

bool names_index(const Step& step, std::size_t index) {
    return std::any_of(step.subjects.begin(), step.subjects.end(), [&](const Subject& s) {
        return s.type == SubjectType::INDEX && s.id == index;
    });
}

} // namespace

// --- Structures ---

void ViewState::on_array(const std::vector<double>& values) {
    mode_ = ViewMode::ARRAY;
    initial_values_ = values;
    values_ = values;
    reset_progress();
}

void ViewState::on_graph(const Graph& graph, const std::string& start) {
    mode_ = ViewMode::GRAPH;
    graph_ = graph;
    start_ = start;
    reset_progress();
}

void ViewState::on_tree(const BinarySearchTree& tree) {
    mode_ = ViewMode::TREE;
    tree_ = tree;
    reset_progress();
}

void ViewState::on_list(const LinkedList& list) {
    mode_ = ViewMode::LIST;
    list_ = list;
    reset_progress();
}

void ViewState::reset_progress() {
    current_.reset();
    narrative_.clear();
    steps_shown_ = 0;
    total_steps_ = 0;
    flash_ = 0.0f;
    finalized_.clear();
    marks_.clear();
    range_.reset();
    found_.reset();
    not_found_ = false;
    notice_.reset();
    visited_.clear();
    scheduled_.clear();
    settled_.clear();
    scores_.clear();
    path_.clear();
    total_weight_ = 0.0;
    visit_order_.clear();
    visited_nodes_.clear();
    hidden_.clear();
    removed_.clear();
    complete_ = false;
    artifact_ = std::monostate{};
}

// --- Playback ---

void ViewState::on_start(const Trace& trace) {
    reset_progress();
    values_ = initial_values_;
    total_steps_ = trace.size();

    // Nodes a build attaches stay hidden until their step arrives
    for (const Step& step : trace.steps()) {
        if ((step.kind == StepKind::INSERT || step.kind == StepKind::APPEND) &&
            !step.subjects.empty()) {
            hidden_.insert(step.subjects.front().id);
        }
    }
}

void ViewState::on_step(const Step& step, std::size_t index) {
    current_ = step;
    narrative_ = step.narrative;
    steps_shown_ = index + 1;
    flash_ = 1.0f;

    switch (step.kind) {
    case StepKind::SWAP:
    case StepKind::SHIFT:
    case StepKind::OVERWRITE:
        apply_array_step(values_, step);
        break;
    case StepKind::MARK: {
        MarkRole role = std::get<MarkPayload>(step.payload).role;
        // One subject per role at a time
        for (auto it = marks_.begin(); it != marks_.end();) {
            it = (it->second == role) ? marks_.erase(it) : std::next(it);
        }
        marks_[step.subjects.front().id] = role;
        break;
    }
    case StepKind::FINALIZED:
        finalized_.insert(step.subjects.front().id);
        marks_.erase(step.subjects.front().id);
        break;
    case StepKind::RANGE:
    case StepKind::NARROW:
        range_ = std::get<RangePayload>(step.payload);
        break;
    case StepKind::FOUND:
        found_ = step.subjects.front();
        break;
    case StepKind::NOT_FOUND:
        not_found_ = true;
        break;
    case StepKind::NOTICE:
        notice_ = std::get<NoticePayload>(step.payload).code;
        break;
    case StepKind::VISIT: {
        const Subject& s = step.subjects.front();
        if (s.type == SubjectType::LABEL) {
            visited_.insert(s.label);
            scheduled_.erase(s.label);
        } else {
            visited_nodes_.insert(s.id);
        }
        visit_order_.push_back(s.label);
        break;
    }
    case StepKind::SCHEDULE:
        scheduled_.insert(step.subjects.front().label);
        break;
    case StepKind::SETTLE:
        settled_.insert(step.subjects.front().label);
        scores_[step.subjects.front().label] = std::get<ScorePayload>(step.payload);
        break;
    case StepKind::RELAX:
        scores_[step.subjects.front().label] = std::get<ScorePayload>(step.payload);
        break;
    case StepKind::PATH: {
        const auto& path = std::get<PathPayload>(step.payload);
        path_ = path.nodes;
        total_weight_ = path.total_weight;
        break;
    }
    case StepKind::INSERT:
    case StepKind::APPEND:
        hidden_.erase(step.subjects.front().id);
        break;
    case StepKind::UNLINK:
        removed_.insert(step.subjects.front().id);
        break;
    case StepKind::COMPARE:
    case StepKind::START:
    case StepKind::COMPLETE:
        break;
    }
}

void ViewState::on_complete(const FinalArtifact& artifact) {
    complete_ = true;
    artifact_ = artifact;
    current_.reset();
    if (const auto* sorted = std::get_if<SortedArray>(&artifact)) {
        values_ = sorted->values;
    }
}

void ViewState::update(float delta_time) {
    flash_ = std::max(0.0f, flash_ - FLASH_DECAY * delta_time);
}

// --- Queries ---

std::optional<StepKind> ViewState::current_kind() const {
    if (!current_) {
        return std::nullopt;
    }
    return current_->kind;
}

bool ViewState::is_active_index(std::size_t index) const {
    return current_ && names_index(*current_, index);
}

bool ViewState::is_active_label(const std::string& label) const {
    if (!current_) {
        return false;
    }
    return std::any_of(current_->subjects.begin(), current_->subjects.end(),
                       [&](const Subject& s) {
                           return s.type == SubjectType::LABEL && s.label == label;
                       });
}

bool ViewState::is_active_node(NodeId id) const {
    if (!current_) {
        return false;
    }
    return std::any_of(current_->subjects.begin(), current_->subjects.end(),
                       [&](const Subject& s) { return s.type == SubjectType::NODE && s.id == id; });
}

bool ViewState::is_finalized(std::size_t index) const {
    return finalized_.count(index) > 0;
}

std::optional<MarkRole> ViewState::mark_at(std::size_t index) const {
    auto it = marks_.find(index);
    if (it == marks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ViewState::is_visited(const std::string& label) const {
    return visited_.count(label) > 0;
}

bool ViewState::is_scheduled(const std::string& label) const {
    return scheduled_.count(label) > 0;
}

bool ViewState::is_settled(const std::string& label) const {
    return settled_.count(label) > 0;
}

std::optional<ScorePayload> ViewState::score(const std::string& label) const {
    auto it = scores_.find(label);
    if (it == scores_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ViewState::on_path(const std::string& label) const {
    return std::find(path_.begin(), path_.end(), label) != path_.end();
}

bool ViewState::is_node_visited(NodeId id) const {
    return visited_nodes_.count(id) > 0;
}

bool ViewState::is_hidden(NodeId id) const {
    return hidden_.count(id) > 0;
}

bool ViewState::is_removed(NodeId id) const {
    return removed_.count(id) > 0;
}

} // namespace algoscope
