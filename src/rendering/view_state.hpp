/// @file view_state.hpp
/// @brief Visual state rebuilt from the steps of the running playback.
///
/// View state is kept apart from the core structures: the workbench hands
/// over copies of the structure a run plays against, and every step that
/// arrives updates only what is currently *visible* (highlights, finalized
/// slots, visited nodes, the array as replayed so far).

#pragma once

#include "session/workbench.hpp"
#include "trace/trace.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace algoscope {

/// Which structure is on screen
enum class ViewMode { NONE, ARRAY, GRAPH, TREE, LIST };

class ViewState : public WorkbenchListener {
  public:
    ViewState() = default;

    // --- WorkbenchListener ---
    void on_array(const std::vector<double>& values) override;
    void on_graph(const Graph& graph, const std::string& start) override;
    void on_tree(const BinarySearchTree& tree) override;
    void on_list(const LinkedList& list) override;
    void on_start(const Trace& trace) override;
    void on_step(const Step& step, std::size_t index) override;
    void on_complete(const FinalArtifact& artifact) override;

    /// Advances the flash timer of the latest step.
    /// @param delta_time Seconds since last frame
    void update(float delta_time);

    // --- Structures ---
    [[nodiscard]] ViewMode mode() const { return mode_; }
    [[nodiscard]] const std::vector<double>& values() const { return values_; }
    [[nodiscard]] const std::optional<Graph>& graph() const { return graph_; }
    [[nodiscard]] const std::string& start_node() const { return start_; }
    [[nodiscard]] const BinarySearchTree& tree() const { return tree_; }
    [[nodiscard]] const LinkedList& list() const { return list_; }

    // --- Current step ---

    /// Kind of the latest step, if a step has been shown since the last reset
    [[nodiscard]] std::optional<StepKind> current_kind() const;
    [[nodiscard]] const std::string& narrative() const { return narrative_; }
    [[nodiscard]] std::size_t steps_shown() const { return steps_shown_; }
    [[nodiscard]] std::size_t total_steps() const { return total_steps_; }

    /// Whether the latest step names this entity
    [[nodiscard]] bool is_active_index(std::size_t index) const;
    [[nodiscard]] bool is_active_label(const std::string& label) const;
    [[nodiscard]] bool is_active_node(NodeId id) const;

    /// 1.0 right after a step arrives, fading to 0.0
    [[nodiscard]] float flash() const { return flash_; }

    // --- Accumulated state ---
    [[nodiscard]] bool is_finalized(std::size_t index) const;
    [[nodiscard]] std::optional<MarkRole> mark_at(std::size_t index) const;
    [[nodiscard]] const std::optional<RangePayload>& range() const { return range_; }
    [[nodiscard]] const std::optional<Subject>& found() const { return found_; }
    [[nodiscard]] bool not_found() const { return not_found_; }
    [[nodiscard]] const std::optional<ErrorCode>& notice() const { return notice_; }

    [[nodiscard]] bool is_visited(const std::string& label) const;
    [[nodiscard]] bool is_scheduled(const std::string& label) const;
    [[nodiscard]] bool is_settled(const std::string& label) const;
    [[nodiscard]] std::optional<ScorePayload> score(const std::string& label) const;
    [[nodiscard]] bool on_path(const std::string& label) const;
    [[nodiscard]] const std::vector<std::string>& path() const { return path_; }
    [[nodiscard]] double total_weight() const { return total_weight_; }

    /// Labels (graph) or values (tree) in the order VISIT steps arrived
    [[nodiscard]] const std::vector<std::string>& visit_order() const { return visit_order_; }

    [[nodiscard]] bool is_node_visited(NodeId id) const;
    /// Tree and list nodes the running build has not reached yet
    [[nodiscard]] bool is_hidden(NodeId id) const;
    [[nodiscard]] bool is_removed(NodeId id) const;

    [[nodiscard]] bool is_complete() const { return complete_; }
    [[nodiscard]] const FinalArtifact& artifact() const { return artifact_; }

  private:
    /// Clears everything accumulated by steps; keeps the structures
    void reset_progress();

    ViewMode mode_ = ViewMode::NONE;
    std::vector<double> initial_values_;
    std::vector<double> values_;
    std::optional<Graph> graph_;
    std::string start_;
    BinarySearchTree tree_;
    LinkedList list_;

    std::optional<Step> current_;
    std::string narrative_;
    std::size_t steps_shown_ = 0;
    std::size_t total_steps_ = 0;
    float flash_ = 0.0f;

    std::set<std::size_t> finalized_;
    std::map<std::size_t, MarkRole> marks_;
    std::optional<RangePayload> range_;
    std::optional<Subject> found_;
    bool not_found_ = false;
    std::optional<ErrorCode> notice_;

    std::set<std::string> visited_;
    std::set<std::string> scheduled_;
    std::set<std::string> settled_;
    std::map<std::string, ScorePayload> scores_;
    std::vector<std::string> path_;
    double total_weight_ = 0.0;
    std::vector<std::string> visit_order_;

    std::set<NodeId> visited_nodes_;
    std::set<NodeId> hidden_;
    std::set<NodeId> removed_;

    bool complete_ = false;
    FinalArtifact artifact_;
};

} // namespace algoscope
