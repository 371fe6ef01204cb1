#pragma once

/// @file workbench.hpp
/// @brief The session: loaded structures, validation, and one playback at a time.
///
/// Every operation validates first and only then replaces state, so a
/// failed load leaves the previous structure in place. While a playback is
/// running every operation except cancel/speed/tick is refused.

#include "algorithms/graph_traversal.hpp"
#include "algorithms/pathfinding.hpp"
#include "algorithms/searching.hpp"
#include "algorithms/sorting.hpp"
#include "algorithms/tree_operations.hpp"
#include "session/notice.hpp"
#include "structures/binary_search_tree.hpp"
#include "structures/graph.hpp"
#include "structures/linked_list.hpp"
#include "timing/playback_scheduler.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace algoscope {

/// Playback listener that is also told which structure a run plays against.
/// The structure callbacks arrive before the run's on_start().
class WorkbenchListener : public PlaybackListener {
  public:
    virtual void on_array(const std::vector<double>& values) = 0;
    virtual void on_graph(const Graph& graph, const std::string& start) = 0;
    virtual void on_tree(const BinarySearchTree& tree) = 0;
    virtual void on_list(const LinkedList& list) = 0;
};

class Workbench {
  public:
    /// @param listener Non-owning; must outlive the workbench
    /// @throws std::invalid_argument if listener is null
    explicit Workbench(WorkbenchListener* listener);

    // --- Arrays ---

    /// Replaces the array with 2..50 comma-separated numbers
    Notice load_array(std::string_view text);
    Notice load_array(const std::vector<double>& values);
    Notice clear_array();

    /// Refused for an array that is already in the requested order
    Notice run_sort(SortAlgorithm algorithm, SortOrder order);

    /// Binary search on an unsorted array replaces the array with its sorted copy
    Notice run_search(SearchAlgorithm algorithm, std::string_view target);

    // --- Graphs ---

    Notice load_graph(std::string_view edges_text, std::string_view weights_text,
                      const std::string& start);
    Notice load_graph(const std::vector<Edge>& edges, const std::vector<WeightedEdge>& weights,
                      const std::string& start);

    /// Heuristic used by A*. Until one is set A* estimates 0 (behaves like Dijkstra).
    void set_heuristic(Heuristic heuristic);

    Notice run_traversal(TraversalAlgorithm algorithm);

    /// A path-not-found failure still plays the exploration
    Notice run_pathfinding(PathAlgorithm algorithm, const std::string& end);

    // --- Trees ---

    Notice build_tree(std::string_view text);
    Notice insert_tree_value(std::string_view text);
    Notice run_tree_search(std::string_view target);
    Notice run_tree_traversal(TreeTraversal traversal);

    // --- Lists ---

    Notice build_list(std::string_view text, ListKind kind);
    Notice run_list_search(std::string_view target);
    Notice run_list_delete(std::string_view target);

    // --- Playback ---

    bool cancel() { return scheduler_.cancel(); }
    void set_speed(int speed);
    void tick(int elapsed_ms) { scheduler_.tick(elapsed_ms); }

    [[nodiscard]] int speed() const { return speed_; }
    [[nodiscard]] bool is_running() const { return scheduler_.is_running(); }
    [[nodiscard]] const PlaybackScheduler& scheduler() const { return scheduler_; }

    // --- Loaded state ---

    [[nodiscard]] const std::vector<double>& array() const { return array_; }
    [[nodiscard]] const std::optional<Graph>& graph() const { return graph_; }
    [[nodiscard]] const std::string& start_node() const { return start_; }
    [[nodiscard]] const BinarySearchTree& tree() const { return tree_; }
    [[nodiscard]] const LinkedList& list() const { return list_; }

  private:
    /// Set when an operation must not run now
    [[nodiscard]] std::optional<Notice> busy() const;

    /// Logs and converts a user-correctable failure
    Notice fail(const EngineError& error) const;
    Notice refuse(std::string message, std::string instruction) const;

    void play(Trace trace);

    WorkbenchListener* listener_;
    PlaybackScheduler scheduler_;
    int speed_;

    std::vector<double> array_;
    std::optional<Graph> graph_;
    std::string start_;
    Heuristic heuristic_;
    BinarySearchTree tree_;
    LinkedList list_;
};

} // namespace algoscope
