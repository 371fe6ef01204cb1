/// @file workbench.cpp
/// @brief Implements the session controller

#include "session/workbench.hpp"

#include "algorithms/list_operations.hpp"
#include "core/config.hpp"
#include "structures/element_input.hpp"

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <utility>
#include <variant>

namespace algoscope {

namespace {

const char* order_name(SortOrder order) {
    return order == SortOrder::ASCENDING ? "ascending" : "descending";
}

std::string named(std::string_view name) {
    return std::string(name);
}

} // namespace

Workbench::Workbench(WorkbenchListener* listener)
    : listener_(listener), scheduler_(listener), speed_(DEFAULT_SPEED),
      heuristic_([](const std::string&, const std::string&) { return 0.0; }) {}

void Workbench::set_speed(int speed) {
    scheduler_.set_speed(speed);
    speed_ = scheduler_.speed();
}

std::optional<Notice> Workbench::busy() const {
    if (scheduler_.is_running()) {
        return refuse("An animation is already running.",
                      "Wait for it to finish or cancel it first.");
    }
    return std::nullopt;
}

Notice Workbench::fail(const EngineError& error) const {
    std::string code(error_code_name(error.code()));
    std::fprintf(stderr, "%s %s: %s\n", LOG_PREFIX, code.c_str(), error.what());
    return Notice::failure(error.code(), error.what());
}

Notice Workbench::refuse(std::string message, std::string instruction) const {
    std::fprintf(stderr, "%s refused: %s\n", LOG_PREFIX, message.c_str());
    return Notice::refused(std::move(message), std::move(instruction));
}

void Workbench::play(Trace trace) {
    scheduler_.start(std::make_shared<const Trace>(std::move(trace)), speed_);
}

// --- Arrays ---

Notice Workbench::load_array(std::string_view text) {
    if (auto notice = busy()) {
        return *notice;
    }
    try {
        std::vector<double> values = parse_elements(text);
        return load_array(values);
    } catch (const EngineError& e) {
        return fail(e);
    }
}

Notice Workbench::load_array(const std::vector<double>& values) {
    if (auto notice = busy()) {
        return *notice;
    }
    try {
        validate_elements(values);
    } catch (const EngineError& e) {
        return fail(e);
    }
    array_ = values;
    listener_->on_array(array_);
    return Notice::success("Loaded " + std::to_string(array_.size()) + " elements.");
}

Notice Workbench::clear_array() {
    if (auto notice = busy()) {
        return *notice;
    }
    array_.clear();
    listener_->on_array(array_);
    return Notice::success("Array cleared.");
}

Notice Workbench::run_sort(SortAlgorithm algorithm, SortOrder order) {
    if (auto notice = busy()) {
        return *notice;
    }
    if (array_.empty()) {
        return refuse("There is no array to sort.", "Enter some numbers and load them first.");
    }
    if (is_sorted(array_, order)) {
        return refuse(std::string("The array is already sorted in ") + order_name(order) +
                          " order.",
                      "Load a different array or pick the other order.");
    }

    Trace trace = algoscope::run_sort(algorithm, array_, order);
    listener_->on_array(array_);
    array_ = std::get<SortedArray>(trace.artifact()).values;
    play(std::move(trace));
    return Notice::success("Running " + named(sort_algorithm_name(algorithm)) + ".");
}

Notice Workbench::run_search(SearchAlgorithm algorithm, std::string_view target) {
    if (auto notice = busy()) {
        return *notice;
    }
    if (array_.empty()) {
        return refuse("There is no array to search.", "Enter some numbers and load them first.");
    }

    double value = 0.0;
    try {
        value = parse_value(target);
    } catch (const EngineError& e) {
        return fail(e);
    }

    if (algorithm == SearchAlgorithm::LINEAR) {
        listener_->on_array(array_);
        play(linear_search(array_, value));
        return Notice::success("Running " + named(search_algorithm_name(algorithm)) + ".");
    }

    BinarySearchResult result = binary_search(array_, value);
    array_ = result.searched;
    listener_->on_array(array_);
    play(std::move(result.trace));
    if (result.auto_sorted) {
        std::fprintf(stderr, "%s binary search input was unsorted, sorted it first\n",
                     LOG_PREFIX);
        Notice notice = Notice::success("The array was not sorted, so it has been sorted "
                                        "before running Binary Search.");
        notice.code = ErrorCode::UNSORTED_INPUT_FOR_BINARY_SEARCH;
        notice.instruction = std::string(error_instruction(*notice.code));
        return notice;
    }
    return Notice::success("Running " + named(search_algorithm_name(algorithm)) + ".");
}

// --- Graphs ---

Notice Workbench::load_graph(std::string_view edges_text, std::string_view weights_text,
                             const std::string& start) {
    if (auto notice = busy()) {
        return *notice;
    }
    try {
        Graph graph = parse_graph(edges_text, weights_text);
        if (!graph.has_node(start)) {
            throw EngineError(ErrorCode::UNKNOWN_START_NODE,
                              "Start node \"" + start + "\" is not in the graph");
        }
        graph_ = std::move(graph);
        start_ = start;
    } catch (const EngineError& e) {
        return fail(e);
    }
    listener_->on_graph(*graph_, start_);
    return Notice::success("Graph loaded with " + std::to_string(graph_->node_count()) +
                           " nodes and " + std::to_string(graph_->edge_count()) + " edges.");
}

Notice Workbench::load_graph(const std::vector<Edge>& edges,
                             const std::vector<WeightedEdge>& weights, const std::string& start) {
    if (auto notice = busy()) {
        return *notice;
    }
    try {
        Graph graph = build_graph(edges, weights);
        if (graph.empty()) {
            throw EngineError(ErrorCode::GRAPH_PARSE_ERROR, "The graph needs at least one edge");
        }
        if (!graph.has_node(start)) {
            throw EngineError(ErrorCode::UNKNOWN_START_NODE,
                              "Start node \"" + start + "\" is not in the graph");
        }
        graph_ = std::move(graph);
        start_ = start;
    } catch (const EngineError& e) {
        return fail(e);
    }
    listener_->on_graph(*graph_, start_);
    return Notice::success("Graph loaded with " + std::to_string(graph_->node_count()) +
                           " nodes and " + std::to_string(graph_->edge_count()) + " edges.");
}

void Workbench::set_heuristic(Heuristic heuristic) {
    if (!heuristic) {
        throw std::invalid_argument("set_heuristic() needs a callable");
    }
    heuristic_ = std::move(heuristic);
}

Notice Workbench::run_traversal(TraversalAlgorithm algorithm) {
    if (auto notice = busy()) {
        return *notice;
    }
    if (!graph_) {
        return refuse("There is no graph to traverse.", "Enter edges and load the graph first.");
    }
    try {
        Trace trace = algoscope::run_traversal(algorithm, *graph_, start_);
        listener_->on_graph(*graph_, start_);
        play(std::move(trace));
    } catch (const EngineError& e) {
        return fail(e);
    }
    return Notice::success("Running " + named(traversal_algorithm_name(algorithm)) + ".");
}

Notice Workbench::run_pathfinding(PathAlgorithm algorithm, const std::string& end) {
    if (auto notice = busy()) {
        return *notice;
    }
    if (!graph_) {
        return refuse("There is no graph to search.", "Enter edges and load the graph first.");
    }
    try {
        Trace trace = (algorithm == PathAlgorithm::DIJKSTRA)
                          ? dijkstra(*graph_, start_, end)
                          : a_star(*graph_, start_, end, heuristic_);
        listener_->on_graph(*graph_, start_);
        play(std::move(trace));
    } catch (const PathNotFoundError& e) {
        listener_->on_graph(*graph_, start_);
        play(e.exploration());
        return fail(e);
    } catch (const EngineError& e) {
        return fail(e);
    }
    return Notice::success("Running " + named(path_algorithm_name(algorithm)) + ".");
}

// --- Trees ---

Notice Workbench::build_tree(std::string_view text) {
    if (auto notice = busy()) {
        return *notice;
    }
    TreeBuildResult result;
    try {
        result = algoscope::build_tree(parse_values(text));
    } catch (const EngineError& e) {
        return fail(e);
    }
    tree_ = std::move(result.tree);
    listener_->on_tree(tree_);
    play(std::move(result.trace));
    return Notice::success("Building a tree of " + std::to_string(tree_.size()) + " nodes.");
}

Notice Workbench::insert_tree_value(std::string_view text) {
    if (auto notice = busy()) {
        return *notice;
    }
    TreeBuildResult result;
    try {
        result = insert_into_tree(tree_, parse_value(text));
    } catch (const EngineError& e) {
        return fail(e);
    }
    tree_ = std::move(result.tree);
    listener_->on_tree(tree_);
    play(std::move(result.trace));
    return Notice::success("Inserting " + std::string(text) + ".");
}

Notice Workbench::run_tree_search(std::string_view target) {
    if (auto notice = busy()) {
        return *notice;
    }
    if (tree_.empty()) {
        return refuse("The tree is empty.", "Build a tree first.");
    }
    try {
        Trace trace = search_tree(tree_, parse_value(target));
        listener_->on_tree(tree_);
        play(std::move(trace));
    } catch (const EngineError& e) {
        return fail(e);
    }
    return Notice::success("Searching the tree.");
}

Notice Workbench::run_tree_traversal(TreeTraversal traversal) {
    if (auto notice = busy()) {
        return *notice;
    }
    if (tree_.empty()) {
        return refuse("The tree is empty.", "Build a tree first.");
    }
    listener_->on_tree(tree_);
    play(traverse_tree(tree_, traversal));
    return Notice::success("Running " + named(tree_traversal_name(traversal)) + ".");
}

// --- Lists ---

Notice Workbench::build_list(std::string_view text, ListKind kind) {
    if (auto notice = busy()) {
        return *notice;
    }
    ListBuildResult result;
    try {
        result = algoscope::build_list(parse_values(text), kind);
    } catch (const EngineError& e) {
        return fail(e);
    }
    list_ = std::move(result.list);
    listener_->on_list(list_);
    play(std::move(result.trace));
    return Notice::success("Building a " + named(list_kind_name(kind)) + ".");
}

Notice Workbench::run_list_search(std::string_view target) {
    if (auto notice = busy()) {
        return *notice;
    }
    if (list_.empty()) {
        return refuse("The list is empty.", "Build a list first.");
    }
    try {
        Trace trace = search_list(list_, parse_value(target));
        listener_->on_list(list_);
        play(std::move(trace));
    } catch (const EngineError& e) {
        return fail(e);
    }
    return Notice::success("Searching the list.");
}

Notice Workbench::run_list_delete(std::string_view target) {
    if (auto notice = busy()) {
        return *notice;
    }
    ListBuildResult result;
    try {
        result = delete_from_list(list_, parse_value(target));
    } catch (const EngineError& e) {
        return fail(e);
    }
    listener_->on_list(list_);
    list_ = std::move(result.list);
    play(std::move(result.trace));
    return Notice::success("Deleting " + std::string(target) + " from the list.");
}

} // namespace algoscope
