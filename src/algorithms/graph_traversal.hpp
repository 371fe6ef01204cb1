#pragma once

/// @file graph_traversal.hpp
/// @brief Breadth-first and depth-first traversal traces

#include "structures/graph.hpp"
#include "trace/trace.hpp"

#include <string>
#include <string_view>

namespace algoscope {

enum class TraversalAlgorithm { BFS, DFS };

[[nodiscard]] constexpr std::string_view traversal_algorithm_name(TraversalAlgorithm algorithm) {
    switch (algorithm) {
    case TraversalAlgorithm::BFS:
        return "Breadth-First Search";
    case TraversalAlgorithm::DFS:
        return "Depth-First Search";
    }
    return "Traversal";
}

/// Queue traversal. A node counts as visited when it is enqueued, and
/// VISIT fires when it is dequeued. Artifact: VisitOrder.
/// @throws EngineError(UNKNOWN_START_NODE) if `start` is not in the graph
[[nodiscard]] Trace breadth_first_search(const Graph& graph, const std::string& start);

/// Stack traversal with the same marking rule. Neighbours are pushed in
/// reverse so they pop in adjacency order. Artifact: VisitOrder.
/// @throws EngineError(UNKNOWN_START_NODE) if `start` is not in the graph
[[nodiscard]] Trace depth_first_search(const Graph& graph, const std::string& start);

[[nodiscard]] Trace run_traversal(TraversalAlgorithm algorithm, const Graph& graph,
                                  const std::string& start);

} // namespace algoscope
