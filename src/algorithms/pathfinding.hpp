#pragma once

/// @file pathfinding.hpp
/// @brief Dijkstra and A* trace generators with explicit path reconstruction.
///
/// Both generators share one priority-queue loop; A* only adds the
/// heuristic to the queue priority. The heuristic is not checked for
/// admissibility: one that overestimates can make A* return a longer path.

#include "core/errors.hpp"
#include "core/geometry.hpp"
#include "structures/graph.hpp"
#include "trace/trace.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace algoscope {

enum class PathAlgorithm { DIJKSTRA, A_STAR };

[[nodiscard]] constexpr std::string_view path_algorithm_name(PathAlgorithm algorithm) {
    switch (algorithm) {
    case PathAlgorithm::DIJKSTRA:
        return "Dijkstra's Algorithm";
    case PathAlgorithm::A_STAR:
        return "A* Search";
    }
    return "Pathfinding";
}

/// Estimated remaining cost from a node to the goal
using Heuristic = std::function<double(const std::string& node, const std::string& goal)>;

/// Euclidean distance between the display positions of two nodes; 0 when
/// either position is unknown.
[[nodiscard]] Heuristic straight_line_heuristic(std::unordered_map<std::string, Vec2> positions);

/// Raised when the end node was never reached. The exploration that led to
/// the failure is kept so the caller can still play it back.
class PathNotFoundError : public EngineError {
  public:
    PathNotFoundError(const std::string& message, Trace exploration);

    [[nodiscard]] const Trace& exploration() const { return *exploration_; }

  private:
    std::shared_ptr<const Trace> exploration_;
};

/// Walks the predecessor map back from `end` to `start`.
/// @throws EngineError(PATH_NOT_FOUND) if the chain breaks before reaching `start`
[[nodiscard]] std::vector<std::string>
reconstruct_path(const std::unordered_map<std::string, std::string>& previous,
                 const std::string& start, const std::string& end);

/// Shortest path by edge weight (unweighted edges cost 1). Artifact: PathOutcome.
/// @throws EngineError(UNKNOWN_START_NODE) if `start` is not in the graph
/// @throws EngineError(MISSING_TARGET_NODE) if `end` is empty
/// @throws PathNotFoundError if `end` is unreachable from `start`
[[nodiscard]] Trace dijkstra(const Graph& graph, const std::string& start,
                             const std::string& end);

/// Dijkstra with priority g + heuristic(node, end). Same errors as dijkstra().
[[nodiscard]] Trace a_star(const Graph& graph, const std::string& start, const std::string& end,
                           const Heuristic& heuristic);

} // namespace algoscope
