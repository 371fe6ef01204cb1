#pragma once

/// @file graph.hpp
/// @brief Undirected weighted graph keyed by label, plus the builder that
/// turns edge and weight lists into one.

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace algoscope {

/// An undirected edge between two labels
struct Edge {
    std::string from;
    std::string to;
};

/// A weight assignment for the edge between two labels (both directions)
struct WeightedEdge {
    std::string from;
    std::string to;
    double weight = 0.0;
};

/// Undirected graph with labelled nodes.
///
/// Node order is the order in which labels first appeared in the edge list,
/// and each neighbour list keeps edge insertion order. Traversal order
/// depends on both, so neither is ever re-sorted.
class Graph {
  public:
    Graph() = default;

    /// Adds an undirected edge, introducing unseen labels in order.
    /// A repeated edge is ignored.
    /// @throws std::invalid_argument for an empty label or a self-loop
    void add_edge(const std::string& u, const std::string& v);

    /// Records the weight for u-v and v-u.
    /// @throws std::invalid_argument for a negative or non-finite weight
    void set_weight(const std::string& u, const std::string& v, double weight);

    [[nodiscard]] bool has_node(const std::string& label) const;
    [[nodiscard]] bool has_edge(const std::string& u, const std::string& v) const;

    /// Labels in first-seen order
    [[nodiscard]] const std::vector<std::string>& nodes() const { return nodes_; }

    /// Neighbours of a node in edge insertion order.
    /// @throws std::out_of_range for an unknown label
    [[nodiscard]] const std::vector<std::string>& neighbors(const std::string& label) const;

    /// The explicit weight of u-v, if one was given
    [[nodiscard]] std::optional<double> weight(const std::string& u, const std::string& v) const;

    /// The weight pathfinding uses: the explicit weight, or 1 for an unweighted edge
    [[nodiscard]] double edge_cost(const std::string& u, const std::string& v) const;

    [[nodiscard]] std::size_t node_count() const { return nodes_.size(); }
    [[nodiscard]] std::size_t edge_count() const { return edge_count_; }
    [[nodiscard]] bool empty() const { return nodes_.empty(); }

  private:
    std::vector<std::string> nodes_;
    std::unordered_map<std::string, std::vector<std::string>> adjacency_;
    std::map<std::pair<std::string, std::string>, double> weights_;
    std::size_t edge_count_ = 0;
};

/// Splits a comma-separated list, trimming whitespace; empty entries are dropped
[[nodiscard]] std::vector<std::string> split_list(std::string_view text);

/// Parses "A-B" into an edge.
/// @throws EngineError(GRAPH_PARSE_ERROR) unless it is exactly two non-empty labels
[[nodiscard]] Edge parse_edge_token(std::string_view token);

/// Parses "A-B:5" into a weighted edge.
/// @throws EngineError(GRAPH_PARSE_ERROR) unless it is two labels and a finite,
///         non-negative number
[[nodiscard]] WeightedEdge parse_weight_token(std::string_view token);

/// Builds a graph from typed edges and weights. All-or-nothing.
/// @throws EngineError(GRAPH_PARSE_ERROR) for self-loops, empty labels, bad weights
///         or a weight whose labels are not joined by an edge
[[nodiscard]] Graph build_graph(const std::vector<Edge>& edges,
                                const std::vector<WeightedEdge>& weights);

/// Builds a graph from comma-separated edge and weight lists,
/// e.g. "A-B, A-C" and "A-B:5, A-C:2". The weight text may be empty.
/// @throws EngineError(GRAPH_PARSE_ERROR) if any token is malformed or no edge is given
[[nodiscard]] Graph parse_graph(std::string_view edges_text, std::string_view weights_text);

} // namespace algoscope
