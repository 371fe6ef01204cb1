#pragma once

/// @file algorithm_catalog.hpp
/// @brief Descriptions and complexity figures shown next to each algorithm

#include "algorithms/graph_traversal.hpp"
#include "algorithms/pathfinding.hpp"
#include "algorithms/searching.hpp"
#include "algorithms/sorting.hpp"
#include "algorithms/tree_operations.hpp"
#include "structures/linked_list.hpp"

#include <string_view>

namespace algoscope {

struct AlgorithmInfo {
    std::string_view name;
    std::string_view description;
    std::string_view time_complexity;
    std::string_view space_complexity;
};

[[nodiscard]] AlgorithmInfo algorithm_info(SortAlgorithm algorithm);
[[nodiscard]] AlgorithmInfo algorithm_info(SearchAlgorithm algorithm);
[[nodiscard]] AlgorithmInfo algorithm_info(TraversalAlgorithm algorithm);
[[nodiscard]] AlgorithmInfo algorithm_info(PathAlgorithm algorithm);
[[nodiscard]] AlgorithmInfo algorithm_info(TreeTraversal traversal);
[[nodiscard]] AlgorithmInfo algorithm_info(ListKind kind);

/// Binary search tree insertion
[[nodiscard]] AlgorithmInfo tree_insertion_info();

} // namespace algoscope
