#pragma once

/// @file tree_operations.hpp
/// @brief Binary search tree build, search and traversal traces

#include "structures/binary_search_tree.hpp"
#include "trace/trace.hpp"

#include <string_view>
#include <vector>

namespace algoscope {

enum class TreeTraversal { IN_ORDER, PRE_ORDER, POST_ORDER };

[[nodiscard]] constexpr std::string_view tree_traversal_name(TreeTraversal traversal) {
    switch (traversal) {
    case TreeTraversal::IN_ORDER:
        return "In-order Traversal";
    case TreeTraversal::PRE_ORDER:
        return "Pre-order Traversal";
    case TreeTraversal::POST_ORDER:
        return "Post-order Traversal";
    }
    return "Traversal";
}

/// A structural operation's trace together with the tree it produced
struct TreeBuildResult {
    Trace trace;
    BinarySearchTree tree;
};

/// Inserts the values in order into a fresh tree
[[nodiscard]] TreeBuildResult build_tree(const std::vector<double>& values);

/// Inserts one value into a copy of `tree`; node ids already in `tree` are kept
[[nodiscard]] TreeBuildResult insert_into_tree(const BinarySearchTree& tree, double value);

/// Root-to-leaf descent. Artifact: SearchOutcome whose position is the node id.
[[nodiscard]] Trace search_tree(const BinarySearchTree& tree, double target);

/// Recursive traversal; each VISIT appends to the ValueSequence artifact
[[nodiscard]] Trace traverse_tree(const BinarySearchTree& tree, TreeTraversal traversal);

} // namespace algoscope
