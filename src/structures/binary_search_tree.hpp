#pragma once

/// @file binary_search_tree.hpp
/// @brief Unbalanced binary search tree stored in an arena

#include "structures/node_id.hpp"

#include <cstddef>
#include <vector>

namespace algoscope {

/// A tree node. Children are arena ids; there is no parent link.
struct TreeNode {
    double value = 0.0;
    NodeId left = NO_NODE;
    NodeId right = NO_NODE;
};

/// Binary search tree built by repeated unbalanced insertion.
///
/// Values smaller than a node go left; equal or larger values go right, so
/// duplicates are kept and the tree may degenerate into a chain.
class BinarySearchTree {
  public:
    BinarySearchTree() = default;

    /// Inserts a value at its leaf position and returns the new node's id
    NodeId insert(double value);

    /// Id of the node `value` would be attached under (NO_NODE for an empty tree)
    [[nodiscard]] NodeId attach_point(double value) const;

    [[nodiscard]] NodeId root() const { return root_; }
    [[nodiscard]] bool empty() const { return root_ == NO_NODE; }
    [[nodiscard]] std::size_t size() const { return nodes_.size(); }

    /// @throws std::out_of_range for an id not in this tree
    [[nodiscard]] const TreeNode& node(NodeId id) const;

  private:
    std::vector<TreeNode> nodes_;
    NodeId root_ = NO_NODE;
};

} // namespace algoscope
