/// @file binary_search_tree.cpp
/// @brief Arena-backed BST insertion and queries

#include "structures/binary_search_tree.hpp"

#include <stdexcept>

namespace algoscope {

NodeId BinarySearchTree::attach_point(double value) const {
    NodeId current = root_;
    NodeId parent = NO_NODE;
    while (current != NO_NODE) {
        parent = current;
        current = (value < nodes_[current].value) ? nodes_[current].left : nodes_[current].right;
    }
    return parent;
}

NodeId BinarySearchTree::insert(double value) {
    NodeId id = nodes_.size();
    NodeId parent = attach_point(value);
    nodes_.push_back({value, NO_NODE, NO_NODE});

    if (parent == NO_NODE) {
        root_ = id;
    } else if (value < nodes_[parent].value) {
        nodes_[parent].left = id;
    } else {
        nodes_[parent].right = id;
    }
    return id;
}

const TreeNode& BinarySearchTree::node(NodeId id) const {
    if (id >= nodes_.size()) {
        throw std::out_of_range("Tree node id out of range");
    }
    return nodes_[id];
}

} // namespace algoscope
