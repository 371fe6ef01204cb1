/// @file tree_operations.cpp
/// @brief Tree trace generation

#include "algorithms/tree_operations.hpp"

#include "core/value_format.hpp"

#include <string>

namespace algoscope {

namespace {

Subject tree_node(const BinarySearchTree& tree, NodeId id) {
    return Subject::node(id, format_value(tree.node(id).value));
}

void record_insert(BinarySearchTree& tree, double value, TraceRecorder& rec) {
    const std::string v = format_value(value);
    NodeId parent = NO_NODE;
    ChildSide side = ChildSide::ROOT;

    for (NodeId current = tree.root(); current != NO_NODE;) {
        const TreeNode& node = tree.node(current);
        rec.record(StepKind::COMPARE, {tree_node(tree, current)},
                   "Comparing " + v + " with " + format_value(node.value) + ".");
        parent = current;
        if (value < node.value) {
            side = ChildSide::LEFT;
            current = node.left;
        } else {
            side = ChildSide::RIGHT;
            current = node.right;
        }
    }

    NodeId id = tree.insert(value);
    if (parent == NO_NODE) {
        rec.record(StepKind::INSERT, {tree_node(tree, id)}, v + " becomes the root.",
                   LinkPayload{ChildSide::ROOT});
        return;
    }
    const char* where = (side == ChildSide::LEFT) ? "left" : "right";
    rec.record(StepKind::INSERT, {tree_node(tree, id), tree_node(tree, parent)},
               "Inserting " + v + " as the " + where + " child of " +
                   format_value(tree.node(parent).value) + ".",
               LinkPayload{side});
}

void visit(const BinarySearchTree& tree, NodeId id, TreeTraversal traversal,
           TraceRecorder& rec, std::vector<double>& visited) {
    if (id == NO_NODE) {
        return;
    }
    const TreeNode& node = tree.node(id);
    auto emit = [&]() {
        visited.push_back(node.value);
        rec.record(StepKind::VISIT, {tree_node(tree, id)},
                   "Visiting " + format_value(node.value) + ".");
    };

    if (traversal == TreeTraversal::PRE_ORDER) {
        emit();
    }
    visit(tree, node.left, traversal, rec, visited);
    if (traversal == TreeTraversal::IN_ORDER) {
        emit();
    }
    visit(tree, node.right, traversal, rec, visited);
    if (traversal == TreeTraversal::POST_ORDER) {
        emit();
    }
}

} // namespace

TreeBuildResult build_tree(const std::vector<double>& values) {
    TreeBuildResult result;
    TraceRecorder rec;
    for (double value : values) {
        record_insert(result.tree, value, rec);
    }
    result.trace = rec.finish(std::monostate{});
    return result;
}

TreeBuildResult insert_into_tree(const BinarySearchTree& tree, double value) {
    TreeBuildResult result{Trace{}, tree};
    TraceRecorder rec;
    record_insert(result.tree, value, rec);
    result.trace = rec.finish(std::monostate{});
    return result;
}

Trace search_tree(const BinarySearchTree& tree, double target) {
    TraceRecorder rec;
    const std::string wanted = format_value(target);

    for (NodeId current = tree.root(); current != NO_NODE;) {
        const TreeNode& node = tree.node(current);
        rec.record(StepKind::COMPARE, {tree_node(tree, current)},
                   "Comparing " + wanted + " with " + format_value(node.value) + ".");
        if (node.value == target) {
            rec.record(StepKind::FOUND, {tree_node(tree, current)}, "Found " + wanted + ".");
            return rec.finish(SearchOutcome{true, current});
        }
        current = (target < node.value) ? node.left : node.right;
    }

    rec.record(StepKind::NOT_FOUND, {}, wanted + " is not in the tree.");
    return rec.finish(SearchOutcome{false, std::nullopt});
}

Trace traverse_tree(const BinarySearchTree& tree, TreeTraversal traversal) {
    TraceRecorder rec;
    std::vector<double> visited;
    visit(tree, tree.root(), traversal, rec, visited);
    return rec.finish(ValueSequence{visited});
}

} // namespace algoscope
