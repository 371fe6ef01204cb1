/// @file algorithm_catalog.cpp
/// @brief Static algorithm descriptions

#include "algorithms/algorithm_catalog.hpp"

namespace algoscope {

AlgorithmInfo algorithm_info(SortAlgorithm algorithm) {
    switch (algorithm) {
    case SortAlgorithm::BUBBLE:
        return {sort_algorithm_name(algorithm),
                "Walks the array repeatedly, swapping neighbours that are out of order. "
                "Each pass carries the largest remaining element to the end.",
                "O(n^2)", "O(1)"};
    case SortAlgorithm::SELECTION:
        return {sort_algorithm_name(algorithm),
                "Finds the smallest element of the unsorted part and swaps it to the front, "
                "growing the sorted prefix by one each pass.",
                "O(n^2)", "O(1)"};
    case SortAlgorithm::INSERTION:
        return {sort_algorithm_name(algorithm),
                "Takes each element in turn and shifts larger elements of the sorted prefix "
                "right until the element fits. Stable and fast on nearly sorted input.",
                "O(n^2)", "O(1)"};
    case SortAlgorithm::QUICK:
        return {sort_algorithm_name(algorithm),
                "Divide and conquer: partitions the range around the last element as pivot, "
                "then sorts both sides. Quadratic in the worst case.",
                "O(n log n) (Average)", "O(log n)"};
    case SortAlgorithm::MERGE:
        return {sort_algorithm_name(algorithm),
                "Divide and conquer: splits the array in half, sorts each half and merges "
                "them back. Stable, with O(n log n) time in every case.",
                "O(n log n)", "O(n)"};
    case SortAlgorithm::HEAP:
        return {sort_algorithm_name(algorithm),
                "Builds a binary heap over the array, then repeatedly moves the root to the "
                "end and restores the heap on the rest.",
                "O(n log n)", "O(1)"};
    }
    return {};
}

AlgorithmInfo algorithm_info(SearchAlgorithm algorithm) {
    switch (algorithm) {
    case SearchAlgorithm::LINEAR:
        return {search_algorithm_name(algorithm),
                "Checks every element from the start until the target is found or the array "
                "ends. Works on unsorted data.",
                "O(n)", "O(1)"};
    case SearchAlgorithm::BINARY:
        return {search_algorithm_name(algorithm),
                "Compares the target with the middle of a sorted range and discards the half "
                "that cannot contain it.",
                "O(log n)", "O(1)"};
    }
    return {};
}

AlgorithmInfo algorithm_info(TraversalAlgorithm algorithm) {
    switch (algorithm) {
    case TraversalAlgorithm::BFS:
        return {traversal_algorithm_name(algorithm),
                "Visits nodes level by level from the start, using a queue.", "O(V + E)",
                "O(V)"};
    case TraversalAlgorithm::DFS:
        return {traversal_algorithm_name(algorithm),
                "Follows one branch as deep as it goes before backtracking, using a stack.",
                "O(V + E)", "O(V)"};
    }
    return {};
}

AlgorithmInfo algorithm_info(PathAlgorithm algorithm) {
    switch (algorithm) {
    case PathAlgorithm::DIJKSTRA:
        return {path_algorithm_name(algorithm),
                "Settles nodes in order of distance from the start with a priority queue. "
                "Finds shortest paths when no weight is negative.",
                "O(E log V)", "O(V + E)"};
    case PathAlgorithm::A_STAR:
        return {path_algorithm_name(algorithm),
                "Dijkstra guided by a straight-line estimate of the distance left to the goal.",
                "O(E)", "O(V)"};
    }
    return {};
}

AlgorithmInfo algorithm_info(TreeTraversal traversal) {
    switch (traversal) {
    case TreeTraversal::IN_ORDER:
        return {tree_traversal_name(traversal),
                "Left subtree, node, right subtree. Yields the values in ascending order.",
                "O(n)", "O(n) (Worst-case)"};
    case TreeTraversal::PRE_ORDER:
        return {tree_traversal_name(traversal),
                "Node, left subtree, right subtree. Useful for copying a tree.", "O(n)",
                "O(n) (Worst-case)"};
    case TreeTraversal::POST_ORDER:
        return {tree_traversal_name(traversal),
                "Left subtree, right subtree, node. Useful for deleting a tree.", "O(n)",
                "O(n) (Worst-case)"};
    }
    return {};
}

AlgorithmInfo algorithm_info(ListKind kind) {
    switch (kind) {
    case ListKind::SINGLY:
        return {list_kind_name(kind), "Each node points to the next one; the list ends at null.",
                "O(n) (Search)", "O(n)"};
    case ListKind::DOUBLY:
        return {list_kind_name(kind),
                "Each node points to both its next and its previous node.", "O(n) (Search)",
                "O(n)"};
    }
    return {};
}

AlgorithmInfo tree_insertion_info() {
    return {"BST Insertion",
            "Smaller values go to the left subtree, equal or larger values to the right. "
            "No rebalancing, so sorted input degenerates into a chain.",
            "O(log n) (Average)", "O(n)"};
}

} // namespace algoscope
