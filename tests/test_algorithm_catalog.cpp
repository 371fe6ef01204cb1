/// @file test_algorithm_catalog.cpp
/// @brief Tests that every selectable algorithm has a catalogue entry

#include <catch2/catch.hpp>

#include "algorithms/algorithm_catalog.hpp"

using namespace algoscope;

namespace {

void check_complete(const AlgorithmInfo& info) {
    CHECK_FALSE(info.name.empty());
    CHECK_FALSE(info.description.empty());
    CHECK_FALSE(info.time_complexity.empty());
    CHECK_FALSE(info.space_complexity.empty());
}

} // namespace

TEST_CASE("Every algorithm has a complete catalogue entry", "[catalog]") {
    for (auto algorithm : {SortAlgorithm::BUBBLE, SortAlgorithm::SELECTION,
                           SortAlgorithm::INSERTION, SortAlgorithm::QUICK, SortAlgorithm::MERGE,
                           SortAlgorithm::HEAP}) {
        check_complete(algorithm_info(algorithm));
        CHECK(algorithm_info(algorithm).name == sort_algorithm_name(algorithm));
    }
    for (auto algorithm : {SearchAlgorithm::LINEAR, SearchAlgorithm::BINARY}) {
        check_complete(algorithm_info(algorithm));
    }
    for (auto algorithm : {TraversalAlgorithm::BFS, TraversalAlgorithm::DFS}) {
        check_complete(algorithm_info(algorithm));
    }
    for (auto algorithm : {PathAlgorithm::DIJKSTRA, PathAlgorithm::A_STAR}) {
        check_complete(algorithm_info(algorithm));
    }
    for (auto traversal :
         {TreeTraversal::IN_ORDER, TreeTraversal::PRE_ORDER, TreeTraversal::POST_ORDER}) {
        check_complete(algorithm_info(traversal));
    }
    for (auto kind : {ListKind::SINGLY, ListKind::DOUBLY}) {
        check_complete(algorithm_info(kind));
    }
    check_complete(tree_insertion_info());
}

TEST_CASE("Catalogue complexities match the textbook figures", "[catalog]") {
    CHECK(algorithm_info(SortAlgorithm::BUBBLE).time_complexity == "O(n^2)");
    CHECK(algorithm_info(SortAlgorithm::MERGE).space_complexity == "O(n)");
    CHECK(algorithm_info(SearchAlgorithm::BINARY).time_complexity == "O(log n)");
    CHECK(algorithm_info(TraversalAlgorithm::BFS).time_complexity == "O(V + E)");
    CHECK(algorithm_info(PathAlgorithm::DIJKSTRA).time_complexity == "O(E log V)");
}
