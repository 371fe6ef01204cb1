/// @file test_view_state.cpp
/// @brief Tests for view state driven through the workbench and scheduler

#include <catch2/catch.hpp>

#include "core/config.hpp"
#include "rendering/view_state.hpp"
#include "session/workbench.hpp"

#include <string>
#include <variant>
#include <vector>

using namespace algoscope;

namespace {

void finish(Workbench& bench) {
    for (int i = 0; i < 100000 && bench.is_running(); i++) {
        bench.tick(MAX_DELAY_MS);
    }
    REQUIRE_FALSE(bench.is_running());
}

} // namespace

TEST_CASE("Loading an array shows it without progress", "[view_state]") {
    ViewState view;
    Workbench bench(&view);
    REQUIRE(bench.load_array("3, 1, 2").ok);

    CHECK(view.mode() == ViewMode::ARRAY);
    CHECK(view.values() == std::vector<double>{3, 1, 2});
    CHECK(view.total_steps() == 0);
    CHECK_FALSE(view.current_kind().has_value());
}

TEST_CASE("Sorting playback starts from the unsorted array", "[view_state]") {
    ViewState view;
    Workbench bench(&view);
    REQUIRE(bench.load_array("3, 1, 2").ok);
    REQUIRE(bench.run_sort(SortAlgorithm::BUBBLE, SortOrder::ASCENDING).ok);

    // First step (a compare) is shown on start
    CHECK(view.steps_shown() == 1);
    CHECK(view.current_kind() == StepKind::COMPARE);
    CHECK(view.values() == std::vector<double>{3, 1, 2});
    CHECK(view.is_active_index(0));
    CHECK(view.is_active_index(1));
    CHECK_FALSE(view.is_active_index(2));
    CHECK(view.flash() == 1.0f);
    CHECK_FALSE(view.narrative().empty());

    bench.tick(bench.scheduler().delay_ms());
    CHECK(view.current_kind() == StepKind::SWAP);
    CHECK(view.values() == std::vector<double>{1, 3, 2});

    finish(bench);
    CHECK(view.is_complete());
    CHECK(view.values() == std::vector<double>{1, 2, 3});
    for (std::size_t i = 0; i < 3; i++) {
        CHECK(view.is_finalized(i));
    }
}

TEST_CASE("Flash fades between steps", "[view_state]") {
    ViewState view;
    Workbench bench(&view);
    REQUIRE(bench.load_array("3, 1").ok);
    REQUIRE(bench.run_sort(SortAlgorithm::BUBBLE, SortOrder::ASCENDING).ok);

    view.update(0.1f);
    CHECK(view.flash() < 1.0f);
    CHECK(view.flash() > 0.0f);
    view.update(10.0f);
    CHECK(view.flash() == 0.0f);
}

TEST_CASE("Only one index holds a given mark role", "[view_state]") {
    ViewState view;
    Workbench bench(&view);
    REQUIRE(bench.load_array("5, 4, 3").ok);
    REQUIRE(bench.run_sort(SortAlgorithm::SELECTION, SortOrder::ASCENDING).ok);

    // Step through the first pass: candidate moves 0 -> 1 -> 2
    for (int i = 0; i < 5; i++) {
        bench.tick(bench.scheduler().delay_ms());
    }
    int candidates = 0;
    for (std::size_t i = 0; i < 3; i++) {
        if (view.mark_at(i) == MarkRole::CANDIDATE) {
            candidates++;
        }
    }
    CHECK(candidates == 1);
    CHECK(view.mark_at(2) == MarkRole::CANDIDATE);
}

TEST_CASE("Binary search shows its range and the auto-sort notice", "[view_state]") {
    ViewState view;
    Workbench bench(&view);
    REQUIRE(bench.load_array("9, 1, 5, 3").ok);
    REQUIRE(bench.run_search(SearchAlgorithm::BINARY, "9").ok);

    CHECK(view.values() == std::vector<double>{1, 3, 5, 9});
    REQUIRE(view.notice().has_value());
    CHECK(*view.notice() == ErrorCode::UNSORTED_INPUT_FOR_BINARY_SEARCH);

    bench.tick(bench.scheduler().delay_ms());
    REQUIRE(view.range().has_value());
    CHECK(view.range()->low == 0);
    CHECK(view.range()->high == 3);

    finish(bench);
    REQUIRE(view.found().has_value());
    CHECK(view.found()->id == 3);
    CHECK_FALSE(view.not_found());
}

TEST_CASE("Graph playback tracks visits, scores and the path", "[view_state]") {
    ViewState view;
    Workbench bench(&view);
    REQUIRE(bench.load_graph("A-B, A-C, B-D, C-E", "A-B:5, A-C:2, B-D:4, C-E:8", "A").ok);
    CHECK(view.mode() == ViewMode::GRAPH);
    CHECK(view.start_node() == "A");

    REQUIRE(bench.run_traversal(TraversalAlgorithm::BFS).ok);
    finish(bench);
    CHECK(view.visit_order() == std::vector<std::string>{"A", "B", "C", "D", "E"});
    CHECK(view.is_visited("E"));
    CHECK_FALSE(view.is_scheduled("E"));

    REQUIRE(bench.run_pathfinding(PathAlgorithm::DIJKSTRA, "D").ok);
    CHECK(view.visit_order().empty());
    finish(bench);
    CHECK(view.path() == std::vector<std::string>{"A", "B", "D"});
    CHECK(view.total_weight() == 9.0);
    CHECK(view.on_path("B"));
    CHECK_FALSE(view.on_path("C"));
    CHECK(view.is_settled("C"));
    REQUIRE(view.score("E").has_value());
    CHECK(view.score("E")->cost == 10.0);
}

TEST_CASE("Tree build reveals nodes as they are inserted", "[view_state]") {
    ViewState view;
    Workbench bench(&view);
    REQUIRE(bench.build_tree("50, 25, 75").ok);

    CHECK(view.mode() == ViewMode::TREE);
    CHECK(view.tree().size() == 3);
    // The root insert has been shown; the children are still hidden
    CHECK_FALSE(view.is_hidden(0));
    CHECK(view.is_hidden(1));
    CHECK(view.is_hidden(2));

    finish(bench);
    CHECK_FALSE(view.is_hidden(1));
    CHECK_FALSE(view.is_hidden(2));

    REQUIRE(bench.run_tree_traversal(TreeTraversal::IN_ORDER).ok);
    finish(bench);
    CHECK(view.is_node_visited(0));
    CHECK(view.visit_order() == std::vector<std::string>{"25", "50", "75"});
}

TEST_CASE("List delete marks the removed node on the old list", "[view_state]") {
    ViewState view;
    Workbench bench(&view);
    REQUIRE(bench.build_list("10, 20, 30", ListKind::SINGLY).ok);
    finish(bench);

    REQUIRE(bench.run_list_delete("20").ok);
    CHECK(view.list().values() == std::vector<double>{10, 20, 30});
    finish(bench);
    CHECK(view.is_removed(1));
    CHECK_FALSE(view.is_removed(0));
    CHECK(std::get<ValueSequence>(view.artifact()).values == std::vector<double>{10, 30});
}

TEST_CASE("Cancelling leaves the view where playback stopped", "[view_state]") {
    ViewState view;
    Workbench bench(&view);
    REQUIRE(bench.load_array("4, 3, 2, 1").ok);
    REQUIRE(bench.run_sort(SortAlgorithm::INSERTION, SortOrder::ASCENDING).ok);
    bench.tick(bench.scheduler().delay_ms());
    std::size_t shown = view.steps_shown();

    REQUIRE(bench.cancel());
    bench.tick(100000);
    CHECK(view.steps_shown() == shown);
    CHECK_FALSE(view.is_complete());
}
