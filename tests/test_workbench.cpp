/// @file test_workbench.cpp
/// @brief Tests for the workbench session: validation, refusals and playback hand-off

#include <catch2/catch.hpp>

#include "core/config.hpp"
#include "session/workbench.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace algoscope;

namespace {

/// Counts structure hand-offs and collects played steps
class RecordingListener : public WorkbenchListener {
  public:
    void on_array(const std::vector<double>& values) override { arrays.push_back(values); }
    void on_graph(const Graph& graph, const std::string& start) override {
        graph_nodes = graph.node_count();
        graph_start = start;
    }
    void on_tree(const BinarySearchTree& tree) override { tree_sizes.push_back(tree.size()); }
    void on_list(const LinkedList& list) override { lists.push_back(list.values()); }
    void on_start(const Trace& trace) override { started.push_back(trace.size()); }
    void on_step(const Step& step, std::size_t /*index*/) override { kinds.push_back(step.kind); }
    void on_complete(const FinalArtifact& artifact) override {
        completions++;
        last_artifact = artifact;
    }

    std::vector<std::vector<double>> arrays;
    std::size_t graph_nodes = 0;
    std::string graph_start;
    std::vector<std::size_t> tree_sizes;
    std::vector<std::vector<double>> lists;
    std::vector<std::size_t> started;
    std::vector<StepKind> kinds;
    int completions = 0;
    FinalArtifact last_artifact;
};

/// Runs the current playback to its end
void finish(Workbench& bench) {
    for (int i = 0; i < 100000 && bench.is_running(); i++) {
        bench.tick(MAX_DELAY_MS);
    }
    REQUIRE_FALSE(bench.is_running());
}

} // namespace

TEST_CASE("Workbench needs a listener", "[workbench]") {
    CHECK_THROWS_AS(Workbench(nullptr), std::invalid_argument);
}

TEST_CASE("Loading an array validates before replacing", "[workbench]") {
    RecordingListener listener;
    Workbench bench(&listener);

    Notice ok = bench.load_array("5, 3, 8");
    CHECK(ok.ok);
    CHECK(bench.array() == std::vector<double>{5, 3, 8});
    REQUIRE(listener.arrays.size() == 1);

    Notice bad = bench.load_array("5, x");
    CHECK_FALSE(bad.ok);
    REQUIRE(bad.code.has_value());
    CHECK(*bad.code == ErrorCode::INVALID_ELEMENT_INPUT);
    CHECK_FALSE(bad.instruction.empty());
    CHECK(bench.array() == std::vector<double>{5, 3, 8});

    Notice too_short = bench.load_array(std::vector<double>{1});
    CHECK_FALSE(too_short.ok);
    CHECK(bench.array() == std::vector<double>{5, 3, 8});
    CHECK(listener.arrays.size() == 1);

    CHECK(bench.clear_array().ok);
    CHECK(bench.array().empty());
}

TEST_CASE("Sorting hands over the unsorted array and keeps the sorted one", "[workbench]") {
    RecordingListener listener;
    Workbench bench(&listener);
    REQUIRE(bench.load_array("3, 1, 2").ok);

    Notice notice = bench.run_sort(SortAlgorithm::BUBBLE, SortOrder::ASCENDING);
    CHECK(notice.ok);
    CHECK(bench.is_running());
    CHECK(listener.arrays.back() == std::vector<double>{3, 1, 2});
    CHECK(bench.array() == std::vector<double>{1, 2, 3});

    finish(bench);
    CHECK(listener.completions == 1);
    CHECK(std::get<SortedArray>(listener.last_artifact).values ==
          std::vector<double>{1, 2, 3});
}

TEST_CASE("Sorting an already sorted array is refused", "[workbench]") {
    RecordingListener listener;
    Workbench bench(&listener);
    REQUIRE(bench.load_array("1, 2, 3").ok);

    Notice notice = bench.run_sort(SortAlgorithm::QUICK, SortOrder::ASCENDING);
    CHECK_FALSE(notice.ok);
    CHECK_FALSE(notice.code.has_value());
    CHECK_FALSE(bench.is_running());
    CHECK(bench.run_sort(SortAlgorithm::QUICK, SortOrder::DESCENDING).ok);
}

TEST_CASE("Operations are refused while a playback runs", "[workbench]") {
    RecordingListener listener;
    Workbench bench(&listener);
    REQUIRE(bench.load_array("3, 1, 2").ok);
    REQUIRE(bench.run_sort(SortAlgorithm::MERGE, SortOrder::ASCENDING).ok);

    CHECK_FALSE(bench.load_array("9, 8").ok);
    CHECK_FALSE(bench.run_search(SearchAlgorithm::LINEAR, "1").ok);
    CHECK_FALSE(bench.build_tree("1, 2").ok);
    CHECK(bench.array() == std::vector<double>{1, 2, 3});
    CHECK(listener.started.size() == 1);

    CHECK(bench.cancel());
    CHECK_FALSE(bench.is_running());
    CHECK(bench.load_array("9, 8").ok);
}

TEST_CASE("Nothing loaded means nothing to run", "[workbench]") {
    RecordingListener listener;
    Workbench bench(&listener);

    CHECK_FALSE(bench.run_sort(SortAlgorithm::HEAP, SortOrder::ASCENDING).ok);
    CHECK_FALSE(bench.run_search(SearchAlgorithm::BINARY, "4").ok);
    CHECK_FALSE(bench.run_traversal(TraversalAlgorithm::BFS).ok);
    CHECK_FALSE(bench.run_pathfinding(PathAlgorithm::DIJKSTRA, "D").ok);
    CHECK_FALSE(bench.run_tree_search("4").ok);
    CHECK_FALSE(bench.run_tree_traversal(TreeTraversal::IN_ORDER).ok);
    CHECK_FALSE(bench.run_list_search("4").ok);
    CHECK(listener.started.empty());
}

TEST_CASE("Binary search on an unsorted array sorts it and says so", "[workbench]") {
    RecordingListener listener;
    Workbench bench(&listener);
    REQUIRE(bench.load_array("64, 25, 12, 22").ok);

    Notice notice = bench.run_search(SearchAlgorithm::BINARY, "22");
    CHECK(notice.ok);
    REQUIRE(notice.code.has_value());
    CHECK(*notice.code == ErrorCode::UNSORTED_INPUT_FOR_BINARY_SEARCH);
    CHECK(bench.array() == std::vector<double>{12, 22, 25, 64});
    CHECK(listener.arrays.back() == std::vector<double>{12, 22, 25, 64});
    REQUIRE_FALSE(listener.kinds.empty());
    CHECK(listener.kinds.front() == StepKind::NOTICE);

    finish(bench);
    const auto& outcome = std::get<SearchOutcome>(listener.last_artifact);
    CHECK(outcome.found);
    CHECK(*outcome.position == 1);
}

TEST_CASE("A bad search target is reported without playing", "[workbench]") {
    RecordingListener listener;
    Workbench bench(&listener);
    REQUIRE(bench.load_array("1, 2").ok);

    Notice notice = bench.run_search(SearchAlgorithm::LINEAR, "two");
    CHECK_FALSE(notice.ok);
    CHECK(*notice.code == ErrorCode::INVALID_ELEMENT_INPUT);
    CHECK(listener.started.empty());
}

TEST_CASE("A failed graph load keeps the previous graph", "[workbench]") {
    RecordingListener listener;
    Workbench bench(&listener);
    REQUIRE(bench.load_graph("A-B, B-C", "", "A").ok);
    CHECK(listener.graph_nodes == 3);

    Notice parse = bench.load_graph("A-B, B", "", "A");
    CHECK(*parse.code == ErrorCode::GRAPH_PARSE_ERROR);
    Notice start = bench.load_graph("X-Y", "", "A");
    CHECK(*start.code == ErrorCode::UNKNOWN_START_NODE);

    REQUIRE(bench.graph().has_value());
    CHECK(bench.graph()->node_count() == 3);
    CHECK(bench.start_node() == "A");
}

TEST_CASE("Typed graph input is validated like text", "[workbench]") {
    RecordingListener listener;
    Workbench bench(&listener);

    Notice empty = bench.load_graph(std::vector<Edge>{}, std::vector<WeightedEdge>{}, "A");
    CHECK(*empty.code == ErrorCode::GRAPH_PARSE_ERROR);

    Notice loop =
        bench.load_graph(std::vector<Edge>{{"A", "A"}}, std::vector<WeightedEdge>{}, "A");
    CHECK(*loop.code == ErrorCode::GRAPH_PARSE_ERROR);

    Notice ok = bench.load_graph(std::vector<Edge>{{"A", "B"}},
                                 std::vector<WeightedEdge>{{"A", "B", 2.0}}, "B");
    CHECK(ok.ok);
    CHECK(bench.graph()->edge_cost("A", "B") == 2.0);
    CHECK(listener.graph_start == "B");
}

TEST_CASE("Pathfinding plays the exploration even when no path exists", "[workbench]") {
    RecordingListener listener;
    Workbench bench(&listener);
    REQUIRE(bench.load_graph("A-B, C-D", "", "A").ok);

    Notice notice = bench.run_pathfinding(PathAlgorithm::DIJKSTRA, "D");
    CHECK_FALSE(notice.ok);
    CHECK(*notice.code == ErrorCode::PATH_NOT_FOUND);
    CHECK(bench.is_running());

    finish(bench);
    CHECK(listener.kinds.back() == StepKind::COMPLETE);
    CHECK(std::holds_alternative<std::monostate>(listener.last_artifact));

    Notice missing = bench.run_pathfinding(PathAlgorithm::A_STAR, "");
    CHECK(*missing.code == ErrorCode::MISSING_TARGET_NODE);
    CHECK_FALSE(bench.is_running());
}

TEST_CASE("Pathfinding and traversal play on the loaded graph", "[workbench]") {
    RecordingListener listener;
    Workbench bench(&listener);
    REQUIRE(bench.load_graph("A-B, A-C, B-D, C-E", "A-B:5, A-C:2, B-D:4, C-E:8", "A").ok);

    REQUIRE(bench.run_pathfinding(PathAlgorithm::A_STAR, "D").ok);
    finish(bench);
    CHECK(std::get<PathOutcome>(listener.last_artifact).total_weight == 9.0);

    REQUIRE(bench.run_traversal(TraversalAlgorithm::DFS).ok);
    finish(bench);
    CHECK(std::get<VisitOrder>(listener.last_artifact).labels ==
          std::vector<std::string>{"A", "B", "D", "C", "E"});
    CHECK_THROWS_AS(bench.set_heuristic(Heuristic{}), std::invalid_argument);
}

TEST_CASE("Tree operations build on the stored tree", "[workbench]") {
    RecordingListener listener;
    Workbench bench(&listener);

    CHECK_FALSE(bench.build_tree("").ok);
    REQUIRE(bench.build_tree("50, 25, 75").ok);
    CHECK(listener.tree_sizes.back() == 3);
    finish(bench);

    REQUIRE(bench.insert_tree_value("10").ok);
    CHECK(bench.tree().size() == 4);
    finish(bench);

    REQUIRE(bench.run_tree_traversal(TreeTraversal::PRE_ORDER).ok);
    finish(bench);
    CHECK(std::get<ValueSequence>(listener.last_artifact).values ==
          std::vector<double>{50, 25, 10, 75});

    REQUIRE(bench.run_tree_search("75").ok);
    finish(bench);
    CHECK(std::get<SearchOutcome>(listener.last_artifact).found);
}

TEST_CASE("List delete hands over the list as it was before", "[workbench]") {
    RecordingListener listener;
    Workbench bench(&listener);
    REQUIRE(bench.build_list("10, 20, 30", ListKind::DOUBLY).ok);
    finish(bench);

    REQUIRE(bench.run_list_delete("10").ok);
    CHECK(listener.lists.back() == std::vector<double>{10, 20, 30});
    CHECK(bench.list().values() == std::vector<double>{20, 30});
    CHECK(bench.list().node(bench.list().head()).prev == NO_NODE);
    finish(bench);

    REQUIRE(bench.run_list_search("30").ok);
    finish(bench);
    CHECK(std::get<SearchOutcome>(listener.last_artifact).found);

    Notice bad = bench.run_list_delete("abc");
    CHECK(*bad.code == ErrorCode::INVALID_ELEMENT_INPUT);
    CHECK(bench.list().values() == std::vector<double>{20, 30});
}

TEST_CASE("Workbench speed is clamped and used for the next run", "[workbench]") {
    RecordingListener listener;
    Workbench bench(&listener);
    CHECK(bench.speed() == DEFAULT_SPEED);

    bench.set_speed(MAX_DELAY_MS + 500);
    CHECK(bench.speed() == MAX_DELAY_MS);
    REQUIRE(bench.load_array("2, 1").ok);
    REQUIRE(bench.run_sort(SortAlgorithm::SELECTION, SortOrder::ASCENDING).ok);
    CHECK(bench.scheduler().delay_ms() == MIN_DELAY_MS);
}
