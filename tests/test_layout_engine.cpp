/// @file test_layout_engine.cpp
/// @brief Tests for bar, graph, tree and list layout geometry

#include <catch2/catch.hpp>

#include "rendering/layout_engine.hpp"
#include "structures/binary_search_tree.hpp"
#include "structures/graph.hpp"
#include "structures/linked_list.hpp"

#include <cmath>
#include <vector>

using namespace algoscope;
using Catch::Detail::Approx;

TEST_CASE("Bars are proportional to the largest value and share a baseline", "[layout]") {
    std::vector<Rect> bars = compute_bar_layout({10, 5, 0, -3});
    REQUIRE(bars.size() == 4);

    CHECK(bars[0].h == Approx(2.0f * bars[1].h));
    CHECK(bars[0].y + bars[0].h == Approx(bars[1].y + bars[1].h));
    CHECK(bars[2].h > 0.0f);
    CHECK(bars[3].h == Approx(bars[2].h));
    CHECK(bars[1].x > bars[0].x + bars[0].w);
}

TEST_CASE("Graph nodes sit on a circle in first-seen order", "[layout]") {
    Graph graph = parse_graph("A-B, B-C, C-D", "");
    GraphLayout layout = compute_graph_layout(graph);
    REQUIRE(layout.positions.size() == 4);

    Vec2 a = layout.positions.at("A");
    Vec2 c = layout.positions.at("C");
    CHECK(a.y == Approx(0.0f).margin(1e-4));
    CHECK(a.x > 0.0f);
    // Opposite sides for four evenly spaced nodes
    CHECK(c.x == Approx(-a.x).margin(1e-4));

    float radius = std::hypot(layout.positions.at("B").x, layout.positions.at("B").y);
    CHECK(radius == Approx(std::hypot(a.x, a.y)));
}

TEST_CASE("Graph layout is deterministic and bounded", "[layout]") {
    Graph graph = parse_graph("A-B, A-C, B-D, C-E", "");
    GraphLayout first = compute_graph_layout(graph);
    GraphLayout second = compute_graph_layout(graph);

    for (const auto& label : graph.nodes()) {
        Vec2 p = first.positions.at(label);
        CHECK(p.x == second.positions.at(label).x);
        CHECK(p.y == second.positions.at(label).y);
        CHECK(p.x > first.bounding_box.x);
        CHECK(p.x < first.bounding_box.x + first.bounding_box.w);
        CHECK(p.y > first.bounding_box.y);
        CHECK(p.y < first.bounding_box.y + first.bounding_box.h);
    }
}

TEST_CASE("Tree children sit one level down, spread narrowing with depth", "[layout]") {
    BinarySearchTree tree;
    NodeId root = tree.insert(50);
    NodeId left = tree.insert(25);
    NodeId right = tree.insert(75);
    NodeId left_left = tree.insert(10);

    NodeLayout layout = compute_tree_layout(tree);
    Vec2 r = layout.positions.at(root);
    Vec2 l = layout.positions.at(left);
    Vec2 rr = layout.positions.at(right);
    Vec2 ll = layout.positions.at(left_left);

    CHECK(l.y > r.y);
    CHECK(l.y == Approx(rr.y));
    CHECK(l.x < r.x);
    CHECK(rr.x > r.x);
    CHECK((r.x - l.x) == Approx(2.0f * (l.x - ll.x)));
    CHECK(compute_tree_layout(BinarySearchTree{}).positions.empty());
}

TEST_CASE("List nodes run left to right and skip unlinked nodes", "[layout]") {
    LinkedList list;
    NodeId a = list.append(1);
    NodeId b = list.append(2);
    NodeId c = list.append(3);
    list.unlink(b, a);

    NodeLayout layout = compute_list_layout(list);
    CHECK(layout.positions.size() == 2);
    CHECK(layout.positions.count(b) == 0);
    CHECK(layout.positions.at(c).x > layout.positions.at(a).x);
    CHECK(layout.positions.at(c).y == Approx(layout.positions.at(a).y));
}
