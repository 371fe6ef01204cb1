/// @file test_priority_queue.cpp
/// @brief Tests for heap ordering, tie-breaking and lazy re-insertion

#include <catch2/catch.hpp>

#include "structures/priority_queue.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace algoscope;

TEST_CASE("Min-first queue extracts in ascending priority", "[priority_queue]") {
    PriorityQueue<std::string> queue;
    queue.insert("c", 3.0);
    queue.insert("a", 1.0);
    queue.insert("d", 4.0);
    queue.insert("b", 2.0);
    REQUIRE(queue.size() == 4);

    std::vector<std::string> order;
    while (!queue.is_empty()) {
        order.push_back(queue.extract_best().key);
    }
    CHECK(order == std::vector<std::string>{"a", "b", "c", "d"});
}

TEST_CASE("Max-first queue extracts in descending priority", "[priority_queue]") {
    PriorityQueue<int> queue(QueueOrder::MAX_FIRST);
    for (int i = 0; i < 10; i++) {
        queue.insert(i, static_cast<double>(i));
    }
    CHECK(queue.extract_best().key == 9);
    CHECK(queue.extract_best().key == 8);
    CHECK(queue.size() == 8);
}

TEST_CASE("Equal priorities come out in insertion order", "[priority_queue]") {
    PriorityQueue<std::string> queue;
    queue.insert("first", 5.0);
    queue.insert("second", 5.0);
    queue.insert("early", 1.0);
    queue.insert("third", 5.0);

    CHECK(queue.extract_best().key == "early");
    CHECK(queue.extract_best().key == "first");
    CHECK(queue.extract_best().key == "second");
    CHECK(queue.extract_best().key == "third");
}

TEST_CASE("A key may be inserted again with a better priority", "[priority_queue]") {
    PriorityQueue<std::string> queue;
    queue.insert("B", 10.0);
    queue.insert("C", 4.0);
    queue.insert("B", 3.0);

    auto best = queue.extract_best();
    CHECK(best.key == "B");
    CHECK(best.priority == 3.0);
    CHECK(queue.extract_best().key == "C");

    auto stale = queue.extract_best();
    CHECK(stale.key == "B");
    CHECK(stale.priority == 10.0);
}

TEST_CASE("Extracting from an empty queue throws", "[priority_queue]") {
    PriorityQueue<int> queue;
    CHECK(queue.is_empty());
    CHECK_THROWS_AS(queue.extract_best(), std::out_of_range);
}
