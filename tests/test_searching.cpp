/// @file test_searching.cpp
/// @brief Tests for linear and binary search traces

#include <catch2/catch.hpp>

#include "algorithms/searching.hpp"

#include <cmath>
#include <cstddef>
#include <vector>

using namespace algoscope;

TEST_CASE("Linear search stops at the first match", "[searching]") {
    Trace trace = linear_search({4, 7, 7, 1}, 7);

    CHECK(trace.count(StepKind::COMPARE) == 2);
    CHECK(trace.steps().back().kind == StepKind::FOUND);
    const auto& outcome = std::get<SearchOutcome>(trace.artifact());
    CHECK(outcome.found);
    REQUIRE(outcome.position.has_value());
    CHECK(*outcome.position == 1);
}

TEST_CASE("Linear search reports a miss after checking every index", "[searching]") {
    Trace trace = linear_search({4, 7, 1}, 9);

    CHECK(trace.count(StepKind::COMPARE) == 3);
    CHECK(trace.steps().back().kind == StepKind::NOT_FOUND);
    CHECK_FALSE(std::get<SearchOutcome>(trace.artifact()).found);
}

TEST_CASE("Binary search halves the range around the middle", "[searching]") {
    BinarySearchResult result = binary_search({11, 12, 22, 25, 45, 64, 90}, 64);

    CHECK_FALSE(result.auto_sorted);
    const Trace& trace = result.trace;
    REQUIRE(trace.size() > 0);
    CHECK(trace.at(0).kind == StepKind::RANGE);
    CHECK(std::get<RangePayload>(trace.at(0).payload) == RangePayload{0, 6});
    CHECK(trace.at(1).subjects.front().id == 3);
    CHECK(trace.at(2).kind == StepKind::NARROW);
    CHECK(std::get<RangePayload>(trace.at(2).payload) == RangePayload{4, 6});

    const auto& outcome = std::get<SearchOutcome>(trace.artifact());
    CHECK(outcome.found);
    CHECK(*outcome.position == 5);
}

TEST_CASE("Binary search sorts an unsorted input first and says so", "[searching]") {
    BinarySearchResult result = binary_search({64, 25, 12, 22, 11}, 22);

    CHECK(result.auto_sorted);
    CHECK(result.searched == std::vector<double>{11, 12, 22, 25, 64});
    REQUIRE(result.trace.size() > 0);
    const Step& notice = result.trace.at(0);
    CHECK(notice.kind == StepKind::NOTICE);
    CHECK(std::get<NoticePayload>(notice.payload).code ==
          ErrorCode::UNSORTED_INPUT_FOR_BINARY_SEARCH);
    CHECK(*std::get<SearchOutcome>(result.trace.artifact()).position == 2);
}

TEST_CASE("Binary search reports an empty range as not found", "[searching]") {
    BinarySearchResult result = binary_search({1, 3, 5, 7}, 4);

    const Trace& trace = result.trace;
    CHECK(trace.steps().back().kind == StepKind::NOT_FOUND);
    CHECK_FALSE(std::get<SearchOutcome>(trace.artifact()).found);

    // The last NARROW leaves low > high
    const Step* last_narrow = nullptr;
    for (const Step& step : trace.steps()) {
        if (step.kind == StepKind::NARROW) {
            last_narrow = &step;
        }
    }
    REQUIRE(last_narrow != nullptr);
    auto range = std::get<RangePayload>(last_narrow->payload);
    CHECK(range.low > range.high);
}

TEST_CASE("Binary search stays within the logarithmic bound", "[searching]") {
    for (std::size_t n : {2u, 3u, 7u, 16u, 33u, 50u}) {
        std::vector<double> values;
        for (std::size_t i = 0; i < n; i++) {
            values.push_back(static_cast<double>(i * 2));
        }
        auto bound = static_cast<std::size_t>(std::ceil(std::log2(static_cast<double>(n)))) + 2;

        for (double target : {-1.0, 0.0, static_cast<double>(n), static_cast<double>(2 * n)}) {
            Trace trace = binary_search(values, target).trace;
            CHECK(trace.count(StepKind::COMPARE) <= bound);
            CHECK(trace.count(StepKind::RANGE) <= bound);
        }
    }
}
