/// @file test_step_trace.cpp
/// @brief Tests for step validation, the trace recorder and array replay

#include <catch2/catch.hpp>

#include "core/errors.hpp"
#include "core/value_format.hpp"
#include "structures/element_input.hpp"
#include "trace/array_replay.hpp"
#include "trace/trace.hpp"

#include <stdexcept>
#include <vector>

using namespace algoscope;

TEST_CASE("Recorder accepts well-formed steps in order", "[trace]") {
    TraceRecorder rec;
    rec.record(StepKind::COMPARE, {Subject::index(0), Subject::index(1)}, "compare");
    rec.record(StepKind::OVERWRITE, {Subject::index(1)}, "write", ValuePayload{7.0});
    rec.record(StepKind::COMPLETE, {}, "done");
    REQUIRE(rec.size() == 3);

    Trace trace = rec.finish(SortedArray{{1.0, 7.0}});
    CHECK(rec.size() == 0);
    REQUIRE(trace.size() == 3);
    CHECK(trace.at(0).kind == StepKind::COMPARE);
    CHECK(trace.at(1).narrative == "write");
    CHECK(trace.count(StepKind::OVERWRITE) == 1);
    CHECK(std::get<SortedArray>(trace.artifact()).values == std::vector<double>{1.0, 7.0});
    CHECK_THROWS_AS(trace.at(3), std::out_of_range);
}

TEST_CASE("Recorder rejects a payload that does not fit the kind", "[trace]") {
    TraceRecorder rec;
    CHECK_THROWS_AS(rec.record(StepKind::OVERWRITE, {Subject::index(0)}, "no value"),
                    std::logic_error);
    CHECK_THROWS_AS(rec.record(StepKind::SWAP, {Subject::index(0), Subject::index(1)}, "swap",
                               ValuePayload{1.0}),
                    std::logic_error);
    CHECK(rec.size() == 0);
}

TEST_CASE("Recorder rejects wrong subject counts", "[trace]") {
    TraceRecorder rec;
    CHECK_THROWS_AS(rec.record(StepKind::SWAP, {Subject::index(0)}, "one side"), std::logic_error);
    CHECK_THROWS_AS(rec.record(StepKind::COMPARE, {}, "nothing"), std::logic_error);
    CHECK_THROWS_AS(rec.record(StepKind::NOT_FOUND, {Subject::index(0)}, "extra"),
                    std::logic_error);
    CHECK_THROWS_AS(rec.record(StepKind::INSERT,
                               {Subject::node(0, "a"), Subject::node(1, "b"),
                                Subject::node(2, "c")},
                               "three", LinkPayload{ChildSide::LEFT}),
                    std::logic_error);
    CHECK_NOTHROW(rec.record(StepKind::INSERT, {Subject::node(0, "50")}, "root",
                             LinkPayload{ChildSide::ROOT}));
}

TEST_CASE("Path step needs one subject per path node", "[trace]") {
    Step step;
    step.kind = StepKind::PATH;
    step.subjects = {Subject::named("A"), Subject::named("B")};
    step.payload = PathPayload{{"A", "B", "D"}, 9.0};
    CHECK_THROWS_AS(validate_step(step), std::logic_error);

    step.subjects.push_back(Subject::named("D"));
    CHECK_NOTHROW(validate_step(step));
}

TEST_CASE("Array replay applies swap, shift and overwrite only", "[trace]") {
    TraceRecorder rec;
    rec.record(StepKind::COMPARE, {Subject::index(0), Subject::index(1)}, "compare");
    rec.record(StepKind::SWAP, {Subject::index(0), Subject::index(2)}, "swap");
    rec.record(StepKind::SHIFT, {Subject::index(0), Subject::index(1)}, "shift");
    rec.record(StepKind::OVERWRITE, {Subject::index(0)}, "write", ValuePayload{9.0});
    Trace trace = rec.finish(std::monostate{});

    std::vector<double> initial = {1.0, 2.0, 3.0};
    CHECK(replay_prefix(initial, trace, 0) == initial);
    CHECK(replay_prefix(initial, trace, 2) == std::vector<double>{3.0, 2.0, 1.0});
    CHECK(replay_prefix(initial, trace, 3) == std::vector<double>{3.0, 3.0, 1.0});
    CHECK(replay_prefix(initial, trace, 100) == std::vector<double>{9.0, 3.0, 1.0});
}

TEST_CASE("Array replay rejects an index outside the array", "[trace]") {
    Step step{StepKind::SWAP, {Subject::index(0), Subject::index(5)}, NoPayload{}, "swap"};
    std::vector<double> values = {1.0, 2.0};
    CHECK_THROWS_AS(apply_array_step(values, step), std::out_of_range);
}

TEST_CASE("Element input parses comma-separated numbers", "[input]") {
    CHECK(parse_elements(" 5, 3 ,8,, -1.5 ") == std::vector<double>{5.0, 3.0, 8.0, -1.5});
    CHECK(parse_value(" 42 ") == 42.0);
    CHECK(parse_values("7") == std::vector<double>{7.0});
}

TEST_CASE("Element input rejects bad tokens and counts", "[input]") {
    auto code_of = [](auto&& fn) {
        try {
            fn();
        } catch (const EngineError& e) {
            return e.code();
        }
        FAIL("expected an EngineError");
        return ErrorCode::PATH_NOT_FOUND;
    };

    CHECK(code_of([] { (void)parse_elements("1, two, 3"); }) == ErrorCode::INVALID_ELEMENT_INPUT);
    CHECK(code_of([] { (void)parse_elements("1"); }) == ErrorCode::INVALID_ELEMENT_INPUT);
    CHECK(code_of([] { (void)parse_values(" , "); }) == ErrorCode::INVALID_ELEMENT_INPUT);
    CHECK(code_of([] { (void)parse_value("1, 2"); }) == ErrorCode::INVALID_ELEMENT_INPUT);

    std::vector<double> too_many(51, 1.0);
    CHECK_THROWS_AS(validate_elements(too_many), EngineError);
    CHECK_NOTHROW(validate_elements(std::vector<double>(50, 1.0)));
}

TEST_CASE("Every error code carries an instruction", "[errors]") {
    for (ErrorCode code : {ErrorCode::INVALID_ELEMENT_INPUT, ErrorCode::GRAPH_PARSE_ERROR,
                           ErrorCode::UNKNOWN_START_NODE, ErrorCode::MISSING_TARGET_NODE,
                           ErrorCode::PATH_NOT_FOUND,
                           ErrorCode::UNSORTED_INPUT_FOR_BINARY_SEARCH}) {
        CHECK_FALSE(error_instruction(code).empty());
    }
    EngineError error(ErrorCode::GRAPH_PARSE_ERROR, "bad edge");
    CHECK(std::string(error.what()) == "bad edge");
    CHECK(error.instruction() == error_instruction(ErrorCode::GRAPH_PARSE_ERROR));
}

TEST_CASE("Values format like typed input", "[format]") {
    CHECK(format_value(42.0) == "42");
    CHECK(format_value(-3.0) == "-3");
    CHECK(format_value(2.5) == "2.5");
}
