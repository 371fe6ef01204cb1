/// @file test_scheduler.cpp
/// @brief Tests for playback timing, completion, cancellation and run ids

#include <catch2/catch.hpp>

#include "core/config.hpp"
#include "timing/playback_scheduler.hpp"
#include "trace/trace.hpp"

#include <functional>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace algoscope;

namespace {

/// Speed that yields the given delay between steps
constexpr int speed_for_delay(int delay_ms) {
    return MAX_DELAY_MS + MIN_DELAY_MS - delay_ms;
}

std::shared_ptr<const Trace> make_trace(std::size_t steps) {
    TraceRecorder rec;
    for (std::size_t i = 0; i < steps; i++) {
        rec.record(StepKind::VISIT, {Subject::index(i)}, "step");
    }
    return std::make_shared<const Trace>(rec.finish(VisitOrder{{"done"}}));
}

/// Records every callback; optionally reacts to a step
class RecordingListener : public PlaybackListener {
  public:
    void on_start(const Trace& trace) override { started.push_back(trace.size()); }

    void on_step(const Step& step, std::size_t index) override {
        indices.push_back(index);
        ids.push_back(step.subjects.front().id);
        if (on_step_hook) {
            on_step_hook(index);
        }
    }

    void on_complete(const FinalArtifact& artifact) override {
        completions++;
        last_artifact = artifact;
    }

    std::vector<std::size_t> started;
    std::vector<std::size_t> indices;
    std::vector<std::size_t> ids;
    int completions = 0;
    FinalArtifact last_artifact;
    std::function<void(std::size_t)> on_step_hook;
};

} // namespace

TEST_CASE("Speed maps inversely to the step delay", "[scheduler]") {
    CHECK(delay_for_speed(MIN_DELAY_MS) == MAX_DELAY_MS);
    CHECK(delay_for_speed(MAX_DELAY_MS) == MIN_DELAY_MS);
    CHECK(delay_for_speed(DEFAULT_SPEED) == MAX_DELAY_MS - DEFAULT_SPEED + MIN_DELAY_MS);
    CHECK(delay_for_speed(-50) == MAX_DELAY_MS);
    CHECK(delay_for_speed(1000000) == MIN_DELAY_MS);
}

TEST_CASE("Scheduler rejects a null listener and a null trace", "[scheduler]") {
    CHECK_THROWS_AS(PlaybackScheduler(nullptr), std::invalid_argument);

    RecordingListener listener;
    PlaybackScheduler scheduler(&listener);
    CHECK_THROWS_AS(scheduler.start(nullptr, DEFAULT_SPEED), std::invalid_argument);
    CHECK(scheduler.state() == PlaybackState::IDLE);
}

TEST_CASE("Start emits the first step immediately, then one per delay", "[scheduler]") {
    RecordingListener listener;
    PlaybackScheduler scheduler(&listener);

    REQUIRE(scheduler.start(make_trace(3), speed_for_delay(100)));
    CHECK(scheduler.is_running());
    CHECK(listener.started == std::vector<std::size_t>{3});
    CHECK(listener.indices == std::vector<std::size_t>{0});
    CHECK(scheduler.delay_ms() == 100);
    REQUIRE(scheduler.time_to_next().has_value());
    CHECK(*scheduler.time_to_next() == 100);

    scheduler.tick(99);
    CHECK(listener.indices.size() == 1);
    CHECK(*scheduler.time_to_next() == 1);

    scheduler.tick(1);
    CHECK(listener.indices == std::vector<std::size_t>{0, 1});

    scheduler.tick(100);
    CHECK(listener.indices == std::vector<std::size_t>{0, 1, 2});
    CHECK(listener.completions == 0);
    CHECK(scheduler.is_running());

    // One more delay after the last step reports completion
    scheduler.tick(100);
    CHECK(listener.completions == 1);
    CHECK(scheduler.state() == PlaybackState::IDLE);
    CHECK_FALSE(scheduler.time_to_next().has_value());
    CHECK(std::get<VisitOrder>(listener.last_artifact).labels ==
          std::vector<std::string>{"done"});
    CHECK(scheduler.emitted() == 3);
}

TEST_CASE("A long tick fires every timer that expires within it", "[scheduler]") {
    RecordingListener listener;
    PlaybackScheduler scheduler(&listener);
    REQUIRE(scheduler.start(make_trace(5), speed_for_delay(50)));

    scheduler.tick(175);
    CHECK(listener.indices == std::vector<std::size_t>{0, 1, 2, 3});
    CHECK(*scheduler.time_to_next() == 25);

    scheduler.tick(1000);
    CHECK(listener.ids == std::vector<std::size_t>{0, 1, 2, 3, 4});
    CHECK(listener.completions == 1);
}

TEST_CASE("An empty trace completes on start", "[scheduler]") {
    RecordingListener listener;
    PlaybackScheduler scheduler(&listener);
    REQUIRE(scheduler.start(make_trace(0), DEFAULT_SPEED));
    CHECK(listener.indices.empty());
    CHECK(listener.completions == 1);
    CHECK(scheduler.state() == PlaybackState::IDLE);
}

TEST_CASE("Only one run at a time", "[scheduler]") {
    RecordingListener listener;
    PlaybackScheduler scheduler(&listener);
    REQUIRE(scheduler.start(make_trace(3), DEFAULT_SPEED));
    std::uint64_t run = scheduler.run_id();

    CHECK_FALSE(scheduler.start(make_trace(1), DEFAULT_SPEED));
    CHECK(scheduler.run_id() == run);
    CHECK(scheduler.trace()->size() == 3);
    CHECK(listener.started.size() == 1);
}

TEST_CASE("Cancel drops remaining steps without completing", "[scheduler]") {
    RecordingListener listener;
    PlaybackScheduler scheduler(&listener);
    REQUIRE(scheduler.start(make_trace(4), speed_for_delay(10)));
    scheduler.tick(10);
    REQUIRE(listener.indices.size() == 2);

    CHECK(scheduler.cancel());
    CHECK(scheduler.state() == PlaybackState::CANCELLED);
    CHECK_FALSE(scheduler.time_to_next().has_value());
    CHECK_FALSE(scheduler.cancel());

    scheduler.tick(10000);
    CHECK(listener.indices.size() == 2);
    CHECK(listener.completions == 0);
}

TEST_CASE("A new run after cancel starts from step 0 with a new run id", "[scheduler]") {
    RecordingListener listener;
    PlaybackScheduler scheduler(&listener);
    REQUIRE(scheduler.start(make_trace(4), speed_for_delay(10)));
    std::uint64_t first = scheduler.run_id();
    scheduler.tick(10);
    REQUIRE(scheduler.cancel());
    REQUIRE(scheduler.state() == PlaybackState::CANCELLED);

    listener.indices.clear();
    REQUIRE(scheduler.start(make_trace(2), speed_for_delay(10)));
    CHECK(scheduler.state() == PlaybackState::RUNNING);
    CHECK(scheduler.run_id() == first + 1);
    scheduler.tick(20);
    CHECK(listener.indices == std::vector<std::size_t>{0, 1});
    CHECK(listener.completions == 1);
    CHECK(scheduler.state() == PlaybackState::IDLE);
}

TEST_CASE("Cancelling and restarting from a step callback never mixes runs", "[scheduler]") {
    RecordingListener listener;
    PlaybackScheduler scheduler(&listener);
    auto second_trace = make_trace(2);

    listener.on_step_hook = [&](std::size_t index) {
        if (index == 1 && scheduler.run_id() == 1) {
            scheduler.cancel();
            scheduler.start(second_trace, speed_for_delay(10));
        }
    };

    REQUIRE(scheduler.start(make_trace(5), speed_for_delay(10)));
    scheduler.tick(10);
    CHECK(scheduler.run_id() == 2);
    CHECK(listener.indices == std::vector<std::size_t>{0, 1, 0});

    scheduler.tick(100);
    CHECK(listener.indices == std::vector<std::size_t>{0, 1, 0, 1});
    CHECK(listener.completions == 1);
}

TEST_CASE("Speed changes apply from the next scheduled delay", "[scheduler]") {
    RecordingListener listener;
    PlaybackScheduler scheduler(&listener);
    REQUIRE(scheduler.start(make_trace(3), speed_for_delay(100)));

    scheduler.set_speed(speed_for_delay(20));
    CHECK(*scheduler.time_to_next() == 100);
    scheduler.tick(100);
    CHECK(listener.indices.size() == 2);
    CHECK(*scheduler.time_to_next() == 20);

    scheduler.set_speed(-5);
    CHECK(scheduler.speed() == MIN_DELAY_MS);
}
