/// @file playback_scheduler.hpp
/// @brief Replays a recorded trace one step at a time under timing control.
///
/// The scheduler owns no clock. The host advances it with tick(elapsed_ms)
/// once per frame (or from a timer), and every time a full delay has
/// elapsed exactly one step is handed to the listener. After the last step
/// one more delay passes before completion is reported.

#pragma once

#include "trace/trace.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace algoscope {

/// IDLE before the first run and after a run completes. cancel() leaves
/// CANCELLED rather than IDLE so the host can tell a stopped run from a
/// finished one; start() accepts CANCELLED exactly like IDLE.
enum class PlaybackState { IDLE, RUNNING, CANCELLED };

/// Receives the steps of a running playback
class PlaybackListener {
  public:
    virtual ~PlaybackListener() = default;

    /// Called by start() before the first step is emitted
    virtual void on_start(const Trace& /*trace*/) {}

    /// One step; `index` counts from 0 within the current run
    virtual void on_step(const Step& step, std::size_t index) = 0;

    /// The run reached its end naturally. Never called for a cancelled run.
    virtual void on_complete(const FinalArtifact& artifact) = 0;
};

/// Converts a speed setting to the delay between steps (higher speed = shorter delay)
[[nodiscard]] int delay_for_speed(int speed);

/// Idle -> Running -> (Idle | Cancelled) state machine over one trace at a time.
///
/// Usage:
///   1. Construct with a listener that outlives the scheduler
///   2. start() a shared trace; step 0 is emitted immediately
///   3. Call tick(elapsed_ms) from the host loop
///   4. cancel() to abandon the run without completion
class PlaybackScheduler {
  public:
    /// @param listener Non-owning; must stay valid for the scheduler's lifetime
    /// @throws std::invalid_argument if listener is null
    explicit PlaybackScheduler(PlaybackListener* listener);

    /// Begins a new run at the given speed.
    /// @return false (and changes nothing) while a run is in progress
    /// @throws std::invalid_argument if trace is null
    bool start(std::shared_ptr<const Trace> trace, int speed);

    /// Abandons the current run: the pending timer is dropped, remaining
    /// steps are discarded and no completion is reported.
    /// @return false if nothing was running
    bool cancel();

    /// Clamped to [MIN_DELAY_MS, MAX_DELAY_MS]. Takes effect from the next
    /// delay that is scheduled; a delay already counting down keeps its length.
    void set_speed(int speed);

    /// Advances time by elapsed_ms, firing every timer that expires
    void tick(int elapsed_ms);

    [[nodiscard]] PlaybackState state() const { return state_; }
    [[nodiscard]] bool is_running() const { return state_ == PlaybackState::RUNNING; }
    [[nodiscard]] int speed() const { return speed_; }
    [[nodiscard]] int delay_ms() const { return delay_for_speed(speed_); }

    /// Identifier of the latest run; increments on every successful start()
    [[nodiscard]] std::uint64_t run_id() const { return run_id_; }

    /// Number of steps emitted in the current (or last) run
    [[nodiscard]] std::size_t emitted() const { return next_index_; }

    /// The trace of the current (or last) run; null before the first start()
    [[nodiscard]] const std::shared_ptr<const Trace>& trace() const { return trace_; }

    /// Milliseconds until the pending timer fires, if one is pending
    [[nodiscard]] std::optional<int> time_to_next() const;

  private:
    /// A countdown tagged with the run that scheduled it
    struct PendingTimer {
        std::uint64_t run_id;
        int remaining_ms;
    };

    /// Emits the next step, or completes the run once all steps are out
    void fire();

    void schedule_next();

    PlaybackListener* listener_;
    std::shared_ptr<const Trace> trace_;
    PlaybackState state_ = PlaybackState::IDLE;
    int speed_;
    std::uint64_t run_id_ = 0;
    std::size_t next_index_ = 0;
    std::optional<PendingTimer> timer_;
};

} // namespace algoscope
