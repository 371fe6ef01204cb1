/// @file playback_scheduler.cpp
/// @brief Implements timed trace playback

#include "timing/playback_scheduler.hpp"

#include "core/config.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace algoscope {

int delay_for_speed(int speed) {
    int clamped = std::clamp(speed, MIN_DELAY_MS, MAX_DELAY_MS);
    return MAX_DELAY_MS - clamped + MIN_DELAY_MS;
}

PlaybackScheduler::PlaybackScheduler(PlaybackListener* listener)
    : listener_(listener), speed_(DEFAULT_SPEED) {
    if (listener_ == nullptr) {
        throw std::invalid_argument("PlaybackScheduler needs a listener");
    }
}

bool PlaybackScheduler::start(std::shared_ptr<const Trace> trace, int speed) {
    if (state_ == PlaybackState::RUNNING) {
        return false;
    }
    if (!trace) {
        throw std::invalid_argument("PlaybackScheduler::start() needs a trace");
    }

    trace_ = std::move(trace);
    set_speed(speed);
    run_id_++;
    next_index_ = 0;
    timer_.reset();
    state_ = PlaybackState::RUNNING;

    std::uint64_t run = run_id_;
    listener_->on_start(*trace_);
    if (state_ != PlaybackState::RUNNING || run_id_ != run) {
        return true; // Cancelled from inside on_start
    }
    fire();
    return true;
}

bool PlaybackScheduler::cancel() {
    if (state_ != PlaybackState::RUNNING) {
        return false;
    }
    timer_.reset();
    state_ = PlaybackState::CANCELLED;
    return true;
}

void PlaybackScheduler::set_speed(int speed) {
    speed_ = std::clamp(speed, MIN_DELAY_MS, MAX_DELAY_MS);
}

void PlaybackScheduler::tick(int elapsed_ms) {
    int budget = std::max(elapsed_ms, 0);

    while (timer_) {
        if (budget < timer_->remaining_ms) {
            timer_->remaining_ms -= budget;
            return;
        }
        budget -= timer_->remaining_ms;
        PendingTimer expired = *timer_;
        timer_.reset();
        // A timer from an earlier run never fires into a newer one
        if (expired.run_id != run_id_ || state_ != PlaybackState::RUNNING) {
            return;
        }
        fire();
    }
}

std::optional<int> PlaybackScheduler::time_to_next() const {
    if (!timer_) {
        return std::nullopt;
    }
    return timer_->remaining_ms;
}

void PlaybackScheduler::fire() {
    if (next_index_ >= trace_->size()) {
        state_ = PlaybackState::IDLE;
        listener_->on_complete(trace_->artifact());
        return;
    }

    std::uint64_t run = run_id_;
    std::size_t index = next_index_++;
    listener_->on_step(trace_->at(index), index);

    // The listener may have cancelled (or cancelled and restarted) the run
    if (state_ == PlaybackState::RUNNING && run_id_ == run) {
        schedule_next();
    }
}

void PlaybackScheduler::schedule_next() {
    timer_ = PendingTimer{run_id_, delay_ms()};
}

} // namespace algoscope
