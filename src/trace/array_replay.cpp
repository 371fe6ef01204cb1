/// @file array_replay.cpp
/// @brief Implements array step replay

#include "trace/array_replay.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace algoscope {

namespace {

std::size_t checked_index(const std::vector<double>& values, const Subject& subject) {
    if (subject.type != SubjectType::INDEX || subject.id >= values.size()) {
        throw std::out_of_range("Array step refers to an invalid index");
    }
    return subject.id;
}

} // namespace

void apply_array_step(std::vector<double>& values, const Step& step) {
    switch (step.kind) {
    case StepKind::SWAP: {
        std::size_t a = checked_index(values, step.subjects[0]);
        std::size_t b = checked_index(values, step.subjects[1]);
        std::swap(values[a], values[b]);
        break;
    }
    case StepKind::SHIFT: {
        std::size_t from = checked_index(values, step.subjects[0]);
        std::size_t to = checked_index(values, step.subjects[1]);
        values[to] = values[from];
        break;
    }
    case StepKind::OVERWRITE: {
        std::size_t at = checked_index(values, step.subjects[0]);
        values[at] = std::get<ValuePayload>(step.payload).value;
        break;
    }
    default:
        break;
    }
}

std::vector<double> replay_prefix(const std::vector<double>& initial, const Trace& trace,
                                  std::size_t count) {
    std::vector<double> values = initial;
    std::size_t limit = std::min(count, trace.size());
    for (std::size_t i = 0; i < limit; i++) {
        apply_array_step(values, trace.steps()[i]);
    }
    return values;
}

} // namespace algoscope
