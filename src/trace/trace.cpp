/// @file trace.cpp
/// @brief Implements Trace accessors and the recorder

#include "trace/trace.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace algoscope {

bool operator==(const SortedArray& a, const SortedArray& b) {
    return a.values == b.values;
}
bool operator==(const SearchOutcome& a, const SearchOutcome& b) {
    return a.found == b.found && a.position == b.position;
}
bool operator==(const PathOutcome& a, const PathOutcome& b) {
    return a.path == b.path && a.total_weight == b.total_weight;
}
bool operator==(const VisitOrder& a, const VisitOrder& b) {
    return a.labels == b.labels;
}
bool operator==(const ValueSequence& a, const ValueSequence& b) {
    return a.values == b.values;
}

Trace::Trace(std::vector<Step> steps, FinalArtifact artifact)
    : steps_(std::move(steps)), artifact_(std::move(artifact)) {}

const Step& Trace::at(std::size_t index) const {
    if (index >= steps_.size()) {
        throw std::out_of_range("Trace step index out of range");
    }
    return steps_[index];
}

std::size_t Trace::count(StepKind kind) const {
    return static_cast<std::size_t>(std::count_if(
        steps_.begin(), steps_.end(), [kind](const Step& step) { return step.kind == kind; }));
}

bool operator==(const Trace& a, const Trace& b) {
    return a.steps() == b.steps() && a.artifact() == b.artifact();
}

bool operator!=(const Trace& a, const Trace& b) {
    return !(a == b);
}

void TraceRecorder::record(StepKind kind, std::vector<Subject> subjects, std::string narrative,
                           Payload payload) {
    Step step{kind, std::move(subjects), std::move(payload), std::move(narrative)};
    validate_step(step);
    steps_.push_back(std::move(step));
}

Trace TraceRecorder::finish(FinalArtifact artifact) {
    Trace trace(std::move(steps_), std::move(artifact));
    steps_.clear();
    return trace;
}

} // namespace algoscope
