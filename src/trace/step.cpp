/// @file step.cpp
/// @brief Step equality and per-kind shape validation

#include "trace/step.hpp"

#include <stdexcept>
#include <utility>

namespace algoscope {

Subject Subject::index(std::size_t position) {
    return {SubjectType::INDEX, position, {}};
}

Subject Subject::named(std::string label) {
    return {SubjectType::LABEL, 0, std::move(label)};
}

Subject Subject::node(std::size_t node_id, std::string label) {
    return {SubjectType::NODE, node_id, std::move(label)};
}

bool operator==(const Subject& a, const Subject& b) {
    return a.type == b.type && a.id == b.id && a.label == b.label;
}

bool operator!=(const Subject& a, const Subject& b) {
    return !(a == b);
}

bool operator==(const NoPayload&, const NoPayload&) {
    return true;
}
bool operator==(const ValuePayload& a, const ValuePayload& b) {
    return a.value == b.value;
}
bool operator==(const MarkPayload& a, const MarkPayload& b) {
    return a.role == b.role;
}
bool operator==(const RangePayload& a, const RangePayload& b) {
    return a.low == b.low && a.high == b.high;
}
bool operator==(const NoticePayload& a, const NoticePayload& b) {
    return a.code == b.code;
}
bool operator==(const FrontierPayload& a, const FrontierPayload& b) {
    return a.frontier == b.frontier;
}
bool operator==(const ScorePayload& a, const ScorePayload& b) {
    return a.cost == b.cost && a.estimate == b.estimate;
}
bool operator==(const PathPayload& a, const PathPayload& b) {
    return a.nodes == b.nodes && a.total_weight == b.total_weight;
}
bool operator==(const LinkPayload& a, const LinkPayload& b) {
    return a.side == b.side;
}
bool operator==(const UnlinkPayload& a, const UnlinkPayload& b) {
    return a.was_head == b.was_head;
}

bool operator==(const Step& a, const Step& b) {
    return a.kind == b.kind && a.subjects == b.subjects && a.payload == b.payload &&
           a.narrative == b.narrative;
}

bool operator!=(const Step& a, const Step& b) {
    return !(a == b);
}

namespace {

/// Inclusive bounds on the number of subjects a kind carries
struct SubjectBounds {
    std::size_t min;
    std::size_t max;
};

constexpr std::size_t ANY = static_cast<std::size_t>(-1);

SubjectBounds subject_bounds(StepKind kind) {
    switch (kind) {
    case StepKind::COMPARE:
        return {1, ANY};
    case StepKind::SWAP:
    case StepKind::SHIFT:
    case StepKind::RANGE:
        return {2, 2};
    case StepKind::OVERWRITE:
    case StepKind::MARK:
    case StepKind::FINALIZED:
    case StepKind::NARROW:
    case StepKind::FOUND:
    case StepKind::START:
    case StepKind::VISIT:
    case StepKind::SCHEDULE:
    case StepKind::SETTLE:
        return {1, 1};
    case StepKind::RELAX:
        return {2, 2};
    case StepKind::PATH:
        return {1, ANY};
    case StepKind::NOT_FOUND:
    case StepKind::NOTICE:
    case StepKind::COMPLETE:
        return {0, 0};
    case StepKind::INSERT:
    case StepKind::APPEND:
    case StepKind::UNLINK:
        return {1, 2};
    }
    return {0, ANY};
}

} // namespace

bool payload_matches(StepKind kind, const Payload& payload) {
    switch (kind) {
    case StepKind::OVERWRITE:
        return std::holds_alternative<ValuePayload>(payload);
    case StepKind::MARK:
        return std::holds_alternative<MarkPayload>(payload);
    case StepKind::RANGE:
    case StepKind::NARROW:
        return std::holds_alternative<RangePayload>(payload);
    case StepKind::NOTICE:
        return std::holds_alternative<NoticePayload>(payload);
    case StepKind::SCHEDULE:
        return std::holds_alternative<FrontierPayload>(payload);
    case StepKind::SETTLE:
    case StepKind::RELAX:
        return std::holds_alternative<ScorePayload>(payload);
    case StepKind::PATH:
        return std::holds_alternative<PathPayload>(payload);
    case StepKind::INSERT:
        return std::holds_alternative<LinkPayload>(payload);
    case StepKind::UNLINK:
        return std::holds_alternative<UnlinkPayload>(payload);
    default:
        return std::holds_alternative<NoPayload>(payload);
    }
}

void validate_step(const Step& step) {
    const std::string name(step_kind_name(step.kind));

    if (!payload_matches(step.kind, step.payload)) {
        throw std::logic_error("Step '" + name + "' carries the wrong payload type");
    }

    SubjectBounds bounds = subject_bounds(step.kind);
    std::size_t count = step.subjects.size();
    if (count < bounds.min || count > bounds.max) {
        throw std::logic_error("Step '" + name + "' has " + std::to_string(count) +
                               " subjects");
    }

    if (const auto* path = std::get_if<PathPayload>(&step.payload)) {
        if (path->nodes.size() != count) {
            throw std::logic_error("Path step subjects must match the path nodes");
        }
    }
}

} // namespace algoscope
