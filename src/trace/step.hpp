#pragma once

/// @file step.hpp
/// @brief The shared event vocabulary every trace generator emits.
///
/// A Step is one narrated state change: a closed kind, the entities it
/// touches, a payload whose shape is fixed by the kind, and a sentence for
/// the user. Steps never hold pointers into the structure that produced
/// them, so a trace stays valid after that structure is gone.

#include "core/errors.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace algoscope {

/// Every kind of event a trace can contain
enum class StepKind {
    COMPARE,   ///< Subjects are being compared
    SWAP,      ///< Two array positions exchange values
    SHIFT,     ///< a[to] = a[from], subjects [from, to]
    OVERWRITE, ///< One array position receives the payload value
    MARK,      ///< A subject takes a role (pivot, candidate, key)
    FINALIZED, ///< An index holds its terminal sorted value from now on
    RANGE,     ///< Binary search announces the active range [low, high]
    NARROW,    ///< Binary search discards half of the range
    FOUND,
    NOT_FOUND,
    NOTICE, ///< Something the user must be told (e.g. automatic sort)
    START,
    VISIT,    ///< Subject is processed and appended to the visit accumulator
    SCHEDULE, ///< Subject enters the BFS queue or DFS stack
    SETTLE,   ///< Pathfinder dequeues a node with its current scores
    RELAX,    ///< Pathfinder improves a node's scores, subjects [node, via]
    PATH,
    COMPLETE,
    INSERT, ///< Tree node attached, subjects [node, parent]
    APPEND, ///< List node appended, subjects [node, previous tail]
    UNLINK, ///< List node removed, subjects [node, predecessor]
};

/// Returns the stable name of a step kind
[[nodiscard]] constexpr std::string_view step_kind_name(StepKind kind) {
    switch (kind) {
    case StepKind::COMPARE:
        return "compare";
    case StepKind::SWAP:
        return "swap";
    case StepKind::SHIFT:
        return "shift";
    case StepKind::OVERWRITE:
        return "overwrite";
    case StepKind::MARK:
        return "mark";
    case StepKind::FINALIZED:
        return "finalized";
    case StepKind::RANGE:
        return "range";
    case StepKind::NARROW:
        return "narrow";
    case StepKind::FOUND:
        return "found";
    case StepKind::NOT_FOUND:
        return "not_found";
    case StepKind::NOTICE:
        return "notice";
    case StepKind::START:
        return "start";
    case StepKind::VISIT:
        return "visit";
    case StepKind::SCHEDULE:
        return "schedule";
    case StepKind::SETTLE:
        return "settle";
    case StepKind::RELAX:
        return "relax";
    case StepKind::PATH:
        return "path";
    case StepKind::COMPLETE:
        return "complete";
    case StepKind::INSERT:
        return "insert";
    case StepKind::APPEND:
        return "append";
    case StepKind::UNLINK:
        return "unlink";
    }
    return "unknown";
}

/// How a subject identifies the entity it refers to
enum class SubjectType { INDEX, LABEL, NODE };

/// Reference to one entity: an array position, a graph label, or a stable
/// arena id of a tree/list node (with its display label).
struct Subject {
    SubjectType type = SubjectType::INDEX;
    std::size_t id = 0; ///< Array position or arena node id; unused for LABEL
    std::string label;  ///< Graph label or node display label; empty for INDEX

    [[nodiscard]] static Subject index(std::size_t position);
    [[nodiscard]] static Subject named(std::string label);
    [[nodiscard]] static Subject node(std::size_t node_id, std::string label);
};

bool operator==(const Subject& a, const Subject& b);
bool operator!=(const Subject& a, const Subject& b);

// --- Payloads (one alternative per kind, see payload_matches) ---

struct NoPayload {};

/// OVERWRITE: the value written
struct ValuePayload {
    double value = 0.0;
};

enum class MarkRole { PIVOT, CANDIDATE, KEY };

/// MARK: the role the subject takes
struct MarkPayload {
    MarkRole role = MarkRole::PIVOT;
};

/// RANGE / NARROW: search bounds; low > high means the range is empty
struct RangePayload {
    long low = 0;
    long high = 0;
};

/// NOTICE: the condition being reported
struct NoticePayload {
    ErrorCode code = ErrorCode::UNSORTED_INPUT_FOR_BINARY_SEARCH;
};

enum class Frontier { QUEUE, STACK };

/// SCHEDULE: which frontier the subject entered
struct FrontierPayload {
    Frontier frontier = Frontier::QUEUE;
};

/// SETTLE / RELAX: cost from the start and priority used by the queue
/// (equal to cost for Dijkstra, cost + heuristic for A*)
struct ScorePayload {
    double cost = 0.0;
    double estimate = 0.0;
};

/// PATH: the reconstructed path and its total edge weight
struct PathPayload {
    std::vector<std::string> nodes;
    double total_weight = 0.0;
};

enum class ChildSide { ROOT, LEFT, RIGHT };

/// INSERT: where the new tree node was attached
struct LinkPayload {
    ChildSide side = ChildSide::ROOT;
};

/// UNLINK: whether the removed node was the head
struct UnlinkPayload {
    bool was_head = false;
};

using Payload = std::variant<NoPayload, ValuePayload, MarkPayload, RangePayload, NoticePayload,
                             FrontierPayload, ScorePayload, PathPayload, LinkPayload, UnlinkPayload>;

bool operator==(const NoPayload&, const NoPayload&);
bool operator==(const ValuePayload& a, const ValuePayload& b);
bool operator==(const MarkPayload& a, const MarkPayload& b);
bool operator==(const RangePayload& a, const RangePayload& b);
bool operator==(const NoticePayload& a, const NoticePayload& b);
bool operator==(const FrontierPayload& a, const FrontierPayload& b);
bool operator==(const ScorePayload& a, const ScorePayload& b);
bool operator==(const PathPayload& a, const PathPayload& b);
bool operator==(const LinkPayload& a, const LinkPayload& b);
bool operator==(const UnlinkPayload& a, const UnlinkPayload& b);

/// One atomic, narrated event in a trace
struct Step {
    StepKind kind = StepKind::COMPARE;
    std::vector<Subject> subjects;
    Payload payload;
    std::string narrative;
};

bool operator==(const Step& a, const Step& b);
bool operator!=(const Step& a, const Step& b);

/// Whether the payload alternative is the one fixed for this kind
[[nodiscard]] bool payload_matches(StepKind kind, const Payload& payload);

/// Checks payload shape and subject count against the kind.
/// @throws std::logic_error describing the mismatch
void validate_step(const Step& step);

} // namespace algoscope
