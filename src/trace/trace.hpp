#pragma once

/// @file trace.hpp
/// @brief An immutable recorded algorithm run and the recorder that builds it

#include "trace/step.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace algoscope {

// --- Final artifacts (what the run produced, handed over on completion) ---

struct SortedArray {
    std::vector<double> values;
};

/// Search result; position is an array index or a tree/list arena id
struct SearchOutcome {
    bool found = false;
    std::optional<std::size_t> position;
};

struct PathOutcome {
    std::vector<std::string> path;
    double total_weight = 0.0;
};

/// Graph traversal order
struct VisitOrder {
    std::vector<std::string> labels;
};

/// Tree traversal accumulator, or list contents after a structural change
struct ValueSequence {
    std::vector<double> values;
};

using FinalArtifact =
    std::variant<std::monostate, SortedArray, SearchOutcome, PathOutcome, VisitOrder, ValueSequence>;

bool operator==(const SortedArray& a, const SortedArray& b);
bool operator==(const SearchOutcome& a, const SearchOutcome& b);
bool operator==(const PathOutcome& a, const PathOutcome& b);
bool operator==(const VisitOrder& a, const VisitOrder& b);
bool operator==(const ValueSequence& a, const ValueSequence& b);

/// The full ordered sequence of Steps produced by one algorithm run.
/// A Trace cannot be modified once constructed; share it by const reference
/// or std::shared_ptr<const Trace>.
class Trace {
  public:
    Trace() = default;
    Trace(std::vector<Step> steps, FinalArtifact artifact);

    [[nodiscard]] const std::vector<Step>& steps() const { return steps_; }
    [[nodiscard]] std::size_t size() const { return steps_.size(); }
    [[nodiscard]] bool empty() const { return steps_.empty(); }
    [[nodiscard]] const FinalArtifact& artifact() const { return artifact_; }

    /// @throws std::out_of_range if index >= size()
    [[nodiscard]] const Step& at(std::size_t index) const;

    /// Number of steps of the given kind
    [[nodiscard]] std::size_t count(StepKind kind) const;

  private:
    std::vector<Step> steps_;
    FinalArtifact artifact_;
};

bool operator==(const Trace& a, const Trace& b);
bool operator!=(const Trace& a, const Trace& b);

/// Accumulates Steps during generation. Every step is validated as it is
/// recorded, so a generator bug surfaces at the line that produced it.
class TraceRecorder {
  public:
    /// @throws std::logic_error if the payload or subject count does not fit the kind
    void record(StepKind kind, std::vector<Subject> subjects, std::string narrative,
                Payload payload = NoPayload{});

    [[nodiscard]] std::size_t size() const { return steps_.size(); }

    /// Hands the recorded steps over to a Trace; the recorder is left empty.
    [[nodiscard]] Trace finish(FinalArtifact artifact);

  private:
    std::vector<Step> steps_;
};

} // namespace algoscope
