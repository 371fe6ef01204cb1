#pragma once

/// @file list_operations.hpp
/// @brief Linked list build, search and delete traces

#include "structures/linked_list.hpp"
#include "trace/trace.hpp"

#include <vector>

namespace algoscope {

/// A structural operation's trace together with the list it produced
struct ListBuildResult {
    Trace trace;
    LinkedList list;
};

/// Appends the values in order to a fresh list. Artifact: ValueSequence.
[[nodiscard]] ListBuildResult build_list(const std::vector<double>& values, ListKind kind);

/// Sequential scan from the head. Artifact: SearchOutcome whose position is the node id.
[[nodiscard]] Trace search_list(const LinkedList& list, double target);

/// Removes the first node holding `target` from a copy of `list`.
/// The head is handled separately; an interior node is found by scanning
/// for its predecessor. Artifact: ValueSequence of the resulting list.
[[nodiscard]] ListBuildResult delete_from_list(const LinkedList& list, double target);

} // namespace algoscope
