#pragma once

/// @file sorting.hpp
/// @brief Trace generators for the six comparison sorts.
///
/// Every generator takes the element sequence by value semantics (the
/// caller's vector is never touched) and returns a Trace whose artifact is
/// a SortedArray. Descending order flips the comparator itself, so every
/// narrative in the trace reads correctly for the chosen direction.

#include "trace/trace.hpp"

#include <string_view>
#include <vector>

namespace algoscope {

enum class SortOrder { ASCENDING, DESCENDING };

enum class SortAlgorithm { BUBBLE, SELECTION, INSERTION, QUICK, MERGE, HEAP };

/// Returns the human-readable name of a sorting algorithm
[[nodiscard]] constexpr std::string_view sort_algorithm_name(SortAlgorithm algorithm) {
    switch (algorithm) {
    case SortAlgorithm::BUBBLE:
        return "Bubble Sort";
    case SortAlgorithm::SELECTION:
        return "Selection Sort";
    case SortAlgorithm::INSERTION:
        return "Insertion Sort";
    case SortAlgorithm::QUICK:
        return "Quick Sort";
    case SortAlgorithm::MERGE:
        return "Merge Sort";
    case SortAlgorithm::HEAP:
        return "Heap Sort";
    }
    return "Sort";
}

/// Whether `a` must come strictly before `b` under the order
[[nodiscard]] constexpr bool precedes(double a, double b, SortOrder order) {
    return order == SortOrder::ASCENDING ? a < b : a > b;
}

/// Whether the sequence is already ordered (equal neighbours allowed)
[[nodiscard]] bool is_sorted(const std::vector<double>& values, SortOrder order);

/// Adjacent compare-and-swap passes; finalizes the last unsorted slot after each pass
[[nodiscard]] Trace bubble_sort(const std::vector<double>& values, SortOrder order);

/// Selects the minimum (maximum for descending) of the unsorted tail each pass
[[nodiscard]] Trace selection_sort(const std::vector<double>& values, SortOrder order);

/// Shifts larger elements right and places the key; stable
[[nodiscard]] Trace insertion_sort(const std::vector<double>& values, SortOrder order);

/// Lomuto partition around the last element of each range
[[nodiscard]] Trace quick_sort(const std::vector<double>& values, SortOrder order);

/// Top-down merge sort with split point low + (high - low) / 2; stable
[[nodiscard]] Trace merge_sort(const std::vector<double>& values, SortOrder order);

/// Bottom-up heap construction, then repeated root extraction
[[nodiscard]] Trace heap_sort(const std::vector<double>& values, SortOrder order);

/// Dispatches to the generator for `algorithm`
[[nodiscard]] Trace run_sort(SortAlgorithm algorithm, const std::vector<double>& values,
                             SortOrder order);

} // namespace algoscope
