#pragma once

/// @file searching.hpp
/// @brief Trace generators for linear and binary search

#include "trace/trace.hpp"

#include <string_view>
#include <vector>

namespace algoscope {

enum class SearchAlgorithm { LINEAR, BINARY };

[[nodiscard]] constexpr std::string_view search_algorithm_name(SearchAlgorithm algorithm) {
    switch (algorithm) {
    case SearchAlgorithm::LINEAR:
        return "Linear Search";
    case SearchAlgorithm::BINARY:
        return "Binary Search";
    }
    return "Search";
}

/// Binary search output. When the input was not ascending, `searched` is
/// the sorted copy the trace indexes into and `auto_sorted` is set; the
/// caller is expected to show that copy instead of the original.
struct BinarySearchResult {
    Trace trace;
    std::vector<double> searched;
    bool auto_sorted = false;
};

/// Checks every index in order until the first match
[[nodiscard]] Trace linear_search(const std::vector<double>& values, double target);

/// Halves [low, high] around mid = (low + high) / 2 until the target is hit
/// or the range is empty. An unsorted input is sorted first and the trace
/// opens with an UnsortedInputForBinarySearch notice.
[[nodiscard]] BinarySearchResult binary_search(const std::vector<double>& values, double target);

} // namespace algoscope
