/// @file searching.cpp
/// @brief Linear and binary search trace generation

#include "algorithms/searching.hpp"

#include "algorithms/sorting.hpp"
#include "core/value_format.hpp"

#include <algorithm>
#include <string>

namespace algoscope {

Trace linear_search(const std::vector<double>& values, double target) {
    TraceRecorder rec;
    const std::string wanted = format_value(target);

    for (std::size_t i = 0; i < values.size(); i++) {
        rec.record(StepKind::COMPARE, {Subject::index(i)},
                   "Checking index " + std::to_string(i) + ": is " + format_value(values[i]) +
                       " equal to " + wanted + "?");
        if (values[i] == target) {
            rec.record(StepKind::FOUND, {Subject::index(i)},
                       "Found " + wanted + " at index " + std::to_string(i) + ".");
            return rec.finish(SearchOutcome{true, i});
        }
    }

    rec.record(StepKind::NOT_FOUND, {}, wanted + " is not in the array.");
    return rec.finish(SearchOutcome{false, std::nullopt});
}

BinarySearchResult binary_search(const std::vector<double>& values, double target) {
    BinarySearchResult result;
    result.searched = values;
    TraceRecorder rec;
    const std::string wanted = format_value(target);

    if (!is_sorted(values, SortOrder::ASCENDING)) {
        std::sort(result.searched.begin(), result.searched.end());
        result.auto_sorted = true;
        rec.record(StepKind::NOTICE, {},
                   "Binary search needs a sorted array, so the array was sorted first.",
                   NoticePayload{ErrorCode::UNSORTED_INPUT_FOR_BINARY_SEARCH});
    }

    const std::vector<double>& arr = result.searched;
    long low = 0;
    long high = static_cast<long>(arr.size()) - 1;

    while (low <= high) {
        rec.record(StepKind::RANGE,
                   {Subject::index(static_cast<std::size_t>(low)),
                    Subject::index(static_cast<std::size_t>(high))},
                   "Searching between index " + std::to_string(low) + " and " +
                       std::to_string(high) + ".",
                   RangePayload{low, high});

        long mid = low + (high - low) / 2;
        Subject at_mid = Subject::index(static_cast<std::size_t>(mid));
        double probe = arr[static_cast<std::size_t>(mid)];
        rec.record(StepKind::COMPARE, {at_mid},
                   "Checking middle element " + format_value(probe) + " at index " +
                       std::to_string(mid) + ".");

        if (probe == target) {
            rec.record(StepKind::FOUND, {at_mid},
                       "Found " + wanted + " at index " + std::to_string(mid) + ".");
            result.trace = rec.finish(SearchOutcome{true, static_cast<std::size_t>(mid)});
            return result;
        }

        std::string half;
        if (probe < target) {
            low = mid + 1;
            half = format_value(probe) + " is smaller than " + wanted +
                   ", discarding the left half.";
        } else {
            high = mid - 1;
            half = format_value(probe) + " is larger than " + wanted +
                   ", discarding the right half.";
        }
        rec.record(StepKind::NARROW, {at_mid}, half, RangePayload{low, high});
    }

    rec.record(StepKind::NOT_FOUND, {}, wanted + " is not in the array.");
    result.trace = rec.finish(SearchOutcome{false, std::nullopt});
    return result;
}

} // namespace algoscope
