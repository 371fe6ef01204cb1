/// @file sorting.cpp
/// @brief Trace generators for bubble, selection, insertion, quick, merge and heap sort

#include "algorithms/sorting.hpp"

#include "core/value_format.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace algoscope {

namespace {

Subject at(std::size_t index) {
    return Subject::index(index);
}

Subject at(long index) {
    return Subject::index(static_cast<std::size_t>(index));
}

std::string v(double value) {
    return format_value(value);
}

/// "minimum" for ascending, "maximum" for descending
const char* extreme_word(SortOrder order) {
    return order == SortOrder::ASCENDING ? "minimum" : "maximum";
}

/// The value bubble sort and heap sort carry to the end of the array
const char* outermost_word(SortOrder order) {
    return order == SortOrder::ASCENDING ? "Largest" : "Smallest";
}

void finalize_all(TraceRecorder& rec, const std::vector<double>& arr) {
    for (std::size_t i = 0; i < arr.size(); i++) {
        rec.record(StepKind::FINALIZED, {at(i)},
                   "Element " + v(arr[i]) + " is in its final position.");
    }
}

// --- Quick sort ---

long partition(std::vector<double>& arr, long low, long high, SortOrder order,
               TraceRecorder& rec) {
    double pivot = arr[high];
    rec.record(StepKind::MARK, {at(high)}, "Selecting " + v(pivot) + " as the pivot.",
               MarkPayload{MarkRole::PIVOT});

    long store = low;
    for (long j = low; j < high; j++) {
        rec.record(StepKind::COMPARE, {at(j), at(high)},
                   "Comparing " + v(arr[j]) + " with pivot " + v(pivot) + ".");
        if (!precedes(pivot, arr[j], order)) {
            if (store != j) {
                rec.record(StepKind::SWAP, {at(store), at(j)},
                           "Swapping " + v(arr[store]) + " and " + v(arr[j]) + ".");
                std::swap(arr[store], arr[j]);
            }
            store++;
        }
    }

    if (store != high) {
        rec.record(StepKind::SWAP, {at(store), at(high)},
                   "Swapping pivot " + v(pivot) + " into its correct position.");
        std::swap(arr[store], arr[high]);
    }
    return store;
}

void quick_range(std::vector<double>& arr, long low, long high, SortOrder order,
                 TraceRecorder& rec) {
    if (low > high) {
        return;
    }
    if (low == high) {
        rec.record(StepKind::FINALIZED, {at(low)},
                   "Element " + v(arr[low]) + " is alone in its range, so it is in its final "
                   "position.");
        return;
    }

    long pivot_index = partition(arr, low, high, order, rec);
    rec.record(StepKind::FINALIZED, {at(pivot_index)},
               "Pivot " + v(arr[pivot_index]) + " is in its final position.");
    quick_range(arr, low, pivot_index - 1, order, rec);
    quick_range(arr, pivot_index + 1, high, order, rec);
}

// --- Merge sort ---

void merge(std::vector<double>& arr, std::size_t low, std::size_t mid, std::size_t high,
           SortOrder order, TraceRecorder& rec) {
    // The top-level merge writes every position for the last time
    const bool final_merge = (low == 0 && high == arr.size() - 1);

    std::vector<double> merged;
    merged.reserve(high - low + 1);
    std::size_t i = low;
    std::size_t j = mid + 1;

    while (i <= mid && j <= high) {
        rec.record(StepKind::COMPARE, {at(i), at(j)},
                   "Comparing " + v(arr[i]) + " and " + v(arr[j]) + ".");
        // Take from the right run only when it strictly precedes: keeps equal values stable
        if (precedes(arr[j], arr[i], order)) {
            merged.push_back(arr[j++]);
        } else {
            merged.push_back(arr[i++]);
        }
    }
    while (i <= mid) {
        merged.push_back(arr[i++]);
    }
    while (j <= high) {
        merged.push_back(arr[j++]);
    }

    for (std::size_t k = 0; k < merged.size(); k++) {
        std::size_t target = low + k;
        rec.record(StepKind::OVERWRITE, {at(target)},
                   "Overwriting position " + std::to_string(target) + " with " + v(merged[k]) +
                       ".",
                   ValuePayload{merged[k]});
        arr[target] = merged[k];
        if (final_merge) {
            rec.record(StepKind::FINALIZED, {at(target)},
                       "Element " + v(merged[k]) + " is in its final position.");
        }
    }
}

void merge_range(std::vector<double>& arr, std::size_t low, std::size_t high, SortOrder order,
                 TraceRecorder& rec) {
    if (low >= high) {
        return;
    }
    std::size_t mid = low + (high - low) / 2;
    merge_range(arr, low, mid, order, rec);
    merge_range(arr, mid + 1, high, order, rec);
    merge(arr, low, mid, high, order, rec);
}

// --- Heap sort ---

/// Sifts arr[root] down within the first `size` elements
void sift_down(std::vector<double>& arr, std::size_t size, std::size_t root, SortOrder order,
               TraceRecorder& rec) {
    const char* child_word = (order == SortOrder::ASCENDING) ? "larger" : "smaller";

    while (true) {
        std::size_t best = root;
        for (std::size_t child : {2 * root + 1, 2 * root + 2}) {
            if (child >= size) {
                continue;
            }
            rec.record(StepKind::COMPARE, {at(child), at(best)},
                       "Comparing child " + v(arr[child]) + " with " + v(arr[best]) + ".");
            // Max-heap for ascending, min-heap for descending
            if (precedes(arr[best], arr[child], order)) {
                best = child;
            }
        }
        if (best == root) {
            return;
        }
        rec.record(StepKind::SWAP, {at(root), at(best)},
                   "Swapping " + v(arr[root]) + " with its " + child_word + " child " +
                       v(arr[best]) + ".");
        std::swap(arr[root], arr[best]);
        root = best;
    }
}

} // namespace

bool is_sorted(const std::vector<double>& values, SortOrder order) {
    for (std::size_t i = 1; i < values.size(); i++) {
        if (precedes(values[i], values[i - 1], order)) {
            return false;
        }
    }
    return true;
}

Trace bubble_sort(const std::vector<double>& values, SortOrder order) {
    std::vector<double> arr = values;
    TraceRecorder rec;
    const std::size_t n = arr.size();

    for (std::size_t pass = 0; pass + 1 < n; pass++) {
        std::size_t last = n - 1 - pass;
        for (std::size_t j = 0; j < last; j++) {
            rec.record(StepKind::COMPARE, {at(j), at(j + 1)},
                       "Comparing adjacent elements " + v(arr[j]) + " and " + v(arr[j + 1]) +
                           ".");
            if (precedes(arr[j + 1], arr[j], order)) {
                rec.record(StepKind::SWAP, {at(j), at(j + 1)},
                           "Swapping " + v(arr[j]) + " and " + v(arr[j + 1]) +
                               " because they are out of order.");
                std::swap(arr[j], arr[j + 1]);
            }
        }
        rec.record(StepKind::FINALIZED, {at(last)},
                   std::string(outermost_word(order)) + " unsorted element " + v(arr[last]) +
                       " is now in its final position.");
    }
    if (n > 0) {
        rec.record(StepKind::FINALIZED, {at(std::size_t{0})},
                   "Element " + v(arr[0]) + " is in its final position. Array is fully sorted!");
    }
    return rec.finish(SortedArray{arr});
}

Trace selection_sort(const std::vector<double>& values, SortOrder order) {
    std::vector<double> arr = values;
    TraceRecorder rec;
    const std::size_t n = arr.size();
    const std::string extreme = extreme_word(order);

    for (std::size_t i = 0; i < n; i++) {
        std::size_t best = i;
        if (i + 1 < n) {
            rec.record(StepKind::MARK, {at(i)},
                       "Starting pass " + std::to_string(i + 1) + ". Assuming " + v(arr[i]) +
                           " is the " + extreme + ".",
                       MarkPayload{MarkRole::CANDIDATE});
        }

        for (std::size_t j = i + 1; j < n; j++) {
            rec.record(StepKind::COMPARE, {at(j), at(best)},
                       "Comparing " + v(arr[j]) + " with current " + extreme + " " +
                           v(arr[best]) + ".");
            if (precedes(arr[j], arr[best], order)) {
                rec.record(StepKind::MARK, {at(j)}, v(arr[j]) + " is the new " + extreme + ".",
                           MarkPayload{MarkRole::CANDIDATE});
                best = j;
            }
        }

        if (best != i) {
            rec.record(StepKind::SWAP, {at(i), at(best)},
                       "Swapping " + v(arr[i]) + " with the " + extreme + " element " +
                           v(arr[best]) + ".");
            std::swap(arr[i], arr[best]);
        }
        rec.record(StepKind::FINALIZED, {at(i)},
                   "Element " + v(arr[i]) + " is now in its final sorted position.");
    }
    return rec.finish(SortedArray{arr});
}

Trace insertion_sort(const std::vector<double>& values, SortOrder order) {
    std::vector<double> arr = values;
    TraceRecorder rec;

    for (std::size_t i = 1; i < arr.size(); i++) {
        double key = arr[i];
        rec.record(StepKind::MARK, {at(i)}, "Picking up " + v(key) + " as the key to insert.",
                   MarkPayload{MarkRole::KEY});

        std::size_t hole = i;
        while (hole > 0) {
            rec.record(StepKind::COMPARE, {at(hole - 1), at(hole)},
                       "Comparing key " + v(key) + " with " + v(arr[hole - 1]) + ".");
            // Strict comparison: equal elements are never shifted past each other
            if (!precedes(key, arr[hole - 1], order)) {
                break;
            }
            rec.record(StepKind::SHIFT, {at(hole - 1), at(hole)},
                       "Shifting " + v(arr[hole - 1]) + " to the right to make space for the key.");
            arr[hole] = arr[hole - 1];
            hole--;
        }

        arr[hole] = key;
        rec.record(StepKind::OVERWRITE, {at(hole)},
                   "Placing " + v(key) + " in its correct sorted position.", ValuePayload{key});
    }

    finalize_all(rec, arr);
    return rec.finish(SortedArray{arr});
}

Trace quick_sort(const std::vector<double>& values, SortOrder order) {
    std::vector<double> arr = values;
    TraceRecorder rec;
    quick_range(arr, 0, static_cast<long>(arr.size()) - 1, order, rec);
    return rec.finish(SortedArray{arr});
}

Trace merge_sort(const std::vector<double>& values, SortOrder order) {
    std::vector<double> arr = values;
    TraceRecorder rec;

    if (arr.size() == 1) {
        finalize_all(rec, arr);
    } else if (arr.size() > 1) {
        merge_range(arr, 0, arr.size() - 1, order, rec);
    }
    return rec.finish(SortedArray{arr});
}

Trace heap_sort(const std::vector<double>& values, SortOrder order) {
    std::vector<double> arr = values;
    TraceRecorder rec;
    const std::size_t n = arr.size();

    for (std::size_t i = n / 2; i-- > 0;) {
        sift_down(arr, n, i, order, rec);
    }

    for (std::size_t end = n; end-- > 1;) {
        rec.record(StepKind::SWAP, {at(std::size_t{0}), at(end)},
                   "Swapping root " + v(arr[0]) + " with last heap element " + v(arr[end]) +
                       ".");
        std::swap(arr[0], arr[end]);
        rec.record(StepKind::FINALIZED, {at(end)},
                   std::string(outermost_word(order)) + " remaining element " + v(arr[end]) +
                       " is in its final position.");
        sift_down(arr, end, 0, order, rec);
    }
    if (n > 0) {
        rec.record(StepKind::FINALIZED, {at(std::size_t{0})},
                   "Element " + v(arr[0]) + " is in its final position.");
    }
    return rec.finish(SortedArray{arr});
}

Trace run_sort(SortAlgorithm algorithm, const std::vector<double>& values, SortOrder order) {
    switch (algorithm) {
    case SortAlgorithm::BUBBLE:
        return bubble_sort(values, order);
    case SortAlgorithm::SELECTION:
        return selection_sort(values, order);
    case SortAlgorithm::INSERTION:
        return insertion_sort(values, order);
    case SortAlgorithm::QUICK:
        return quick_sort(values, order);
    case SortAlgorithm::MERGE:
        return merge_sort(values, order);
    case SortAlgorithm::HEAP:
        return heap_sort(values, order);
    }
    throw std::invalid_argument("Unknown sorting algorithm");
}

} // namespace algoscope
