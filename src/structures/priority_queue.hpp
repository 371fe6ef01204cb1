#pragma once

/// @file priority_queue.hpp
/// @brief Binary-heap priority queue with a fixed ordering direction.
///
/// Keys are not unique: a caller that finds a better priority for a key
/// inserts it again, and must discard stale entries on extraction by
/// comparing the extracted priority with the best value it knows for that
/// key (lazy deletion). Entries with equal priority come out in insertion
/// order, which keeps every trace that depends on the queue deterministic.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace algoscope {

/// Which priority is extracted first
enum class QueueOrder { MIN_FIRST, MAX_FIRST };

template <typename Key>
struct QueueEntry {
    Key key;
    double priority = 0.0;
};

template <typename Key>
class PriorityQueue {
  public:
    explicit PriorityQueue(QueueOrder order = QueueOrder::MIN_FIRST) : order_(order) {}

    /// Adds an entry. O(log n).
    void insert(Key key, double priority) {
        heap_.push_back({{std::move(key), priority}, next_sequence_++});
        std::push_heap(heap_.begin(), heap_.end(), HeapCompare{order_});
    }

    /// Removes and returns the entry with the best priority. O(log n).
    /// @throws std::out_of_range if the queue is empty
    [[nodiscard]] QueueEntry<Key> extract_best() {
        if (heap_.empty()) {
            throw std::out_of_range("extract_best() on an empty priority queue");
        }
        std::pop_heap(heap_.begin(), heap_.end(), HeapCompare{order_});
        QueueEntry<Key> best = std::move(heap_.back().entry);
        heap_.pop_back();
        return best;
    }

    [[nodiscard]] bool is_empty() const { return heap_.empty(); }
    [[nodiscard]] std::size_t size() const { return heap_.size(); }
    [[nodiscard]] QueueOrder order() const { return order_; }

  private:
    struct Slot {
        QueueEntry<Key> entry;
        std::uint64_t sequence;
    };

    /// "a sits below b in the heap": std heaps keep the greatest element on top
    struct HeapCompare {
        QueueOrder order;

        bool operator()(const Slot& a, const Slot& b) const {
            if (a.entry.priority != b.entry.priority) {
                return order == QueueOrder::MIN_FIRST ? a.entry.priority > b.entry.priority
                                                      : a.entry.priority < b.entry.priority;
            }
            return a.sequence > b.sequence; // Earlier insertions win ties
        }
    };

    std::vector<Slot> heap_;
    QueueOrder order_;
    std::uint64_t next_sequence_ = 0;
};

} // namespace algoscope
