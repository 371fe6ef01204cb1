#pragma once

/// @file linked_list.hpp
/// @brief Singly or doubly linked list stored in an arena

#include "structures/node_id.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace algoscope {

enum class ListKind { SINGLY, DOUBLY };

/// Returns the human-readable name of a list kind
[[nodiscard]] constexpr std::string_view list_kind_name(ListKind kind) {
    switch (kind) {
    case ListKind::SINGLY:
        return "Singly Linked List";
    case ListKind::DOUBLY:
        return "Doubly Linked List";
    }
    return "Linked List";
}

/// A list node. `prev` is only maintained for doubly linked lists.
struct ListNode {
    double value = 0.0;
    NodeId next = NO_NODE;
    NodeId prev = NO_NODE;
    bool linked = true; ///< False once the node has been unlinked
};

/// Linked list that only grows at the tail.
///
/// Nodes live in an arena and keep their id for the lifetime of the list;
/// an unlinked node stays in the arena (marked unlinked) so ids in an
/// already recorded trace stay meaningful.
class LinkedList {
  public:
    explicit LinkedList(ListKind kind = ListKind::SINGLY) : kind_(kind) {}

    /// Appends a value after the current tail and returns the new node's id
    NodeId append(double value);

    /// Removes a linked node. `predecessor` must be the node whose `next` is
    /// `id`, or NO_NODE when `id` is the head.
    /// @throws std::invalid_argument if the links do not match
    void unlink(NodeId id, NodeId predecessor);

    [[nodiscard]] ListKind kind() const { return kind_; }
    [[nodiscard]] NodeId head() const { return head_; }
    [[nodiscard]] NodeId tail() const { return tail_; }
    [[nodiscard]] std::size_t size() const { return size_; }
    [[nodiscard]] bool empty() const { return size_ == 0; }

    /// @throws std::out_of_range for an id not in the arena
    [[nodiscard]] const ListNode& node(NodeId id) const;

    /// Values from head to tail
    [[nodiscard]] std::vector<double> values() const;

    /// Linked ids from head to tail
    [[nodiscard]] std::vector<NodeId> order() const;

    /// Verifies that forward and backward links agree (doubly) or that no
    /// backward link is set (singly), and that the tail terminates the list.
    [[nodiscard]] bool is_consistent() const;

  private:
    ListNode& mutable_node(NodeId id);

    std::vector<ListNode> nodes_;
    NodeId head_ = NO_NODE;
    NodeId tail_ = NO_NODE;
    std::size_t size_ = 0;
    ListKind kind_;
};

} // namespace algoscope
