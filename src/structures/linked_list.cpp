/// @file linked_list.cpp
/// @brief Tail append, unlink and link-consistency checks

#include "structures/linked_list.hpp"

#include <stdexcept>

namespace algoscope {

NodeId LinkedList::append(double value) {
    NodeId id = nodes_.size();
    nodes_.push_back({value, NO_NODE, NO_NODE, true});

    if (head_ == NO_NODE) {
        head_ = id;
    } else {
        nodes_[tail_].next = id;
        if (kind_ == ListKind::DOUBLY) {
            nodes_[id].prev = tail_;
        }
    }
    tail_ = id;
    size_++;
    return id;
}

void LinkedList::unlink(NodeId id, NodeId predecessor) {
    ListNode& removed = mutable_node(id);
    if (!removed.linked) {
        throw std::invalid_argument("Node is already unlinked");
    }

    if (predecessor == NO_NODE) {
        if (head_ != id) {
            throw std::invalid_argument("Only the head has no predecessor");
        }
        head_ = removed.next;
        if (kind_ == ListKind::DOUBLY && head_ != NO_NODE) {
            nodes_[head_].prev = NO_NODE;
        }
    } else {
        ListNode& before = mutable_node(predecessor);
        if (before.next != id) {
            throw std::invalid_argument("Predecessor does not link to the removed node");
        }
        before.next = removed.next;
        if (kind_ == ListKind::DOUBLY && removed.next != NO_NODE) {
            nodes_[removed.next].prev = predecessor;
        }
    }

    if (tail_ == id) {
        tail_ = predecessor;
    }
    removed.next = NO_NODE;
    removed.prev = NO_NODE;
    removed.linked = false;
    size_--;
}

const ListNode& LinkedList::node(NodeId id) const {
    if (id >= nodes_.size()) {
        throw std::out_of_range("List node id out of range");
    }
    return nodes_[id];
}

ListNode& LinkedList::mutable_node(NodeId id) {
    if (id >= nodes_.size()) {
        throw std::out_of_range("List node id out of range");
    }
    return nodes_[id];
}

std::vector<double> LinkedList::values() const {
    std::vector<double> result;
    result.reserve(size_);
    for (NodeId id = head_; id != NO_NODE; id = nodes_[id].next) {
        result.push_back(nodes_[id].value);
    }
    return result;
}

std::vector<NodeId> LinkedList::order() const {
    std::vector<NodeId> result;
    result.reserve(size_);
    for (NodeId id = head_; id != NO_NODE; id = nodes_[id].next) {
        result.push_back(id);
    }
    return result;
}

bool LinkedList::is_consistent() const {
    if (head_ == NO_NODE) {
        return tail_ == NO_NODE && size_ == 0;
    }
    if (kind_ == ListKind::DOUBLY && nodes_[head_].prev != NO_NODE) {
        return false;
    }

    std::size_t count = 0;
    NodeId previous = NO_NODE;
    for (NodeId id = head_; id != NO_NODE; id = nodes_[id].next) {
        const ListNode& current = nodes_[id];
        if (!current.linked || count > nodes_.size()) {
            return false;
        }
        NodeId expected_prev = (kind_ == ListKind::DOUBLY) ? previous : NO_NODE;
        if (current.prev != expected_prev) {
            return false;
        }
        previous = id;
        count++;
    }
    return previous == tail_ && count == size_;
}

} // namespace algoscope
