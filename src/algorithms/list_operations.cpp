/// @file list_operations.cpp
/// @brief Linked list trace generation

#include "algorithms/list_operations.hpp"

#include "core/value_format.hpp"

#include <string>

namespace algoscope {

namespace {

Subject list_node(const LinkedList& list, NodeId id) {
    return Subject::node(id, format_value(list.node(id).value));
}

} // namespace

ListBuildResult build_list(const std::vector<double>& values, ListKind kind) {
    ListBuildResult result{Trace{}, LinkedList(kind)};
    LinkedList& list = result.list;
    TraceRecorder rec;

    for (double value : values) {
        NodeId previous_tail = list.tail();
        NodeId id = list.append(value);
        const std::string v = format_value(value);
        if (previous_tail == NO_NODE) {
            rec.record(StepKind::APPEND, {list_node(list, id)}, v + " becomes the head.");
        } else {
            rec.record(StepKind::APPEND, {list_node(list, id), list_node(list, previous_tail)},
                       "Appending " + v + " after " + format_value(list.node(previous_tail).value) +
                           ".");
        }
    }

    result.trace = rec.finish(ValueSequence{list.values()});
    return result;
}

Trace search_list(const LinkedList& list, double target) {
    TraceRecorder rec;
    const std::string wanted = format_value(target);
    std::size_t position = 0;

    for (NodeId current = list.head(); current != NO_NODE; current = list.node(current).next) {
        double value = list.node(current).value;
        rec.record(StepKind::COMPARE, {list_node(list, current)},
                   "Checking node " + std::to_string(position) + ": is " + format_value(value) +
                       " equal to " + wanted + "?");
        if (value == target) {
            rec.record(StepKind::FOUND, {list_node(list, current)},
                       "Found " + wanted + " at position " + std::to_string(position) + ".");
            return rec.finish(SearchOutcome{true, current});
        }
        position++;
    }

    rec.record(StepKind::NOT_FOUND, {}, wanted + " is not in the list.");
    return rec.finish(SearchOutcome{false, std::nullopt});
}

ListBuildResult delete_from_list(const LinkedList& list, double target) {
    ListBuildResult result{Trace{}, list};
    LinkedList& out = result.list;
    TraceRecorder rec;
    const std::string wanted = format_value(target);

    if (out.empty()) {
        rec.record(StepKind::NOT_FOUND, {}, "The list is empty, there is nothing to delete.");
        result.trace = rec.finish(ValueSequence{});
        return result;
    }

    NodeId head = out.head();
    rec.record(StepKind::COMPARE, {list_node(out, head)},
               "Checking the head " + format_value(out.node(head).value) + ".");
    if (out.node(head).value == target) {
        NodeId successor = out.node(head).next;
        std::string narrative = "Deleting the head " + wanted + ".";
        if (successor != NO_NODE) {
            narrative += " " + format_value(out.node(successor).value) + " is the new head.";
        }
        rec.record(StepKind::UNLINK, {list_node(out, head)}, narrative, UnlinkPayload{true});
        out.unlink(head, NO_NODE);
        result.trace = rec.finish(ValueSequence{out.values()});
        return result;
    }

    NodeId predecessor = head;
    for (NodeId current = out.node(head).next; current != NO_NODE;
         current = out.node(current).next) {
        rec.record(StepKind::COMPARE, {list_node(out, current)},
                   "Checking " + format_value(out.node(current).value) + ".");
        if (out.node(current).value == target) {
            rec.record(StepKind::UNLINK, {list_node(out, current), list_node(out, predecessor)},
                       "Deleting " + wanted + ": linking " +
                           format_value(out.node(predecessor).value) + " past it.",
                       UnlinkPayload{false});
            out.unlink(current, predecessor);
            result.trace = rec.finish(ValueSequence{out.values()});
            return result;
        }
        predecessor = current;
    }

    rec.record(StepKind::NOT_FOUND, {}, wanted + " is not in the list.");
    result.trace = rec.finish(ValueSequence{out.values()});
    return result;
}

} // namespace algoscope
