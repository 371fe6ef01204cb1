/// @file graph_traversal.cpp
/// @brief BFS and DFS trace generation over a labelled graph

#include "algorithms/graph_traversal.hpp"

#include "core/errors.hpp"

#include <deque>
#include <stdexcept>
#include <unordered_set>
#include <vector>

namespace algoscope {

namespace {

void require_start(const Graph& graph, const std::string& start) {
    if (!graph.has_node(start)) {
        throw EngineError(ErrorCode::UNKNOWN_START_NODE,
                          "Start node \"" + start + "\" is not in the graph");
    }
}

std::string join(const std::vector<std::string>& labels) {
    std::string out;
    for (std::size_t i = 0; i < labels.size(); i++) {
        if (i > 0) {
            out += " -> ";
        }
        out += labels[i];
    }
    return out;
}

/// BFS and DFS differ only in which end of the frontier is taken
Trace traverse(const Graph& graph, const std::string& start, Frontier frontier) {
    require_start(graph, start);

    const bool queue = (frontier == Frontier::QUEUE);
    const char* container = queue ? "queue" : "stack";
    TraceRecorder rec;
    std::vector<std::string> order;
    std::unordered_set<std::string> visited;
    std::deque<std::string> pending;

    rec.record(StepKind::START, {Subject::named(start)},
               std::string("Starting ") + (queue ? "BFS" : "DFS") + " from node " + start + ".");
    visited.insert(start);
    pending.push_back(start);
    rec.record(StepKind::SCHEDULE, {Subject::named(start)},
               "Adding " + start + " to the " + container + ".", FrontierPayload{frontier});

    while (!pending.empty()) {
        std::string current;
        if (queue) {
            current = pending.front();
            pending.pop_front();
        } else {
            current = pending.back();
            pending.pop_back();
        }
        order.push_back(current);
        rec.record(StepKind::VISIT, {Subject::named(current)}, "Visiting node " + current + ".");

        const std::vector<std::string>& neighbors = graph.neighbors(current);
        std::vector<std::string> candidates =
            queue ? std::vector<std::string>(neighbors.begin(), neighbors.end())
                  : std::vector<std::string>(neighbors.rbegin(), neighbors.rend());
        for (const std::string& next : candidates) {
            if (!visited.insert(next).second) {
                continue;
            }
            pending.push_back(next);
            rec.record(StepKind::SCHEDULE, {Subject::named(next)},
                       "Adding neighbour " + next + " of " + current + " to the " + container +
                           ".",
                       FrontierPayload{frontier});
        }
    }

    rec.record(StepKind::COMPLETE, {}, "Traversal complete. Visit order: " + join(order) + ".");
    return rec.finish(VisitOrder{order});
}

} // namespace

Trace breadth_first_search(const Graph& graph, const std::string& start) {
    return traverse(graph, start, Frontier::QUEUE);
}

Trace depth_first_search(const Graph& graph, const std::string& start) {
    return traverse(graph, start, Frontier::STACK);
}

Trace run_traversal(TraversalAlgorithm algorithm, const Graph& graph, const std::string& start) {
    switch (algorithm) {
    case TraversalAlgorithm::BFS:
        return breadth_first_search(graph, start);
    case TraversalAlgorithm::DFS:
        return depth_first_search(graph, start);
    }
    throw std::invalid_argument("Unknown traversal algorithm");
}

} // namespace algoscope
