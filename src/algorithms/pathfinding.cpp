/// @file pathfinding.cpp
/// @brief Priority-queue shortest path search with lazy deletion

#include "algorithms/pathfinding.hpp"

#include "core/value_format.hpp"
#include "structures/priority_queue.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace algoscope {

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

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

Trace shortest_path(const Graph& graph, const std::string& start, const std::string& end,
                    const Heuristic* heuristic) {
    if (!graph.has_node(start)) {
        throw EngineError(ErrorCode::UNKNOWN_START_NODE,
                          "Start node \"" + start + "\" is not in the graph");
    }
    if (end.empty()) {
        throw EngineError(ErrorCode::MISSING_TARGET_NODE, "No end node was given");
    }

    auto estimate = [&](const std::string& node) {
        return heuristic ? (*heuristic)(node, end) : 0.0;
    };

    TraceRecorder rec;
    std::unordered_map<std::string, double> cost;
    for (const std::string& node : graph.nodes()) {
        cost[node] = INF;
    }
    cost[start] = 0.0;
    std::unordered_map<std::string, std::string> previous;
    std::unordered_set<std::string> settled;

    PriorityQueue<std::string> open(QueueOrder::MIN_FIRST);
    open.insert(start, estimate(start));
    rec.record(StepKind::START, {Subject::named(start)},
               "Starting at " + start + " with distance 0.");

    while (!open.is_empty()) {
        QueueEntry<std::string> entry = open.extract_best();
        const std::string& node = entry.key;

        // Stale entry: a better priority for this node was queued after it
        if (settled.count(node) > 0 || entry.priority > cost[node] + estimate(node)) {
            continue;
        }
        settled.insert(node);
        rec.record(StepKind::SETTLE, {Subject::named(node)},
                   "Settling " + node + " at distance " + format_value(cost[node]) + ".",
                   ScorePayload{cost[node], entry.priority});

        if (node == end) {
            rec.record(StepKind::FOUND, {Subject::named(node)},
                       "Reached the end node " + end + ".");
            break;
        }

        for (const std::string& next : graph.neighbors(node)) {
            if (settled.count(next) > 0) {
                continue;
            }
            double candidate = cost[node] + graph.edge_cost(node, next);
            if (candidate < cost[next]) {
                cost[next] = candidate;
                previous[next] = node;
                double priority = candidate + estimate(next);
                rec.record(StepKind::RELAX, {Subject::named(next), Subject::named(node)},
                           "Shorter route to " + next + " via " + node + ": distance " +
                               format_value(candidate) + ".",
                           ScorePayload{candidate, priority});
                open.insert(next, priority);
            }
        }
    }

    std::vector<std::string> path;
    try {
        path = reconstruct_path(previous, start, end);
    } catch (const EngineError& e) {
        rec.record(StepKind::NOT_FOUND, {}, "There is no path from " + start + " to " + end + ".");
        rec.record(StepKind::COMPLETE, {}, "Search finished without reaching " + end + ".");
        throw PathNotFoundError(e.what(), rec.finish(std::monostate{}));
    }

    double total = 0.0;
    std::vector<Subject> subjects;
    subjects.reserve(path.size());
    for (std::size_t i = 0; i < path.size(); i++) {
        subjects.push_back(Subject::named(path[i]));
        if (i > 0) {
            total += graph.edge_cost(path[i - 1], path[i]);
        }
    }
    rec.record(StepKind::PATH, std::move(subjects),
               "Shortest path: " + join(path) + " (total weight " + format_value(total) + ").",
               PathPayload{path, total});
    rec.record(StepKind::COMPLETE, {}, "Pathfinding complete.");
    return rec.finish(PathOutcome{path, total});
}

} // namespace

Heuristic straight_line_heuristic(std::unordered_map<std::string, Vec2> positions) {
    return [positions = std::move(positions)](const std::string& node, const std::string& goal) {
        auto a = positions.find(node);
        auto b = positions.find(goal);
        if (a == positions.end() || b == positions.end()) {
            return 0.0;
        }
        return static_cast<double>(
            std::hypot(a->second.x - b->second.x, a->second.y - b->second.y));
    };
}

PathNotFoundError::PathNotFoundError(const std::string& message, Trace exploration)
    : EngineError(ErrorCode::PATH_NOT_FOUND, message),
      exploration_(std::make_shared<const Trace>(std::move(exploration))) {}

std::vector<std::string>
reconstruct_path(const std::unordered_map<std::string, std::string>& previous,
                 const std::string& start, const std::string& end) {
    std::vector<std::string> path{end};
    std::string current = end;
    while (current != start) {
        auto it = previous.find(current);
        // A chain longer than the map must loop back on itself
        if (it == previous.end() || path.size() > previous.size()) {
            throw EngineError(ErrorCode::PATH_NOT_FOUND,
                              "No path from \"" + start + "\" to \"" + end + "\"");
        }
        current = it->second;
        path.push_back(current);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

Trace dijkstra(const Graph& graph, const std::string& start, const std::string& end) {
    return shortest_path(graph, start, end, nullptr);
}

Trace a_star(const Graph& graph, const std::string& start, const std::string& end,
             const Heuristic& heuristic) {
    if (!heuristic) {
        throw std::invalid_argument("a_star() needs a heuristic");
    }
    return shortest_path(graph, start, end, &heuristic);
}

} // namespace algoscope
