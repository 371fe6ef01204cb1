/// @file graph.cpp
/// @brief Graph storage and edge/weight token parsing

#include "structures/graph.hpp"

#include "core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace algoscope {

void Graph::add_edge(const std::string& u, const std::string& v) {
    if (u.empty() || v.empty()) {
        throw std::invalid_argument("Edge labels must not be empty");
    }
    if (u == v) {
        throw std::invalid_argument("Self-loop on node " + u);
    }
    if (has_edge(u, v)) {
        return;
    }

    for (const std::string* label : {&u, &v}) {
        if (adjacency_.find(*label) == adjacency_.end()) {
            adjacency_[*label] = {};
            nodes_.push_back(*label);
        }
    }
    adjacency_[u].push_back(v);
    adjacency_[v].push_back(u);
    edge_count_++;
}

void Graph::set_weight(const std::string& u, const std::string& v, double weight) {
    if (!std::isfinite(weight) || weight < 0.0) {
        throw std::invalid_argument("Edge weight must be a finite, non-negative number");
    }
    weights_[{u, v}] = weight;
    weights_[{v, u}] = weight;
}

bool Graph::has_node(const std::string& label) const {
    return adjacency_.find(label) != adjacency_.end();
}

bool Graph::has_edge(const std::string& u, const std::string& v) const {
    auto it = adjacency_.find(u);
    if (it == adjacency_.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), v) != it->second.end();
}

const std::vector<std::string>& Graph::neighbors(const std::string& label) const {
    auto it = adjacency_.find(label);
    if (it == adjacency_.end()) {
        throw std::out_of_range("Unknown node " + label);
    }
    return it->second;
}

std::optional<double> Graph::weight(const std::string& u, const std::string& v) const {
    auto it = weights_.find({u, v});
    if (it == weights_.end()) {
        return std::nullopt;
    }
    return it->second;
}

double Graph::edge_cost(const std::string& u, const std::string& v) const {
    return weight(u, v).value_or(1.0);
}

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

[[noreturn]] void parse_failure(const std::string& message) {
    throw EngineError(ErrorCode::GRAPH_PARSE_ERROR, message);
}

/// Splits "A-B" into two trimmed, non-empty labels
std::pair<std::string, std::string> parse_label_pair(std::string_view token) {
    std::size_t dash = token.find('-');
    if (dash == std::string_view::npos || token.find('-', dash + 1) != std::string_view::npos) {
        parse_failure("Invalid edge format: \"" + std::string(token) + "\"");
    }
    std::string_view u = trim(token.substr(0, dash));
    std::string_view v = trim(token.substr(dash + 1));
    if (u.empty() || v.empty()) {
        parse_failure("Invalid edge format: \"" + std::string(token) + "\"");
    }
    return {std::string(u), std::string(v)};
}

} // namespace

std::vector<std::string> split_list(std::string_view text) {
    std::vector<std::string> parts;
    std::size_t begin = 0;
    while (begin <= text.size()) {
        std::size_t comma = text.find(',', begin);
        std::size_t end = (comma == std::string_view::npos) ? text.size() : comma;
        std::string_view part = trim(text.substr(begin, end - begin));
        if (!part.empty()) {
            parts.emplace_back(part);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        begin = comma + 1;
    }
    return parts;
}

Edge parse_edge_token(std::string_view token) {
    auto [u, v] = parse_label_pair(trim(token));
    return {std::move(u), std::move(v)};
}

WeightedEdge parse_weight_token(std::string_view token) {
    token = trim(token);
    std::size_t colon = token.find(':');
    if (colon == std::string_view::npos) {
        parse_failure("Invalid weight format: \"" + std::string(token) + "\"");
    }

    auto [u, v] = parse_label_pair(trim(token.substr(0, colon)));

    std::string number(trim(token.substr(colon + 1)));
    char* end = nullptr;
    double weight = std::strtod(number.c_str(), &end);
    if (number.empty() || end != number.c_str() + number.size() || !std::isfinite(weight) ||
        weight < 0.0) {
        parse_failure("Invalid weight format: \"" + std::string(token) + "\"");
    }
    return {std::move(u), std::move(v), weight};
}

Graph build_graph(const std::vector<Edge>& edges, const std::vector<WeightedEdge>& weights) {
    Graph graph;
    try {
        for (const Edge& edge : edges) {
            graph.add_edge(edge.from, edge.to);
        }
        for (const WeightedEdge& w : weights) {
            if (!graph.has_edge(w.from, w.to)) {
                parse_failure("Weight given for \"" + w.from + "-" + w.to +
                              "\", which is not an edge");
            }
            graph.set_weight(w.from, w.to, w.weight);
        }
    } catch (const std::invalid_argument& e) {
        parse_failure(e.what());
    }
    return graph;
}

Graph parse_graph(std::string_view edges_text, std::string_view weights_text) {
    std::vector<Edge> edges;
    for (const std::string& token : split_list(edges_text)) {
        edges.push_back(parse_edge_token(token));
    }
    if (edges.empty()) {
        parse_failure("The graph needs at least one edge");
    }

    std::vector<WeightedEdge> weights;
    for (const std::string& token : split_list(weights_text)) {
        weights.push_back(parse_weight_token(token));
    }
    return build_graph(edges, weights);
}

} // namespace algoscope
