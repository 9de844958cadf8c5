// -*- c++ -*-
// DominanceGraph: graph of named intervals weighted by comparison probabilities

#include "dominance_graph.hpp"

#include <algorithm>
#include <asymint/exception.hpp>
#include <iomanip>
#include <sstream>

#include "comparison.hpp"
#include "util_numerical.hpp"

namespace AsymInt {

// Undirected and directed weights are reported with four decimals
static constexpr int EDGE_WEIGHT_DECIMALS = 4;

DominanceGraph::DominanceGraph(bool directed, double edge_threshold, bool dominance_only)
    : directed_(directed)
    , edge_threshold_(edge_threshold)
    , dominance_only_(dominance_only) {
    if (!(edge_threshold >= 0.0 && edge_threshold <= 1.0)) {
        std::ostringstream what;
        what << "edge threshold must be between 0.0 and 1.0, got " << edge_threshold;
        throw RangeError(what.str());
    }
    if (dominance_only && !directed) {
        throw ConfigurationException("dominance_only can only be set for directed graphs");
    }
}

void DominanceGraph::add_node(const std::string& name, const Ain& ain) {
    if (name.empty()) {
        throw RuntimeException("DominanceGraph: node name must not be empty");
    }
    if (has_node(name)) {
        throw RuntimeException("DominanceGraph: node \"" + name + "\" already exists");
    }

    node_index_[name] = nodes_.size();
    nodes_.emplace_back(name, ain);

    for (size_t i = 0; i + 1 < nodes_.size(); i++) {
        const std::string& other = nodes_[i].first;
        if (!directed_) {
            add_undirected_edge(name, other);
        } else if (dominance_only_) {
            add_directed_edge_max(name, other);
        } else {
            add_directed_edge(name, other);
            add_directed_edge(other, name);
        }
    }
}

bool DominanceGraph::has_node(const std::string& name) const {
    return node_index_.find(name) != node_index_.end();
}

const Ain& DominanceGraph::node(const std::string& name) const {
    return nodes_[index_of(name)].second;
}

size_t DominanceGraph::index_of(const std::string& name) const {
    auto i = node_index_.find(name);
    if (i == node_index_.end()) {
        throw RuntimeException("DominanceGraph: node \"" + name + "\" not found");
    }
    return i->second;
}

void DominanceGraph::add_undirected_edge(const std::string& u, const std::string& v) {
    double p = gt(node(v), node(u));
    double w = round_to(4.0 * p * (1.0 - p), EDGE_WEIGHT_DECIMALS);
    if (w > edge_threshold_) {
        // Store from the earlier node so that edges() lists the pair once
        if (index_of(u) < index_of(v)) {
            add_edge(u, v, w);
        } else {
            add_edge(v, u, w);
        }
    }
}

void DominanceGraph::add_directed_edge(const std::string& u, const std::string& v) {
    double w = round_to(gt(node(u), node(v)), EDGE_WEIGHT_DECIMALS);
    if (w > edge_threshold_) {
        add_edge(u, v, w);
    }
}

void DominanceGraph::add_directed_edge_max(const std::string& u, const std::string& v) {
    double p_uv = gt(node(u), node(v));
    double p_vu = gt(node(v), node(u));

    std::string src;
    std::string dst;
    double weight = 0.0;
    if (p_uv > p_vu) {
        src = u;
        dst = v;
        weight = p_uv;
    } else if (p_vu > p_uv) {
        src = v;
        dst = u;
        weight = p_vu;
    } else {
        src = std::min(u, v);
        dst = std::max(u, v);
        weight = p_uv;
    }

    if (weight > edge_threshold_) {
        add_edge(src, dst, weight);
    }
}

void DominanceGraph::add_edge(const std::string& from, const std::string& to, double weight) {
    edge_index_[std::make_pair(from, to)] = edges_.size();
    edges_.push_back(Edge{from, to, weight});
}

DominanceGraph::Edges DominanceGraph::edges() const {
    Edges sorted = edges_;
    std::stable_sort(sorted.begin(), sorted.end(), [this](const Edge& a, const Edge& b) {
        return index_of(a.from) < index_of(b.from);
    });
    return sorted;
}

std::optional<double> DominanceGraph::edge_weight(const std::string& a, const std::string& b) const {
    auto i = edge_index_.find(std::make_pair(a, b));
    if (i != edge_index_.end()) {
        return edges_[i->second].weight;
    }
    if (!directed_) {
        i = edge_index_.find(std::make_pair(b, a));
        if (i != edge_index_.end()) {
            return edges_[i->second].weight;
        }
    }
    return std::nullopt;
}

size_t DominanceGraph::degree(const std::string& name) const {
    if (!has_node(name)) {
        throw RuntimeException("DominanceGraph: node \"" + name + "\" not found");
    }
    return static_cast<size_t>(std::count_if(edges_.begin(), edges_.end(), [&name](const Edge& e) {
        return e.from == name || e.to == name;
    }));
}

DominanceGraph::Matrix DominanceGraph::adjacency_matrix() const {
    size_t n = nodes_.size();
    Matrix matrix(n, std::vector<double>(n, 0.0));
    for (const auto& e : edges_) {
        size_t i = index_of(e.from);
        size_t j = index_of(e.to);
        matrix[i][j] = e.weight;
        if (!directed_) {
            matrix[j][i] = e.weight;
        }
    }
    return matrix;
}

void DominanceGraph::check_undirected(const char* metric) const {
    if (directed_) {
        throw ConfigurationException(std::string(metric) + " is only defined for undirected graphs");
    }
}

double DominanceGraph::average_uncertainty() const {
    check_undirected("average uncertainty");

    size_t n = nodes_.size();
    if (n < 2) {
        return 0.0;
    }

    double total = 0.0;
    for (size_t i = 0; i < n; i++) {
        for (size_t j = i + 1; j < n; j++) {
            double p = gt(nodes_[j].second, nodes_[i].second);
            total += 4.0 * p * (1.0 - p);
        }
    }
    return 2.0 * total / (static_cast<double>(n) * static_cast<double>(n - 1));
}

double DominanceGraph::graph_entropy() const {
    check_undirected("graph entropy");

    size_t n = nodes_.size();
    if (n < 2) {
        return 0.0;
    }

    double total = 0.0;
    for (size_t i = 0; i < n; i++) {
        for (size_t j = i + 1; j < n; j++) {
            total += binary_entropy(gt(nodes_[j].second, nodes_[i].second));
        }
    }
    return 2.0 * total / (static_cast<double>(n) * static_cast<double>(n - 1));
}

std::string DominanceGraph::summary() const {
    const std::string rule(50, '=');

    std::ostringstream oss;
    oss << rule << std::endl;
    oss << "Graph Type: " << (directed_ ? "Directed" : "Undirected") << std::endl;
    oss << "Number of Nodes: " << node_count() << std::endl;
    oss << "Number of Edges: " << edge_count() << std::endl;
    oss << rule << std::endl;
    oss << "Nodes:" << std::endl;
    for (const auto& n : nodes_) {
        oss << "  " << n.first << ": " << to_string(n.second) << std::endl;
    }
    oss << rule << std::endl;
    oss << "Edges (with weights):" << std::endl;
    for (const auto& e : edges()) {
        oss << "  " << e.from << " -> " << e.to << ": " << std::fixed << std::setprecision(4)
            << e.weight << std::endl;
    }
    oss << rule << std::endl;
    return oss.str();
}

}  // namespace AsymInt
