// -*- c++ -*-
// DominanceGraph: graph of named intervals weighted by comparison probabilities

#ifndef ASYMINT_DOMINANCE_GRAPH_H
#define ASYMINT_DOMINANCE_GRAPH_H

#include <asymint/analysis_results.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ain.hpp"

namespace AsymInt {

// Undirected graphs weight the pair {u, v} by 4 p (1 - p) with p = P(v > u),
// which is 1 for indistinguishable intervals and 0 for separated ones.
// Directed graphs weight u -> v by P(u > v); with dominance_only, only the
// direction of the larger probability is kept.
// Edges with weight <= edge_threshold are not added.
class DominanceGraph {
   public:
    struct Edge {
        std::string from;
        std::string to;
        double weight;
    };
    using Edges = std::vector<Edge>;
    using Node = std::pair<std::string, Ain>;
    using Nodes = std::vector<Node>;
    using Matrix = std::vector<std::vector<double>>;

    explicit DominanceGraph(bool directed = false, double edge_threshold = 0.0,
                            bool dominance_only = false);

    void add_node(const std::string& name, const Ain& ain);

    [[nodiscard]] bool is_directed() const {
        return directed_;
    }
    [[nodiscard]] bool is_dominance_only() const {
        return dominance_only_;
    }
    [[nodiscard]] double edge_threshold() const {
        return edge_threshold_;
    }

    [[nodiscard]] bool has_node(const std::string& name) const;
    [[nodiscard]] const Ain& node(const std::string& name) const;
    [[nodiscard]] const Nodes& nodes() const {
        return nodes_;
    }
    [[nodiscard]] size_t node_count() const {
        return nodes_.size();
    }
    [[nodiscard]] size_t edge_count() const {
        return edges_.size();
    }

    // Edges grouped by source node in node order, each group in insertion order
    [[nodiscard]] Edges edges() const;

    // Weight of the edge a -> b (either direction for undirected graphs)
    [[nodiscard]] std::optional<double> edge_weight(const std::string& a, const std::string& b) const;

    // Number of incident edges (in + out for directed graphs)
    [[nodiscard]] size_t degree(const std::string& name) const;

    // Weights indexed by node order, 0 where there is no edge
    [[nodiscard]] Matrix adjacency_matrix() const;

    // Undirected graphs only; both consider every pair, ignoring the threshold
    [[nodiscard]] double average_uncertainty() const;
    [[nodiscard]] double graph_entropy() const;

    [[nodiscard]] std::string summary() const;

   private:
    void add_undirected_edge(const std::string& u, const std::string& v);
    void add_directed_edge(const std::string& u, const std::string& v);
    void add_directed_edge_max(const std::string& u, const std::string& v);
    void add_edge(const std::string& from, const std::string& to, double weight);
    [[nodiscard]] size_t index_of(const std::string& name) const;
    void check_undirected(const char* metric) const;

    bool directed_;
    double edge_threshold_;
    bool dominance_only_;

    Nodes nodes_;
    std::unordered_map<std::string, size_t> node_index_;
    Edges edges_;
    std::unordered_map<std::pair<std::string, std::string>, size_t, StringPairHash> edge_index_;
};

}  // namespace AsymInt

#endif  // ASYMINT_DOMINANCE_GRAPH_H
