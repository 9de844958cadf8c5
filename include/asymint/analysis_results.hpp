// -*- c++ -*-
//
// Data structures returned by Analysis

#ifndef ASYMINT_ANALYSIS_RESULTS__H
#define ASYMINT_ANALYSIS_RESULTS__H

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace AsymInt {

// Custom hash function for std::pair<std::string, std::string>
struct StringPairHash {
    template <class T1, class T2>
    std::size_t operator()(const std::pair<T1, T2>& p) const {
        auto h1 = std::hash<T1>{}(p.first);
        auto h2 = std::hash<T2>{}(p.second);
        return h1 ^ (h2 << 1);
    }
};

using PairMap = std::unordered_map<std::pair<std::string, std::string>, double, StringPairHash>;

// Characteristics of a single named interval
struct SummaryResult {
    std::string name;
    double lower;
    double upper;
    double expected;
    double alpha;
    double beta;
    double asymmetry;
    double variance;
    double std_dev;
    std::string report;  // framed text of summary()

    SummaryResult()
        : lower(0.0)
        , upper(0.0)
        , expected(0.0)
        , alpha(0.0)
        , beta(0.0)
        , asymmetry(0.0)
        , variance(0.0)
        , std_dev(0.0) {}
};

using SummaryResults = std::vector<SummaryResult>;

// P(row > column) for every ordered pair of names
struct ProbabilityMatrix {
    std::vector<std::string> node_names;
    PairMap probabilities;

    [[nodiscard]] double getProbability(const std::string& row, const std::string& column) const {
        auto it = probabilities.find(std::make_pair(row, column));
        if (it != probabilities.end()) {
            return it->second;
        }
        return 0.0;
    }
};

// Symmetric distance between every pair of names
struct DistanceMatrix {
    std::string metric;
    std::vector<std::string> node_names;
    PairMap distances;

    [[nodiscard]] double getDistance(const std::string& node1, const std::string& node2) const {
        auto it = distances.find(std::make_pair(node1, node2));
        if (it != distances.end()) {
            return it->second;
        }
        it = distances.find(std::make_pair(node2, node1));
        if (it != distances.end()) {
            return it->second;
        }
        return 0.0;
    }
};

struct GraphEdge {
    std::string from;
    std::string to;
    double weight;

    GraphEdge()
        : weight(0.0) {}
    GraphEdge(const std::string& f, const std::string& t, double w)
        : from(f)
        , to(t)
        , weight(w) {}
};

struct GraphResult {
    bool directed{false};
    std::vector<std::string> node_names;
    std::vector<GraphEdge> edges;
    // Only for undirected graphs
    std::optional<double> average_uncertainty;
    std::optional<double> entropy;
    std::string report;  // framed text of DominanceGraph::summary()
};

}  // namespace AsymInt

#endif  // ASYMINT_ANALYSIS_RESULTS__H
