// -*- c++ -*-
// Analysis: reads a .ain file and computes the requested reports

#include <asymint/analysis.hpp>
#include <asymint/analysis_results.hpp>
#include <sstream>

#include "ain_parser.hpp"
#include "comparison.hpp"
#include "distances.hpp"
#include "dominance_graph.hpp"

namespace AsymInt {

DistanceMetric parse_distance_metric(const std::string& name) {
    if (name == "w1") {
        return DistanceMetric::W1;
    }
    if (name == "w2") {
        return DistanceMetric::W2;
    }
    if (name == "winf") {
        return DistanceMetric::WInf;
    }
    throw ConfigurationException("unknown distance metric \"" + name + "\" (use w1, w2 or winf)");
}

std::string distance_metric_name(DistanceMetric metric) {
    switch (metric) {
        case DistanceMetric::W1:
            return "w1";
        case DistanceMetric::W2:
            return "w2";
        case DistanceMetric::WInf:
            return "winf";
    }
    throw RuntimeException("invalid distance metric");
}

GraphType parse_graph_type(const std::string& name) {
    if (name == "undirected") {
        return GraphType::Undirected;
    }
    if (name == "directed") {
        return GraphType::Directed;
    }
    if (name == "dominance") {
        return GraphType::Dominance;
    }
    throw ConfigurationException("unknown graph type \"" + name +
                                 "\" (use undirected, directed or dominance)");
}

Analysis::Analysis() = default;

Analysis::~Analysis() = default;

void Analysis::check() {
    std::ostringstream error_msg;
    auto append = [&error_msg](const std::string& what) {
        if (error_msg.tellp() > 0) {
            error_msg << "; ";
        }
        error_msg << what;
    };

    if (file_.empty()) {
        append("please specify `-f' properly");
    }

    if (is_distance_) {
        try {
            (void)parse_distance_metric(distance_metric_);
        } catch (const ConfigurationException&) {
            append("please specify `-d' with w1, w2 or winf");
        }
    }

    if (is_graph_) {
        try {
            (void)parse_graph_type(graph_type_);
        } catch (const ConfigurationException&) {
            append("please specify `-g' with undirected, directed or dominance");
        }
    }

    if (is_threshold_set_ && !is_graph_) {
        append("`-t' requires `-g'");
    }
    if (!(threshold_ >= 0.0 && threshold_ <= 1.0)) {
        append("please specify `-t' in [0, 1]");
    }

    if (precision_ < 0) {
        append("please specify `-p' as a non-negative integer");
    }

    std::string error_str = error_msg.str();
    if (!error_str.empty()) {
        throw ConfigurationException(error_str);
    }
}

void Analysis::read_ain() {
    auto parser = std::make_unique<AinParser>(file_);
    parser->parse();
    parser_ = std::move(parser);
}

const AinParser& Analysis::parser() const {
    if (!parser_) {
        throw RuntimeException("no .ain file has been read");
    }
    return *parser_;
}

std::vector<std::string> Analysis::getNames() const {
    std::vector<std::string> names;
    for (const auto& d : parser().definitions()) {
        names.push_back(d.first);
    }
    return names;
}

SummaryResults Analysis::getSummaryResults() const {
    SummaryResults results;
    for (const auto& d : parser().definitions()) {
        const Ain& a = d.second;
        SummaryResult r;
        r.name = d.first;
        r.lower = a.lower();
        r.upper = a.upper();
        r.expected = a.expected();
        r.alpha = a.alpha();
        r.beta = a.beta();
        r.asymmetry = a.asymmetry();
        r.variance = a.variance();
        r.std_dev = a.std_dev();
        r.report = summary(a, precision_);
        results.push_back(r);
    }
    return results;
}

ProbabilityMatrix Analysis::getProbabilityMatrix() const {
    ProbabilityMatrix matrix;
    matrix.node_names = getNames();
    for (const auto& x : parser().definitions()) {
        for (const auto& y : parser().definitions()) {
            matrix.probabilities[std::make_pair(x.first, y.first)] = gt(x.second, y.second);
        }
    }
    return matrix;
}

DistanceMatrix Analysis::getDistanceMatrix() const {
    DistanceMetric metric = parse_distance_metric(distance_metric_);

    DistanceMatrix matrix;
    matrix.metric = distance_metric_name(metric);
    matrix.node_names = getNames();

    const auto& defs = parser().definitions();
    for (size_t i = 0; i < defs.size(); i++) {
        for (size_t j = i; j < defs.size(); j++) {
            const Ain& x = defs[i].second;
            const Ain& y = defs[j].second;
            double d = 0.0;
            switch (metric) {
                case DistanceMetric::W1:
                    d = w1(x, y);
                    break;
                case DistanceMetric::W2:
                    d = w2(x, y);
                    break;
                case DistanceMetric::WInf:
                    d = winf(x, y);
                    break;
            }
            matrix.distances[std::make_pair(defs[i].first, defs[j].first)] = d;
        }
    }
    return matrix;
}

GraphResult Analysis::getGraphResult() const {
    GraphType type = parse_graph_type(graph_type_);
    bool directed = (type != GraphType::Undirected);

    DominanceGraph graph(directed, threshold_, type == GraphType::Dominance);
    for (const auto& d : parser().definitions()) {
        graph.add_node(d.first, d.second);
    }

    GraphResult result;
    result.directed = directed;
    result.node_names = getNames();
    for (const auto& e : graph.edges()) {
        result.edges.emplace_back(e.from, e.to, e.weight);
    }
    if (!directed) {
        result.average_uncertainty = graph.average_uncertainty();
        result.entropy = graph.graph_entropy();
    }
    result.report = graph.summary();
    return result;
}

}  // namespace AsymInt
