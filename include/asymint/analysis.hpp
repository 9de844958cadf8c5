// -*- c++ -*-
// Analysis: reads a .ain file and computes the requested reports

#ifndef ASYMINT_ANALYSIS__H
#define ASYMINT_ANALYSIS__H

#include <asymint/analysis_results.hpp>
#include <asymint/exception.hpp>
#include <memory>
#include <string>

namespace AsymInt {

class AinParser;

// Decimals of the per-interval summary when -p is not given
constexpr int DEFAULT_PRECISION = 6;

enum class DistanceMetric { W1, W2, WInf };
enum class GraphType { Undirected, Directed, Dominance };

// "w1", "w2", "winf"; ConfigurationException otherwise
DistanceMetric parse_distance_metric(const std::string& name);
std::string distance_metric_name(DistanceMetric metric);

// "undirected", "directed", "dominance"; ConfigurationException otherwise
GraphType parse_graph_type(const std::string& name);

class Analysis {
   public:
    Analysis();
    ~Analysis();

    // Throws ConfigurationException for incomplete or contradictory settings
    void check();
    void read_ain();

    void set_file(const std::string& file) {
        file_ = file;
    }
    void set_summary() {
        is_summary_ = true;
    }
    void set_compare() {
        is_compare_ = true;
    }
    void set_distance(const std::string& metric = "w1") {
        is_distance_ = true;
        distance_metric_ = metric;
    }
    void set_graph(const std::string& type = "undirected") {
        is_graph_ = true;
        graph_type_ = type;
    }
    void set_threshold(double threshold) {
        threshold_ = threshold;
        is_threshold_set_ = true;
    }
    void set_precision(int precision) {
        precision_ = precision;
    }

    [[nodiscard]] const std::string& file() const {
        return file_;
    }
    [[nodiscard]] bool is_summary() const {
        return is_summary_;
    }
    [[nodiscard]] bool is_compare() const {
        return is_compare_;
    }
    [[nodiscard]] bool is_distance() const {
        return is_distance_;
    }
    [[nodiscard]] bool is_graph() const {
        return is_graph_;
    }
    [[nodiscard]] int precision() const {
        return precision_;
    }
    [[nodiscard]] double threshold() const {
        return threshold_;
    }

    // Pure logic, available after read_ain()
    [[nodiscard]] std::vector<std::string> getNames() const;
    [[nodiscard]] SummaryResults getSummaryResults() const;
    [[nodiscard]] ProbabilityMatrix getProbabilityMatrix() const;
    [[nodiscard]] DistanceMatrix getDistanceMatrix() const;
    [[nodiscard]] GraphResult getGraphResult() const;

   private:
    const AinParser& parser() const;

    std::string file_;
    bool is_summary_ = false;
    bool is_compare_ = false;
    bool is_distance_ = false;
    bool is_graph_ = false;
    bool is_threshold_set_ = false;
    std::string distance_metric_ = "w1";
    std::string graph_type_ = "undirected";
    double threshold_ = 0.0;
    int precision_ = DEFAULT_PRECISION;

    std::unique_ptr<AinParser> parser_;
};

}  // namespace AsymInt

#endif  // ASYMINT_ANALYSIS__H
