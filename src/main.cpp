// -*- c++ -*-

#include <asymint/analysis.hpp>
#include <asymint/analysis_results.hpp>
#include <asymint/exception.hpp>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

[[noreturn]] void usage() {
    std::cerr << "usage: asymint" << std::endl;
    std::cerr << " -f, --file FILE          specifies .ain file" << std::endl;
    std::cerr << " -s, --summary            prints summary of every interval" << std::endl;
    std::cerr << " -c, --compare            prints P(row > column) matrix" << std::endl;
    std::cerr << " -d, --distance [METRIC]  prints distance matrix (w1, w2, winf; default: w1)"
              << std::endl;
    std::cerr << " -g, --graph [TYPE]       prints dominance graph (undirected, directed, dominance; "
                 "default: undirected)"
              << std::endl;
    std::cerr << " -t, --threshold X        edge threshold for -g in [0, 1] (default: 0)" << std::endl;
    std::cerr << " -p, --precision N        decimals in summary (default: 6)" << std::endl;
    std::cerr << " -h, --help               gives this help" << std::endl;
    throw AsymInt::RuntimeException("Invalid command-line arguments");
}

// Consumes the next argument when it is a value rather than another option
// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays)
std::string parse_optional(int argc, char* argv[], int& i, const std::string& default_value) {
    if (i + 1 < argc) {
        std::string next_arg = argv[i + 1];
        if (!next_arg.empty() && next_arg[0] != '-') {
            i++;
            return next_arg;
        }
    }
    return default_value;
}

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays)
std::string parse_required(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) {
        usage();
    }
    return argv[++i];
}

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays)
double parse_threshold(int argc, char* argv[], int& i) {
    std::string value = parse_required(argc, argv, i);
    size_t used = 0;
    double threshold = 0.0;
    try {
        threshold = std::stod(value, &used);
    } catch (const std::exception&) {
        usage();
    }
    if (used != value.size()) {
        usage();
    }
    return threshold;
}

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays)
int parse_precision(int argc, char* argv[], int& i) {
    std::string value = parse_required(argc, argv, i);
    size_t used = 0;
    int precision = 0;
    try {
        precision = std::stoi(value, &used);
    } catch (const std::exception&) {
        usage();
    }
    if (used != value.size()) {
        usage();
    }
    return precision;
}

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays)
void set_option(int argc, char* argv[], AsymInt::Analysis* analysis) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        // Long options are rewritten to their short form
        char option = 0;
        if (arg == "--help") {
            option = 'h';
        } else if (arg == "--file") {
            option = 'f';
        } else if (arg == "--summary") {
            option = 's';
        } else if (arg == "--compare") {
            option = 'c';
        } else if (arg == "--distance") {
            option = 'd';
        } else if (arg == "--graph") {
            option = 'g';
        } else if (arg == "--threshold") {
            option = 't';
        } else if (arg == "--precision") {
            option = 'p';
        } else if (arg.length() == 2 && arg[0] == '-') {
            option = arg[1];
        } else {
            usage();
        }

        switch (option) {
            case 'f':
                analysis->set_file(parse_required(argc, argv, i));
                break;
            case 's':
                analysis->set_summary();
                break;
            case 'c':
                analysis->set_compare();
                break;
            case 'd':
                analysis->set_distance(parse_optional(argc, argv, i, "w1"));
                break;
            case 'g':
                analysis->set_graph(parse_optional(argc, argv, i, "undirected"));
                break;
            case 't':
                analysis->set_threshold(parse_threshold(argc, argv, i));
                break;
            case 'p':
                analysis->set_precision(parse_precision(argc, argv, i));
                break;
            default:  // 'h' and unknown options
                usage();
        }
    }
}

std::string get_version_string() {
    auto now = std::time(nullptr);
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &now);
#else
    localtime_r(&now, &timeinfo);
#endif

    std::ostringstream oss;
    oss << "asymint 1.1.1 (";
    oss << std::put_time(&timeinfo, "%a %b %d %H:%M:%S %Y");
    oss << ")";
    return oss.str();
}

std::string formatSummaryResults(const AsymInt::SummaryResults& results) {
    std::ostringstream oss;
    oss << "#" << std::endl;
    oss << "# summary" << std::endl;
    oss << "#" << std::endl;

    for (size_t i = 0; i < results.size(); i++) {
        oss << "# " << results[i].name << std::endl;
        oss << results[i].report;
        if (i + 1 < results.size()) {
            oss << std::endl;
        }
    }
    return oss.str();
}

// Square table of pairwise values with names along both axes
template <class Lookup>
std::string formatMatrix(const std::string& title, const std::vector<std::string>& names,
                         Lookup lookup) {
    std::ostringstream oss;
    oss << "#" << std::endl;
    oss << "# " << title << std::endl;
    oss << "#" << std::endl;

    oss << "#\t";
    for (const auto& name : names) {
        oss << name << "\t";
    }
    oss << std::endl;

    std::string rule = "#-------";
    for (size_t i = 1; i < names.size(); i++) {
        rule += "--------";
    }
    rule += "-----";

    oss << rule << std::endl;
    for (const auto& row : names) {
        oss << row << "\t";
        for (const auto& column : names) {
            oss << std::fixed << std::setprecision(4) << lookup(row, column) << "\t";
        }
        oss << std::endl;
    }
    oss << rule << std::endl;
    return oss.str();
}

std::string formatProbabilityMatrix(const AsymInt::ProbabilityMatrix& matrix) {
    return formatMatrix("P(row > column)", matrix.node_names,
                        [&matrix](const std::string& r, const std::string& c) {
                            return matrix.getProbability(r, c);
                        });
}

std::string formatDistanceMatrix(const AsymInt::DistanceMatrix& matrix) {
    return formatMatrix(matrix.metric + " distance matrix", matrix.node_names,
                        [&matrix](const std::string& r, const std::string& c) {
                            return matrix.getDistance(r, c);
                        });
}

std::string formatGraphResult(const AsymInt::GraphResult& result) {
    std::ostringstream oss;
    oss << result.report;
    if (result.average_uncertainty) {
        oss << "Average Uncertainty: " << std::fixed << std::setprecision(4)
            << *result.average_uncertainty << std::endl;
    }
    if (result.entropy) {
        oss << "Graph Entropy: " << std::fixed << std::setprecision(4) << *result.entropy
            << std::endl;
    }
    return oss.str();
}

int main(int argc, char* argv[]) {
    try {
        std::cerr << get_version_string() << std::endl;

        AsymInt::Analysis analysis;
        set_option(argc, argv, &analysis);
        analysis.check();
        analysis.read_ain();

        if (analysis.is_summary() || analysis.is_compare() || analysis.is_distance() ||
            analysis.is_graph()) {
            std::cout << std::endl;
        }

        if (analysis.is_summary()) {
            std::cout << formatSummaryResults(analysis.getSummaryResults());
        }

        if (analysis.is_compare()) {
            std::cout << std::endl;
            std::cout << formatProbabilityMatrix(analysis.getProbabilityMatrix());
        }

        if (analysis.is_distance()) {
            std::cout << std::endl;
            std::cout << formatDistanceMatrix(analysis.getDistanceMatrix());
        }

        if (analysis.is_graph()) {
            std::cout << std::endl;
            std::cout << formatGraphResult(analysis.getGraphResult());
        }

        std::cerr << "OK" << std::endl;

    } catch (AsymInt::Exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;

    } catch (std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 2;

    } catch (...) {
        std::cerr << "error: unknown error" << std::endl;
        return 3;
    }

    return 0;
}
