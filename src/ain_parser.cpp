// -*- c++ -*-
// AinParser: .ain file parser for named intervals

#include "ain_parser.hpp"

#include <asymint/exception.hpp>
#include <cctype>
#include <sstream>
#include <variant>

#include "parser.hpp"
#include "transcendental.hpp"

namespace AsymInt {

namespace {

using Arguments = std::vector<Operand>;

bool is_number_token(const std::string& token) {
    if (token.empty()) {
        return false;
    }
    char c = token[0];
    return std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '+' || c == '.';
}

bool is_separator_token(const std::string& token) {
    return token.size() == 1 && std::string("(),=").find(token[0]) != std::string::npos;
}

// A scalar in interval position is a degenerate interval
Ain as_ain(const Operand& operand) {
    if (const double* value = std::get_if<double>(&operand)) {
        return Ain(*value, *value, *value);
    }
    return std::get<Ain>(operand);
}

Ain apply_unary(const std::string& function, const Ain& x) {
    if (function == "neg") {
        return negate(x);
    }
    if (function == "log") {
        return log(x);
    }
    if (function == "log2") {
        return log2(x);
    }
    if (function == "log10") {
        return log10(x);
    }
    if (function == "exp") {
        return exp(x);
    }
    if (function == "sin") {
        return sin(x);
    }
    if (function == "cos") {
        return cos(x);
    }
    return tan(x);  // "tan"
}

Ain apply_binary(const std::string& function, const Operand& x, const Operand& y) {
    if (function == "pow") {
        // A scalar base raised to an interval is base^X
        if (std::holds_alternative<double>(x) && std::holds_alternative<Ain>(y)) {
            return pow(std::get<double>(x), std::get<Ain>(y));
        }
        return pow(as_ain(x), y);
    }
    if (function == "add") {
        return add(as_ain(x), y);
    }
    if (function == "sub") {
        return subtract(as_ain(x), y);
    }
    if (function == "mul") {
        return multiply(as_ain(x), y);
    }
    return divide(as_ain(x), y);  // "div"
}

// Number of arguments, 0 for unknown functions
size_t arity(const std::string& function) {
    if (function == "add" || function == "sub" || function == "mul" || function == "div" ||
        function == "pow") {
        return 2;
    }
    if (function == "neg" || function == "log" || function == "log2" || function == "log10" ||
        function == "exp" || function == "sin" || function == "cos" || function == "tan") {
        return 1;
    }
    return 0;
}

}  // namespace

AinParser::AinParser(const std::string& ain_file)
    : ain_file_(ain_file) {}

void AinParser::parse() {
    Parser parser(ain_file_, '#', "(),=", " \t\r");
    parser.checkFile();

    while (parser.getLine()) {
        parse_line(parser);
    }
}

bool AinParser::has(const std::string& name) const {
    return index_.find(name) != index_.end();
}

const Ain& AinParser::get(const std::string& name) const {
    auto i = index_.find(name);
    if (i == index_.end()) {
        throw RuntimeException("interval \"" + name + "\" is not defined in file \"" + ain_file_ + "\"");
    }
    return definitions_[i->second].second;
}

void AinParser::define(const std::string& name, const Ain& value) {
    if (has(name)) {
        std::ostringstream what;
        what << "interval \"" << name << "\" is multiply defined in file \"" << ain_file_ << "\"";
        throw RuntimeException(what.str());
    }
    index_[name] = definitions_.size();
    definitions_.emplace_back(name, value);
}

void AinParser::parse_line(Parser& parser) {
    std::string name;
    parser.getToken(name);
    if (is_number_token(name) || is_separator_token(name)) {
        parser.unexpectedToken();
    }

    Ain value;
    if (parser.acceptSeparator('=')) {
        value = parse_derived(parser);
    } else {
        std::string type;
        parser.getToken(type);
        if (!(type == "ain" || type == "const")) {
            parser.unexpectedToken();
        }
        value = parse_literal(parser, type);
    }
    parser.checkEnd();

    define(name, value);
}

Ain AinParser::parse_literal(Parser& parser, const std::string& type) {
    parser.checkSeparator('(');

    double lower = 0.0;
    parser.getToken(lower);

    if (type == "const") {
        parser.checkSeparator(')');
        return Ain(lower, lower, lower);
    }

    parser.checkSeparator(',');
    double upper = 0.0;
    parser.getToken(upper);

    if (parser.acceptSeparator(')')) {
        return Ain(lower, upper);
    }

    parser.checkSeparator(',');
    double expected = 0.0;
    parser.getToken(expected);
    parser.checkSeparator(')');

    return Ain(lower, upper, expected);
}

Ain AinParser::parse_derived(Parser& parser) {
    std::string function;
    parser.getToken(function);
    size_t n = arity(function);
    if (n == 0) {
        parser.error("unknown function \"" + function + "\"");
    }

    parser.checkSeparator('(');
    Arguments args;
    args.push_back(parse_argument(parser));
    while (parser.acceptSeparator(',')) {
        args.push_back(parse_argument(parser));
    }
    parser.checkSeparator(')');

    if (args.size() != n) {
        std::ostringstream what;
        what << "function \"" << function << "\" takes " << n << " argument" << (n > 1 ? "s" : "")
             << ", got " << args.size();
        parser.error(what.str());
    }

    if (n == 1) {
        return apply_unary(function, as_ain(args[0]));
    }
    return apply_binary(function, args[0], args[1]);
}

Operand AinParser::parse_argument(Parser& parser) {
    if (is_number_token(parser.peekToken())) {
        double value = 0.0;
        parser.getToken(value);
        return value;
    }

    std::string name;
    parser.getToken(name);
    if (is_separator_token(name)) {
        parser.unexpectedToken();
    }
    if (!has(name)) {
        parser.error("interval \"" + name + "\" is not defined");
    }
    return get(name);
}

}  // namespace AsymInt
