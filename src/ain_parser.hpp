// -*- c++ -*-
// AinParser: .ain file parser for named intervals
//
//   A ain(0, 10, 2)      # lower, upper[, expected]
//   K const(5)           # degenerate interval
//   S = add(A, K)        # derived from earlier definitions

#ifndef ASYMINT_AIN_PARSER_H
#define ASYMINT_AIN_PARSER_H

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "arithmetic.hpp"

namespace AsymInt {

class Parser;

class AinParser {
   public:
    using Definition = std::pair<std::string, Ain>;
    // In file order
    using Definitions = std::vector<Definition>;

    explicit AinParser(const std::string& ain_file);
    void parse();

    [[nodiscard]] const Definitions& definitions() const {
        return definitions_;
    }
    [[nodiscard]] bool has(const std::string& name) const;
    [[nodiscard]] const Ain& get(const std::string& name) const;

   private:
    void parse_line(Parser& parser);
    [[nodiscard]] Ain parse_literal(Parser& parser, const std::string& type);
    [[nodiscard]] Ain parse_derived(Parser& parser);
    [[nodiscard]] Operand parse_argument(Parser& parser);
    void define(const std::string& name, const Ain& value);

    std::string ain_file_;
    Definitions definitions_;
    std::unordered_map<std::string, size_t> index_;
};

}  // namespace AsymInt

#endif  // ASYMINT_AIN_PARSER_H
