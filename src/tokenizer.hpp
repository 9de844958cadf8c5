// -*- c++ -*-
// Tokenizer: splits a line into tokens
//
// Characters in drop_separator end the current token and are discarded;
// characters in keep_separator end the current token and become a
// one-character token of their own.

#ifndef ASYMINT_TOKENIZER__H
#define ASYMINT_TOKENIZER__H

#include <string>
#include <vector>

namespace AsymInt {

class Tokenizer {
   public:
    using Tokens = std::vector<std::string>;
    using iterator = Tokens::const_iterator;

    Tokenizer(const std::string& str, const std::string& drop_separator,
              const std::string& keep_separator) {
        std::string current;
        for (char c : str) {
            bool keep = keep_separator.find(c) != std::string::npos;
            bool drop = drop_separator.find(c) != std::string::npos;
            if (!keep && !drop) {
                current += c;
                continue;
            }
            if (!current.empty()) {
                tokens_.push_back(current);
                current.clear();
            }
            if (keep) {
                tokens_.emplace_back(1, c);
            }
        }
        if (!current.empty()) {
            tokens_.push_back(current);
        }
    }

    [[nodiscard]] iterator begin() const {
        return tokens_.begin();
    }
    [[nodiscard]] iterator end() const {
        return tokens_.end();
    }
    [[nodiscard]] const Tokens& tokens() const {
        return tokens_;
    }
    [[nodiscard]] bool empty() const {
        return tokens_.empty();
    }

   private:
    Tokens tokens_;
};

}  // namespace AsymInt

#endif  // ASYMINT_TOKENIZER__H
