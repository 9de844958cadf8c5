// -*- c++ -*-
// Parser: line and token reader for the .ain definition files

#ifndef ASYMINT_PARSER__H
#define ASYMINT_PARSER__H

#include <asymint/exception.hpp>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "tokenizer.hpp"

namespace AsymInt {

class Parser {
   private:
    using Token = Tokenizer::iterator;

   public:
    Parser(const std::string& file, char begin_comment, const char* keep_separator,
           const char* drop_separator = " \t");

    ~Parser() = default;

    // Throws FileException when the file could not be opened
    void checkFile();

    // Advances to the next line that is neither empty nor a comment.
    // Evaluates to false at end of file.
    std::istream& getLine();

    template <class U>
    void getToken(U& u) {
        checkTermination();
        try {
            u = convertToken<U>(*token_);
        } catch (const std::exception&) {
            unexpectedToken_(*token_);
        }
        pre_ = *token_;
        token_++;
    }

    // Next token without consuming it, empty at end of line
    [[nodiscard]] std::string peekToken() const;

    // Consumes the separator and returns true when it is the next token
    bool acceptSeparator(char separator);

    void checkSeparator(char separator);
    void checkEnd();
    [[noreturn]] void unexpectedToken();

    // ParseException located at the current line
    [[noreturn]] void error(const std::string& what) const;

    [[nodiscard]] const std::string& getFileName() const {
        return file_;
    }
    [[nodiscard]] int getNumLine() const {
        return line_number_;
    }

   private:
    template <typename T>
    T convertToken(const std::string& token) {
        if constexpr (std::is_same_v<T, std::string>) {
            return token;
        } else if constexpr (std::is_same_v<T, double>) {
            size_t used = 0;
            double value = std::stod(token, &used);
            if (used != token.size()) {
                throw std::invalid_argument("trailing characters in number");
            }
            return value;
        } else {
            static_assert(std::is_same_v<T, int>, "unsupported token type");
            size_t used = 0;
            int value = std::stoi(token, &used);
            if (used != token.size()) {
                throw std::invalid_argument("trailing characters in integer");
            }
            return value;
        }
    }

    [[noreturn]] void unexpectedToken_(const std::string& token) const;
    void checkTermination() const;
    [[nodiscard]] bool atEnd() const;

    int line_number_ = 0;
    std::string file_;
    std::string line_;
    std::ifstream infile_;
    std::string drop_separator_;
    std::string keep_separator_;
    const char begin_comment_;
    std::unique_ptr<Tokenizer> tokenizer_;
    std::string pre_;
    Token token_;
};

}  // namespace AsymInt

#endif  // ASYMINT_PARSER__H
