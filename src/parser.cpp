// -*- c++ -*-
// Parser: line and token reader for the .ain definition files

#include "parser.hpp"

namespace AsymInt {

Parser::Parser(const std::string& file, const char begin_comment, const char* keep_separator,
               const char* drop_separator)
    : file_(file)
    , infile_(file.c_str())
    , drop_separator_(drop_separator != nullptr ? drop_separator : "")
    , keep_separator_(keep_separator != nullptr ? keep_separator : "")
    , begin_comment_(begin_comment) {}

std::istream& Parser::getLine() {
    while (true) {
        tokenizer_.reset();

        if (!std::getline(infile_, line_)) {
            // Keep an empty tokenizer so that token_ stays valid at end of file
            line_.clear();
            tokenizer_ = std::make_unique<Tokenizer>(line_, drop_separator_, keep_separator_);
            token_ = tokenizer_->begin();
            return infile_;
        }

        line_number_++;

        // Strip the comment before tokenizing so that "A ain(0, 1)  # note" works
        std::string::size_type comment = line_.find(begin_comment_);
        if (comment != std::string::npos) {
            line_.erase(comment);
        }

        tokenizer_ = std::make_unique<Tokenizer>(line_, drop_separator_, keep_separator_);
        if (!tokenizer_->empty()) {
            token_ = tokenizer_->begin();
            return infile_;
        }
    }
}

std::string Parser::peekToken() const {
    if (atEnd()) {
        return std::string();
    }
    return *token_;
}

bool Parser::acceptSeparator(char separator) {
    if (atEnd() || *token_ != std::string(1, separator)) {
        return false;
    }
    pre_ = *token_++;
    return true;
}

bool Parser::atEnd() const {
    return !tokenizer_ || token_ == tokenizer_->end();
}

void Parser::checkTermination() const {
    if (atEnd()) {
        error("unexpected termination");
    }
}

void Parser::unexpectedToken() {
    unexpectedToken_(pre_);
}

void Parser::unexpectedToken_(const std::string& token) const {
    error("unexpected token \"" + token + "\"");
}

void Parser::error(const std::string& what) const {
    throw ParseException(getFileName(), getNumLine(), what);
}

void Parser::checkFile() {
    if (infile_.fail()) {
        throw FileException(getFileName(), "failed to open file");
    }
}

void Parser::checkSeparator(char separator) {
    checkTermination();
    if (*token_ != std::string(1, separator)) {
        unexpectedToken_(*token_);
    }
    pre_ = *token_++;
}

void Parser::checkEnd() {
    if (!atEnd()) {
        unexpectedToken_(*token_);
    }
}

}  // namespace AsymInt
