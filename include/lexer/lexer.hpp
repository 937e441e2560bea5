#pragma once

#include "lexer/token.hpp"
#include <string>
#include <vector>

namespace snap {

class Lexer {
public:
    explicit Lexer(const std::string& source, const std::string& filename = "<stdin>");

    // Tokenize the entire source; the last token is always END_OF_FILE
    std::vector<Token> tokenize();

    // Get next token
    Token next_token();

private:
    std::string source_;
    std::string filename_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    // Set while skipping trivia, consumed by make_token
    size_t token_start_ = 0;
    size_t token_line_ = 1;
    size_t token_column_ = 1;
    size_t trivia_start_ = 0;
    std::vector<Trivia> trivia_;

    char current() const;
    char peek_next() const;
    char advance();
    bool at_end() const;
    void skip_trivia();

    Token make_token(TokenType type);
    Token error_token(const std::string& message);
    Token scan_string();
    Token scan_char();
    Token scan_number();
    Token scan_identifier();
    bool scan_escape(char& out);
};

} // namespace snap
