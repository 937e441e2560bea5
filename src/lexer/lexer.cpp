#include "lexer/lexer.hpp"
#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace snap {

static const std::unordered_map<std::string, TokenType> keywords = {
    {"var", TokenType::VAR},
    {"func", TokenType::FUNC},
    {"async", TokenType::ASYNC},
    {"await", TokenType::AWAIT},
    {"extern", TokenType::EXTERN},
    {"class", TokenType::CLASS},
    {"enum", TokenType::ENUM},
    {"prop", TokenType::PROP},
    {"private", TokenType::PRIVATE},
    {"if", TokenType::IF},
    {"else", TokenType::ELSE},
    {"while", TokenType::WHILE},
    {"for", TokenType::FOR},
    {"in", TokenType::IN},
    {"return", TokenType::RETURN},
    {"break", TokenType::BREAK},
    {"continue", TokenType::CONTINUE},
    {"new", TokenType::NEW},
    {"this", TokenType::THIS},
    {"true", TokenType::TRUE},
    {"false", TokenType::FALSE},
    {"null", TokenType::NULL_LITERAL},
};

Lexer::Lexer(const std::string& source, const std::string& filename)
    : source_(source), filename_(filename) {}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(next_token());
        if (tokens.back().type == TokenType::END_OF_FILE) {
            break;
        }
    }
    return tokens;
}

Token Lexer::next_token() {
    skip_trivia();

    token_start_ = pos_;
    token_line_ = line_;
    token_column_ = column_;

    if (at_end()) {
        return make_token(TokenType::END_OF_FILE);
    }

    char c = advance();

    if (std::isdigit(static_cast<unsigned char>(c))) {
        return scan_number();
    }

    if (c == '"') {
        return scan_string();
    }

    if (c == '\'') {
        return scan_char();
    }

    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        return scan_identifier();
    }

    switch (c) {
        case '+':
            if (current() == '=') { advance(); return make_token(TokenType::PLUS_ASSIGN); }
            return make_token(TokenType::PLUS);
        case '-':
            if (current() == '=') { advance(); return make_token(TokenType::MINUS_ASSIGN); }
            return make_token(TokenType::MINUS);
        case '*': return make_token(TokenType::STAR);
        case '/': return make_token(TokenType::SLASH);
        case '%': return make_token(TokenType::PERCENT);
        case '(': return make_token(TokenType::LPAREN);
        case ')': return make_token(TokenType::RPAREN);
        case '{': return make_token(TokenType::LBRACE);
        case '}': return make_token(TokenType::RBRACE);
        case '[': return make_token(TokenType::LBRACKET);
        case ']': return make_token(TokenType::RBRACKET);
        case ',': return make_token(TokenType::COMMA);
        case ';': return make_token(TokenType::SEMICOLON);
        case ':': return make_token(TokenType::COLON);
        case '.': return make_token(TokenType::DOT);
        case '=':
            if (current() == '=') { advance(); return make_token(TokenType::EQUALS); }
            if (current() == '>') { advance(); return make_token(TokenType::ARROW); }
            return make_token(TokenType::ASSIGN);
        case '!':
            if (current() == '=') { advance(); return make_token(TokenType::NOT_EQUALS); }
            return make_token(TokenType::NOT);
        case '<':
            if (current() == '=') { advance(); return make_token(TokenType::LESS_EQUAL); }
            return make_token(TokenType::LESS);
        case '>':
            if (current() == '=') { advance(); return make_token(TokenType::GREATER_EQUAL); }
            return make_token(TokenType::GREATER);
        case '&':
            if (current() == '&') { advance(); return make_token(TokenType::AND); }
            break;
        case '|':
            if (current() == '|') { advance(); return make_token(TokenType::OR); }
            break;
    }

    return error_token(std::string("Unexpected character '") + c + "'");
}

char Lexer::current() const {
    if (at_end()) return '\0';
    return source_[pos_];
}

char Lexer::peek_next() const {
    if (pos_ + 1 >= source_.size()) return '\0';
    return source_[pos_ + 1];
}

char Lexer::advance() {
    char c = source_[pos_++];
    if (c == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    return c;
}

bool Lexer::at_end() const {
    return pos_ >= source_.size();
}

void Lexer::skip_trivia() {
    trivia_start_ = pos_;
    trivia_.clear();

    while (!at_end()) {
        char c = current();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else if (c == '/' && peek_next() == '/') {
            size_t start = pos_;
            while (!at_end() && current() != '\n') {
                advance();
            }
            trivia_.push_back({Trivia::Kind::LineComment, start, pos_ - start});
        } else if (c == '/' && peek_next() == '*') {
            size_t start = pos_;
            advance();
            advance();
            while (!at_end() && !(current() == '*' && peek_next() == '/')) {
                advance();
            }
            if (!at_end()) {
                advance();
                advance();
            }
            trivia_.push_back({Trivia::Kind::BlockComment, start, pos_ - start});
        } else {
            break;
        }
    }
}

Token Lexer::make_token(TokenType type) {
    Token token;
    token.type = type;
    token.lexeme = source_.substr(token_start_, pos_ - token_start_);
    token.location = {token_line_, token_column_, filename_};
    token.offset = token_start_;
    token.full_start = trivia_start_;
    token.leading_trivia = trivia_;
    return token;
}

Token Lexer::error_token(const std::string& message) {
    Token token = make_token(TokenType::ERROR);
    token.value = message;
    return token;
}

bool Lexer::scan_escape(char& out) {
    if (at_end()) {
        return false;
    }
    char c = advance();
    switch (c) {
        case 'n': out = '\n'; break;
        case 't': out = '\t'; break;
        case 'r': out = '\r'; break;
        case '0': out = '\0'; break;
        case '"': out = '"'; break;
        case '\'': out = '\''; break;
        case '\\': out = '\\'; break;
        default: return false;
    }
    return true;
}

Token Lexer::scan_string() {
    std::string value;
    while (!at_end() && current() != '"') {
        if (current() == '\n') {
            return error_token("Unterminated string");
        }
        if (current() == '\\') {
            advance();
            char escaped;
            if (!scan_escape(escaped)) {
                return error_token("Invalid escape sequence in string");
            }
            value += escaped;
        } else {
            value += advance();
        }
    }

    if (at_end()) {
        return error_token("Unterminated string");
    }

    advance(); // closing "

    Token token = make_token(TokenType::STRING);
    token.value = value;
    return token;
}

Token Lexer::scan_char() {
    char value;
    if (at_end() || current() == '\'' || current() == '\n') {
        return error_token("Empty character literal");
    }
    if (current() == '\\') {
        advance();
        if (!scan_escape(value)) {
            return error_token("Invalid escape sequence in character literal");
        }
    } else {
        value = advance();
    }

    if (current() != '\'') {
        return error_token("Unterminated character literal");
    }
    advance(); // closing '

    Token token = make_token(TokenType::CHAR);
    token.value = value;
    return token;
}

Token Lexer::scan_number() {
    bool is_float = false;

    while (!at_end() && std::isdigit(static_cast<unsigned char>(current()))) {
        advance();
    }

    if (current() == '.' && std::isdigit(static_cast<unsigned char>(peek_next()))) {
        is_float = true;
        advance(); // .
        while (!at_end() && std::isdigit(static_cast<unsigned char>(current()))) {
            advance();
        }
    }

    Token token = make_token(is_float ? TokenType::FLOAT : TokenType::INTEGER);
    try {
        if (is_float) {
            token.value = std::stod(token.lexeme);
        } else {
            token.value = static_cast<int64_t>(std::stoll(token.lexeme));
        }
    } catch (const std::out_of_range&) {
        token.type = TokenType::ERROR;
        token.value = "Numeric literal out of range: " + token.lexeme;
    }
    return token;
}

Token Lexer::scan_identifier() {
    while (!at_end() && (std::isalnum(static_cast<unsigned char>(current())) || current() == '_')) {
        advance();
    }

    Token token = make_token(TokenType::IDENTIFIER);

    auto it = keywords.find(token.lexeme);
    if (it != keywords.end()) {
        token.type = it->second;
    }

    return token;
}

} // namespace snap
