#pragma once

#include "lexer/sourceLocation.hpp"
#include "lexer/tokenType.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace snap {

// A comment found between two tokens
struct Trivia {
    enum class Kind { LineComment, BlockComment };

    Kind kind = Kind::LineComment;
    size_t offset = 0;
    size_t length = 0;
};

struct Token {
    TokenType type = TokenType::ERROR;
    std::string lexeme;
    SourceLocation location;

    // Byte offset of the lexeme in the source
    size_t offset = 0;
    // Start of the whitespace/comments preceding this token
    size_t full_start = 0;
    std::vector<Trivia> leading_trivia;

    // Literal value if applicable
    std::variant<std::monostate, int64_t, double, std::string, char> value;

    size_t end() const { return offset + lexeme.size(); }
};

} // namespace snap
