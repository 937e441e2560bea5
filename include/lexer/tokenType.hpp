#pragma once

#include <string_view>

namespace snap {

/**
 * @brief SnapScript token types
 *
 * Comments and whitespace never become tokens; they are attached to the
 * following token as leading trivia so that breakpoint markers keep their
 * offsets.
 */
enum class TokenType {
  // Literals & Identifiers
  INTEGER,
  FLOAT,
  STRING,
  CHAR,
  IDENTIFIER,

  // Keywords
  VAR,
  FUNC,
  ASYNC,
  AWAIT,
  EXTERN,
  CLASS,
  ENUM,
  PROP,
  PRIVATE,
  IF,
  ELSE,
  WHILE,
  FOR,
  IN,
  RETURN,
  BREAK,
  CONTINUE,
  NEW,
  THIS,
  TRUE,
  FALSE,
  NULL_LITERAL,

  // Operators
  PLUS,
  MINUS,
  STAR,
  SLASH,
  PERCENT,
  ASSIGN,
  PLUS_ASSIGN,
  MINUS_ASSIGN,
  EQUALS,
  NOT_EQUALS,
  LESS,
  LESS_EQUAL,
  GREATER,
  GREATER_EQUAL,
  AND,
  OR,
  NOT,
  ARROW, // =>

  // Delimiters
  LPAREN,
  RPAREN,
  LBRACE,
  RBRACE,
  LBRACKET,
  RBRACKET,
  COMMA,
  SEMICOLON,
  COLON,
  DOT,

  // Special
  END_OF_FILE,
  ERROR
};

// Convert token type to string for diagnostics
constexpr std::string_view tokenTypeToString(TokenType type) {
  switch (type) {
  case TokenType::INTEGER:
    return "integer literal";
  case TokenType::FLOAT:
    return "float literal";
  case TokenType::STRING:
    return "string literal";
  case TokenType::CHAR:
    return "character literal";
  case TokenType::IDENTIFIER:
    return "identifier";
  case TokenType::VAR:
    return "'var'";
  case TokenType::FUNC:
    return "'func'";
  case TokenType::ASYNC:
    return "'async'";
  case TokenType::AWAIT:
    return "'await'";
  case TokenType::EXTERN:
    return "'extern'";
  case TokenType::CLASS:
    return "'class'";
  case TokenType::ENUM:
    return "'enum'";
  case TokenType::PROP:
    return "'prop'";
  case TokenType::PRIVATE:
    return "'private'";
  case TokenType::IF:
    return "'if'";
  case TokenType::ELSE:
    return "'else'";
  case TokenType::WHILE:
    return "'while'";
  case TokenType::FOR:
    return "'for'";
  case TokenType::IN:
    return "'in'";
  case TokenType::RETURN:
    return "'return'";
  case TokenType::BREAK:
    return "'break'";
  case TokenType::CONTINUE:
    return "'continue'";
  case TokenType::NEW:
    return "'new'";
  case TokenType::THIS:
    return "'this'";
  case TokenType::TRUE:
    return "'true'";
  case TokenType::FALSE:
    return "'false'";
  case TokenType::NULL_LITERAL:
    return "'null'";
  case TokenType::PLUS:
    return "'+'";
  case TokenType::MINUS:
    return "'-'";
  case TokenType::STAR:
    return "'*'";
  case TokenType::SLASH:
    return "'/'";
  case TokenType::PERCENT:
    return "'%'";
  case TokenType::ASSIGN:
    return "'='";
  case TokenType::PLUS_ASSIGN:
    return "'+='";
  case TokenType::MINUS_ASSIGN:
    return "'-='";
  case TokenType::EQUALS:
    return "'=='";
  case TokenType::NOT_EQUALS:
    return "'!='";
  case TokenType::LESS:
    return "'<'";
  case TokenType::LESS_EQUAL:
    return "'<='";
  case TokenType::GREATER:
    return "'>'";
  case TokenType::GREATER_EQUAL:
    return "'>='";
  case TokenType::AND:
    return "'&&'";
  case TokenType::OR:
    return "'||'";
  case TokenType::NOT:
    return "'!'";
  case TokenType::ARROW:
    return "'=>'";
  case TokenType::LPAREN:
    return "'('";
  case TokenType::RPAREN:
    return "')'";
  case TokenType::LBRACE:
    return "'{'";
  case TokenType::RBRACE:
    return "'}'";
  case TokenType::LBRACKET:
    return "'['";
  case TokenType::RBRACKET:
    return "']'";
  case TokenType::COMMA:
    return "','";
  case TokenType::SEMICOLON:
    return "';'";
  case TokenType::COLON:
    return "':'";
  case TokenType::DOT:
    return "'.'";
  case TokenType::END_OF_FILE:
    return "end of file";
  case TokenType::ERROR:
    return "invalid token";
  default:
    return "unknown";
  }
}

} // namespace snap
