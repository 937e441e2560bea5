#include "lexer/lexer.hpp"

#include <gtest/gtest.h>

using namespace snap;

TEST(Lexer, KeywordsAndOperators) {
	Lexer lexer("async func f(a: int) { await g(); return a >= 2 && !b; }");
	std::vector<TokenType> types;
	for (const Token &token : lexer.tokenize()) {
		types.push_back(token.type);
	}
	std::vector<TokenType> expected = {
	    TokenType::ASYNC,  TokenType::FUNC,          TokenType::IDENTIFIER, TokenType::LPAREN,     TokenType::IDENTIFIER,
	    TokenType::COLON,  TokenType::IDENTIFIER,    TokenType::RPAREN,     TokenType::LBRACE,     TokenType::AWAIT,
	    TokenType::IDENTIFIER, TokenType::LPAREN,    TokenType::RPAREN,     TokenType::SEMICOLON,  TokenType::RETURN,
	    TokenType::IDENTIFIER, TokenType::GREATER_EQUAL, TokenType::INTEGER, TokenType::AND,       TokenType::NOT,
	    TokenType::IDENTIFIER, TokenType::SEMICOLON, TokenType::RBRACE,     TokenType::END_OF_FILE};
	EXPECT_EQ(types, expected);
}

TEST(Lexer, LiteralValues) {
	Lexer lexer("42 2.5 \"a\\n\\\"b\" 'x' '\\t'");
	auto tokens = lexer.tokenize();
	ASSERT_EQ(tokens.size(), 6u);
	EXPECT_EQ(std::get<int64_t>(tokens[0].value), 42);
	EXPECT_DOUBLE_EQ(std::get<double>(tokens[1].value), 2.5);
	EXPECT_EQ(std::get<std::string>(tokens[2].value), "a\n\"b");
	EXPECT_EQ(std::get<char>(tokens[3].value), 'x');
	EXPECT_EQ(std::get<char>(tokens[4].value), '\t');
}

TEST(Lexer, CommentsBecomeLeadingTrivia) {
	std::string source = "x; // note\n  /* Breakpoint */ y;";
	Lexer lexer(source);
	auto tokens = lexer.tokenize();

	const Token &y = tokens[2];
	ASSERT_EQ(y.lexeme, "y");
	ASSERT_EQ(y.leading_trivia.size(), 2u);
	EXPECT_EQ(y.leading_trivia[0].kind, Trivia::Kind::LineComment);
	EXPECT_EQ(source.substr(y.leading_trivia[0].offset, y.leading_trivia[0].length), "// note");
	EXPECT_EQ(y.leading_trivia[1].kind, Trivia::Kind::BlockComment);
	EXPECT_EQ(source.substr(y.leading_trivia[1].offset, y.leading_trivia[1].length), "/* Breakpoint */");
	EXPECT_EQ(y.full_start, 2u);
	EXPECT_EQ(y.offset, source.find("y;"));
}

TEST(Lexer, TracksLinesAndColumns) {
	Lexer lexer("a\n  b");
	auto tokens = lexer.tokenize();
	EXPECT_EQ(tokens[1].location.line, 2u);
	EXPECT_EQ(tokens[1].location.column, 3u);
}

TEST(Lexer, ReportsMalformedInputAsErrorTokens) {
	Lexer lexer("\"open");
	auto tokens = lexer.tokenize();
	ASSERT_FALSE(tokens.empty());
	EXPECT_EQ(tokens[0].type, TokenType::ERROR);
	EXPECT_EQ(std::get<std::string>(tokens[0].value), "Unterminated string");
	EXPECT_EQ(tokens.back().type, TokenType::END_OF_FILE);
}
