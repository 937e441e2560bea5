#pragma once

#include "ast/ast.hpp"
#include "compiler/diagnostic.hpp"
#include "lexer/lexer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace snap {

/**
 * @brief Recursive-descent parser for SnapScript
 *
 * Never throws on malformed input: errors are collected as diagnostics and
 * the parser resynchronizes on the next ';' or '}', so a partial tree is
 * always returned.
 */
class Parser {
public:
    explicit Parser(Lexer& lexer);

    std::unique_ptr<Program> parse();

    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
    bool has_errors() const { return !diagnostics_.empty(); }

private:
    // Significant tokens; program_tokens_ also keeps invalid ones
    std::vector<Token> tokens_;
    std::vector<Token> program_tokens_;
    size_t current_ = 0;
    std::string filename_;
    std::vector<Diagnostic> diagnostics_;

    // Unwinds to the nearest statement or declaration boundary
    struct ParseError {};

    const Token& peek(size_t ahead = 0) const;
    const Token& previous() const;
    const Token& advance();
    bool check(TokenType type) const;
    bool match(TokenType type);
    const Token& expect(TokenType type, const std::string& context);
    bool at_end() const;

    void error_at(const Token& token, const std::string& message);
    void synchronize();

    template <typename T>
    std::unique_ptr<T> begin_node(const Token& first);
    void finish_node(Node& node);

    // Declarations
    NodePtr parse_declaration();
    std::unique_ptr<FunctionDecl> parse_function(bool is_extern);
    std::unique_ptr<ClassDecl> parse_class();
    std::unique_ptr<EnumDecl> parse_enum();
    NodePtr parse_member();
    std::vector<Parameter> parse_parameters();
    std::string parse_type();

    // Statements
    StmtPtr parse_statement();
    StmtPtr parse_embedded_statement();
    std::unique_ptr<VarDecl> parse_var_decl();
    std::unique_ptr<BlockStmt> parse_block();
    StmtPtr parse_if();
    StmtPtr parse_while();
    StmtPtr parse_for();
    StmtPtr parse_return();
    StmtPtr parse_expression_statement();

    // Expressions
    ExprPtr parse_expression();
    ExprPtr parse_assignment();
    ExprPtr parse_or();
    ExprPtr parse_and();
    ExprPtr parse_equality();
    ExprPtr parse_comparison();
    ExprPtr parse_additive();
    ExprPtr parse_multiplicative();
    ExprPtr parse_unary();
    ExprPtr parse_postfix();
    ExprPtr parse_primary();
    ExprPtr parse_function_expression();
    std::vector<ExprPtr> parse_arguments();

    bool lambda_ahead() const;
    ExprPtr make_binary(const Token& first, TokenType op, ExprPtr left, ExprPtr right);
};

} // namespace snap
