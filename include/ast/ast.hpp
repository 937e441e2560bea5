#pragma once

#include "lexer/token.hpp"

#include <memory>
#include <string>
#include <vector>

namespace snap {

class ASTVisitor;

// Base class for all AST nodes
struct Node {
    virtual ~Node() = default;
    virtual void accept(ASTVisitor& visitor) = 0;

    // Direct children in source order
    virtual std::vector<Node*> children() { return {}; }

    Node* parent = nullptr;
    SourceLocation location;

    // Offset of the first token
    size_t start = 0;
    // Offset of the first token's leading trivia
    size_t full_start = 0;
    // End offset of the last token
    size_t end = 0;

    bool contains(size_t offset) const { return offset >= start && offset < end; }
};

struct Expression : Node {};

struct Statement : Node {
    // Body of an if/while/for written without braces
    bool embedded = false;
};

struct Declaration : Node {};

using NodePtr = std::unique_ptr<Node>;
using ExprPtr = std::unique_ptr<Expression>;
using StmtPtr = std::unique_ptr<Statement>;

struct BlockStmt;

struct Parameter {
    std::string name;
    std::string type_name;
    SourceLocation location;
    size_t offset = 0;
};

// Shared by named functions, anonymous methods and lambdas
struct Callable {
    virtual ~Callable() = default;

    bool is_async = false;
    std::vector<Parameter> params;
    std::unique_ptr<BlockStmt> body;
};

// ============================================================================
// Expressions
// ============================================================================

struct IntegerLiteral : Expression {
    int64_t value = 0;
    void accept(ASTVisitor& visitor) override;
};

struct FloatLiteral : Expression {
    double value = 0.0;
    void accept(ASTVisitor& visitor) override;
};

struct StringLiteral : Expression {
    std::string value;
    void accept(ASTVisitor& visitor) override;
};

struct CharLiteral : Expression {
    char value = '\0';
    void accept(ASTVisitor& visitor) override;
};

struct BoolLiteral : Expression {
    bool value = false;
    void accept(ASTVisitor& visitor) override;
};

struct NullLiteral : Expression {
    void accept(ASTVisitor& visitor) override;
};

struct ThisExpr : Expression {
    void accept(ASTVisitor& visitor) override;
};

struct Identifier : Expression {
    std::string name;
    void accept(ASTVisitor& visitor) override;
};

struct UnaryExpr : Expression {
    TokenType op = TokenType::MINUS;
    ExprPtr operand;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

struct BinaryExpr : Expression {
    TokenType op = TokenType::PLUS;
    ExprPtr left;
    ExprPtr right;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

struct AssignExpr : Expression {
    TokenType op = TokenType::ASSIGN;
    ExprPtr target;
    ExprPtr value;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

struct CallExpr : Expression {
    ExprPtr callee;
    std::vector<ExprPtr> arguments;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

struct MemberExpr : Expression {
    ExprPtr object;
    std::string member;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

struct IndexExpr : Expression {
    ExprPtr object;
    ExprPtr index;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

struct ListExpr : Expression {
    std::vector<ExprPtr> elements;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

struct NewExpr : Expression {
    std::string class_name;
    std::vector<ExprPtr> arguments;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

struct AwaitExpr : Expression {
    ExprPtr operand;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

// Anonymous method: [async] func(params) { ... }
// Parenthesized lambda: [async] (params) => { ... } | expr
struct FunctionExpr : Expression, Callable {
    bool is_lambda = false;
    // Set for `(params) => expr`; body is then null
    ExprPtr expression_body;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

// ============================================================================
// Statements
// ============================================================================

struct VarDecl : Statement {
    std::string name;
    std::string type_name;
    ExprPtr initializer;
    size_t name_offset = 0;
    // Class fields only
    bool is_private = false;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

struct BlockStmt : Statement {
    std::vector<StmtPtr> statements;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

struct IfStmt : Statement {
    ExprPtr condition;
    StmtPtr then_branch;
    StmtPtr else_branch;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

struct WhileStmt : Statement {
    ExprPtr condition;
    StmtPtr body;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

struct ForStmt : Statement {
    std::string var_name;
    size_t var_offset = 0;
    ExprPtr iterable;
    StmtPtr body;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

struct ReturnStmt : Statement {
    ExprPtr value;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

struct BreakStmt : Statement {
    void accept(ASTVisitor& visitor) override;
};

struct ContinueStmt : Statement {
    void accept(ASTVisitor& visitor) override;
};

struct ExpressionStmt : Statement {
    ExprPtr expression;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

// ============================================================================
// Declarations
// ============================================================================

struct FunctionDecl : Declaration, Callable {
    std::string name;
    bool is_extern = false;
    bool is_private = false;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

struct PropertyDecl : Declaration {
    std::string name;
    ExprPtr getter;
    bool is_private = false;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

// Members are VarDecl fields, PropertyDecl and FunctionDecl methods
struct ClassDecl : Declaration {
    std::string name;
    std::vector<NodePtr> members;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

struct EnumDecl : Declaration {
    std::string name;
    std::vector<std::string> values;
    void accept(ASTVisitor& visitor) override;
};

// Root node; declarations are FunctionDecl, ClassDecl, EnumDecl and global VarDecl
struct Program : Node {
    std::vector<NodePtr> declarations;
    // Every token of the unit, END_OF_FILE included, so comment trivia stays reachable
    std::vector<Token> tokens;
    std::string filename;
    void accept(ASTVisitor& visitor) override;
    std::vector<Node*> children() override;
};

// Visitor interface
class ASTVisitor {
public:
    virtual ~ASTVisitor() = default;

    virtual void visit(IntegerLiteral& node) = 0;
    virtual void visit(FloatLiteral& node) = 0;
    virtual void visit(StringLiteral& node) = 0;
    virtual void visit(CharLiteral& node) = 0;
    virtual void visit(BoolLiteral& node) = 0;
    virtual void visit(NullLiteral& node) = 0;
    virtual void visit(ThisExpr& node) = 0;
    virtual void visit(Identifier& node) = 0;
    virtual void visit(UnaryExpr& node) = 0;
    virtual void visit(BinaryExpr& node) = 0;
    virtual void visit(AssignExpr& node) = 0;
    virtual void visit(CallExpr& node) = 0;
    virtual void visit(MemberExpr& node) = 0;
    virtual void visit(IndexExpr& node) = 0;
    virtual void visit(ListExpr& node) = 0;
    virtual void visit(NewExpr& node) = 0;
    virtual void visit(AwaitExpr& node) = 0;
    virtual void visit(FunctionExpr& node) = 0;
    virtual void visit(VarDecl& node) = 0;
    virtual void visit(BlockStmt& node) = 0;
    virtual void visit(IfStmt& node) = 0;
    virtual void visit(WhileStmt& node) = 0;
    virtual void visit(ForStmt& node) = 0;
    virtual void visit(ReturnStmt& node) = 0;
    virtual void visit(BreakStmt& node) = 0;
    virtual void visit(ContinueStmt& node) = 0;
    virtual void visit(ExpressionStmt& node) = 0;
    virtual void visit(FunctionDecl& node) = 0;
    virtual void visit(PropertyDecl& node) = 0;
    virtual void visit(ClassDecl& node) = 0;
    virtual void visit(EnumDecl& node) = 0;
    virtual void visit(Program& node) = 0;
};

// Set the parent pointer of every node below root
void link_parents(Node& root);

// Enclosing function, anonymous method or lambda of a node (nullptr at top level)
Node* enclosing_callable(const Node& node);

// Innermost statement whose span contains offset; function bodies are not
// considered statements
Statement* innermost_statement(Node& root, size_t offset);

} // namespace snap
