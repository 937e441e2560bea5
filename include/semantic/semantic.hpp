#pragma once

#include "ast/ast.hpp"
#include "compiler/diagnostic.hpp"

#include <set>
#include <string>
#include <vector>

namespace snap {

// A local variable or parameter visible at some position
struct LocalSymbol {
    std::string name;
    // Declared type annotation, empty when omitted
    std::string type_name;
    // Offset of the declaration (the `var` keyword, loop variable or parameter name)
    size_t declared_at = 0;
    bool is_parameter = false;
};

/**
 * Locals a naive lookup sees at a statement: parameters of every enclosing
 * function or lambda, loop variables of enclosing `for` statements whose
 * body holds the statement, and every variable declared directly in each
 * enclosing block regardless of position. Inner declarations shadow outer
 * ones. Sorted by declaration offset.
 */
std::vector<LocalSymbol> lookup_locals(const Node& position);

class SemanticAnalyzer : public ASTVisitor {
public:
    SemanticAnalyzer();

    // Analyze a program; returns true when no errors were found
    bool analyze(Program& program);

    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    void visit(IntegerLiteral& node) override;
    void visit(FloatLiteral& node) override;
    void visit(StringLiteral& node) override;
    void visit(CharLiteral& node) override;
    void visit(BoolLiteral& node) override;
    void visit(NullLiteral& node) override;
    void visit(ThisExpr& node) override;
    void visit(Identifier& node) override;
    void visit(UnaryExpr& node) override;
    void visit(BinaryExpr& node) override;
    void visit(AssignExpr& node) override;
    void visit(CallExpr& node) override;
    void visit(MemberExpr& node) override;
    void visit(IndexExpr& node) override;
    void visit(ListExpr& node) override;
    void visit(NewExpr& node) override;
    void visit(AwaitExpr& node) override;
    void visit(FunctionExpr& node) override;
    void visit(VarDecl& node) override;
    void visit(BlockStmt& node) override;
    void visit(IfStmt& node) override;
    void visit(WhileStmt& node) override;
    void visit(ForStmt& node) override;
    void visit(ReturnStmt& node) override;
    void visit(BreakStmt& node) override;
    void visit(ContinueStmt& node) override;
    void visit(ExpressionStmt& node) override;
    void visit(FunctionDecl& node) override;
    void visit(PropertyDecl& node) override;
    void visit(ClassDecl& node) override;
    void visit(EnumDecl& node) override;
    void visit(Program& node) override;

private:
    struct FunctionContext {
        bool is_async = false;
        int loop_depth = 0;
    };

    std::vector<Diagnostic> diagnostics_;
    std::vector<FunctionContext> functions_;
    std::vector<std::set<std::string>> scopes_;
    std::set<std::string> classes_;
    bool in_class_ = false;

    void error(const Node& node, const std::string& message);
    void declare(const Node& node, const std::string& name, const std::string& what);
    void visit_callable(Callable& callable, const Node& node);
    void visit_optional(Node* node);
};

} // namespace snap
