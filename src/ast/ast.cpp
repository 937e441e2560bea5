#include "ast/ast.hpp"

namespace snap {

void IntegerLiteral::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void FloatLiteral::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void StringLiteral::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void CharLiteral::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void BoolLiteral::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void NullLiteral::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ThisExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void Identifier::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void UnaryExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void BinaryExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void AssignExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void CallExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void MemberExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void IndexExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ListExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void NewExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void AwaitExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void FunctionExpr::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void VarDecl::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void BlockStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void IfStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void WhileStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ForStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ReturnStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void BreakStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ContinueStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ExpressionStmt::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void FunctionDecl::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void PropertyDecl::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void ClassDecl::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void EnumDecl::accept(ASTVisitor& visitor) { visitor.visit(*this); }
void Program::accept(ASTVisitor& visitor) { visitor.visit(*this); }

// Null children (missing pieces after a parse error) are skipped
template <typename... Ptrs>
static std::vector<Node*> collect(const Ptrs&... ptrs) {
    std::vector<Node*> result;
    (..., (ptrs ? result.push_back(ptrs.get()) : void()));
    return result;
}

template <typename T>
static void append(std::vector<Node*>& result, const std::vector<std::unique_ptr<T>>& nodes) {
    for (const auto& node : nodes) {
        if (node) result.push_back(node.get());
    }
}

std::vector<Node*> UnaryExpr::children() { return collect(operand); }
std::vector<Node*> BinaryExpr::children() { return collect(left, right); }
std::vector<Node*> AssignExpr::children() { return collect(target, value); }

std::vector<Node*> CallExpr::children() {
    auto result = collect(callee);
    append(result, arguments);
    return result;
}

std::vector<Node*> MemberExpr::children() { return collect(object); }
std::vector<Node*> IndexExpr::children() { return collect(object, index); }

std::vector<Node*> ListExpr::children() {
    std::vector<Node*> result;
    append(result, elements);
    return result;
}

std::vector<Node*> NewExpr::children() {
    std::vector<Node*> result;
    append(result, arguments);
    return result;
}

std::vector<Node*> AwaitExpr::children() { return collect(operand); }
std::vector<Node*> FunctionExpr::children() { return collect(body, expression_body); }
std::vector<Node*> VarDecl::children() { return collect(initializer); }

std::vector<Node*> BlockStmt::children() {
    std::vector<Node*> result;
    append(result, statements);
    return result;
}

std::vector<Node*> IfStmt::children() { return collect(condition, then_branch, else_branch); }
std::vector<Node*> WhileStmt::children() { return collect(condition, body); }
std::vector<Node*> ForStmt::children() { return collect(iterable, body); }
std::vector<Node*> ReturnStmt::children() { return collect(value); }
std::vector<Node*> ExpressionStmt::children() { return collect(expression); }
std::vector<Node*> FunctionDecl::children() { return collect(body); }
std::vector<Node*> PropertyDecl::children() { return collect(getter); }

std::vector<Node*> ClassDecl::children() {
    std::vector<Node*> result;
    append(result, members);
    return result;
}

std::vector<Node*> Program::children() {
    std::vector<Node*> result;
    append(result, declarations);
    return result;
}

void link_parents(Node& root) {
    for (Node* child : root.children()) {
        child->parent = &root;
        link_parents(*child);
    }
}

Node* enclosing_callable(const Node& node) {
    for (Node* current = node.parent; current; current = current->parent) {
        if (dynamic_cast<Callable*>(current)) {
            return current;
        }
    }
    return nullptr;
}

static bool is_function_body(const Node& node) {
    return dynamic_cast<const BlockStmt*>(&node) && node.parent &&
           dynamic_cast<const Callable*>(node.parent);
}

Statement* innermost_statement(Node& root, size_t offset) {
    Statement* best = nullptr;
    for (Node* child : root.children()) {
        if (!child->contains(offset)) {
            continue;
        }
        auto* statement = dynamic_cast<Statement*>(child);
        if (statement && !is_function_body(*child)) {
            best = statement;
        }
        if (Statement* inner = innermost_statement(*child, offset)) {
            best = inner;
        }
        break;
    }
    return best;
}

} // namespace snap
