#include "semantic/semantic.hpp"

#include <algorithm>

namespace snap {

// ============================================================================
// Scope lookup
// ============================================================================

std::vector<LocalSymbol> lookup_locals(const Node& position) {
    std::vector<LocalSymbol> locals;
    std::set<std::string> seen;

    auto add = [&](LocalSymbol symbol) {
        if (seen.insert(symbol.name).second) {
            locals.push_back(std::move(symbol));
        }
    };

    const Node* child = &position;
    for (const Node* current = position.parent; current; child = current, current = current->parent) {
        if (const auto* block = dynamic_cast<const BlockStmt*>(current)) {
            for (const auto& statement : block->statements) {
                if (const auto* decl = dynamic_cast<const VarDecl*>(statement.get())) {
                    add({decl->name, decl->type_name, decl->start, false});
                }
            }
        } else if (const auto* loop = dynamic_cast<const ForStmt*>(current)) {
            if (child == loop->body.get()) {
                add({loop->var_name, "", loop->var_offset, false});
            }
        } else if (const auto* callable = dynamic_cast<const Callable*>(current)) {
            for (const auto& param : callable->params) {
                add({param.name, param.type_name, param.offset, true});
            }
            // Named functions do not capture; lambdas and anonymous methods do
            if (dynamic_cast<const FunctionDecl*>(current)) {
                break;
            }
        } else if (dynamic_cast<const ClassDecl*>(current) || dynamic_cast<const Program*>(current)) {
            break;
        }
    }

    std::stable_sort(locals.begin(), locals.end(), [](const LocalSymbol& a, const LocalSymbol& b) {
        return a.declared_at < b.declared_at;
    });
    return locals;
}

// ============================================================================
// SemanticAnalyzer
// ============================================================================

SemanticAnalyzer::SemanticAnalyzer() = default;

bool SemanticAnalyzer::analyze(Program& program) {
    program.accept(*this);
    return !hasErrors(diagnostics_);
}

void SemanticAnalyzer::error(const Node& node, const std::string& message) {
    diagnostics_.emplace_back(message, node.location.filename,
                              static_cast<int>(node.location.line),
                              static_cast<int>(node.location.column) - 1);
}

void SemanticAnalyzer::declare(const Node& node, const std::string& name, const std::string& what) {
    if (scopes_.empty()) {
        return;
    }
    if (!scopes_.back().insert(name).second) {
        error(node, "Duplicate " + what + " '" + name + "'");
    }
}

void SemanticAnalyzer::visit_optional(Node* node) {
    if (node) {
        node->accept(*this);
    }
}

void SemanticAnalyzer::visit_callable(Callable& callable, const Node& node) {
    functions_.push_back({callable.is_async, 0});
    scopes_.emplace_back();
    for (const auto& param : callable.params) {
        declare(node, param.name, "parameter");
    }
    visit_optional(callable.body.get());
    scopes_.pop_back();
    functions_.pop_back();
}

void SemanticAnalyzer::visit(IntegerLiteral& node) { (void)node; }
void SemanticAnalyzer::visit(FloatLiteral& node) { (void)node; }
void SemanticAnalyzer::visit(StringLiteral& node) { (void)node; }
void SemanticAnalyzer::visit(CharLiteral& node) { (void)node; }
void SemanticAnalyzer::visit(BoolLiteral& node) { (void)node; }
void SemanticAnalyzer::visit(NullLiteral& node) { (void)node; }

void SemanticAnalyzer::visit(ThisExpr& node) {
    if (!in_class_ || functions_.empty()) {
        error(node, "'this' can only be used inside a class method");
    }
}

// Names resolve at run time; references and externs may supply them
void SemanticAnalyzer::visit(Identifier& node) { (void)node; }

void SemanticAnalyzer::visit(UnaryExpr& node) {
    visit_optional(node.operand.get());
}

void SemanticAnalyzer::visit(BinaryExpr& node) {
    visit_optional(node.left.get());
    visit_optional(node.right.get());
}

void SemanticAnalyzer::visit(AssignExpr& node) {
    visit_optional(node.target.get());
    visit_optional(node.value.get());
}

void SemanticAnalyzer::visit(CallExpr& node) {
    visit_optional(node.callee.get());
    for (auto& arg : node.arguments) {
        visit_optional(arg.get());
    }
}

void SemanticAnalyzer::visit(MemberExpr& node) {
    visit_optional(node.object.get());
}

void SemanticAnalyzer::visit(IndexExpr& node) {
    visit_optional(node.object.get());
    visit_optional(node.index.get());
}

void SemanticAnalyzer::visit(ListExpr& node) {
    for (auto& element : node.elements) {
        visit_optional(element.get());
    }
}

void SemanticAnalyzer::visit(NewExpr& node) {
    for (auto& arg : node.arguments) {
        visit_optional(arg.get());
    }
}

void SemanticAnalyzer::visit(AwaitExpr& node) {
    if (functions_.empty() || !functions_.back().is_async) {
        error(node, "'await' can only be used inside an async function");
    }
    visit_optional(node.operand.get());
}

void SemanticAnalyzer::visit(FunctionExpr& node) {
    visit_callable(node, node);
    if (node.expression_body) {
        functions_.push_back({node.is_async, 0});
        node.expression_body->accept(*this);
        functions_.pop_back();
    }
}

void SemanticAnalyzer::visit(VarDecl& node) {
    visit_optional(node.initializer.get());
    declare(node, node.name, "variable");
}

void SemanticAnalyzer::visit(BlockStmt& node) {
    scopes_.emplace_back();
    for (auto& statement : node.statements) {
        statement->accept(*this);
    }
    scopes_.pop_back();
}

void SemanticAnalyzer::visit(IfStmt& node) {
    visit_optional(node.condition.get());
    visit_optional(node.then_branch.get());
    visit_optional(node.else_branch.get());
}

void SemanticAnalyzer::visit(WhileStmt& node) {
    visit_optional(node.condition.get());
    if (!functions_.empty()) functions_.back().loop_depth++;
    visit_optional(node.body.get());
    if (!functions_.empty()) functions_.back().loop_depth--;
}

void SemanticAnalyzer::visit(ForStmt& node) {
    visit_optional(node.iterable.get());
    scopes_.emplace_back();
    declare(node, node.var_name, "variable");
    if (!functions_.empty()) functions_.back().loop_depth++;
    visit_optional(node.body.get());
    if (!functions_.empty()) functions_.back().loop_depth--;
    scopes_.pop_back();
}

void SemanticAnalyzer::visit(ReturnStmt& node) {
    visit_optional(node.value.get());
}

void SemanticAnalyzer::visit(BreakStmt& node) {
    if (functions_.empty() || functions_.back().loop_depth == 0) {
        error(node, "'break' outside of a loop");
    }
}

void SemanticAnalyzer::visit(ContinueStmt& node) {
    if (functions_.empty() || functions_.back().loop_depth == 0) {
        error(node, "'continue' outside of a loop");
    }
}

void SemanticAnalyzer::visit(ExpressionStmt& node) {
    visit_optional(node.expression.get());
}

void SemanticAnalyzer::visit(FunctionDecl& node) {
    declare(node, node.name, "function");
    visit_callable(node, node);
}

void SemanticAnalyzer::visit(PropertyDecl& node) {
    declare(node, node.name, "member");
    functions_.push_back({false, 0});
    visit_optional(node.getter.get());
    functions_.pop_back();
}

void SemanticAnalyzer::visit(ClassDecl& node) {
    declare(node, node.name, "class");
    in_class_ = true;
    scopes_.emplace_back();
    for (auto& member : node.members) {
        if (auto* field = dynamic_cast<VarDecl*>(member.get())) {
            // Field initializers run inside the instance
            functions_.push_back({false, 0});
            visit_optional(field->initializer.get());
            functions_.pop_back();
            declare(*field, field->name, "member");
        } else {
            member->accept(*this);
        }
    }
    scopes_.pop_back();
    in_class_ = false;
}

void SemanticAnalyzer::visit(EnumDecl& node) {
    declare(node, node.name, "enum");
    std::set<std::string> values;
    for (const auto& value : node.values) {
        if (!values.insert(value).second) {
            error(node, "Duplicate enum value '" + value + "' in '" + node.name + "'");
        }
    }
}

void SemanticAnalyzer::visit(Program& node) {
    scopes_.emplace_back();
    for (auto& decl : node.declarations) {
        decl->accept(*this);
    }
    scopes_.pop_back();
}

} // namespace snap
