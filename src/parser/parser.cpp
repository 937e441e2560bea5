#include "parser/parser.hpp"

namespace snap {

Parser::Parser(Lexer& lexer) {
    std::vector<Token> all = lexer.tokenize();
    if (!all.empty()) {
        filename_ = all.front().location.filename;
    }

    // Lexical errors are reported once here; the parser never sees them
    for (const Token& token : all) {
        if (token.type == TokenType::ERROR) {
            const auto* message = std::get_if<std::string>(&token.value);
            error_at(token, message ? *message : "Invalid token");
        } else {
            tokens_.push_back(token);
        }
    }
    program_tokens_ = std::move(all);
}

std::unique_ptr<Program> Parser::parse() {
    auto program = std::make_unique<Program>();
    program->filename = filename_;
    program->location = {1, 1, filename_};

    while (!at_end()) {
        size_t before = current_;
        try {
            if (NodePtr decl = parse_declaration()) {
                program->declarations.push_back(std::move(decl));
            }
        } catch (const ParseError&) {
            synchronize();
            if (current_ == before) {
                advance();
            }
        }
    }

    program->end = peek().offset;
    program->tokens = std::move(program_tokens_);
    link_parents(*program);
    return program;
}

// ============================================================================
// Token helpers
// ============================================================================

const Token& Parser::peek(size_t ahead) const {
    size_t index = current_ + ahead;
    if (index >= tokens_.size()) {
        return tokens_.back();
    }
    return tokens_[index];
}

const Token& Parser::previous() const {
    return tokens_[current_ == 0 ? 0 : current_ - 1];
}

const Token& Parser::advance() {
    if (!at_end()) {
        current_++;
    }
    return previous();
}

bool Parser::check(TokenType type) const {
    return peek().type == type;
}

bool Parser::match(TokenType type) {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

const Token& Parser::expect(TokenType type, const std::string& context) {
    if (check(type)) {
        return advance();
    }
    error_at(peek(), "Expected " + std::string(tokenTypeToString(type)) + " " + context +
                     ", got " + std::string(tokenTypeToString(peek().type)));
    throw ParseError{};
}

bool Parser::at_end() const {
    return peek().type == TokenType::END_OF_FILE;
}

void Parser::error_at(const Token& token, const std::string& message) {
    diagnostics_.emplace_back(message, token.location.filename,
                              static_cast<int>(token.location.line),
                              static_cast<int>(token.location.column) - 1);
}

void Parser::synchronize() {
    while (!at_end()) {
        if (check(TokenType::RBRACE)) {
            return;
        }
        if (advance().type == TokenType::SEMICOLON) {
            return;
        }
    }
}

template <typename T>
std::unique_ptr<T> Parser::begin_node(const Token& first) {
    auto node = std::make_unique<T>();
    node->location = first.location;
    node->start = first.offset;
    node->full_start = first.full_start;
    node->end = first.end();
    return node;
}

void Parser::finish_node(Node& node) {
    if (current_ > 0 && previous().end() > node.start) {
        node.end = previous().end();
    }
}

// ============================================================================
// Declarations
// ============================================================================

NodePtr Parser::parse_declaration() {
    switch (peek().type) {
        case TokenType::FUNC:
            return parse_function(false);
        case TokenType::ASYNC:
            if (peek(1).type == TokenType::FUNC) {
                return parse_function(false);
            }
            break;
        case TokenType::EXTERN:
            return parse_function(true);
        case TokenType::CLASS:
            return parse_class();
        case TokenType::ENUM:
            return parse_enum();
        case TokenType::VAR:
            return parse_var_decl();
        default:
            break;
    }
    error_at(peek(), "Expected declaration, got " + std::string(tokenTypeToString(peek().type)));
    throw ParseError{};
}

std::unique_ptr<FunctionDecl> Parser::parse_function(bool is_extern) {
    auto func = begin_node<FunctionDecl>(peek());
    func->is_extern = is_extern;
    if (is_extern) {
        expect(TokenType::EXTERN, "");
    }
    func->is_async = match(TokenType::ASYNC);
    expect(TokenType::FUNC, "in function declaration");
    func->name = expect(TokenType::IDENTIFIER, "after 'func'").lexeme;
    func->params = parse_parameters();

    if (is_extern) {
        expect(TokenType::SEMICOLON, "after extern function declaration");
    } else {
        func->body = parse_block();
    }
    finish_node(*func);
    return func;
}

std::unique_ptr<ClassDecl> Parser::parse_class() {
    auto cls = begin_node<ClassDecl>(peek());
    expect(TokenType::CLASS, "");
    cls->name = expect(TokenType::IDENTIFIER, "after 'class'").lexeme;
    expect(TokenType::LBRACE, "before class body");

    while (!check(TokenType::RBRACE) && !at_end()) {
        size_t before = current_;
        try {
            cls->members.push_back(parse_member());
        } catch (const ParseError&) {
            synchronize();
            if (current_ == before) {
                advance();
            }
        }
    }

    expect(TokenType::RBRACE, "after class body");
    finish_node(*cls);
    return cls;
}

NodePtr Parser::parse_member() {
    const Token& first = peek();
    bool is_private = match(TokenType::PRIVATE);

    if (check(TokenType::VAR)) {
        auto field = parse_var_decl();
        field->is_private = is_private;
        field->location = first.location;
        field->start = first.offset;
        field->full_start = first.full_start;
        return field;
    }

    if (check(TokenType::PROP)) {
        auto prop = begin_node<PropertyDecl>(first);
        advance();
        prop->is_private = is_private;
        prop->name = expect(TokenType::IDENTIFIER, "after 'prop'").lexeme;
        expect(TokenType::ARROW, "after property name");
        prop->getter = parse_expression();
        expect(TokenType::SEMICOLON, "after property");
        finish_node(*prop);
        return prop;
    }

    if (check(TokenType::FUNC) || (check(TokenType::ASYNC) && peek(1).type == TokenType::FUNC)) {
        auto method = parse_function(false);
        method->is_private = is_private;
        method->location = first.location;
        method->start = first.offset;
        method->full_start = first.full_start;
        return method;
    }

    error_at(peek(), "Expected class member, got " + std::string(tokenTypeToString(peek().type)));
    throw ParseError{};
}

std::unique_ptr<EnumDecl> Parser::parse_enum() {
    auto decl = begin_node<EnumDecl>(peek());
    expect(TokenType::ENUM, "");
    decl->name = expect(TokenType::IDENTIFIER, "after 'enum'").lexeme;
    expect(TokenType::LBRACE, "before enum values");
    do {
        decl->values.push_back(expect(TokenType::IDENTIFIER, "in enum").lexeme);
    } while (match(TokenType::COMMA));
    expect(TokenType::RBRACE, "after enum values");
    finish_node(*decl);
    return decl;
}

std::vector<Parameter> Parser::parse_parameters() {
    std::vector<Parameter> params;
    expect(TokenType::LPAREN, "before parameters");
    if (!check(TokenType::RPAREN)) {
        do {
            const Token& name = expect(TokenType::IDENTIFIER, "as parameter name");
            Parameter param;
            param.name = name.lexeme;
            param.location = name.location;
            param.offset = name.offset;
            if (match(TokenType::COLON)) {
                param.type_name = parse_type();
            }
            params.push_back(std::move(param));
        } while (match(TokenType::COMMA));
    }
    expect(TokenType::RPAREN, "after parameters");
    return params;
}

std::string Parser::parse_type() {
    std::string type = expect(TokenType::IDENTIFIER, "as type name").lexeme;
    if (match(TokenType::LESS)) {
        type += "<";
        do {
            type += parse_type();
            if (check(TokenType::COMMA)) {
                type += ", ";
            }
        } while (match(TokenType::COMMA));
        expect(TokenType::GREATER, "after type arguments");
        type += ">";
    }
    return type;
}

// ============================================================================
// Statements
// ============================================================================

StmtPtr Parser::parse_statement() {
    switch (peek().type) {
        case TokenType::VAR:
            return parse_var_decl();
        case TokenType::LBRACE:
            return parse_block();
        case TokenType::IF:
            return parse_if();
        case TokenType::WHILE:
            return parse_while();
        case TokenType::FOR:
            return parse_for();
        case TokenType::RETURN:
            return parse_return();
        case TokenType::BREAK: {
            auto stmt = begin_node<BreakStmt>(advance());
            expect(TokenType::SEMICOLON, "after 'break'");
            finish_node(*stmt);
            return stmt;
        }
        case TokenType::CONTINUE: {
            auto stmt = begin_node<ContinueStmt>(advance());
            expect(TokenType::SEMICOLON, "after 'continue'");
            finish_node(*stmt);
            return stmt;
        }
        default:
            return parse_expression_statement();
    }
}

StmtPtr Parser::parse_embedded_statement() {
    if (check(TokenType::VAR)) {
        error_at(peek(), "A variable declaration cannot be the body of an if, while or for statement");
    }
    StmtPtr stmt = parse_statement();
    if (!dynamic_cast<BlockStmt*>(stmt.get())) {
        stmt->embedded = true;
    }
    return stmt;
}

std::unique_ptr<VarDecl> Parser::parse_var_decl() {
    auto decl = begin_node<VarDecl>(peek());
    expect(TokenType::VAR, "");
    const Token& name = expect(TokenType::IDENTIFIER, "after 'var'");
    decl->name = name.lexeme;
    decl->name_offset = name.offset;
    if (match(TokenType::COLON)) {
        decl->type_name = parse_type();
    }
    if (match(TokenType::ASSIGN)) {
        decl->initializer = parse_expression();
    }
    expect(TokenType::SEMICOLON, "after variable declaration");
    finish_node(*decl);
    return decl;
}

std::unique_ptr<BlockStmt> Parser::parse_block() {
    auto block = begin_node<BlockStmt>(peek());
    expect(TokenType::LBRACE, "to open block");

    while (!check(TokenType::RBRACE) && !at_end()) {
        size_t before = current_;
        try {
            block->statements.push_back(parse_statement());
        } catch (const ParseError&) {
            synchronize();
            if (current_ == before) {
                advance();
            }
        }
    }

    if (!match(TokenType::RBRACE)) {
        error_at(peek(), "Expected '}' to close block, got " + std::string(tokenTypeToString(peek().type)));
    }
    finish_node(*block);
    return block;
}

StmtPtr Parser::parse_if() {
    auto stmt = begin_node<IfStmt>(advance());
    expect(TokenType::LPAREN, "after 'if'");
    stmt->condition = parse_expression();
    expect(TokenType::RPAREN, "after condition");
    stmt->then_branch = parse_embedded_statement();
    if (match(TokenType::ELSE)) {
        stmt->else_branch = parse_embedded_statement();
    }
    finish_node(*stmt);
    return stmt;
}

StmtPtr Parser::parse_while() {
    auto stmt = begin_node<WhileStmt>(advance());
    expect(TokenType::LPAREN, "after 'while'");
    stmt->condition = parse_expression();
    expect(TokenType::RPAREN, "after condition");
    stmt->body = parse_embedded_statement();
    finish_node(*stmt);
    return stmt;
}

StmtPtr Parser::parse_for() {
    auto stmt = begin_node<ForStmt>(advance());
    expect(TokenType::LPAREN, "after 'for'");
    expect(TokenType::VAR, "in for statement");
    const Token& name = expect(TokenType::IDENTIFIER, "after 'var'");
    stmt->var_name = name.lexeme;
    stmt->var_offset = name.offset;
    expect(TokenType::IN, "after loop variable");
    stmt->iterable = parse_expression();
    expect(TokenType::RPAREN, "after for header");
    stmt->body = parse_embedded_statement();
    finish_node(*stmt);
    return stmt;
}

StmtPtr Parser::parse_return() {
    auto stmt = begin_node<ReturnStmt>(advance());
    if (!check(TokenType::SEMICOLON)) {
        stmt->value = parse_expression();
    }
    expect(TokenType::SEMICOLON, "after return statement");
    finish_node(*stmt);
    return stmt;
}

StmtPtr Parser::parse_expression_statement() {
    auto stmt = begin_node<ExpressionStmt>(peek());
    stmt->expression = parse_expression();
    expect(TokenType::SEMICOLON, "after expression");
    finish_node(*stmt);
    return stmt;
}

// ============================================================================
// Expressions
// ============================================================================

ExprPtr Parser::parse_expression() {
    return parse_assignment();
}

ExprPtr Parser::parse_assignment() {
    const Token& first = peek();
    ExprPtr target = parse_or();

    if (check(TokenType::ASSIGN) || check(TokenType::PLUS_ASSIGN) || check(TokenType::MINUS_ASSIGN)) {
        const Token& op = advance();
        if (!dynamic_cast<Identifier*>(target.get()) && !dynamic_cast<MemberExpr*>(target.get()) &&
            !dynamic_cast<IndexExpr*>(target.get())) {
            error_at(op, "Invalid assignment target");
            throw ParseError{};
        }
        auto assign = begin_node<AssignExpr>(first);
        assign->op = op.type;
        assign->target = std::move(target);
        assign->value = parse_assignment();
        finish_node(*assign);
        return assign;
    }
    return target;
}

ExprPtr Parser::make_binary(const Token& first, TokenType op, ExprPtr left, ExprPtr right) {
    auto binary = begin_node<BinaryExpr>(first);
    binary->op = op;
    binary->left = std::move(left);
    binary->right = std::move(right);
    finish_node(*binary);
    return binary;
}

ExprPtr Parser::parse_or() {
    const Token& first = peek();
    ExprPtr left = parse_and();
    while (match(TokenType::OR)) {
        left = make_binary(first, TokenType::OR, std::move(left), parse_and());
    }
    return left;
}

ExprPtr Parser::parse_and() {
    const Token& first = peek();
    ExprPtr left = parse_equality();
    while (match(TokenType::AND)) {
        left = make_binary(first, TokenType::AND, std::move(left), parse_equality());
    }
    return left;
}

ExprPtr Parser::parse_equality() {
    const Token& first = peek();
    ExprPtr left = parse_comparison();
    while (check(TokenType::EQUALS) || check(TokenType::NOT_EQUALS)) {
        TokenType op = advance().type;
        left = make_binary(first, op, std::move(left), parse_comparison());
    }
    return left;
}

ExprPtr Parser::parse_comparison() {
    const Token& first = peek();
    ExprPtr left = parse_additive();
    while (check(TokenType::LESS) || check(TokenType::LESS_EQUAL) ||
           check(TokenType::GREATER) || check(TokenType::GREATER_EQUAL)) {
        TokenType op = advance().type;
        left = make_binary(first, op, std::move(left), parse_additive());
    }
    return left;
}

ExprPtr Parser::parse_additive() {
    const Token& first = peek();
    ExprPtr left = parse_multiplicative();
    while (check(TokenType::PLUS) || check(TokenType::MINUS)) {
        TokenType op = advance().type;
        left = make_binary(first, op, std::move(left), parse_multiplicative());
    }
    return left;
}

ExprPtr Parser::parse_multiplicative() {
    const Token& first = peek();
    ExprPtr left = parse_unary();
    while (check(TokenType::STAR) || check(TokenType::SLASH) || check(TokenType::PERCENT)) {
        TokenType op = advance().type;
        left = make_binary(first, op, std::move(left), parse_unary());
    }
    return left;
}

ExprPtr Parser::parse_unary() {
    if (check(TokenType::NOT) || check(TokenType::MINUS)) {
        const Token& op = advance();
        auto unary = begin_node<UnaryExpr>(op);
        unary->op = op.type;
        unary->operand = parse_unary();
        finish_node(*unary);
        return unary;
    }
    if (check(TokenType::AWAIT)) {
        auto await = begin_node<AwaitExpr>(advance());
        await->operand = parse_unary();
        finish_node(*await);
        return await;
    }
    return parse_postfix();
}

ExprPtr Parser::parse_postfix() {
    const Token& first = peek();
    ExprPtr expr = parse_primary();

    while (true) {
        if (match(TokenType::LPAREN)) {
            auto call = begin_node<CallExpr>(first);
            call->callee = std::move(expr);
            call->arguments = parse_arguments();
            finish_node(*call);
            expr = std::move(call);
        } else if (match(TokenType::DOT)) {
            auto member = begin_node<MemberExpr>(first);
            member->object = std::move(expr);
            member->member = expect(TokenType::IDENTIFIER, "after '.'").lexeme;
            finish_node(*member);
            expr = std::move(member);
        } else if (match(TokenType::LBRACKET)) {
            auto index = begin_node<IndexExpr>(first);
            index->object = std::move(expr);
            index->index = parse_expression();
            expect(TokenType::RBRACKET, "after index");
            finish_node(*index);
            expr = std::move(index);
        } else {
            break;
        }
    }
    return expr;
}

// Called after the opening '('
std::vector<ExprPtr> Parser::parse_arguments() {
    std::vector<ExprPtr> args;
    if (!check(TokenType::RPAREN)) {
        do {
            args.push_back(parse_expression());
        } while (match(TokenType::COMMA));
    }
    expect(TokenType::RPAREN, "after arguments");
    return args;
}

// True when the '(' at the cursor opens a lambda parameter list
bool Parser::lambda_ahead() const {
    size_t ahead = check(TokenType::ASYNC) ? 1 : 0;
    if (peek(ahead).type != TokenType::LPAREN) {
        return false;
    }
    int depth = 0;
    for (size_t i = current_ + ahead; i < tokens_.size(); i++) {
        TokenType type = tokens_[i].type;
        if (type == TokenType::LPAREN) {
            depth++;
        } else if (type == TokenType::RPAREN) {
            if (--depth == 0) {
                return i + 1 < tokens_.size() && tokens_[i + 1].type == TokenType::ARROW;
            }
        } else if (type == TokenType::END_OF_FILE || type == TokenType::SEMICOLON ||
                   type == TokenType::LBRACE || type == TokenType::RBRACE) {
            return false;
        }
    }
    return false;
}

ExprPtr Parser::parse_function_expression() {
    auto func = begin_node<FunctionExpr>(peek());
    func->is_async = match(TokenType::ASYNC);

    if (match(TokenType::FUNC)) {
        func->params = parse_parameters();
        func->body = parse_block();
    } else {
        func->is_lambda = true;
        func->params = parse_parameters();
        expect(TokenType::ARROW, "after lambda parameters");
        if (check(TokenType::LBRACE)) {
            func->body = parse_block();
        } else {
            func->expression_body = parse_assignment();
        }
    }
    finish_node(*func);
    return func;
}

ExprPtr Parser::parse_primary() {
    const Token& token = peek();

    switch (token.type) {
        case TokenType::INTEGER: {
            auto literal = begin_node<IntegerLiteral>(advance());
            literal->value = std::get<int64_t>(token.value);
            return literal;
        }
        case TokenType::FLOAT: {
            auto literal = begin_node<FloatLiteral>(advance());
            literal->value = std::get<double>(token.value);
            return literal;
        }
        case TokenType::STRING: {
            auto literal = begin_node<StringLiteral>(advance());
            literal->value = std::get<std::string>(token.value);
            return literal;
        }
        case TokenType::CHAR: {
            auto literal = begin_node<CharLiteral>(advance());
            literal->value = std::get<char>(token.value);
            return literal;
        }
        case TokenType::TRUE:
        case TokenType::FALSE: {
            auto literal = begin_node<BoolLiteral>(advance());
            literal->value = token.type == TokenType::TRUE;
            return literal;
        }
        case TokenType::NULL_LITERAL:
            return begin_node<NullLiteral>(advance());
        case TokenType::THIS:
            return begin_node<ThisExpr>(advance());
        case TokenType::IDENTIFIER: {
            auto ident = begin_node<Identifier>(advance());
            ident->name = token.lexeme;
            return ident;
        }
        case TokenType::FUNC:
            return parse_function_expression();
        case TokenType::ASYNC:
            if (peek(1).type == TokenType::FUNC || lambda_ahead()) {
                return parse_function_expression();
            }
            break;
        case TokenType::LPAREN: {
            if (lambda_ahead()) {
                return parse_function_expression();
            }
            advance();
            ExprPtr inner = parse_expression();
            expect(TokenType::RPAREN, "after expression");
            return inner;
        }
        case TokenType::LBRACKET: {
            auto list = begin_node<ListExpr>(advance());
            if (!check(TokenType::RBRACKET)) {
                do {
                    list->elements.push_back(parse_expression());
                } while (match(TokenType::COMMA));
            }
            expect(TokenType::RBRACKET, "after list elements");
            finish_node(*list);
            return list;
        }
        case TokenType::NEW: {
            auto expr = begin_node<NewExpr>(advance());
            expr->class_name = expect(TokenType::IDENTIFIER, "after 'new'").lexeme;
            expect(TokenType::LPAREN, "after class name");
            expr->arguments = parse_arguments();
            finish_node(*expr);
            return expr;
        }
        default:
            break;
    }

    error_at(token, "Expected expression, got " + std::string(tokenTypeToString(token.type)));
    throw ParseError{};
}

} // namespace snap
