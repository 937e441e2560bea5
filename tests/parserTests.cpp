#include "lexer/lexer.hpp"
#include "parser/parser.hpp"

#include <gtest/gtest.h>

using namespace snap;

namespace {

struct Parsed {
	std::unique_ptr<Program> program;
	std::vector<Diagnostic> diagnostics;
};

Parsed parse(const std::string &source) {
	Lexer lexer(source, "test.snap");
	Parser parser(lexer);
	Parsed parsed;
	parsed.program = parser.parse();
	parsed.diagnostics = parser.diagnostics();
	return parsed;
}

} // namespace

TEST(Parser, Declarations) {
	auto parsed = parse("var g = 1;\n"
	                    "enum Color { Red, Green }\n"
	                    "class Point { var x = 0; private var y = 0; prop sum => this.x + this.y; func init(a) { this.x = a; } }\n"
	                    "extern func host(a);\n"
	                    "async func main() { await host(1); }\n");
	ASSERT_TRUE(parsed.diagnostics.empty()) << parsed.diagnostics[0].toString();
	ASSERT_EQ(parsed.program->declarations.size(), 5u);

	auto *cls = dynamic_cast<ClassDecl *>(parsed.program->declarations[2].get());
	ASSERT_NE(cls, nullptr);
	ASSERT_EQ(cls->members.size(), 4u);
	EXPECT_TRUE(dynamic_cast<VarDecl *>(cls->members[1].get())->is_private);
	EXPECT_NE(dynamic_cast<PropertyDecl *>(cls->members[2].get()), nullptr);

	auto *host = dynamic_cast<FunctionDecl *>(parsed.program->declarations[3].get());
	ASSERT_NE(host, nullptr);
	EXPECT_TRUE(host->is_extern);
	EXPECT_EQ(host->body, nullptr);

	auto *main = dynamic_cast<FunctionDecl *>(parsed.program->declarations[4].get());
	ASSERT_NE(main, nullptr);
	EXPECT_TRUE(main->is_async);
}

TEST(Parser, BracelessBodiesAreEmbedded) {
	auto parsed = parse("func f(x) { if (x) print(1); else { print(2); } while (x) x = x - 1; }");
	ASSERT_TRUE(parsed.diagnostics.empty());
	auto *f = dynamic_cast<FunctionDecl *>(parsed.program->declarations[0].get());
	auto *branch = dynamic_cast<IfStmt *>(f->body->statements[0].get());
	ASSERT_NE(branch, nullptr);
	EXPECT_TRUE(branch->then_branch->embedded);
	EXPECT_FALSE(branch->else_branch->embedded);
	auto *loop = dynamic_cast<WhileStmt *>(f->body->statements[1].get());
	ASSERT_NE(loop, nullptr);
	EXPECT_TRUE(loop->body->embedded);
}

TEST(Parser, DeclarationAsEmbeddedBodyIsAnError) {
	auto parsed = parse("func f(x) { if (x) var y = 1; }");
	ASSERT_EQ(parsed.diagnostics.size(), 1u);
	EXPECT_NE(parsed.diagnostics[0].message.find("cannot be the body"), std::string::npos);
}

TEST(Parser, RecoversAfterErrors) {
	auto parsed = parse("func f() { var = 3; print(1); }\nfunc g() { }");
	EXPECT_FALSE(parsed.diagnostics.empty());
	EXPECT_EQ(parsed.diagnostics[0].filePath, "test.snap");
	EXPECT_EQ(parsed.diagnostics[0].line, 1);
	ASSERT_EQ(parsed.program->declarations.size(), 2u);
	auto *f = dynamic_cast<FunctionDecl *>(parsed.program->declarations[0].get());
	ASSERT_NE(f, nullptr);
	ASSERT_EQ(f->body->statements.size(), 1u);
	EXPECT_NE(dynamic_cast<ExpressionStmt *>(f->body->statements[0].get()), nullptr);
}

TEST(Parser, LambdasAndAnonymousMethods) {
	auto parsed = parse("func f() { var a = (x) => x + 1; var b = async (y) => { return y; }; var c = func(z) { return z; }; }");
	ASSERT_TRUE(parsed.diagnostics.empty());
	auto *f = dynamic_cast<FunctionDecl *>(parsed.program->declarations[0].get());
	auto *a = dynamic_cast<FunctionExpr *>(dynamic_cast<VarDecl *>(f->body->statements[0].get())->initializer.get());
	auto *b = dynamic_cast<FunctionExpr *>(dynamic_cast<VarDecl *>(f->body->statements[1].get())->initializer.get());
	auto *c = dynamic_cast<FunctionExpr *>(dynamic_cast<VarDecl *>(f->body->statements[2].get())->initializer.get());
	ASSERT_TRUE(a && b && c);
	EXPECT_TRUE(a->is_lambda);
	EXPECT_NE(a->expression_body, nullptr);
	EXPECT_TRUE(b->is_async);
	EXPECT_NE(b->body, nullptr);
	EXPECT_FALSE(c->is_lambda);
}

TEST(Parser, SpansAndStatementLookup) {
	std::string source = "func f() {\n  var x = 1;\n  /* Breakpoint */ print(x);\n}";
	auto parsed = parse(source);
	ASSERT_TRUE(parsed.diagnostics.empty());

	size_t call = source.find("print");
	Statement *statement = innermost_statement(*parsed.program, call + 2);
	ASSERT_NE(statement, nullptr);
	EXPECT_NE(dynamic_cast<ExpressionStmt *>(statement), nullptr);
	EXPECT_EQ(statement->start, call);
	EXPECT_EQ(statement->end, source.find(";\n}") + 1);
	EXPECT_EQ(statement->full_start, source.find(";\n  /*") + 1);

	Node *callable = enclosing_callable(*statement);
	ASSERT_NE(callable, nullptr);
	EXPECT_EQ(dynamic_cast<FunctionDecl *>(callable)->name, "f");

	// The function body itself is not a statement
	EXPECT_EQ(innermost_statement(*parsed.program, source.find('{')), nullptr);
}

TEST(Parser, GenericTypeAnnotations) {
	auto parsed = parse("func f(items: List<Map<string, int>>) { var n: int = 0; }");
	ASSERT_TRUE(parsed.diagnostics.empty());
	auto *f = dynamic_cast<FunctionDecl *>(parsed.program->declarations[0].get());
	EXPECT_EQ(f->params[0].type_name, "List<Map<string, int>>");
	EXPECT_EQ(dynamic_cast<VarDecl *>(f->body->statements[0].get())->type_name, "int");
}
