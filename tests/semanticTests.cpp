#include "lexer/lexer.hpp"
#include "parser/parser.hpp"
#include "semantic/semantic.hpp"

#include <gtest/gtest.h>

using namespace snap;

namespace {

std::unique_ptr<Program> parse(const std::string &source) {
	Lexer lexer(source);
	Parser parser(lexer);
	auto program = parser.parse();
	EXPECT_FALSE(parser.has_errors());
	return program;
}

std::vector<std::string> analyze(const std::string &source) {
	auto program = parse(source);
	SemanticAnalyzer analyzer;
	analyzer.analyze(*program);
	std::vector<std::string> messages;
	for (const auto &diagnostic : analyzer.diagnostics()) {
		messages.push_back(diagnostic.message);
	}
	return messages;
}

std::vector<std::string> localsAt(Program &program, const std::string &source, const std::string &needle) {
	Statement *statement = innermost_statement(program, source.find(needle));
	EXPECT_NE(statement, nullptr);
	std::vector<std::string> names;
	if (statement) {
		for (const auto &local : lookup_locals(*statement)) {
			names.push_back(local.name);
		}
	}
	return names;
}

} // namespace

TEST(Semantic, AcceptsWellFormedProgram) {
	EXPECT_TRUE(analyze("async func main() { var t = spawn(() => 1); var v = await t; for (var i in [1]) { break; } }")
	                .empty());
}

TEST(Semantic, AwaitOutsideAsync) {
	auto messages = analyze("func main() { await delay(1); }");
	ASSERT_EQ(messages.size(), 1u);
	EXPECT_EQ(messages[0], "'await' can only be used inside an async function");
}

TEST(Semantic, BreakOutsideLoop) {
	auto messages = analyze("func main() { break; }");
	ASSERT_EQ(messages.size(), 1u);
	EXPECT_EQ(messages[0], "'break' outside of a loop");
}

TEST(Semantic, DuplicateDeclarations) {
	auto messages = analyze("func main() { var a = 1; var a = 2; }\nfunc main() { }");
	ASSERT_EQ(messages.size(), 2u);
	EXPECT_NE(messages[0].find("'a'"), std::string::npos);
	EXPECT_NE(messages[1].find("'main'"), std::string::npos);
}

TEST(LookupLocals, SeesWholeEnclosingBlocks) {
	std::string source = "func f(p) {\n"
	                     "  var before = 1;\n"
	                     "  if (p) {\n"
	                     "    var inner = 2;\n"
	                     "    print(inner);\n"
	                     "  }\n"
	                     "  var after = 3;\n"
	                     "}\n";
	auto program = parse(source);
	std::vector<std::string> expected = {"p", "before", "inner", "after"};
	EXPECT_EQ(localsAt(*program, source, "print"), expected);
}

TEST(LookupLocals, LoopVariableOnlyInsideBody) {
	std::string source = "func f(items) {\n"
	                     "  for (var item in items) print(item);\n"
	                     "  return 0;\n"
	                     "}\n";
	auto program = parse(source);
	std::vector<std::string> inside = {"items", "item"};
	EXPECT_EQ(localsAt(*program, source, "print"), inside);
	std::vector<std::string> outside = {"items"};
	EXPECT_EQ(localsAt(*program, source, "return"), outside);
}

TEST(LookupLocals, LambdasCaptureButFunctionsDoNot) {
	std::string source = "var global = 0;\n"
	                     "func f(a) {\n"
	                     "  var outer = 1;\n"
	                     "  var g = (b) => { var c = b; return c; };\n"
	                     "}\n";
	auto program = parse(source);
	std::vector<std::string> expected = {"a", "outer", "g", "b", "c"};
	EXPECT_EQ(localsAt(*program, source, "return"), expected);
}

TEST(LookupLocals, InnerNamesShadowOuter) {
	std::string source = "func f(x) {\n"
	                     "  var h = func(x) { print(x); };\n"
	                     "}\n";
	auto program = parse(source);
	Statement *statement = innermost_statement(*program, source.find("print"));
	ASSERT_NE(statement, nullptr);
	auto locals = lookup_locals(*statement);
	ASSERT_EQ(locals.size(), 2u);
	EXPECT_EQ(locals[0].name, "h");
	EXPECT_FALSE(locals[0].is_parameter);
	EXPECT_EQ(locals[1].name, "x");
	EXPECT_TRUE(locals[1].is_parameter);
	EXPECT_EQ(locals[1].declared_at, source.find("x) { print"));
}
