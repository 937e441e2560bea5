#include "compiler/compilation.hpp"
#include "instrumentation/instrumentor.hpp"
#include "lexer/lexer.hpp"
#include "parser/parser.hpp"
#include "runtime/scriptObjects.hpp"

#include <gtest/gtest.h>

#include <mutex>

using namespace snap;

namespace {

std::unique_ptr<Program> parse(const std::string &source) {
	Lexer lexer(source);
	Parser parser(lexer);
	auto program = parser.parse();
	EXPECT_FALSE(parser.has_errors());
	return program;
}

std::vector<std::string> names(const BreakpointSite &site) {
	std::vector<std::string> result;
	for (const auto &local : site.locals) {
		result.push_back(local.name);
	}
	return result;
}

std::string runMain(const CompileResult &result) {
	EXPECT_TRUE(result.succeeded());
	if (!result.succeeded()) {
		return "";
	}
	std::string output;
	result.module->setOutput([&output](const std::string &text) { output += text; });
	Value value = result.module->call("main");
	if (auto task = value.objectAs<TaskObject>()) {
		task->task().get();
	}
	return output;
}

const std::string loopProgram = "func main() {\n"
                                "  var total = 0;\n"
                                "  for (var i in [1, 2, 3]) /* Breakpoint */ total += i;\n"
                                "  /* Breakpoint */ print(total);\n"
                                "  if (total > 5) /* Breakpoint */ print(\"big\"); else print(\"small\");\n"
                                "  var later = 1;\n"
                                "}\n";

} // namespace

TEST(Instrumentor, UniqueSuffixShape) {
	std::string a = uniqueIdentifierSuffix();
	std::string b = uniqueIdentifierSuffix();
	ASSERT_EQ(a.size(), 33u);
	EXPECT_EQ(a[0], '_');
	EXPECT_EQ(a.find_first_not_of("0123456789abcdef", 1), std::string::npos);
	EXPECT_NE(a, b);
}

TEST(Instrumentor, FindsOnlyMarkerComments) {
	std::string source = "func f() {\n"
	                     "  var s = \"/* Breakpoint */\";\n"
	                     "  // /* Breakpoint */\n"
	                     "  /* Breakpoint! */ print(1);\n"
	                     "  /* Breakpoint */ print(s);\n"
	                     "}\n";
	auto program = parse(source);
	auto markers = findBreakpointMarkers(*program, source);
	ASSERT_EQ(markers.size(), 1u);
	EXPECT_EQ(markers[0], source.find("/* Breakpoint */ print(s)"));
}

TEST(Instrumentor, ExcludesLocalsDeclaredAfterTheMarker) {
	std::string source = "func f(a) {\n"
	                     "  var x = 1;\n"
	                     "  /* Breakpoint */ var y = x + 1;\n"
	                     "  if (a) {\n"
	                     "    var inner = 2;\n"
	                     "  }\n"
	                     "  var z = 3;\n"
	                     "}\n";
	auto program = parse(source);
	Instrumentor instrumentor("_shim", true, true);
	auto sites = instrumentor.resolveSites(*program, source);
	ASSERT_EQ(sites.size(), 1u);
	std::vector<std::string> expected = {"a", "x"};
	EXPECT_EQ(names(sites[0]), expected);
	EXPECT_TRUE(sites[0].locals[0].is_parameter);
	EXPECT_EQ(sites[0].markerOffset, source.find("/*"));
	EXPECT_EQ(sites[0].statementStart, source.find("var y"));
	EXPECT_FALSE(sites[0].embedded);
}

TEST(Instrumentor, OneSitePerStatement) {
	std::string source = "func f() {\n  /* Breakpoint */ /* Breakpoint */ print(1);\n}\n";
	auto program = parse(source);
	Instrumentor instrumentor("_shim", true, true);
	EXPECT_EQ(instrumentor.resolveSites(*program, source).size(), 1u);
}

TEST(Instrumentor, SkipsMarkersOutsideFunctions) {
	std::string source = "/* Breakpoint */ var g = 1;\n"
	                     "class C { var field = /* Breakpoint */ 2; }\n"
	                     "func f() { /* Breakpoint */ print(g); }\n";
	auto program = parse(source);
	Instrumentor instrumentor("_shim", true, true);
	auto sites = instrumentor.resolveSites(*program, source);
	ASSERT_EQ(sites.size(), 1u);
	EXPECT_EQ(sites[0].markerOffset, source.rfind("/* Breakpoint */"));
}

TEST(Instrumentor, HonorsWhichHooksExist) {
	std::string source = "func f() { /* Breakpoint */ print(1); }\n"
	                     "async func g() { /* Breakpoint */ print(2); }\n";
	auto program = parse(source);

	auto syncOnly = Instrumentor("_shim", true, false).resolveSites(*program, source);
	ASSERT_EQ(syncOnly.size(), 1u);
	EXPECT_FALSE(syncOnly[0].isAsync);

	auto asyncOnly = Instrumentor("_shim", false, true).resolveSites(*program, source);
	ASSERT_EQ(asyncOnly.size(), 1u);
	EXPECT_TRUE(asyncOnly[0].isAsync);
}

TEST(Instrumentor, LambdaIsTheEnclosingCallable) {
	std::string source = "func f(items) {\n"
	                     "  var handler = async (e) => { /* Breakpoint */ print(e); };\n"
	                     "}\n";
	auto program = parse(source);
	auto sites = Instrumentor("_shim", true, true).resolveSites(*program, source);
	ASSERT_EQ(sites.size(), 1u);
	EXPECT_TRUE(sites[0].isAsync);
	std::vector<std::string> expected = {"items", "handler", "e"};
	EXPECT_EQ(names(sites[0]), expected);
}

TEST(Instrumentor, WrapsEmbeddedStatements) {
	std::string source = "func f(x) {\n  while (x > 0) /* Breakpoint */ x -= 1;\n}\n";
	auto program = parse(source);
	Instrumentor instrumentor("_shim", true, true);
	std::vector<BreakpointSite> sites;
	std::string rewritten = instrumentor.instrument(*program, source, &sites);
	ASSERT_EQ(sites.size(), 1u);
	EXPECT_TRUE(sites[0].embedded);

	const std::string &id = sites[0].id;
	std::string block = "{ var start" + id + " = " + std::to_string(sites[0].markerOffset) +
	                    "; var localVariableNames" + id + " = [\"x\"]; var localVariableDisplay" + id +
	                    " = [\"[{\\\"Tag\\\":\\\"Keyword\\\",\\\"Text\\\":\\\"var\\\"},{\\\"Tag\\\":\\\"Space\\\","
	                    "\\\"Text\\\":\\\" \\\"},{\\\"Tag\\\":\\\"Parameter\\\",\\\"Text\\\":\\\"x\\\"}]\"]; "
	                    "var localVariableValues" +
	                    id + " = [x]; _shim_Breakpoint(start" + id + ", localVariableNames" + id +
	                    ", localVariableDisplay" + id + ", localVariableValues" + id + "); }";
	std::string expected = "func f(x) {\n  while (x > 0) /* Breakpoint */ { " + block + " x -= 1; }\n}\n";
	EXPECT_EQ(rewritten, expected);
}

TEST(Instrumentor, DisplayPartsClassifyTypes) {
	LocalSymbol typed{"items", "List<int>", 0, false};
	auto parts = localDisplayParts(typed);
	ASSERT_EQ(parts.size(), 6u);
	EXPECT_EQ(parts[0], (DisplayPart{DisplayTag::Class, "List"}));
	EXPECT_EQ(parts[1], (DisplayPart{DisplayTag::Punctuation, "<"}));
	EXPECT_EQ(parts[2], (DisplayPart{DisplayTag::Keyword, "int"}));
	EXPECT_EQ(parts[5], (DisplayPart{DisplayTag::Local, "items"}));
	EXPECT_EQ(displayText(parts), "List<int> items");

	LocalSymbol untyped{"n", "", 0, true};
	EXPECT_EQ(displayText(localDisplayParts(untyped)), "var n");
}

TEST(Instrumentation, PreservesProgramBehaviour) {
	std::string plain = runMain(compileSource(loopProgram, {}, nullptr, nullptr));
	EXPECT_EQ(plain, "6\nbig\n");

	std::vector<BreakpointHit> hits;
	auto hook = [&hits](const BreakpointHit &hit) { hits.push_back(hit); };
	CompileResult instrumented = compileSource(loopProgram, {}, hook, nullptr);
	EXPECT_EQ(instrumented.sites.size(), 3u);
	EXPECT_NE(instrumented.source, loopProgram);
	EXPECT_FALSE(instrumented.shimName.empty());
	EXPECT_EQ(runMain(instrumented), plain);

	ASSERT_EQ(hits.size(), 5u);
	size_t loopMarker = loopProgram.find("/* Breakpoint */ total");
	for (int i = 0; i < 3; i++) {
		EXPECT_EQ(hits[i].start, static_cast<int64_t>(loopMarker));
		std::vector<std::string> expected = {"total", "i"};
		EXPECT_EQ(hits[i].names, expected);
		EXPECT_EQ(hits[i].values[1].asInt(), i + 1);
	}
	std::vector<std::string> afterLoop = {"total"};
	EXPECT_EQ(hits[3].names, afterLoop);
	EXPECT_EQ(hits[3].values[0].asInt(), 6);
	EXPECT_EQ(hits[4].start, static_cast<int64_t>(loopProgram.find("/* Breakpoint */ print(\"big\")")));
}

TEST(Instrumentation, AsyncSitesAwaitTheHook) {
	std::string source = "async func main() {\n"
	                     "  var n = 41;\n"
	                     "  /* Breakpoint */ print(n + 1);\n"
	                     "}\n";
	std::mutex mutex;
	std::vector<int64_t> starts;
	auto asyncHook = [&](const BreakpointHit &hit) {
		std::lock_guard<std::mutex> lock(mutex);
		starts.push_back(hit.start);
		return Task<Value>::fromResult(Value());
	};
	CompileResult result = compileSource(source, {}, nullptr, asyncHook);
	ASSERT_EQ(result.sites.size(), 1u);
	EXPECT_NE(result.source.find("await " + result.shimName + "_BreakpointAsync("), std::string::npos);
	EXPECT_EQ(runMain(result), "42\n");
	ASSERT_EQ(starts.size(), 1u);
	EXPECT_EQ(starts[0], static_cast<int64_t>(source.find("/*")));
}

TEST(Instrumentation, WithoutHooksMarkersStayComments) {
	CompileResult result = compileSource(loopProgram, {}, nullptr, nullptr);
	EXPECT_TRUE(result.sites.empty());
	EXPECT_TRUE(result.shimName.empty());
	EXPECT_EQ(result.source, loopProgram);
}

TEST(Instrumentation, DiagnosticsComeFromTheOriginalSource) {
	std::string source = "func main() {\n  /* Breakpoint */ print(1)\n}\n";
	CompileResult result = compileSource(source, {}, [](const BreakpointHit &) {}, nullptr);
	EXPECT_FALSE(result.succeeded());
	ASSERT_FALSE(result.diagnostics.empty());
	EXPECT_EQ(result.diagnostics[0].line, 3);
	EXPECT_EQ(result.diagnostics[0].message.find("Instrumented source"), std::string::npos);
}

TEST(TextEdits, AppliedBackToFront) {
	std::string text = "abcdef";
	std::vector<TextEdit> edits = {{1, 0, "X"}, {4, 1, "Y"}, {1, 0, "Z"}};
	EXPECT_EQ(applyEdits(text, edits), "aXZbcdYf");
}
