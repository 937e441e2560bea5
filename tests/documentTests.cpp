#include "compiler/document.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace snap;

namespace {

const std::string program = "func main() {\n"
                            "  var x = 1;\n"
                            "  print(x);\n"
                            "  if (x > 0) {\n"
                            "    x = 2;\n"
                            "  } else print(x);\n"
                            "}\n";

} // namespace

TEST(Document, FullSourceFramesTheText) {
	Document document("body", "pre", "post");
	EXPECT_EQ(document.fullSource(), "pre\nbody\npost");
	EXPECT_EQ(document.textOffset(), 4u);
}

TEST(Document, ToggleOnOwnLineRestoresText) {
	Document document(program);
	ASSERT_EQ(document.toggleBreakpoint(2), BreakpointToggleResult::Added);
	EXPECT_EQ(document.text(), "func main() {\n"
	                           "  var x = 1;\n"
	                           "  /* Breakpoint */\n"
	                           "  print(x);\n"
	                           "  if (x > 0) {\n"
	                           "    x = 2;\n"
	                           "  } else print(x);\n"
	                           "}\n");
	ASSERT_EQ(document.toggleBreakpoint(2), BreakpointToggleResult::Removed);
	EXPECT_EQ(document.text(), program);
}

TEST(Document, ToggleInsideLineRestoresText) {
	Document document(program);
	ASSERT_EQ(document.toggleBreakpoint(5), BreakpointToggleResult::Added);
	EXPECT_NE(document.text().find("  } else /* Breakpoint */ print(x);\n"), std::string::npos);
	ASSERT_EQ(document.toggleBreakpoint(5), BreakpointToggleResult::Removed);
	EXPECT_EQ(document.text(), program);
}

TEST(Document, ToggleByLineRange) {
	Document document(program);
	size_t lineStart = program.find("    x = 2;");
	size_t lineEnd = program.find('\n', lineStart);
	ASSERT_EQ(document.toggleBreakpoint(lineStart, lineEnd), BreakpointToggleResult::Added);
	EXPECT_NE(document.text().find("    /* Breakpoint */\n    x = 2;"), std::string::npos);
}

TEST(Document, InvalidPositions) {
	Document document("var g = 1;\nfunc main() {\n\n  print(g);\n}\n");
	EXPECT_EQ(document.toggleBreakpoint(0), BreakpointToggleResult::InvalidPosition);
	EXPECT_EQ(document.toggleBreakpoint(2), BreakpointToggleResult::InvalidPosition);
	EXPECT_EQ(document.toggleBreakpoint(4), BreakpointToggleResult::InvalidPosition);
	EXPECT_EQ(document.toggleBreakpoint(40), BreakpointToggleResult::InvalidPosition);
	EXPECT_EQ(document.toggleBreakpoint(10, 5), BreakpointToggleResult::InvalidPosition);
	EXPECT_EQ(document.text(), "var g = 1;\nfunc main() {\n\n  print(g);\n}\n");
}

TEST(Document, BreakpointOffsetsAreFullSourcePositions) {
	Document document("func main() {\n  var x = 3;\n  /* Breakpoint */ print(x);\n}", "var prefix = 1;",
	                  "func unused() { }");
	std::vector<int64_t> starts;
	CompileResult result = document.compile([&starts](const BreakpointHit &hit) { starts.push_back(hit.start); },
	                                        nullptr);
	ASSERT_TRUE(result.succeeded());
	result.module->setOutput([](const std::string &) {});
	result.module->call("main");
	ASSERT_EQ(starts.size(), 1u);
	EXPECT_EQ(starts[0], static_cast<int64_t>(document.textOffset() + document.text().find("/*")));
	EXPECT_EQ(starts[0], static_cast<int64_t>(document.fullSource().find("/*")));
}

TEST(Document, CreateCompilationIgnoresMarkers) {
	Document document("func main() {\n  /* Breakpoint */ return 1;\n}");
	CompileResult result = document.createCompilation();
	ASSERT_TRUE(result.succeeded());
	EXPECT_TRUE(result.sites.empty());
	EXPECT_EQ(result.module->call("main").asInt(), 1);
}

TEST(Document, ReferencesAreCompiledWithTheUnit) {
	auto path = std::filesystem::temp_directory_path() / "snapdbg_document_reference.snap";
	{
		std::ofstream file(path);
		file << "func helper() { return 7; }\n";
	}
	Document document("func main() { return helper() * 2; }");
	document.setReferences({path.string()});
	CompileResult result = document.createCompilation();
	ASSERT_TRUE(result.succeeded());
	EXPECT_EQ(result.module->call("main").asInt(), 14);
	std::filesystem::remove(path);

	document.setReferences({path.string()});
	result = document.createCompilation();
	EXPECT_FALSE(result.succeeded());
	ASSERT_EQ(result.diagnostics.size(), 1u);
	EXPECT_EQ(result.diagnostics[0].message, "Cannot read reference: " + path.string());
}

TEST(Document, CompileErrorsLeaveNoModule) {
	Document document("func main() { await delay(1); }");
	CompileResult result = document.compile([](const BreakpointHit &) {}, nullptr);
	EXPECT_FALSE(result.succeeded());
	ASSERT_EQ(result.diagnostics.size(), 1u);
	EXPECT_EQ(result.diagnostics[0].filePath, "<document>");
	EXPECT_EQ(result.diagnostics[0].line, 2);
}
