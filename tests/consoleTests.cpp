#include "console/consolePresenter.hpp"
#include "console/variableNode.hpp"
#include "debugger/sourceView.hpp"
#include "runtime/classBinding.hpp"
#include "runtime/scriptObjects.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace snap;

namespace {

struct Point {
	int64_t x{3};
	int64_t y{4};
	std::string tag{"origin"};
};

Value point() {
	ClassBinding<Point> binding("Point");
	binding.field("x", &Point::x).field("y", &Point::y).field("tag", &Point::tag, true);
	return binding.wrap(std::make_shared<Point>());
}

std::vector<std::shared_ptr<VariableNode>> roots() {
	auto list = std::make_shared<ListObject>(std::vector<Value>{Value(10), Value(20)});
	return {
	    std::make_shared<LocalVariableNode>("count", "var count", Value(2)),
	    std::make_shared<LocalVariableNode>("items", "var items", Value(list)),
	    std::make_shared<LocalVariableNode>("p", "Point p", point()),
	};
}

SourceView sourceView() {
	SourceView source("var pre = 1;", "");
	source.setText("func main() {\n  var count = 2;\n  /* Breakpoint */ print(count);\n}");
	return source;
}

std::string run(const std::string &script, bool &suppress) {
	std::istringstream in;
	std::ostringstream out;
	ConsolePresenter presenter(in, out);
	presenter.setScript(ConsolePresenter::splitScript(script));
	SourceView source = sourceView();
	int64_t offset = static_cast<int64_t>(source.preSource().size() + 1 + source.text().find("/*"));
	suppress = presenter.present(offset, source, roots());
	return out.str();
}

} // namespace

TEST(ConsolePresenter, SplitScript) {
	std::vector<std::string> expected = {"vars", "show p.x", "continue"};
	EXPECT_EQ(ConsolePresenter::splitScript("vars;show p.x;  continue ;;"), expected);
	EXPECT_TRUE(ConsolePresenter::splitScript(" ; ").empty());
}

TEST(ConsolePresenter, ListsVariables) {
	bool suppress = true;
	std::string output = run("vars", suppress);
	EXPECT_FALSE(suppress);
	EXPECT_NE(output.find("Breakpoint hit at line 3\n"), std::string::npos);
	EXPECT_NE(output.find("->    3    /* Breakpoint */ print(count);\n"), std::string::npos);
	EXPECT_NE(output.find("var count = 2\n"), std::string::npos);
	EXPECT_NE(output.find("var items = List<int> (2)\n"), std::string::npos);
	EXPECT_NE(output.find("Point p = {3 members}\n"), std::string::npos);
	EXPECT_NE(output.find("Continuing\n"), std::string::npos);
}

TEST(ConsolePresenter, ShowsItemsAndMembers) {
	bool suppress = false;
	std::string output = run("show items; show items[1]; show p", suppress);
	EXPECT_NE(output.find("items = List<int> (2)\n  [0] = 10\n  [1] = 20\n"), std::string::npos);
	EXPECT_NE(output.find("items[1] = 20\n"), std::string::npos);
	EXPECT_NE(output.find("p = {3 members}\n  x = 3\n  y = 4\n"), std::string::npos);
	EXPECT_EQ(output.find("tag"), std::string::npos);
}

TEST(ConsolePresenter, NonPublicMembersCanBeShown) {
	bool suppress = false;
	std::string output = run("nonpublic; show p; show missing; show p..x", suppress);
	EXPECT_NE(output.find("Non-public members shown\n"), std::string::npos);
	EXPECT_NE(output.find("  tag = \"origin\" (non-public)\n"), std::string::npos);
	EXPECT_NE(output.find("No variable missing\n"), std::string::npos);
	EXPECT_NE(output.find("No variable p..x\n"), std::string::npos);
}

TEST(ConsolePresenter, IgnoreSuppresses) {
	bool suppress = false;
	std::string output = run("bogus; ignore; vars", suppress);
	EXPECT_TRUE(suppress);
	EXPECT_NE(output.find("Unknown command: bogus"), std::string::npos);
	EXPECT_EQ(output.find("> vars"), std::string::npos);
}

TEST(ConsolePresenter, EndOfInputContinues) {
	std::istringstream in("vars\n");
	std::ostringstream out;
	ConsolePresenter presenter(in, out);
	EXPECT_FALSE(presenter.present(-5, SourceView("", ""), {}));
	EXPECT_NE(out.str().find("Breakpoint hit at offset -5\n"), std::string::npos);
	EXPECT_NE(out.str().find("(snapdbg) No local variables\n"), std::string::npos);
}

TEST(VariableNode, SplitVariablePath) {
	std::vector<std::string> expected = {"list", "[1]", "x"};
	EXPECT_EQ(splitVariablePath("list[1].x"), expected);
	expected = {"a", "[0]", "[2]"};
	EXPECT_EQ(splitVariablePath("a[00][2]"), expected);
	EXPECT_TRUE(splitVariablePath("").empty());
	EXPECT_TRUE(splitVariablePath("a[]").empty());
	EXPECT_TRUE(splitVariablePath("a[x]").empty());
	EXPECT_TRUE(splitVariablePath("a.").empty());
	EXPECT_TRUE(splitVariablePath("[1]").empty());
}

TEST(VariableNode, ChildrenLoadOnceAndOnlyForExpandableValues) {
	auto list = std::make_shared<ListObject>(std::vector<Value>{Value("a")});
	LocalVariableNode node("l", "var l", Value(list));
	EXPECT_TRUE(node.isExpandable());
	ASSERT_EQ(node.children().size(), 1u);
	EXPECT_EQ(node.child("[0]")->summary(), "\"a\"");
	EXPECT_EQ(node.child("[1]"), nullptr);

	EXPECT_EQ(node.children().size(), 1u);

	LocalVariableNode scalar("n", "var n", Value(1));
	EXPECT_FALSE(scalar.isExpandable());
	EXPECT_TRUE(scalar.children().empty());
}

TEST(SourceView, MapsFullSourceOffsetsToLines) {
	SourceView source = sourceView();
	size_t textStart = source.preSource().size() + 1;
	EXPECT_EQ(source.lineOf(0), -1);
	EXPECT_EQ(source.lineOf(static_cast<int64_t>(textStart)), 0);
	EXPECT_EQ(source.lineOf(static_cast<int64_t>(textStart + source.text().find("var count"))), 1);
	EXPECT_EQ(source.lineOf(static_cast<int64_t>(textStart + source.text().size() + 1)), -1);
	EXPECT_EQ(source.lineCount(), 4u);
	EXPECT_EQ(source.line(3), "}");
	EXPECT_EQ(source.line(9), "");
}

TEST(SourceView, Excerpt) {
	SourceView source = sourceView();
	EXPECT_EQ(source.excerpt(1, 1), "      1  func main() {\n"
	                                "->    2    var count = 2;\n"
	                                "      3    /* Breakpoint */ print(count);\n");
	EXPECT_EQ(source.excerpt(-1), "");
}
