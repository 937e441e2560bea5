#include "compiler/compilation.hpp"
#include "runtime/classBinding.hpp"
#include "runtime/scriptError.hpp"
#include "runtime/scriptObjects.hpp"

#include <gtest/gtest.h>

using namespace snap;

namespace {

std::shared_ptr<Module> load(const std::string &source) {
	CompileResult result = compileSource(source, {}, nullptr, nullptr);
	for (const auto &diagnostic : result.diagnostics) {
		ADD_FAILURE() << diagnostic.toString();
	}
	return result.module;
}

std::string run(const std::string &source) {
	auto module = load(source);
	if (!module) {
		return "";
	}
	std::string output;
	module->setOutput([&output](const std::string &text) { output += text; });
	Value value = module->call("main");
	if (auto task = value.objectAs<TaskObject>()) {
		task->task().get();
	}
	return output;
}

struct Point {
	int64_t x{};
	int64_t y{};
};

} // namespace

TEST(Interpreter, ArithmeticAndControlFlow) {
	EXPECT_EQ(run("func main() {\n"
	              "  var total = 0;\n"
	              "  var i = 0;\n"
	              "  while (i < 10) { i += 1; if (i % 2 == 0) continue; total = total + i; }\n"
	              "  print(total, 7 / 2, 7.0 / 2, \"a\" + 1);\n"
	              "}\n"),
	          "25 3 3.5 a1\n");
}

TEST(Interpreter, ListsAndLoops) {
	EXPECT_EQ(run("func main() {\n"
	              "  var items = [1, 2];\n"
	              "  items.add(3);\n"
	              "  for (var item in items) print(item);\n"
	              "  print(len(items), items.Count, items[2], items);\n"
	              "}\n"),
	          "1\n2\n3\n3 3 3 [1, 2, 3]\n");
}

TEST(Interpreter, ClassesEnumsAndProperties) {
	EXPECT_EQ(run("enum Color { Red, Green }\n"
	              "class Counter {\n"
	              "  var count = 0;\n"
	              "  private var color = Color.Green;\n"
	              "  prop twice => this.count * 2;\n"
	              "  func init(start) { this.count = start; }\n"
	              "  func bump() { this.count += 1; return this; }\n"
	              "}\n"
	              "func main() {\n"
	              "  var c = new Counter(4);\n"
	              "  print(c.bump().twice, Color.Red);\n"
	              "}\n"),
	          "10 Red\n");
}

TEST(Interpreter, ClosuresCaptureTheirScope) {
	EXPECT_EQ(run("func makeAdder(n) { return (x) => x + n; }\n"
	              "func main() {\n"
	              "  var add2 = makeAdder(2);\n"
	              "  var twice = func(f, v) { return f(f(v)); };\n"
	              "  print(twice(add2, 1));\n"
	              "}\n"),
	          "5\n");
}

TEST(Interpreter, AsyncFunctionsAndSpawn) {
	EXPECT_EQ(run("async func compute(n) { await delay(1); return n * 2; }\n"
	              "async func main() {\n"
	              "  var a = await compute(3);\n"
	              "  var t = spawn((x) => x + 1, 41);\n"
	              "  print(a, await t, join(spawn(() => 7)));\n"
	              "}\n"),
	          "6 42 7\n");
}

TEST(Interpreter, GlobalsInitializeOnFirstCall) {
	auto module = load("var greeting = \"hi\";\nfunc main() { return greeting + \"!\"; }\n");
	ASSERT_TRUE(module);
	EXPECT_EQ(module->call("main").asString(), "hi!");
	EXPECT_EQ(module->global("greeting").asString(), "hi");
	EXPECT_THROW(module->global("missing"), ScriptError);
}

TEST(Interpreter, RuntimeErrorsCarryLocations) {
	auto module = load("func main() {\n  var items = [1];\n  return items[5];\n}\n");
	ASSERT_TRUE(module);
	try {
		module->call("main");
		FAIL() << "expected a ScriptError";
	} catch (const ScriptError &error) {
		EXPECT_EQ(error.location().line, 3u);
		EXPECT_NE(error.message().find("out of range"), std::string::npos);
	}
}

TEST(Interpreter, ExternsMustBeBound) {
	auto module = load("extern func host(a);\nfunc main() { return host(20); }\n");
	ASSERT_TRUE(module);
	EXPECT_THROW(module->call("main"), ScriptError);
	EXPECT_THROW(module->bindExtern("nothing", [](const std::vector<Value> &) { return Value(); }),
	             std::invalid_argument);

	module->bindExtern("host", [](const std::vector<Value> &args) { return Value(args[0].asInt() + 1); });
	EXPECT_TRUE(module->isBound("host"));
	EXPECT_EQ(module->call("main").asInt(), 21);
}

TEST(Interpreter, HostObjectsThroughClassBinding) {
	ClassBinding<Point> binding("Point");
	binding.field("x", &Point::x).field("y", &Point::y, true).property("sum", [](const Point &p) {
		return Value(p.x + p.y);
	});
	Value point = binding.wrap(std::make_shared<Point>(Point{2, 3}));

	auto module = load("func main(p) { return p.sum * 10 + p.x; }\n");
	ASSERT_TRUE(module);
	EXPECT_EQ(module->call("main", {point}).asInt(), 52);

	auto members = point.asObject()->members();
	ASSERT_EQ(members.size(), 3u);
	EXPECT_TRUE(members[1].isNonPublic);
	EXPECT_TRUE(members[2].isProperty);
}
