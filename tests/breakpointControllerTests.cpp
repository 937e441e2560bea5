#include "compiler/compilation.hpp"
#include "debugger/breakpointController.hpp"
#include "debugger/dispatcher.hpp"
#include "debugger/localDebugger.hpp"
#include "runtime/scriptObjects.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

using namespace snap;

namespace {

const char *displayX = R"([{"Tag":"Keyword","Text":"var"},{"Tag":"Space","Text":" "},{"Tag":"Local","Text":"x"}])";

BreakpointHit makeHit(int64_t start) {
	BreakpointHit hit;
	hit.start = start;
	hit.names = {"x", "label"};
	hit.displayJson = {displayX, R"([{"Tag":"Keyword","Text":"string"},{"Tag":"Space","Text":" "},{"Tag":"Local","Text":"label"}])"};
	hit.values = {Value(5), Value("five")};
	return hit;
}

const std::string loopScript = "func main() {\n"
                               "  var count = 0;\n"
                               "  for (var i in [1, 2, 3]) {\n"
                               "    /* Breakpoint */ count += i;\n"
                               "  }\n"
                               "  return count;\n"
                               "}\n";

class RecordingPresenter : public BreakpointPresenter {
public:
	explicit RecordingPresenter(bool suppress, bool deferred = false) : suppress(suppress), deferred(deferred) {}

	void show(const BreakpointInfo &info, std::function<void(bool)> resume) override {
		shownOnUiThread.push_back(dispatcherThread == std::this_thread::get_id());
		const Value *x = info.local("x");
		seen.push_back(x ? x->asInt() : -1);
		if (deferred) {
			pending = std::move(resume);
			return;
		}
		resume(suppress);
		// A second resume is ignored
		resume(!suppress);
	}

	std::thread::id dispatcherThread{std::this_thread::get_id()};
	std::vector<bool> shownOnUiThread;
	std::vector<int64_t> seen;
	std::function<void(bool)> pending;

private:
	bool suppress;
	bool deferred;
};

} // namespace

TEST(BreakpointInfo, DecodesHit) {
	BreakpointInfo info(makeHit(120));
	EXPECT_EQ(info.span().start, 120);
	EXPECT_EQ(info.span().length, 16);
	EXPECT_EQ(info.span().end(), 136);
	ASSERT_EQ(info.locals().size(), 2u);
	EXPECT_EQ(info.locals()[0].first, "x");
	EXPECT_EQ(info.locals()[1].second.asString(), "five");
	EXPECT_EQ(displayText(info.displayParts("label")), "string label");
	EXPECT_TRUE(info.displayParts("missing").empty());
	EXPECT_EQ(info.local("missing"), nullptr);
}

TEST(BreakpointController, SuppressedOffsetNeverCallsBackAgain) {
	BreakpointController controller;
	int calls = 0;
	auto hook = controller.synchronousHandler([&calls](const BreakpointInfo &info) {
		calls++;
		EXPECT_EQ(info.local("i")->asInt(), 1);
		return true;
	});
	CompileResult result = compileSource(loopScript, {}, hook, nullptr);
	ASSERT_TRUE(result.succeeded());
	EXPECT_EQ(result.module->call("main").asInt(), 6);
	EXPECT_EQ(calls, 1);
	EXPECT_TRUE(controller.isSuppressed(static_cast<int64_t>(loopScript.find("/*"))));
}

TEST(BreakpointController, ContinuingKeepsTheBreakpointActive) {
	BreakpointController controller;
	std::vector<int64_t> values;
	auto hook = controller.synchronousHandler([&values](const BreakpointInfo &info) {
		values.push_back(info.local("count")->asInt());
		return false;
	});
	CompileResult result = compileSource(loopScript, {}, hook, nullptr);
	ASSERT_TRUE(result.succeeded());
	result.module->call("main");
	std::vector<int64_t> expected = {0, 1, 3};
	EXPECT_EQ(values, expected);
	EXPECT_FALSE(controller.isSuppressed(static_cast<int64_t>(loopScript.find("/*"))));
}

TEST(BreakpointController, SuppressionIsPermanent) {
	BreakpointController controller;
	bool answer = true;
	int calls = 0;
	auto hook = controller.synchronousHandler([&](const BreakpointInfo &) {
		calls++;
		return answer;
	});
	hook(makeHit(10));
	answer = false;
	hook(makeHit(10));
	hook(makeHit(20));
	EXPECT_EQ(calls, 2);
	EXPECT_TRUE(controller.isSuppressed(10));
	EXPECT_FALSE(controller.isSuppressed(20));
}

TEST(BreakpointController, UiThreadReturnsImmediately) {
	auto dispatcher = std::make_shared<Dispatcher>();
	BreakpointController controller(dispatcher);
	int calls = 0;
	auto hook = controller.synchronousHandler([&calls](const BreakpointInfo &) {
		calls++;
		return true;
	});

	hook(makeHit(7));
	EXPECT_EQ(calls, 0);
	EXPECT_FALSE(controller.isSuppressed(7));

	std::thread worker([&hook] { hook(makeHit(7)); });
	worker.join();
	EXPECT_EQ(calls, 1);
	EXPECT_TRUE(controller.isSuppressed(7));
}

TEST(BreakpointController, ControllersDoNotShareState) {
	BreakpointController first;
	BreakpointController second;
	first.synchronousHandler([](const BreakpointInfo &) { return true; })(makeHit(3));
	EXPECT_TRUE(first.isSuppressed(3));
	EXPECT_FALSE(second.isSuppressed(3));
}

TEST(BreakpointController, AsynchronousHandlerCompletesAfterTheCallback) {
	BreakpointController controller;
	TaskCompletionSource<bool> decision;
	int calls = 0;
	auto hook = controller.asynchronousHandler([&](const BreakpointInfo &) {
		calls++;
		return decision.task();
	});

	Task<Value> pending = hook(makeHit(42));
	EXPECT_EQ(calls, 1);
	EXPECT_FALSE(pending.isReady());
	EXPECT_FALSE(controller.isSuppressed(42));

	decision.setResult(true);
	EXPECT_TRUE(pending.isReady());
	EXPECT_TRUE(controller.isSuppressed(42));

	EXPECT_TRUE(hook(makeHit(42)).isReady());
	EXPECT_EQ(calls, 1);
}

TEST(BreakpointController, AsynchronousFailurePropagates) {
	BreakpointController controller;
	auto hook = controller.asynchronousHandler([](const BreakpointInfo &) {
		return Task<bool>::fromException(std::make_exception_ptr(std::runtime_error("presenter failed")));
	});
	Task<Value> result = hook(makeHit(1));
	EXPECT_THROW(result.get(), std::runtime_error);
	EXPECT_FALSE(controller.isSuppressed(1));
}

TEST(Dispatcher, OnlyTheOwnerRunsTheQueue) {
	Dispatcher dispatcher;
	int ran = 0;
	dispatcher.post([&ran] { ran++; });
	std::thread foreign([&dispatcher] {
		EXPECT_FALSE(dispatcher.isUiThread());
		EXPECT_THROW(dispatcher.runPending(), std::logic_error);
	});
	foreign.join();
	EXPECT_EQ(dispatcher.runPending(), 1u);
	EXPECT_EQ(ran, 1);
}

TEST(LocalDebugger, SynchronousHitsAreShownOnTheDispatcher) {
	auto dispatcher = std::make_shared<Dispatcher>();
	auto presenter = std::make_shared<RecordingPresenter>(true);
	LocalDebugger debugger(dispatcher, presenter);
	BreakpointController controller(dispatcher);

	std::string source = "func main() {\n"
	                     "  for (var x in [4, 5]) {\n"
	                     "    /* Breakpoint */ print(x);\n"
	                     "  }\n"
	                     "}\n";
	CompileResult result = compileSource(source, {}, controller.synchronousHandler(debugger.synchronousCallback()), nullptr);
	ASSERT_TRUE(result.succeeded());
	result.module->setOutput([](const std::string &) {});

	std::atomic<bool> done{false};
	std::thread script([&] {
		result.module->call("main");
		done = true;
		dispatcher->post([] {});
	});
	dispatcher->runUntil([&done] { return done.load(); });
	script.join();

	std::vector<int64_t> expected = {4};
	EXPECT_EQ(presenter->seen, expected);
	ASSERT_EQ(presenter->shownOnUiThread.size(), 1u);
	EXPECT_TRUE(presenter->shownOnUiThread[0]);
}

TEST(LocalDebugger, AsynchronousHitsResumeLater) {
	auto dispatcher = std::make_shared<Dispatcher>();
	auto presenter = std::make_shared<RecordingPresenter>(false, true);
	LocalDebugger debugger(dispatcher, presenter);
	BreakpointController controller(dispatcher);

	BreakpointHit hit = makeHit(99);
	Task<Value> pending = controller.asynchronousHandler(debugger.asynchronousCallback())(hit);
	EXPECT_FALSE(pending.isReady());

	dispatcher->runPending();
	ASSERT_TRUE(presenter->pending);
	EXPECT_FALSE(pending.isReady());

	presenter->pending(true);
	EXPECT_TRUE(pending.isReady());
	EXPECT_TRUE(controller.isSuppressed(99));
}
