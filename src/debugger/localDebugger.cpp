#include "debugger/localDebugger.hpp"

#include <atomic>
#include <future>

namespace snap {

LocalDebugger::LocalDebugger(std::shared_ptr<Dispatcher> dispatcher, std::shared_ptr<BreakpointPresenter> presenter)
    : dispatcher(std::move(dispatcher)), presenter(std::move(presenter)) {}

BreakpointController::SyncCallback LocalDebugger::synchronousCallback() const {
	return [dispatcher = dispatcher, presenter = presenter](const BreakpointInfo &info) {
		auto decision = std::make_shared<std::promise<bool>>();
		auto resumed = std::make_shared<std::atomic<bool>>(false);
		auto copy = std::make_shared<BreakpointInfo>(info);
		std::future<bool> result = decision->get_future();

		dispatcher->post([copy, presenter, decision, resumed]() {
			presenter->show(*copy, [decision, resumed, copy](bool suppress) {
				if (!resumed->exchange(true)) {
					decision->set_value(suppress);
				}
			});
		});
		return result.get();
	};
}

BreakpointController::AsyncCallback LocalDebugger::asynchronousCallback() const {
	return [dispatcher = dispatcher, presenter = presenter](const BreakpointInfo &info) {
		TaskCompletionSource<bool> completion;
		auto resumed = std::make_shared<std::atomic<bool>>(false);
		auto copy = std::make_shared<BreakpointInfo>(info);

		dispatcher->post([copy, presenter, completion, resumed]() {
			presenter->show(*copy, [completion, resumed, copy](bool suppress) mutable {
				if (!resumed->exchange(true)) {
					completion.setResult(suppress);
				}
			});
		});
		return completion.task();
	};
}

} // namespace snap
