#include "debugger/breakpointController.hpp"

#include <iostream>

namespace snap {

bool BreakpointController::State::isSuppressed(int64_t offset) {
	std::lock_guard<std::mutex> lock(mutex);
	auto it = suppressed.find(offset);
	return it != suppressed.end() && it->second;
}

void BreakpointController::State::record(int64_t offset, bool suppress) {
	std::lock_guard<std::mutex> lock(mutex);
	bool &entry = suppressed[offset];
	entry = entry || suppress;
	if (suppress) {
		log("Suppressing breakpoint at " + std::to_string(offset));
	}
}

void BreakpointController::State::log(const std::string &message) const {
	if (debug) {
		std::cerr << "[BREAKPOINT] " << message << std::endl;
	}
}

BreakpointController::BreakpointController(std::shared_ptr<ExecutionContext> context)
    : state(std::make_shared<State>()) {
	state->context = std::move(context);
}

bool BreakpointController::isSuppressed(int64_t offset) const {
	return state->isSuppressed(offset);
}

SyncBreakpointHook BreakpointController::synchronousHandler(SyncCallback callback) const {
	return [state = state, callback = std::move(callback)](const BreakpointHit &hit) {
		if (state->isSuppressed(hit.start)) {
			return;
		}
		// Blocking the UI thread on its own input would deadlock
		if (state->context && state->context->isUiThread()) {
			state->log("Skipping breakpoint at " + std::to_string(hit.start) + " on the UI thread");
			return;
		}
		BreakpointInfo info(hit);
		bool suppress = callback ? callback(info) : false;
		state->record(hit.start, suppress);
	};
}

AsyncBreakpointHook BreakpointController::asynchronousHandler(AsyncCallback callback) const {
	return [state = state, callback = std::move(callback)](const BreakpointHit &hit) {
		if (state->isSuppressed(hit.start) || !callback) {
			return Task<Value>::fromResult(Value());
		}
		BreakpointInfo info(hit);
		TaskCompletionSource<Value> completion;
		int64_t offset = hit.start;
		callback(info).then([state, completion, offset](const Task<bool> &decision) mutable {
			try {
				state->record(offset, decision.get());
				completion.setResult(Value());
			} catch (const std::exception &) {
				completion.setException(std::current_exception());
			}
		});
		return completion.task();
	};
}

} // namespace snap
