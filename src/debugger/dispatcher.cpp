#include "debugger/dispatcher.hpp"

#include <stdexcept>

namespace snap {

// Upper bound on how long runUntil sleeps before re-checking its predicate
static constexpr std::chrono::milliseconds wakeInterval{50};

Dispatcher::Dispatcher() : owner(std::this_thread::get_id()) {}

bool Dispatcher::isUiThread() const {
	std::lock_guard<std::mutex> lock(mutex);
	return std::this_thread::get_id() == owner;
}

void Dispatcher::bindToCurrentThread() {
	std::lock_guard<std::mutex> lock(mutex);
	owner = std::this_thread::get_id();
}

void Dispatcher::post(std::function<void()> work) {
	{
		std::lock_guard<std::mutex> lock(mutex);
		queue.push_back(std::move(work));
	}
	queued.notify_all();
}

size_t Dispatcher::runPending() {
	if (!isUiThread()) {
		throw std::logic_error("Dispatcher queue run from a foreign thread");
	}
	std::deque<std::function<void()>> batch;
	{
		std::lock_guard<std::mutex> lock(mutex);
		batch.swap(queue);
	}
	for (auto &work : batch) {
		work();
	}
	return batch.size();
}

void Dispatcher::runUntil(const std::function<bool()> &done) {
	while (true) {
		runPending();
		if (done()) {
			return;
		}
		std::unique_lock<std::mutex> lock(mutex);
		queued.wait_for(lock, wakeInterval, [this] { return !queue.empty(); });
	}
}

} // namespace snap
