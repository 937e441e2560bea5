#include "ipc/debuggerClient.hpp"
#include "ipc/debuggerProtocolError.hpp"
#include "ipc/namedPipe.hpp"
#include "ipc/protocol.hpp"

#include <cerrno>
#include <csignal>
#include <iostream>

namespace snap {

using Json = nlohmann::json;

static bool processAlive(int pid) {
	return ::kill(pid, 0) == 0 || errno != ESRCH;
}

DebuggerClient::DebuggerClient(const std::vector<std::string> &args, DebuggerOptions options) : options(options) {
	if (args.size() < 3) {
		throw DebuggerProtocolError("Expected <parent pid> <input pipe> <output pipe> as the last arguments");
	}
	const std::string &pidText = args[args.size() - 3];
	const std::string &inPath = args[args.size() - 2];
	const std::string &outPath = args[args.size() - 1];

	try {
		parent = std::stoi(pidText);
	} catch (const std::logic_error &) {
		throw DebuggerProtocolError("Invalid parent pid: " + pidText);
	}

	std::signal(SIGPIPE, SIG_IGN);

	auto alive = [this]() { return processAlive(parent); };
	input = std::make_unique<LineChannel>(
	    openPipeEnd(inPath, PipeEnd::Read, options.connectTimeout, options.pollInterval, alive));
	output = std::make_unique<LineChannel>(
	    openPipeEnd(outPath, PipeEnd::Write, options.connectTimeout, options.pollInterval, alive));

	const auto deadline = std::chrono::steady_clock::now() + options.connectTimeout;
	while (!input->waitReadable(options.pollInterval)) {
		if (!alive() || std::chrono::steady_clock::now() >= deadline) {
			throw DebuggerProtocolError("The debugger server did not send its handshake");
		}
	}
	std::optional<std::string> token = input->readLine();
	if (!token || !output->writeLine(*token)) {
		throw DebuggerProtocolError("The debugger server closed the connection during the handshake");
	}
	log("Connected to " + std::to_string(parent));

	monitor = std::thread([this]() { monitorParent(); });
}

DebuggerClient::~DebuggerClient() {
	dispose();
}

void DebuggerClient::log(const std::string &message) const {
	if (options.debug) {
		std::cerr << "[DBG-CLIENT] " << message << std::endl;
	}
}

void DebuggerClient::logError(const std::string &message) const {
	std::cerr << "[DBG-CLIENT ERROR] " << message << std::endl;
}

void DebuggerClient::onParentProcessExited(std::function<void()> handler) {
	bool deliver = false;
	{
		std::lock_guard<std::mutex> lock(mutex);
		parentExitedHandler = handler;
		if (parentExitedRaised && !parentExitedDelivered && handler) {
			parentExitedDelivered = true;
			deliver = true;
		}
	}
	if (deliver) {
		handler();
	}
}

void DebuggerClient::onBreakpointHit(HitHandler handler) {
	std::lock_guard<std::mutex> lock(mutex);
	hitHandler = std::move(handler);
}

void DebuggerClient::onBreakpointResumed(std::function<void()> handler) {
	std::lock_guard<std::mutex> lock(mutex);
	resumedHandler = std::move(handler);
}

bool DebuggerClient::isStopping() const {
	std::lock_guard<std::mutex> lock(mutex);
	return stopping;
}

size_t DebuggerClient::sourceViewRebuilds() const {
	std::lock_guard<std::mutex> lock(mutex);
	return rebuilds;
}

void DebuggerClient::raiseParentExited() {
	std::function<void()> handler;
	bool first = false;
	{
		std::lock_guard<std::mutex> lock(mutex);
		stopping = true;
		first = !parentExitedRaised;
		parentExitedRaised = true;
		if (!parentExitedDelivered && parentExitedHandler) {
			parentExitedDelivered = true;
			handler = parentExitedHandler;
		}
	}
	changed.notify_all();
	if (first) {
		log("Parent process exited");
	}
	if (handler) {
		handler();
	}
}

void DebuggerClient::monitorParent() {
	std::unique_lock<std::mutex> lock(mutex);
	while (!stopping) {
		lock.unlock();
		bool alive = processAlive(parent);
		lock.lock();
		if (!alive) {
			lock.unlock();
			raiseParentExited();
			return;
		}
		changed.wait_for(lock, options.pollInterval * 10, [this] { return stopping; });
	}
}

void DebuggerClient::start() {
	std::lock_guard<std::mutex> lock(mutex);
	if (receiver.joinable() || disposed) {
		return;
	}
	receiver = std::thread([this]() {
		receiveLoop();
		{
			std::lock_guard<std::mutex> lock(mutex);
			finished = true;
		}
		changed.notify_all();
	});
}

void DebuggerClient::resume(bool suppress) {
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (!paused || decision) {
			return;
		}
		decision = suppress;
	}
	changed.notify_all();
}

void DebuggerClient::wait() {
	std::unique_lock<std::mutex> lock(mutex);
	changed.wait(lock, [this] { return finished || (stopping && !receiver.joinable()); });
}

void DebuggerClient::dispose() {
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (disposed) {
			return;
		}
		disposed = true;
		stopping = true;
	}
	changed.notify_all();

	if (monitor.joinable()) {
		monitor.join();
	}
	if (receiver.joinable()) {
		if (receiver.get_id() == std::this_thread::get_id()) {
			receiver.detach();
		} else {
			receiver.join();
		}
	}
	input->close();
	output->close();
	{
		std::lock_guard<std::mutex> lock(mutex);
		finished = true;
	}
	changed.notify_all();
	log("Disposed");
}

// Next line from the server, waking up regularly to notice dispose()
std::optional<std::string> DebuggerClient::readMessage() {
	while (!input->waitReadable(options.pollInterval)) {
		if (isStopping()) {
			return std::nullopt;
		}
	}
	return input->readLine();
}

std::optional<std::string> DebuggerClient::request(const std::string &line) {
	std::lock_guard<std::mutex> requestLock(requestMutex);
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (!paused || decision || stopping) {
			logError("Request outside a paused breakpoint ignored");
			return std::nullopt;
		}
	}
	if (!output->writeLine(line)) {
		raiseParentExited();
		return std::nullopt;
	}
	std::optional<std::string> reply = readMessage();
	if (!reply || *reply == protocol::Abort) {
		raiseParentExited();
		return std::nullopt;
	}
	return reply;
}

RemoteVariable DebuggerClient::requestProperty(const std::string &handle, const std::string &name, bool isProperty,
                                               std::shared_ptr<const RemoteAccess> access) {
	std::optional<std::string> reply =
	    request(Json::array({protocol::GetProperty, handle, name, protocol::booleanText(isProperty)}).dump());
	if (!reply) {
		return RemoteVariable::null();
	}
	try {
		return RemoteVariable(Json::parse(*reply).get<WireVariable>(), access);
	} catch (const std::exception &e) {
		logError("Malformed property reply: " + std::string(e.what()));
		return RemoteVariable::null();
	}
}

std::vector<RemoteVariable> DebuggerClient::requestItems(const std::string &handle,
                                                         std::shared_ptr<const RemoteAccess> access) {
	std::optional<std::string> reply = request(Json::array({protocol::GetItems, handle}).dump());
	if (!reply) {
		return {RemoteVariable::null()};
	}
	std::vector<RemoteVariable> items;
	try {
		for (const auto &entry : Json::parse(*reply)) {
			items.emplace_back(entry.get<WireVariable>(), access);
		}
	} catch (const std::exception &e) {
		logError("Malformed items reply: " + std::string(e.what()));
	}
	return items;
}

void DebuggerClient::receiveLoop() {
	while (!isStopping()) {
		std::optional<std::string> message = readMessage();
		if (!message) {
			if (!isStopping()) {
				log("Server closed the connection");
				raiseParentExited();
			}
			return;
		}
		if (*message == protocol::Abort) {
			raiseParentExited();
			return;
		}
		if (*message != protocol::Init) {
			continue;
		}

		std::optional<std::string> line = readMessage();
		if (!line || *line == protocol::Abort) {
			raiseParentExited();
			return;
		}

		auto access = std::make_shared<RemoteAccess>();
		std::weak_ptr<const RemoteAccess> weakAccess = access;
		access->property = [this, weakAccess](const std::string &handle, const std::string &name, bool isProperty) {
			return requestProperty(handle, name, isProperty, weakAccess.lock());
		};
		access->items = [this, weakAccess](const std::string &handle) {
			return requestItems(handle, weakAccess.lock());
		};
		std::shared_ptr<const RemoteBreakpointInfo> info;
		BreakpointPayload payload;
		try {
			payload = BreakpointPayload::decode(*line);
			info = std::make_shared<RemoteBreakpointInfo>(payload, access);
		} catch (const std::exception &e) {
			logError("Malformed breakpoint payload: " + std::string(e.what()));
			if (!output->writeLine(Json::array({protocol::Resume, protocol::booleanText(false)}).dump())) {
				raiseParentExited();
				return;
			}
			continue;
		}

		HitHandler handler;
		{
			std::lock_guard<std::mutex> lock(mutex);
			if (!view || view->preSource() != payload.preSource || view->postSource() != payload.postSource) {
				view = std::make_unique<SourceView>(payload.preSource, payload.postSource);
				rebuilds++;
			}
			view->setText(payload.text);
			view->setReferences(payload.references);
			paused = true;
			decision.reset();
			handler = hitHandler;
		}
		log("Breakpoint hit at " + std::to_string(payload.start));

		if (handler) {
			try {
				handler(info, *view);
			} catch (const std::exception &e) {
				logError("Breakpoint handler failed: " + std::string(e.what()));
				resume(false);
			}
		} else {
			resume(false);
		}

		std::optional<bool> suppress;
		std::function<void()> resumed;
		{
			std::unique_lock<std::mutex> lock(mutex);
			changed.wait(lock, [this] { return decision.has_value() || stopping; });
			suppress = decision;
			paused = false;
			decision.reset();
			resumed = resumedHandler;
		}
		if (!suppress) {
			return;
		}

		if (!output->writeLine(Json::array({protocol::Resume, protocol::booleanText(*suppress)}).dump())) {
			raiseParentExited();
			return;
		}
		log(std::string("Resumed") + (*suppress ? ", suppressing" : ""));
		if (resumed) {
			resumed();
		}
	}
}

} // namespace snap
