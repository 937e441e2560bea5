#include "ipc/debuggerServer.hpp"
#include "debugger/variableCodec.hpp"
#include "instrumentation/instrumentor.hpp"
#include "ipc/debuggerProtocolError.hpp"
#include "runtime/scriptError.hpp"

#include <llvm/Support/Process.h>

#include <csignal>
#include <iostream>
#include <thread>

namespace snap {

using Json = nlohmann::json;

DebuggerServer::DebuggerServer(std::string clientExePath, std::vector<std::string> initialArgs,
                               ClientPidResolver getClientPid, DebuggerOptions options)
    : clientExePath(std::move(clientExePath)), initialArgs(std::move(initialArgs)),
      getClientPid(std::move(getClientPid)), options(options) {
	// A client dying mid-write must surface as a failed write
	std::signal(SIGPIPE, SIG_IGN);

	std::lock_guard<std::mutex> lock(mutex);
	try {
		connect();
	} catch (...) {
		disconnect();
		throw;
	}
}

DebuggerServer::~DebuggerServer() {
	dispose();
}

void DebuggerServer::log(const std::string &message) const {
	if (options.debug) {
		std::cerr << "[DBG-SERVER] " << message << std::endl;
	}
}

void DebuggerServer::logError(const std::string &message) const {
	std::cerr << "[DBG-SERVER ERROR] " << message << std::endl;
}

bool DebuggerServer::clientExited() {
	return client.hasExited();
}

void DebuggerServer::connect() {
	outPipe = NamedPipe::create();
	inPipe = NamedPipe::create();

	std::vector<std::string> args = initialArgs;
	args.push_back(std::to_string(llvm::sys::Process::getProcessId()));
	args.push_back(outPipe.path());
	args.push_back(inPipe.path());

	log("Starting " + clientExePath);
	ChildProcess spawned = ChildProcess::spawn(clientExePath, args);
	if (getClientPid) {
		int resolved = getClientPid(spawned.pid());
		if (resolved != spawned.pid()) {
			launched = spawned;
			client = ChildProcess::adopt(resolved);
		} else {
			client = spawned;
		}
	} else {
		client = spawned;
	}
	counters.connections++;
	log("Client pid " + std::to_string(client.pid()));

	auto alive = [this]() { return !clientExited(); };
	output = std::make_unique<LineChannel>(
	    openPipeEnd(outPipe.path(), PipeEnd::Write, options.connectTimeout, options.pollInterval, alive));
	input = std::make_unique<LineChannel>(
	    openPipeEnd(inPipe.path(), PipeEnd::Read, options.connectTimeout, options.pollInterval, alive));

	std::string token = uniqueIdentifierSuffix().substr(1);
	if (!output->writeLine(token)) {
		throw DebuggerProtocolError("The debugger client closed its pipe before the handshake");
	}

	const auto deadline = std::chrono::steady_clock::now() + options.connectTimeout;
	while (!input->waitReadable(options.pollInterval)) {
		if (clientExited()) {
			throw DebuggerProtocolError("The debugger client exited during the handshake");
		}
		if (std::chrono::steady_clock::now() >= deadline) {
			throw DebuggerProtocolError("Timed out waiting for the debugger client to answer");
		}
	}

	std::optional<std::string> echo = input->readLine();
	if (!echo || *echo != token) {
		throw DebuggerProtocolError("The debugger client answered incorrectly!\n" + echo.value_or("<end of stream>"));
	}
	log("Handshake complete");
}

void DebuggerServer::disconnect() {
	output.reset();
	input.reset();

	const auto deadline = std::chrono::steady_clock::now() + options.shutdownTimeout;
	while (!client.hasExited() && std::chrono::steady_clock::now() < deadline) {
		std::this_thread::sleep_for(options.pollInterval);
	}
	client.kill();
	launched.kill();

	outPipe.remove();
	inPipe.remove();
	handles.clear();
}

void DebuggerServer::dispose() {
	std::lock_guard<std::mutex> lock(mutex);
	if (disposed) {
		return;
	}
	disposed = true;

	if (output && !clientExited() && !output->writeLine(protocol::Abort)) {
		logError("Could not send Abort to the debugger client");
	}
	disconnect();
	log("Disposed");
}

DebuggerServer::Statistics DebuggerServer::statistics() const {
	std::lock_guard<std::mutex> lock(mutex);
	return counters;
}

int DebuggerServer::clientPid() const {
	std::lock_guard<std::mutex> lock(mutex);
	return client.pid();
}

void DebuggerServer::setRequestObserver(
    std::function<void(const std::string &request, const std::string &reply)> requestObserver) {
	std::lock_guard<std::mutex> lock(mutex);
	observer = std::move(requestObserver);
}

BreakpointController::SyncCallback DebuggerServer::synchronousBreak(const Document &document) {
	DocumentSnapshot snapshot{document.text(), document.preSource(), document.postSource(), document.references()};

	return [this, snapshot](const BreakpointInfo &info) {
		std::lock_guard<std::mutex> lock(mutex);
		if (disposed) {
			return false;
		}
		if (clientExited()) {
			log("Client has exited, restarting it");
			disconnect();
			try {
				connect();
			} catch (const DebuggerProtocolError &e) {
				logError(std::string("Cannot restart the debugger client: ") + e.what());
				disconnect();
				return false;
			}
		}
		bool suppress = false;
		try {
			suppress = serviceHit(info, snapshot);
		} catch (const std::exception &e) {
			// The client may be waiting for a reply that will never come
			logError(std::string("Breakpoint abandoned: ") + e.what());
			disconnect();
		}
		handles.clear();
		return suppress;
	};
}

BreakpointController::AsyncCallback DebuggerServer::asynchronousBreak(const Document &document) {
	auto synchronous = synchronousBreak(document);
	return [synchronous](const BreakpointInfo &info) { return Task<bool>::fromResult(synchronous(info)); };
}

WireVariable DebuggerServer::track(const Value &value) {
	handles.push_back(value);
	VariableDescription description = describe(value);
	return WireVariable{std::to_string(handles.size() - 1), description.kind, description.json};
}

const Value *DebuggerServer::lookup(const std::string &handle) const {
	size_t index = 0;
	try {
		index = std::stoul(handle);
	} catch (const std::logic_error &) {
		return nullptr;
	}
	return index < handles.size() ? &handles[index] : nullptr;
}

std::string DebuggerServer::answerItems(const std::vector<std::string> &request) {
	Json items = Json::array();
	const Value *owner = request.size() > 1 ? lookup(request[1]) : nullptr;
	if (!owner || !owner->isObject() || !owner->asObject()->isEnumerable()) {
		logError("GetItems on an unknown or non-enumerable handle");
		return dumpJson(items);
	}
	for (const Value &item : owner->asObject()->items()) {
		items.push_back(track(item));
	}
	return dumpJson(items);
}

std::string DebuggerServer::answerProperty(const std::vector<std::string> &request) {
	const Value *owner = request.size() > 3 ? lookup(request[1]) : nullptr;
	if (!owner) {
		logError("GetProperty on an unknown handle");
		return dumpJson(Json(track(Value())));
	}

	Value result;
	try {
		if (!owner->isObject()) {
			throw ScriptError("Value of type '" + owner->typeName() + "' has no members");
		}
		result = owner->asObject()->getMember(request[2], parseBoolean(request[3]));
	} catch (const ScriptError &e) {
		result = Value(memberAccessError + e.message());
	} catch (const std::exception &e) {
		result = Value(memberAccessError + std::string(e.what()));
	}
	return dumpJson(Json(track(result)));
}

bool DebuggerServer::serviceHit(const BreakpointInfo &info, const DocumentSnapshot &document) {
	handles.clear();

	BreakpointPayload payload;
	for (const auto &[name, value] : info.locals()) {
		payload.displayParts.emplace_back(name, info.displayParts(name));
		payload.locals.emplace_back(name, track(value));
	}
	payload.text = document.text;
	payload.start = info.span().start;
	payload.preSource = document.preSource;
	payload.postSource = document.postSource;
	payload.references = document.references;

	if (!output->writeLine(protocol::Init) || !output->writeLine(payload.encode())) {
		logError("Could not send the breakpoint to the debugger client");
		return false;
	}
	counters.hits++;
	log("Breakpoint at " + std::to_string(payload.start) + " sent");

	while (true) {
		std::optional<std::string> line = input->readLine();
		if (!line) {
			log("Client closed the connection");
			return false;
		}
		if (line->empty()) {
			continue;
		}

		std::vector<std::string> request;
		try {
			request = Json::parse(*line).get<std::vector<std::string>>();
		} catch (const Json::exception &e) {
			logError("Malformed request: " + std::string(e.what()));
			continue;
		}
		if (request.empty()) {
			continue;
		}

		std::string reply;
		if (request[0] == protocol::GetItems) {
			counters.itemRequests++;
			reply = answerItems(request);
		} else if (request[0] == protocol::GetProperty) {
			counters.propertyRequests++;
			reply = answerProperty(request);
		} else if (request[0] == protocol::Resume) {
			bool suppress = request.size() > 1 && parseBoolean(request[1]);
			log(std::string("Resumed") + (suppress ? ", suppressing" : ""));
			return suppress;
		} else {
			logError("Unknown request: " + request[0]);
			continue;
		}

		if (observer) {
			observer(*line, reply);
		}
		if (!output->writeLine(reply)) {
			logError("Could not answer the debugger client");
			return false;
		}
	}
}

} // namespace snap
