#include "ipc/childProcess.hpp"
#include "ipc/debuggerProtocolError.hpp"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Program.h>

#include <cerrno>
#include <csignal>
#include <sys/wait.h>

namespace snap {

ChildProcess ChildProcess::spawn(const std::string &program, const std::vector<std::string> &args) {
	std::string executable = program;
	if (program.find('/') == std::string::npos) {
		auto found = llvm::sys::findProgramByName(program);
		if (!found) {
			throw DebuggerProtocolError("Cannot find debugger client '" + program + "': " + found.getError().message());
		}
		executable = *found;
	}

	std::vector<llvm::StringRef> argv;
	argv.push_back(executable);
	for (const auto &arg : args) {
		argv.push_back(arg);
	}

	std::string errorMessage;
	bool failed = false;
	llvm::sys::ProcessInfo info =
	    llvm::sys::ExecuteNoWait(executable, argv, {}, {}, 0, &errorMessage, &failed);
	if (failed || info.Pid <= 0) {
		throw DebuggerProtocolError("Cannot start debugger client '" + executable + "': " + errorMessage);
	}

	ChildProcess child;
	child.processId = static_cast<int>(info.Pid);
	child.spawned = true;
	child.exited = false;
	return child;
}

ChildProcess ChildProcess::adopt(int pid) {
	ChildProcess child;
	child.processId = pid;
	child.spawned = false;
	child.exited = pid <= 0;
	return child;
}

bool ChildProcess::hasExited() {
	if (exited) {
		return true;
	}
	if (spawned) {
		int status = 0;
		pid_t result = ::waitpid(processId, &status, WNOHANG);
		if (result == processId || (result < 0 && errno == ECHILD)) {
			exited = true;
		}
	} else if (::kill(processId, 0) != 0 && errno == ESRCH) {
		exited = true;
	}
	return exited;
}

void ChildProcess::kill() {
	if (hasExited()) {
		return;
	}
	::kill(processId, SIGKILL);
	if (spawned) {
		int status = 0;
		::waitpid(processId, &status, 0);
	}
	exited = true;
}

} // namespace snap
