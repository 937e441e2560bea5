#include "ipc/namedPipe.hpp"
#include "ipc/debuggerProtocolError.hpp"

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace snap {

NamedPipe NamedPipe::create() {
	llvm::SmallString<128> directory;
	llvm::sys::path::system_temp_directory(true, directory);
	llvm::sys::path::append(directory, "snapdbg-%%%%%%%%%%%%%%%%.pipe");

	// createUniquePath only picks a name; mkfifo fails if it was taken since
	for (int attempt = 0; attempt < 16; attempt++) {
		llvm::SmallString<128> path;
		llvm::sys::fs::createUniquePath(directory, path, false);
		if (::mkfifo(path.c_str(), 0600) == 0) {
			return NamedPipe(path.str().str());
		}
		if (errno != EEXIST) {
			throw DebuggerProtocolError("Cannot create pipe " + path.str().str() + ": " + std::strerror(errno));
		}
	}
	throw DebuggerProtocolError("Cannot find a free pipe name in " + directory.str().str());
}

NamedPipe::~NamedPipe() {
	remove();
}

NamedPipe::NamedPipe(NamedPipe &&other) noexcept : fifoPath(std::move(other.fifoPath)) {
	other.fifoPath.clear();
}

NamedPipe &NamedPipe::operator=(NamedPipe &&other) noexcept {
	if (this != &other) {
		remove();
		fifoPath = std::move(other.fifoPath);
		other.fifoPath.clear();
	}
	return *this;
}

void NamedPipe::remove() {
	if (!fifoPath.empty()) {
		if (std::error_code error = llvm::sys::fs::remove(fifoPath)) {
			llvm::errs() << "[PIPE] Cannot remove " << fifoPath << ": " << error.message() << "\n";
		}
		fifoPath.clear();
	}
}

static void clearNonBlocking(int fd) {
	int flags = ::fcntl(fd, F_GETFL);
	if (flags >= 0) {
		::fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
	}
}

int openPipeEnd(const std::string &path, PipeEnd end, std::chrono::milliseconds timeout,
                std::chrono::milliseconds pollInterval, const std::function<bool()> &peerAlive) {
	const int mode = (end == PipeEnd::Read ? O_RDONLY : O_WRONLY) | O_NONBLOCK | O_CLOEXEC;
	const auto deadline = std::chrono::steady_clock::now() + timeout;

	while (true) {
		int fd = ::open(path.c_str(), mode);
		if (fd >= 0) {
			clearNonBlocking(fd);
			return fd;
		}
		// ENXIO: no reader yet for a write end
		if (errno != ENXIO && errno != EINTR) {
			throw DebuggerProtocolError("Cannot open pipe " + path + ": " + std::strerror(errno));
		}
		if (peerAlive && !peerAlive()) {
			throw DebuggerProtocolError("The debugger process exited before connecting to " + path);
		}
		if (std::chrono::steady_clock::now() >= deadline) {
			throw DebuggerProtocolError("Timed out waiting for the debugger process to open " + path);
		}
		std::this_thread::sleep_for(pollInterval);
	}
}

} // namespace snap
