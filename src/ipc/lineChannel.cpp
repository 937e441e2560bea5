#include "ipc/lineChannel.hpp"

#include <cerrno>
#include <poll.h>
#include <unistd.h>

namespace snap {

LineChannel::~LineChannel() {
	close();
}

bool LineChannel::isOpen() const {
	std::lock_guard<std::mutex> lock(mutex);
	return descriptor >= 0;
}

void LineChannel::close() {
	std::lock_guard<std::mutex> lock(mutex);
	if (descriptor >= 0) {
		::close(descriptor);
		descriptor = -1;
	}
}

std::optional<std::string> LineChannel::readLine() {
	while (true) {
		size_t newline = buffer.find('\n');
		if (newline != std::string::npos) {
			std::string line = buffer.substr(0, newline);
			buffer.erase(0, newline + 1);
			if (!line.empty() && line.back() == '\r') {
				line.pop_back();
			}
			return line;
		}

		int fd;
		{
			std::lock_guard<std::mutex> lock(mutex);
			fd = descriptor;
		}
		if (fd < 0) {
			return std::nullopt;
		}

		char chunk[4096];
		ssize_t n = ::read(fd, chunk, sizeof(chunk));
		if (n < 0 && errno == EINTR) {
			continue;
		}
		if (n <= 0) {
			return std::nullopt;
		}
		buffer.append(chunk, static_cast<size_t>(n));
	}
}

bool LineChannel::writeLine(const std::string &line) {
	std::string message = line + "\n";
	size_t written = 0;
	while (written < message.size()) {
		int fd;
		{
			std::lock_guard<std::mutex> lock(mutex);
			fd = descriptor;
		}
		if (fd < 0) {
			return false;
		}
		ssize_t n = ::write(fd, message.data() + written, message.size() - written);
		if (n < 0 && errno == EINTR) {
			continue;
		}
		if (n <= 0) {
			return false;
		}
		written += static_cast<size_t>(n);
	}
	return true;
}

bool LineChannel::waitReadable(std::chrono::milliseconds timeout) {
	if (buffer.find('\n') != std::string::npos) {
		return true;
	}
	int fd;
	{
		std::lock_guard<std::mutex> lock(mutex);
		fd = descriptor;
	}
	if (fd < 0) {
		return true;
	}
	struct pollfd request{};
	request.fd = fd;
	request.events = POLLIN;
	int ready = ::poll(&request, 1, static_cast<int>(timeout.count()));
	return ready > 0;
}

} // namespace snap
