#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace snap {

/**
 * @brief A FIFO in the temp directory, removed when the owner goes away
 */
class NamedPipe {
public:
  // Create a FIFO with a unique name; throws DebuggerProtocolError
  static NamedPipe create();

  NamedPipe() = default;
  ~NamedPipe();
  NamedPipe(NamedPipe &&other) noexcept;
  NamedPipe &operator=(NamedPipe &&other) noexcept;
  NamedPipe(const NamedPipe &) = delete;
  NamedPipe &operator=(const NamedPipe &) = delete;

  const std::string &path() const { return fifoPath; }
  void remove();

private:
  explicit NamedPipe(std::string path) : fifoPath(std::move(path)) {}

  std::string fifoPath;
};

enum class PipeEnd { Read, Write };

/**
 * Open one end of a FIFO without hanging on a peer that never shows up.
 * Retries until the peer has the other end open, peerAlive() turns false or
 * the timeout elapses; returns a blocking, close-on-exec descriptor.
 * Throws DebuggerProtocolError on failure.
 *
 * A read end opened this way returns at once; use LineChannel::waitReadable
 * before the first read.
 */
int openPipeEnd(const std::string &path, PipeEnd end,
                std::chrono::milliseconds timeout,
                std::chrono::milliseconds pollInterval,
                const std::function<bool()> &peerAlive);

} // namespace snap
