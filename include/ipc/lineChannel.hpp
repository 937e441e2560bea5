#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace snap {

/**
 * @brief Newline-delimited messages over a file descriptor
 *
 * Owns the descriptor. End of stream and I/O errors are reported through
 * the return values, never thrown. Reads and writes may happen on different
 * threads; close() may be called from any thread.
 */
class LineChannel {
public:
  LineChannel() = default;
  explicit LineChannel(int fd) : descriptor(fd) {}
  ~LineChannel();
  LineChannel(const LineChannel &) = delete;
  LineChannel &operator=(const LineChannel &) = delete;

  // Next line without its terminator; nullopt at end of stream
  std::optional<std::string> readLine();
  // Write text plus "\n"; false when the peer is gone
  bool writeLine(const std::string &line);
  // True when a read would not block (data, end of stream or error)
  bool waitReadable(std::chrono::milliseconds timeout);

  bool isOpen() const;
  void close();

private:
  mutable std::mutex mutex;
  int descriptor{-1};
  std::string buffer;
};

} // namespace snap
