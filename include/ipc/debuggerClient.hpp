#pragma once

#include "debugger/sourceView.hpp"
#include "ipc/debuggerOptions.hpp"
#include "ipc/lineChannel.hpp"
#include "ipc/remoteBreakpointInfo.hpp"

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace snap {

/**
 * @brief The client process side of the interprocess debugger
 *
 * Constructed from the command line the server passes: the last three
 * arguments are the server's pid, the pipe to read from and the pipe to
 * write to. Earlier arguments belong to the host program.
 *
 * Handlers run on the receive thread. A hit stays paused until resume() is
 * called, from the handler or from any other thread.
 */
class DebuggerClient {
public:
  using HitHandler = std::function<void(std::shared_ptr<const RemoteBreakpointInfo> info,
                                        const SourceView &source)>;

  // Connects and answers the handshake; throws DebuggerProtocolError
  explicit DebuggerClient(const std::vector<std::string> &args,
                          DebuggerOptions options = {});
  ~DebuggerClient();
  DebuggerClient(const DebuggerClient &) = delete;
  DebuggerClient &operator=(const DebuggerClient &) = delete;

  // Raised at most once: the server exited, aborted or closed its pipe
  void onParentProcessExited(std::function<void()> handler);
  void onBreakpointHit(HitHandler handler);
  void onBreakpointResumed(std::function<void()> handler);

  // Start receiving breakpoints on a background thread
  void start();
  // End the current hit; true ignores further hits of this breakpoint
  void resume(bool suppress);
  // Block until the receive loop has stopped
  void wait();
  void dispose();

  int parentPid() const { return parent; }
  // Number of times the source view had to be rebuilt
  size_t sourceViewRebuilds() const;

  void setDebug(bool debug) { options.debug = debug; }

private:
  int parent{};
  DebuggerOptions options;
  std::unique_ptr<LineChannel> input;
  std::unique_ptr<LineChannel> output;

  mutable std::mutex mutex;
  std::condition_variable changed;
  bool stopping{};
  bool finished{};
  bool disposed{};
  bool paused{};
  std::optional<bool> decision;
  size_t rebuilds{};

  // Both guarded by mutex; a handler registered after the event still
  // receives it, but only one handler call is ever made
  bool parentExitedRaised{};
  bool parentExitedDelivered{};
  std::function<void()> parentExitedHandler;
  HitHandler hitHandler;
  std::function<void()> resumedHandler;

  // One round trip at a time
  std::mutex requestMutex;
  std::unique_ptr<SourceView> view;
  std::thread receiver;
  std::thread monitor;

  void receiveLoop();
  void monitorParent();
  void raiseParentExited();
  bool isStopping() const;
  std::optional<std::string> readMessage();
  std::optional<std::string> request(const std::string &line);
  RemoteVariable requestProperty(const std::string &handle, const std::string &name,
                                 bool isProperty,
                                 std::shared_ptr<const RemoteAccess> access);
  std::vector<RemoteVariable> requestItems(const std::string &handle,
                                           std::shared_ptr<const RemoteAccess> access);

  void log(const std::string &message) const;
  void logError(const std::string &message) const;
};

} // namespace snap
