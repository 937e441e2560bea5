#pragma once

#include "compiler/document.hpp"
#include "debugger/breakpointController.hpp"
#include "ipc/childProcess.hpp"
#include "ipc/debuggerOptions.hpp"
#include "ipc/lineChannel.hpp"
#include "ipc/namedPipe.hpp"
#include "ipc/protocol.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace snap {

/**
 * @brief Shows breakpoints in a separate client process
 *
 * The script thread that hits a breakpoint blocks while the client inspects
 * values through the pipes. The client is started
 * with [initialArgs..., ownPid, serverOutPipe, serverInPipe] and restarted
 * on the next hit when it has exited.
 *
 * Callbacks returned by synchronousBreak/asynchronousBreak refer to the
 * server; keep it alive while scripts compiled with them can run.
 */
class DebuggerServer {
public:
  // Maps the pid we spawned to the pid of the process to watch
  using ClientPidResolver = std::function<int(int)>;

  struct Statistics {
    size_t hits{};
    size_t itemRequests{};
    size_t propertyRequests{};
    size_t connections{};
  };

  // Starts the client and completes the handshake; throws
  // DebuggerProtocolError when either fails
  explicit DebuggerServer(std::string clientExePath,
                          std::vector<std::string> initialArgs = {},
                          ClientPidResolver getClientPid = {},
                          DebuggerOptions options = {});
  ~DebuggerServer();
  DebuggerServer(const DebuggerServer &) = delete;
  DebuggerServer &operator=(const DebuggerServer &) = delete;

  // Capture the document as it is now and show its breakpoints remotely
  BreakpointController::SyncCallback synchronousBreak(const Document &document);
  BreakpointController::AsyncCallback asynchronousBreak(const Document &document);

  // Once only: tell the client to go away and release everything. Waits
  // for a hit in progress to be resumed first.
  void dispose();

  Statistics statistics() const;
  int clientPid() const;

  // Sees every client request and the reply sent for it
  void setRequestObserver(
      std::function<void(const std::string &request, const std::string &reply)> observer);

  void setDebug(bool debug) { options.debug = debug; }

private:
  struct DocumentSnapshot {
    std::string text;
    std::string preSource;
    std::string postSource;
    std::vector<std::string> references;
  };

  std::string clientExePath;
  std::vector<std::string> initialArgs;
  ClientPidResolver getClientPid;
  DebuggerOptions options;

  // Serializes hits: one conversation on the pipes at a time
  mutable std::mutex mutex;
  bool disposed{};
  NamedPipe outPipe;
  NamedPipe inPipe;
  std::unique_ptr<LineChannel> output;
  std::unique_ptr<LineChannel> input;
  ChildProcess launched;
  ChildProcess client;
  Statistics counters;
  std::function<void(const std::string &, const std::string &)> observer;

  // Values handed out during the current hit, indexed by handle
  std::vector<Value> handles;

  void connect();
  void disconnect();
  bool clientExited();
  bool serviceHit(const BreakpointInfo &info, const DocumentSnapshot &document);
  WireVariable track(const Value &value);
  std::string answerItems(const std::vector<std::string> &request);
  std::string answerProperty(const std::vector<std::string> &request);
  const Value *lookup(const std::string &handle) const;

  void log(const std::string &message) const;
  void logError(const std::string &message) const;
};

} // namespace snap
