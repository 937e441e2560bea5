#pragma once

#include <string>
#include <vector>

namespace snap {

/**
 * @brief A debugger client process seen from the server
 *
 * Either spawned by us (and reaped by us) or adopted by pid, in which case
 * it can only be probed for liveness.
 */
class ChildProcess {
public:
  ChildProcess() = default;

  // Start program with args (argv[0] excluded); throws DebuggerProtocolError
  static ChildProcess spawn(const std::string &program,
                            const std::vector<std::string> &args);
  static ChildProcess adopt(int pid);

  int pid() const { return processId; }
  bool hasExited();
  // SIGKILL, then reap when spawned by us
  void kill();

private:
  int processId{-1};
  bool spawned{};
  bool exited{true};
};

} // namespace snap
