#pragma once

#include "compiler/breakpointHooks.hpp"
#include "debugger/breakpointInfo.hpp"
#include "runtime/executionContext.hpp"
#include "runtime/task.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace snap {

/**
 * @brief Turns user breakpoint callbacks into the hooks a compilation binds
 *
 * Tracks which breakpoint offsets the user chose to ignore. A callback
 * returning true suppresses its offset for the rest of the session; there is
 * no way back. Hooks stay valid after the controller is destroyed.
 */
class BreakpointController {
public:
  using SyncCallback = std::function<bool(const BreakpointInfo &)>;
  using AsyncCallback = std::function<Task<bool>(const BreakpointInfo &)>;

  // Without a context no caller counts as the UI thread
  explicit BreakpointController(std::shared_ptr<ExecutionContext> context = nullptr);

  SyncBreakpointHook synchronousHandler(SyncCallback callback) const;
  AsyncBreakpointHook asynchronousHandler(AsyncCallback callback) const;

  bool isSuppressed(int64_t offset) const;

  void setDebug(bool debug) { state->debug = debug; }

private:
  struct State {
    std::shared_ptr<ExecutionContext> context;
    std::mutex mutex;
    std::map<int64_t, bool> suppressed;
    bool debug{};

    bool isSuppressed(int64_t offset);
    void record(int64_t offset, bool suppress);
    void log(const std::string &message) const;
  };

  std::shared_ptr<State> state;
};

} // namespace snap
