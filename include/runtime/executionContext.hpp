#pragma once

#include <functional>

namespace snap {

/**
 * @brief The thread that owns the user interface, seen from script code
 *
 * Blocking that thread while it waits for user input would deadlock, so the
 * breakpoint controller asks the context before blocking and `await` pumps
 * queued work through it instead of sleeping.
 */
class ExecutionContext {
public:
  virtual ~ExecutionContext() = default;

  // True when the calling thread is the UI thread
  virtual bool isUiThread() const = 0;

  // Queue work for the UI thread; callable from any thread
  virtual void post(std::function<void()> work) = 0;

  // Run queued work on the calling (UI) thread until done() returns true
  virtual void runUntil(const std::function<bool()> &done) = 0;
};

} // namespace snap
