#pragma once

#include "runtime/executionContext.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace snap {

/**
 * @brief Work queue owned by one thread, the UI thread of a debugging
 * session
 *
 * Any thread may post; only the owning thread runs the queue.
 */
class Dispatcher : public ExecutionContext {
public:
  // Owned by the constructing thread
  Dispatcher();

  bool isUiThread() const override;
  void post(std::function<void()> work) override;
  void runUntil(const std::function<bool()> &done) override;

  // Run everything queued so far; returns the number of items run
  size_t runPending();

  // Make the calling thread the owner
  void bindToCurrentThread();

private:
  std::thread::id owner;
  mutable std::mutex mutex;
  std::condition_variable queued;
  std::deque<std::function<void()>> queue;
};

} // namespace snap
