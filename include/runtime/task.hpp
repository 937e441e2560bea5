#pragma once

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace snap {

template <typename T> class TaskCompletionSource;

/**
 * @brief Handle to a value that becomes available later
 *
 * Copies share one completion state. Continuations registered with then()
 * run on the thread that completes the task, or immediately when it is
 * already complete.
 */
template <typename T> class Task {
public:
  Task() : state(std::make_shared<State>()) {}

  static Task fromResult(T value) {
    Task task;
    task.state->value = std::move(value);
    task.state->ready = true;
    return task;
  }

  static Task fromException(std::exception_ptr error) {
    Task task;
    task.state->error = std::move(error);
    task.state->ready = true;
    return task;
  }

  bool isReady() const {
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->ready;
  }

  void wait() const {
    std::unique_lock<std::mutex> lock(state->mutex);
    state->changed.wait(lock, [this] { return state->ready; });
  }

  // Blocks until complete; rethrows the failure if there was one
  T get() const {
    wait();
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->error) {
      std::rethrow_exception(state->error);
    }
    return *state->value;
  }

  void then(std::function<void(const Task &)> continuation) const {
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      if (!state->ready) {
        state->continuations.push_back(std::move(continuation));
        return;
      }
    }
    continuation(*this);
  }

private:
  friend class TaskCompletionSource<T>;

  struct State {
    std::mutex mutex;
    std::condition_variable changed;
    bool ready{};
    std::optional<T> value;
    std::exception_ptr error;
    std::vector<std::function<void(const Task &)>> continuations;
  };

  std::shared_ptr<State> state;

  void complete(std::optional<T> value, std::exception_ptr error) {
    std::vector<std::function<void(const Task &)>> pending;
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      if (state->ready) {
        throw std::logic_error("Task already completed");
      }
      state->value = std::move(value);
      state->error = std::move(error);
      state->ready = true;
      pending.swap(state->continuations);
    }
    state->changed.notify_all();
    for (auto &continuation : pending) {
      continuation(*this);
    }
  }
};

// Producer side of a Task
template <typename T> class TaskCompletionSource {
public:
  Task<T> task() const { return pending; }

  void setResult(T value) { pending.complete(std::move(value), nullptr); }
  void setException(std::exception_ptr error) {
    pending.complete(std::nullopt, std::move(error));
  }

private:
  Task<T> pending;
};

} // namespace snap
