#include "bridgeway/execution-context.hpp"

#include <algorithm>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "bridgeway/log.hpp"
#include "bridgeway/task.hpp"

namespace bridgeway {

namespace {

thread_local ExecutionContext* gCurrentContext = nullptr;

// Publishes the running context for the awaitables created on this thread, restores the previous one at exit.
class RunningScope {
 public:
  RunningScope(ExecutionContext* context, bool& running) noexcept
      : _previous(std::exchange(gCurrentContext, context)), _running(running) {
    _running = true;
  }

  RunningScope(const RunningScope&) = delete;
  RunningScope(RunningScope&&) = delete;
  RunningScope& operator=(const RunningScope&) = delete;
  RunningScope& operator=(RunningScope&&) = delete;

  ~RunningScope() {
    gCurrentContext = _previous;
    _running = false;
  }

 private:
  ExecutionContext* _previous;
  bool& _running;
};

void LogSpawnedTaskFailure(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& ex) {
    log::error("Spawned task failed: {}", ex.what());
  } catch (...) {
    log::error("Spawned task failed with an unknown exception");
  }
}

}  // namespace

ExecutionContext::~ExecutionContext() {
  if (!_spawned.empty()) {
    log::debug("Destroying execution context with {} pending task(s)", _spawned.size());
  }
}

ExecutionContext* ExecutionContext::Current() noexcept { return gCurrentContext; }

void ExecutionContext::runUntilComplete(Task<void>& task) {
  if (_closed) {
    throw std::logic_error("ExecutionContext is closed");
  }
  if (_running) {
    throw std::logic_error("ExecutionContext is already running");
  }
  if (!task.valid()) {
    throw std::invalid_argument("Cannot run an empty Task");
  }

  ++_nbRuns;
  {
    RunningScope runningScope(this, _running);
    if (!task.done()) {
      schedule(task.handle());
    }
    while (!task.done()) {
      runReady();
      reapSpawned();
      fireExpiredTimers();
      if (task.done() || !_ready.empty()) {
        continue;
      }
      if (_timers.empty()) {
        throw std::logic_error("Task is suspended with nothing left to run, it would never complete");
      }
      std::this_thread::sleep_until(_timers.top().deadline);
    }
    reapSpawned();
  }
  task.rethrowIfFailed();
}

void ExecutionContext::spawn(Task<void> task) {
  if (_closed) {
    throw std::logic_error("Cannot spawn a task on a closed ExecutionContext");
  }
  if (!task.valid()) {
    return;
  }
  schedule(task.handle());
  _spawned.push_back(std::move(task));
}

void ExecutionContext::schedule(std::coroutine_handle<> handle) { _ready.push_back(handle); }

void ExecutionContext::scheduleAt(Clock::time_point deadline, std::coroutine_handle<> handle) {
  _timers.push(Timer{deadline, _timerSeq++, handle});
}

std::size_t ExecutionContext::releasePendingTasks() {
  if (_running) {
    throw std::logic_error("Cannot release tasks of a running ExecutionContext");
  }
  reapSpawned();
  // Scheduled handles and timers may refer to the frames destroyed below, forget them first
  _ready.clear();
  _timers = {};
  const auto nbReleased = _spawned.size();
  _spawned.clear();
  return nbReleased;
}

void ExecutionContext::close() {
  releasePendingTasks();
  _closed = true;
}

void ExecutionContext::runReady() {
  if (_ready.empty()) {
    return;
  }
  // Coroutines scheduled while this batch runs are resumed at the next round
  std::deque<std::coroutine_handle<>> batch;
  batch.swap(_ready);
  for (auto handle : batch) {
    handle.resume();
  }
}

void ExecutionContext::fireExpiredTimers() {
  const auto now = Clock::now();
  while (!_timers.empty() && _timers.top().deadline <= now) {
    _ready.push_back(_timers.top().handle);
    _timers.pop();
  }
}

void ExecutionContext::reapSpawned() {
  std::erase_if(_spawned, [](const Task<void>& task) {
    if (!task.done()) {
      return false;
    }
    if (auto error = task.exception()) {
      LogSpawnedTaskFailure(error);
    }
    return true;
  });
}

YieldAwaitable YieldNow() {
  auto* context = ExecutionContext::Current();
  if (context == nullptr) {
    throw std::logic_error("YieldNow() called outside of a running ExecutionContext");
  }
  return YieldAwaitable(*context);
}

SleepAwaitable SleepFor(std::chrono::steady_clock::duration duration) {
  auto* context = ExecutionContext::Current();
  if (context == nullptr) {
    throw std::logic_error("SleepFor() called outside of a running ExecutionContext");
  }
  return {*context, ExecutionContext::Clock::now() + duration};
}

}  // namespace bridgeway
