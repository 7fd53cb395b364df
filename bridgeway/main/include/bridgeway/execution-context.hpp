#pragma once

#include <chrono>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <queue>
#include <vector>

#include "bridgeway/task.hpp"

namespace bridgeway {

// Single-threaded cooperative scheduler running Tasks.
// Coroutines only switch at co_await points: YieldNow(), SleepFor() or any awaitable scheduling its continuation
// through schedule() / scheduleAt().
//
// A context is meant to be owned by one thread (a worker) and reused for many successive runs.
// It is not thread safe: schedule(), spawn() and run methods must all be called from the owning thread.
class ExecutionContext {
 public:
  using Clock = std::chrono::steady_clock;

  ExecutionContext() noexcept = default;

  // Non-copyable and non-movable: suspended coroutines keep a pointer to it.
  ExecutionContext(const ExecutionContext&) = delete;
  ExecutionContext(ExecutionContext&&) = delete;
  ExecutionContext& operator=(const ExecutionContext&) = delete;
  ExecutionContext& operator=(ExecutionContext&&) = delete;

  ~ExecutionContext();

  // Runs 'task' until it completes, also running spawned tasks and timers in the meantime.
  // Rethrows the exception which ended 'task', if any.
  // Throws std::logic_error if the context is closed or already running, or if 'task' gets suspended while there is
  // nothing left to run (it would never complete).
  void runUntilComplete(Task<void>& task);

  // Starts 'task' detached from the caller. It is run while the context runs, and released by
  // releasePendingTasks() if it has not completed by then. Its exception, if any, is logged.
  void spawn(Task<void> task);

  // Resumes 'handle' at the next scheduling round.
  void schedule(std::coroutine_handle<> handle);

  // Resumes 'handle' once 'deadline' is reached.
  void scheduleAt(Clock::time_point deadline, std::coroutine_handle<> handle);

  // Destroys spawned tasks which are not finished and forgets all pending timers and scheduled coroutines.
  // Returns the number of released tasks.
  std::size_t releasePendingTasks();

  // Releases pending tasks and marks this context as closed. A closed context cannot run anymore.
  void close();

  [[nodiscard]] bool isClosed() const noexcept { return _closed; }

  [[nodiscard]] bool isRunning() const noexcept { return _running; }

  [[nodiscard]] std::size_t nbPendingTasks() const noexcept { return _spawned.size(); }

  [[nodiscard]] std::size_t nbPendingTimers() const noexcept { return _timers.size(); }

  // Total number of completed runUntilComplete() calls on this context.
  [[nodiscard]] uint64_t nbRuns() const noexcept { return _nbRuns; }

  // Context currently running on the calling thread, nullptr if none.
  [[nodiscard]] static ExecutionContext* Current() noexcept;

 private:
  struct Timer {
    bool operator>(const Timer& other) const noexcept {
      return deadline > other.deadline || (deadline == other.deadline && seq > other.seq);
    }

    Clock::time_point deadline;
    uint64_t seq;
    std::coroutine_handle<> handle;
  };

  void runReady();
  void fireExpiredTimers();
  void reapSpawned();

  std::deque<std::coroutine_handle<>> _ready;
  std::priority_queue<Timer, std::vector<Timer>, std::greater<>> _timers;
  std::vector<Task<void>> _spawned;
  uint64_t _timerSeq{};
  uint64_t _nbRuns{};
  bool _running{false};
  bool _closed{false};
};

// co_await YieldNow() lets the other ready coroutines of the current context run before resuming.
class YieldAwaitable {
 public:
  explicit YieldAwaitable(ExecutionContext& context) noexcept : _context(context) {}

  [[nodiscard]] bool await_ready() const noexcept { return false; }
  void await_suspend(std::coroutine_handle<> handle) const { _context.schedule(handle); }
  void await_resume() const noexcept {}

 private:
  ExecutionContext& _context;
};

// co_await SleepFor(d) resumes the awaiting coroutine after at least 'd', without blocking the other coroutines of
// the current context.
class SleepAwaitable {
 public:
  SleepAwaitable(ExecutionContext& context, ExecutionContext::Clock::time_point deadline) noexcept
      : _context(context), _deadline(deadline) {}

  [[nodiscard]] bool await_ready() const noexcept { return false; }
  void await_suspend(std::coroutine_handle<> handle) const { _context.scheduleAt(_deadline, handle); }
  void await_resume() const noexcept {}

 private:
  ExecutionContext& _context;
  ExecutionContext::Clock::time_point _deadline;
};

// Both throw std::logic_error when called outside of a running ExecutionContext.
[[nodiscard]] YieldAwaitable YieldNow();

[[nodiscard]] SleepAwaitable SleepFor(std::chrono::steady_clock::duration duration);

}  // namespace bridgeway
