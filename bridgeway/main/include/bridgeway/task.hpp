#pragma once

#include <coroutine>
#include <exception>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace bridgeway {

namespace internal {

// Resumes the coroutine awaiting the finished task, if any (symmetric transfer).
template <class Promise>
struct TaskFinalAwaiter {
  [[nodiscard]] bool await_ready() const noexcept { return false; }

  std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> coro) const noexcept {
    if (auto continuation = coro.promise()._continuation) {
      return continuation;
    }
    return std::noop_coroutine();
  }

  void await_resume() const noexcept {}
};

struct TaskPromiseBase {
  std::suspend_always initial_suspend() noexcept { return {}; }

  void unhandled_exception() noexcept { _exception = std::current_exception(); }

  void rethrow_if_needed() const {
    if (_exception) {
      std::rethrow_exception(_exception);
    }
  }

  std::coroutine_handle<> _continuation;
  std::exception_ptr _exception;
};

}  // namespace internal

// Lazily started coroutine returning a T.
// A Task does nothing until it is either awaited by another coroutine (co_await task) or run by an
// ExecutionContext. Awaiting a task resumes the awaiting coroutine once it completes, and rethrows its exception if
// it failed. The coroutine frame is owned by the Task object.
template <class T>
class Task {
 public:
  struct promise_type : internal::TaskPromiseBase {
    Task get_return_object() noexcept { return Task{std::coroutine_handle<promise_type>::from_promise(*this)}; }

    internal::TaskFinalAwaiter<promise_type> final_suspend() noexcept { return {}; }

    void return_value(T value) noexcept(std::is_nothrow_move_constructible_v<T>) { _value = std::move(value); }

    T&& consume_result() {
      rethrow_if_needed();
      return std::move(_value);
    }

    T _value{};
  };

  struct Awaiter {
    [[nodiscard]] bool await_ready() const noexcept { return !_coro || _coro.done(); }

    std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
      _coro.promise()._continuation = awaiting;
      return _coro;
    }

    T await_resume() {
      if (!_coro) {
        throw std::logic_error("awaiting an empty Task");
      }
      return std::move(_coro.promise().consume_result());
    }

    std::coroutine_handle<promise_type> _coro;
  };

  Task() noexcept = default;
  explicit Task(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  Task(Task&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  Task& operator=(Task&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  ~Task() { reset(); }

  Awaiter operator co_await() const& noexcept { return Awaiter{_coro}; }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  [[nodiscard]] std::coroutine_handle<> handle() const noexcept { return _coro; }

  // Exception which ended the coroutine, null if it did not fail (or is not finished).
  [[nodiscard]] std::exception_ptr exception() const noexcept {
    return _coro ? _coro.promise()._exception : std::exception_ptr{};
  }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

 private:
  std::coroutine_handle<promise_type> _coro;
};

template <>
class Task<void> {
 public:
  struct promise_type : internal::TaskPromiseBase {
    Task get_return_object() noexcept { return Task{std::coroutine_handle<promise_type>::from_promise(*this)}; }

    internal::TaskFinalAwaiter<promise_type> final_suspend() noexcept { return {}; }

    void return_void() const noexcept {}
  };

  struct Awaiter {
    [[nodiscard]] bool await_ready() const noexcept { return !_coro || _coro.done(); }

    std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
      _coro.promise()._continuation = awaiting;
      return _coro;
    }

    void await_resume() const {
      if (!_coro) {
        throw std::logic_error("awaiting an empty Task");
      }
      _coro.promise().rethrow_if_needed();
    }

    std::coroutine_handle<promise_type> _coro;
  };

  Task() noexcept = default;
  explicit Task(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  Task(Task&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  Task& operator=(Task&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  ~Task() { reset(); }

  Awaiter operator co_await() const& noexcept { return Awaiter{_coro}; }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  [[nodiscard]] std::coroutine_handle<> handle() const noexcept { return _coro; }

  [[nodiscard]] std::exception_ptr exception() const noexcept {
    return _coro ? _coro.promise()._exception : std::exception_ptr{};
  }

  void rethrowIfFailed() const {
    if (_coro) {
      _coro.promise().rethrow_if_needed();
    }
  }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

 private:
  std::coroutine_handle<promise_type> _coro;
};

}  // namespace bridgeway
