#include "bridgeway/execution-context.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <coroutine>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "bridgeway/task.hpp"

namespace bridgeway {

namespace {

using namespace std::chrono_literals;

// Sets a flag when the coroutine frame holding it is destroyed.
struct DestructionFlag {
  explicit DestructionFlag(bool& flag) : destroyed(&flag) {}

  DestructionFlag(const DestructionFlag&) = delete;
  DestructionFlag& operator=(const DestructionFlag&) = delete;

  ~DestructionFlag() { *destroyed = true; }

  bool* destroyed;
};

// Suspends forever: nobody ever resumes the awaiting coroutine.
struct NeverResumed {
  [[nodiscard]] bool await_ready() const noexcept { return false; }
  void await_suspend(std::coroutine_handle<>) const noexcept {}
  void await_resume() const noexcept {}
};

Task<void> Record(std::vector<std::string>& events, std::string name, int nbSteps) {
  for (int step = 0; step < nbSteps; ++step) {
    events.push_back(name + std::to_string(step));
    co_await YieldNow();
  }
}

}  // namespace

TEST(ExecutionContextTest, CurrentIsSetOnlyWhileRunning) {
  ExecutionContext context;
  EXPECT_EQ(ExecutionContext::Current(), nullptr);
  ExecutionContext* seen = nullptr;
  auto body = [](ExecutionContext*& out) -> Task<void> {
    out = ExecutionContext::Current();
    co_return;
  };
  Task<void> task = body(seen);
  EXPECT_FALSE(context.isRunning());
  context.runUntilComplete(task);
  EXPECT_EQ(seen, &context);
  EXPECT_EQ(ExecutionContext::Current(), nullptr);
  EXPECT_FALSE(context.isRunning());
  EXPECT_EQ(context.nbRuns(), 1U);
}

TEST(ExecutionContextTest, YieldInterleavesSpawnedTasks) {
  std::vector<std::string> events;
  auto root = [](std::vector<std::string>& out) -> Task<void> {
    ExecutionContext::Current()->spawn(Record(out, "b", 2));
    co_await Record(out, "a", 3);
  };
  ExecutionContext context;
  Task<void> task = root(events);
  context.runUntilComplete(task);

  EXPECT_EQ(events, (std::vector<std::string>{"a0", "b0", "a1", "b1", "a2"}));
  EXPECT_EQ(context.nbPendingTasks(), 0U);
}

TEST(ExecutionContextTest, SleepForWaitsWithoutBlockingOthers) {
  std::vector<std::string> events;
  auto sleeper = [](std::vector<std::string>& out) -> Task<void> {
    co_await SleepFor(30ms);
    out.emplace_back("slept");
  };
  auto root = [&sleeper](std::vector<std::string>& out) -> Task<void> {
    Task<void> child = sleeper(out);
    ExecutionContext::Current()->spawn(Record(out, "x", 1));
    co_await child;
  };
  ExecutionContext context;
  Task<void> task = root(events);
  const auto before = std::chrono::steady_clock::now();
  context.runUntilComplete(task);
  EXPECT_GE(std::chrono::steady_clock::now() - before, 30ms);
  EXPECT_EQ(events, (std::vector<std::string>{"x0", "slept"}));
}

TEST(ExecutionContextTest, TimersFireInDeadlineOrder) {
  std::vector<std::string> events;
  auto sleeper = [](std::vector<std::string>& out, std::chrono::milliseconds delay, std::string name) -> Task<void> {
    co_await SleepFor(delay);
    out.push_back(std::move(name));
  };
  auto root = [&sleeper](std::vector<std::string>& out) -> Task<void> {
    ExecutionContext::Current()->spawn(sleeper(out, 20ms, "late"));
    ExecutionContext::Current()->spawn(sleeper(out, 5ms, "early"));
    co_await SleepFor(40ms);
  };
  ExecutionContext context;
  Task<void> task = root(events);
  context.runUntilComplete(task);
  EXPECT_EQ(events, (std::vector<std::string>{"early", "late"}));
}

TEST(ExecutionContextTest, SuspendedWithNothingToRunThrows) {
  auto stuck = []() -> Task<void> { co_await NeverResumed{}; };
  ExecutionContext context;
  Task<void> task = stuck();
  EXPECT_THROW(context.runUntilComplete(task), std::logic_error);
  EXPECT_FALSE(task.done());
  EXPECT_FALSE(context.isRunning());
}

TEST(ExecutionContextTest, ReleasePendingTasksDestroysUnfinishedSpawnedTasks) {
  bool destroyed = false;
  auto background = [](bool& flag) -> Task<void> {
    DestructionFlag guard(flag);
    co_await SleepFor(std::chrono::hours(1));
  };
  auto root = [&background](bool& flag) -> Task<void> {
    ExecutionContext::Current()->spawn(background(flag));
    co_await YieldNow();
  };
  ExecutionContext context;
  Task<void> task = root(destroyed);
  context.runUntilComplete(task);

  EXPECT_EQ(context.nbPendingTasks(), 1U);
  EXPECT_EQ(context.nbPendingTimers(), 1U);
  EXPECT_FALSE(destroyed);

  EXPECT_EQ(context.releasePendingTasks(), 1U);
  EXPECT_TRUE(destroyed);
  EXPECT_EQ(context.nbPendingTasks(), 0U);
  EXPECT_EQ(context.nbPendingTimers(), 0U);

  // the context stays usable
  std::vector<std::string> events;
  Task<void> next = Record(events, "n", 1);
  EXPECT_NO_THROW(context.runUntilComplete(next));
}

TEST(ExecutionContextTest, SpawnedTaskFailureDoesNotAffectRoot) {
  auto failing = []() -> Task<void> {
    throw std::runtime_error("background failure");
    co_return;
  };
  auto root = [&failing]() -> Task<void> {
    ExecutionContext::Current()->spawn(failing());
    co_await YieldNow();
    co_await YieldNow();
  };
  ExecutionContext context;
  Task<void> task = root();
  EXPECT_NO_THROW(context.runUntilComplete(task));
  EXPECT_EQ(context.nbPendingTasks(), 0U);
}

TEST(ExecutionContextTest, ClosedContextRefusesToRun) {
  ExecutionContext context;
  EXPECT_FALSE(context.isClosed());
  context.close();
  EXPECT_TRUE(context.isClosed());

  std::vector<std::string> events;
  Task<void> task = Record(events, "c", 1);
  EXPECT_THROW(context.runUntilComplete(task), std::logic_error);
  EXPECT_THROW(context.spawn(Record(events, "s", 1)), std::logic_error);
  EXPECT_TRUE(events.empty());
}

TEST(ExecutionContextTest, EmptyTaskIsRejected) {
  ExecutionContext context;
  Task<void> task;
  EXPECT_THROW(context.runUntilComplete(task), std::invalid_argument);
}

TEST(ExecutionContextTest, AwaitablesRequireRunningContext) {
  EXPECT_THROW((void)YieldNow(), std::logic_error);
  EXPECT_THROW((void)SleepFor(1ms), std::logic_error);
}

}  // namespace bridgeway
