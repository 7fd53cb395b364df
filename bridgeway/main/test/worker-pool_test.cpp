#include "bridgeway/worker-pool.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "bridgeway/http-status-code.hpp"
#include "bridgeway/message.hpp"
#include "bridgeway/request-exchange.hpp"
#include "bridgeway/response-channels.hpp"
#include "bridgeway/scope.hpp"
#include "bridgeway/task.hpp"

namespace bridgeway {

namespace {

using namespace std::chrono_literals;

std::shared_ptr<const Scope> MakeScope(std::string path) {
  auto scope = std::make_shared<Scope>();
  scope->path = std::move(path);
  return scope;
}

std::string ReadBody(BodyChannel& body) {
  std::string ret;
  for (auto chunk = body.pop(); chunk; chunk = body.pop()) {
    ret += *chunk;
  }
  return ret;
}

Task<void> EchoPath(const Scope& scope, Receive receive, Send send) {
  InboundMessage request = co_await receive();
  co_await send(ResponseStart{});
  co_await send(ResponseBody{scope.path, true});
  co_await send(ResponseBody{'|' + request.body, false});
}

}  // namespace

TEST(WorkerPoolTest, InvalidConstruction) {
  EXPECT_THROW(WorkerPool(Handler{}, 1), std::invalid_argument);
  EXPECT_THROW(WorkerPool(EchoPath, 0), std::invalid_argument);
}

TEST(WorkerPoolTest, EachRequestGetsItsOwnChannels) {
  WorkerPool pool(EchoPath, 4);
  EXPECT_EQ(pool.nbWorkers(), 4U);

  std::vector<std::shared_ptr<ResponseChannels>> allChannels;
  for (int requestPos = 0; requestPos < 16; ++requestPos) {
    allChannels.push_back(pool.submit(MakeScope("/r" + std::to_string(requestPos)), std::to_string(requestPos)));
  }
  for (int requestPos = 0; requestPos < 16; ++requestPos) {
    auto& channels = *allChannels[static_cast<std::size_t>(requestPos)];
    EXPECT_EQ(channels.status().wait().status, http::StatusCodeOK);
    EXPECT_EQ(ReadBody(channels.body()), "/r" + std::to_string(requestPos) + '|' + std::to_string(requestPos));
  }
}

TEST(WorkerPoolTest, ConcurrencyIsBoundedByNumberOfWorkers) {
  static constexpr uint32_t kNbWorkers = 3;
  std::atomic<int> nbRunning{0};
  std::atomic<int> maxRunning{0};
  Handler handler = [&](const Scope&, Receive, Send send) -> Task<void> {
    const int running = ++nbRunning;
    int observedMax = maxRunning.load();
    while (running > observedMax && !maxRunning.compare_exchange_weak(observedMax, running)) {
    }
    // blocking on purpose: the handler holds its worker thread
    std::this_thread::sleep_for(15ms);
    --nbRunning;
    co_await send(ResponseStart{});
    co_await send(ResponseBody{"x", false});
  };

  std::vector<std::shared_ptr<ResponseChannels>> allChannels;
  {
    WorkerPool pool(handler, kNbWorkers);
    for (int requestPos = 0; requestPos < 12; ++requestPos) {
      allChannels.push_back(pool.submit(MakeScope("/"), {}));
    }
    pool.stop();

    uint64_t nbJobs = 0;
    for (uint32_t workerPos = 0; workerPos < pool.nbWorkers(); ++workerPos) {
      nbJobs += pool.worker(workerPos).nbJobsExecuted();
      EXPECT_LE(pool.worker(workerPos).nbContextsCreated(), 1U);
    }
    EXPECT_EQ(nbJobs, 12U);
  }

  for (auto& channels : allChannels) {
    EXPECT_EQ(ReadBody(channels->body()), "x");
  }
  EXPECT_GE(maxRunning.load(), 1);
  EXPECT_LE(maxRunning.load(), static_cast<int>(kNbWorkers));
}

TEST(WorkerPoolTest, StopFinishesQueuedJobs) {
  WorkerPool pool(EchoPath, 1);
  std::vector<std::shared_ptr<ResponseChannels>> allChannels;
  for (int requestPos = 0; requestPos < 5; ++requestPos) {
    allChannels.push_back(pool.submit(MakeScope("/q"), "b"));
  }
  pool.stop();
  EXPECT_EQ(pool.nbQueuedJobs(), 0U);
  for (auto& channels : allChannels) {
    EXPECT_TRUE(channels->status().filled());
    EXPECT_TRUE(channels->body().closed());
    EXPECT_EQ(ReadBody(channels->body()), "/q|b");
  }
}

TEST(WorkerPoolTest, SubmitAfterStopThrows) {
  WorkerPool pool(EchoPath, 2);
  pool.stop();
  pool.stop();
  EXPECT_THROW((void)pool.submit(MakeScope("/"), {}), std::logic_error);
}

TEST(WorkerPoolTest, FailingRequestDoesNotAffectOthers) {
  Handler handler = [](const Scope& scope, Receive receive, Send send) -> Task<void> {
    if (scope.path == "/fail") {
      throw std::runtime_error("requested failure");
    }
    co_await EchoPath(scope, std::move(receive), std::move(send));
  };
  WorkerPool pool(handler, 1);
  auto failing = pool.submit(MakeScope("/fail"), {});
  auto working = pool.submit(MakeScope("/ok"), "fine");

  EXPECT_EQ(failing->status().wait().status, http::StatusCodeInternalServerError);
  EXPECT_EQ(ReadBody(failing->body()), "Handler error: requested failure");
  EXPECT_EQ(working->status().wait().status, http::StatusCodeOK);
  EXPECT_EQ(ReadBody(working->body()), "/ok|fine");
}

}  // namespace bridgeway
