#include "bridgeway/worker-pool.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

#include "bridgeway/log.hpp"
#include "bridgeway/request-exchange.hpp"
#include "bridgeway/response-channels.hpp"
#include "bridgeway/scope.hpp"
#include "bridgeway/worker.hpp"

namespace bridgeway {

WorkerPool::WorkerPool(Handler handler, uint32_t nbWorkers) : _handler(std::move(handler)) {
  if (!_handler) {
    throw std::invalid_argument("WorkerPool requires a handler");
  }
  if (nbWorkers == 0) {
    throw std::invalid_argument("WorkerPool requires at least one worker");
  }
  _workers.reserve(nbWorkers);
  _threads.reserve(nbWorkers);
  for (uint32_t workerPos = 0; workerPos < nbWorkers; ++workerPos) {
    _workers.push_back(std::make_unique<Worker>(_handler));
  }
  for (auto& worker : _workers) {
    _threads.emplace_back([this, &worker = *worker](const std::stop_token& stopToken) { workerLoop(worker, stopToken); });
  }
  log::debug("Started worker pool of {} thread(s)", nbWorkers);
}

WorkerPool::~WorkerPool() { stop(); }

std::shared_ptr<ResponseChannels> WorkerPool::submit(std::shared_ptr<const Scope> scope, std::string body) {
  auto channels = std::make_shared<ResponseChannels>();
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_stopped) {
      throw std::logic_error("Cannot submit a request to a stopped WorkerPool");
    }
    _jobs.push_back(Job{std::move(scope), std::move(body), channels});
  }
  _cv.notify_one();
  return channels;
}

void WorkerPool::stop() noexcept {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_stopped) {
      return;
    }
    _stopped = true;
  }
  for (auto& thread : _threads) {
    thread.request_stop();
  }
  for (auto& thread : _threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  log::debug("Stopped worker pool of {} thread(s)", _threads.size());
}

std::size_t WorkerPool::nbQueuedJobs() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _jobs.size();
}

void WorkerPool::workerLoop(Worker& worker, const std::stop_token& stopToken) {
  while (true) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(_mutex);
      // returns false only when stop is requested and there is nothing left to do
      if (!_cv.wait(lock, stopToken, [this] { return !_jobs.empty(); })) {
        return;
      }
      job = std::move(_jobs.front());
      _jobs.pop_front();
    }
    worker.execute(std::move(job));
  }
}

}  // namespace bridgeway
