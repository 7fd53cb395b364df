#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "bridgeway/request-exchange.hpp"
#include "bridgeway/response-channels.hpp"
#include "bridgeway/scope.hpp"
#include "bridgeway/worker.hpp"

namespace bridgeway {

// Fixed-size pool of worker threads running handler invocations.
// At most nbWorkers() handlers run concurrently. Each worker thread owns one Worker (and thus one execution
// context) for its whole life.
//
// Destroying the pool (or calling stop()) lets the workers finish the queued jobs, then joins them.
class WorkerPool {
 public:
  WorkerPool(Handler handler, uint32_t nbWorkers);

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  ~WorkerPool();

  // Queues a request and returns its freshly allocated channels. Does not wait for a worker.
  // Throws std::logic_error if the pool is stopped.
  [[nodiscard]] std::shared_ptr<ResponseChannels> submit(std::shared_ptr<const Scope> scope, std::string body);

  // Finishes queued jobs then joins the workers. Safe to call several times.
  void stop() noexcept;

  [[nodiscard]] uint32_t nbWorkers() const noexcept { return static_cast<uint32_t>(_workers.size()); }

  // Number of jobs submitted and not yet picked by a worker.
  [[nodiscard]] std::size_t nbQueuedJobs() const;

  // Access to the worker of index 'workerPos'. Its counters should be read only once the pool is stopped.
  [[nodiscard]] const Worker& worker(uint32_t workerPos) const { return *_workers[workerPos]; }

 private:
  void workerLoop(Worker& worker, const std::stop_token& stopToken);

  Handler _handler;
  mutable std::mutex _mutex;
  std::condition_variable_any _cv;
  std::deque<Job> _jobs;
  bool _stopped{false};
  std::vector<std::unique_ptr<Worker>> _workers;
  std::vector<std::jthread> _threads;
};

}  // namespace bridgeway
