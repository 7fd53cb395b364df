#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "bridgeway/execution-context.hpp"
#include "bridgeway/request-exchange.hpp"
#include "bridgeway/response-channels.hpp"
#include "bridgeway/scope.hpp"

namespace bridgeway {

// A request waiting for, or being run by, a worker.
struct Job {
  std::shared_ptr<const Scope> scope;
  std::string body;
  std::shared_ptr<ResponseChannels> channels;
};

// Runs handler invocations one at a time, inside an ExecutionContext that it keeps across jobs.
// The context is created on first use and recreated if it has been closed in the meantime.
// A Worker is driven by a single thread at a time (see WorkerPool).
class Worker {
 public:
  explicit Worker(const Handler& handler) noexcept : _handler(handler) {}

  // Runs the handler for 'job' to completion. Never throws: failures are turned into channel messages.
  void execute(Job job) noexcept;

  // Context of this worker, nullptr before the first job.
  [[nodiscard]] ExecutionContext* context() noexcept { return _context.get(); }

  [[nodiscard]] uint32_t nbContextsCreated() const noexcept { return _nbContextsCreated; }

  [[nodiscard]] uint64_t nbJobsExecuted() const noexcept { return _nbJobsExecuted; }

 private:
  ExecutionContext& ensureContext();
  void releaseRequestResources() noexcept;

  const Handler& _handler;
  std::unique_ptr<ExecutionContext> _context;
  uint32_t _nbContextsCreated{};
  uint64_t _nbJobsExecuted{};
};

}  // namespace bridgeway
