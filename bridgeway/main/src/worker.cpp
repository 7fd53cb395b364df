#include "bridgeway/worker.hpp"

#include <exception>
#include <memory>
#include <string>
#include <utility>

#include "bridgeway/execution-context.hpp"
#include "bridgeway/log.hpp"
#include "bridgeway/request-exchange.hpp"
#include "bridgeway/task.hpp"

namespace bridgeway {

void Worker::execute(Job job) noexcept {
  ++_nbJobsExecuted;

  // Only used if the shared exchange cannot be allocated, so that the channels are terminated in all cases
  RequestExchange fallback(std::string{}, job.channels);
  std::shared_ptr<RequestExchange> exchange;

  // Declared before the try block: spawned tasks may still refer to the handler frame until they are released
  Task<void> task;
  try {
    exchange = std::make_shared<RequestExchange>(std::move(job.body), job.channels);
    exchange->start();

    ExecutionContext& context = ensureContext();
    task = _handler(*job.scope, Receive(exchange), Send(exchange));
    context.runUntilComplete(task);
    exchange->complete();
  } catch (const RequestCancelled& ex) {
    (exchange ? *exchange : fallback).abandon(ex.what());
  } catch (const std::exception& ex) {
    (exchange ? *exchange : fallback).fail(ex.what());
  } catch (...) {
    (exchange ? *exchange : fallback).fail("unknown exception");
  }

  releaseRequestResources();
}

ExecutionContext& Worker::ensureContext() {
  if (!_context || _context->isClosed()) {
    log::debug("Worker creates execution context #{}", _nbContextsCreated + 1U);
    _context = std::make_unique<ExecutionContext>();
    ++_nbContextsCreated;
  }
  return *_context;
}

void Worker::releaseRequestResources() noexcept {
  if (!_context) {
    return;
  }
  try {
    const auto nbReleased = _context->releasePendingTasks();
    if (nbReleased != 0) {
      log::debug("Released {} task(s) left pending by the handler", nbReleased);
    }
  } catch (const std::exception& ex) {
    // the response is already terminated, nothing else to do
    log::debug("Release of pending tasks failed: {}", ex.what());
  }
}

}  // namespace bridgeway
