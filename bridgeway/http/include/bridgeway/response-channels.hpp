#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <string>

#include "bridgeway/message.hpp"

namespace bridgeway {

// One-shot channel carrying the ResponseStart of a request from its worker to the waiting caller.
class StatusChannel {
 public:
  StatusChannel() : _future(_promise.get_future()) {}

  // Publishes 'start'. Only the first call has an effect, later ones return false.
  bool offer(ResponseStart start);

  // Tells whether a ResponseStart has been offered already.
  [[nodiscard]] bool filled() const noexcept { return _filled.load(std::memory_order_acquire); }

  // Blocks until a ResponseStart is available and returns it.
  // Can be called only once (the value is moved out).
  [[nodiscard]] ResponseStart wait();

 private:
  std::promise<ResponseStart> _promise;
  std::future<ResponseStart> _future;
  std::atomic<bool> _filled{false};
};

// FIFO of body chunks, terminated by a single end-of-stream marker.
// Empty chunks are never queued, so a zero-length chunk can never be confused with the end of the stream.
class BodyChannel {
 public:
  // Queues 'chunk'. Returns false (and drops it) if it is empty or if the channel has been closed.
  bool push(std::string chunk);

  // Queues the end-of-stream marker. Only the first call has an effect, later ones return false.
  bool close();

  // Blocks until a chunk or the end-of-stream marker is available.
  // Returns std::nullopt for the end of stream, and on every call after it.
  [[nodiscard]] std::optional<std::string> pop();

  [[nodiscard]] bool closed() const;

 private:
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::deque<std::string> _chunks;
  bool _closed{false};
};

// Channels of one request. Freshly allocated per request, shared by the worker producing the response and the
// caller consuming it, released when both are done.
class ResponseChannels {
 public:
  StatusChannel& status() noexcept { return _status; }
  BodyChannel& body() noexcept { return _body; }

  // Asks the handler to stop producing the response. Cooperative: checked at each send.
  void requestCancel() noexcept { _cancelRequested.store(true, std::memory_order_release); }

  [[nodiscard]] bool cancelRequested() const noexcept { return _cancelRequested.load(std::memory_order_acquire); }

 private:
  StatusChannel _status;
  BodyChannel _body;
  std::atomic<bool> _cancelRequested{false};
};

}  // namespace bridgeway
