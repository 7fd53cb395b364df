#pragma once

#include <coroutine>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "bridgeway/message.hpp"
#include "bridgeway/response-channels.hpp"
#include "bridgeway/scope.hpp"
#include "bridgeway/task.hpp"

namespace bridgeway {

// Thrown by Send when the caller gave up on the response (its body stream was dropped before the end).
class RequestCancelled : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Life cycle of a request on the engine side.
//   Submitted -> Running -> StatusEmitted -> Streaming -> Completed
//   Running -> Failed -> Completed
// Completed is terminal: both channels are terminated and later writes are dropped.
enum class RequestState : uint8_t { Submitted, Running, StatusEmitted, Streaming, Failed, Completed };

[[nodiscard]] std::string_view RequestStateName(RequestState state) noexcept;

// Bridges the messages of one handler invocation to the channels of its request.
// Only accessed from the worker thread running the handler.
class RequestExchange {
 public:
  RequestExchange(std::string body, std::shared_ptr<ResponseChannels> channels) noexcept
      : _body(std::move(body)), _channels(std::move(channels)) {}

  [[nodiscard]] RequestState state() const noexcept { return _state; }

  // Submitted -> Running, when a worker picks the request.
  void start() noexcept;

  // First call returns the whole request body as a single http.request message, later calls return http.disconnect.
  // http.disconnect is also returned once the request has been cancelled.
  [[nodiscard]] InboundMessage receive();

  // Routes 'message' to the response channels.
  // Protocol violations (second response start, body before start, message after completion) are logged and ignored.
  // Throws RequestCancelled if the caller cancelled the request.
  void send(OutboundMessage message);

  // The handler returned normally: terminates whatever the handler left open.
  // If it never started the response, a 500 response is synthesized.
  void complete();

  // The handler failed with 'reason'. Synthesizes a 500 response if it had not started one, and terminates the body.
  void fail(std::string_view reason);

  // The handler stopped because of a cancellation: terminates the channels without logging an error.
  void abandon(std::string_view reason);

 private:
  void synthesizeErrorResponse(std::string diagnostic);
  void finish();

  std::string _body;
  std::shared_ptr<ResponseChannels> _channels;
  RequestState _state{RequestState::Submitted};
  bool _bodyDelivered{false};
};

// Callable given to a handler to pull the next inbound message: co_await receive().
class Receive {
 public:
  class Awaitable {
   public:
    explicit Awaitable(RequestExchange& exchange) noexcept : _exchange(exchange) {}

    [[nodiscard]] bool await_ready() const noexcept { return true; }
    void await_suspend(std::coroutine_handle<>) const noexcept {}
    [[nodiscard]] InboundMessage await_resume() const { return _exchange.receive(); }

   private:
    RequestExchange& _exchange;
  };

  explicit Receive(std::shared_ptr<RequestExchange> exchange) noexcept : _exchange(std::move(exchange)) {}

  [[nodiscard]] Awaitable operator()() const noexcept { return Awaitable(*_exchange); }

 private:
  std::shared_ptr<RequestExchange> _exchange;
};

// Callable given to a handler to emit an outbound message: co_await send(ResponseStart{...}).
class Send {
 public:
  class Awaitable {
   public:
    Awaitable(RequestExchange& exchange, OutboundMessage message) noexcept
        : _exchange(exchange), _message(std::move(message)) {}

    [[nodiscard]] bool await_ready() const noexcept { return true; }
    void await_suspend(std::coroutine_handle<>) const noexcept {}
    void await_resume() { _exchange.send(std::move(_message)); }

   private:
    RequestExchange& _exchange;
    OutboundMessage _message;
  };

  explicit Send(std::shared_ptr<RequestExchange> exchange) noexcept : _exchange(std::move(exchange)) {}

  [[nodiscard]] Awaitable operator()(OutboundMessage message) const noexcept {
    return {*_exchange, std::move(message)};
  }

 private:
  std::shared_ptr<RequestExchange> _exchange;
};

// Asynchronous handler: a coroutine invoked once per request with its scope and the two callables above.
// The Scope reference stays valid until the coroutine (and any task it spawned) is finished or released.
using Handler = std::function<Task<void>(const Scope&, Receive, Send)>;

}  // namespace bridgeway
