#include "bridgeway/request-exchange.hpp"

#include <format>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "bridgeway/http-constants.hpp"
#include "bridgeway/http-header.hpp"
#include "bridgeway/http-status-code.hpp"
#include "bridgeway/log.hpp"
#include "bridgeway/message.hpp"

namespace bridgeway {

std::string_view RequestStateName(RequestState state) noexcept {
  switch (state) {
    case RequestState::Submitted:
      return "Submitted";
    case RequestState::Running:
      return "Running";
    case RequestState::StatusEmitted:
      return "StatusEmitted";
    case RequestState::Streaming:
      return "Streaming";
    case RequestState::Failed:
      return "Failed";
    case RequestState::Completed:
      return "Completed";
    default:
      return "Unknown";
  }
}

void RequestExchange::start() noexcept {
  if (_state == RequestState::Submitted) {
    _state = RequestState::Running;
  }
}

InboundMessage RequestExchange::receive() {
  InboundMessage message;
  if (_bodyDelivered || _channels->cancelRequested()) {
    message.type = InboundMessage::Type::Disconnect;
  } else {
    message.body = std::move(_body);
    _bodyDelivered = true;
  }
  return message;
}

void RequestExchange::send(OutboundMessage message) {
  if (_channels->cancelRequested()) {
    throw RequestCancelled("request cancelled by the caller");
  }
  if (_state == RequestState::Completed || _state == RequestState::Failed) {
    log::warn("{} received after the end of the response, ignored", MessageTypeName(message));
    return;
  }

  if (auto* start = std::get_if<ResponseStart>(&message)) {
    if (_state != RequestState::Running) {
      log::warn("Duplicated {} (status {}) ignored, response already started", kMessageHttpResponseStart,
                start->status);
      return;
    }
    _channels->status().offer(std::move(*start));
    _state = RequestState::StatusEmitted;
    return;
  }

  auto& body = std::get<ResponseBody>(message);
  if (_state == RequestState::Running) {
    log::warn("{} received before {}, dropped", kMessageHttpResponseBody, kMessageHttpResponseStart);
    return;
  }
  if (!body.body.empty()) {
    _channels->body().push(std::move(body.body));
  }
  _state = RequestState::Streaming;
  if (!body.moreBody) {
    finish();
  }
}

void RequestExchange::complete() {
  switch (_state) {
    case RequestState::Submitted:
      [[fallthrough]];
    case RequestState::Running:
      log::error("Handler returned without sending {}", kMessageHttpResponseStart);
      synthesizeErrorResponse("Handler returned without starting a response");
      break;
    case RequestState::StatusEmitted:
      [[fallthrough]];
    case RequestState::Streaming:
      log::debug("Handler returned without a final {}, closing the body", kMessageHttpResponseBody);
      break;
    default:
      return;
  }
  finish();
}

void RequestExchange::fail(std::string_view reason) {
  log::error("Handler failed in state {}: {}", RequestStateName(_state), reason);
  if (_state == RequestState::Submitted || _state == RequestState::Running) {
    synthesizeErrorResponse(std::format("Handler error: {}", reason));
  }
  if (_state != RequestState::Completed) {
    _state = RequestState::Failed;
  }
  finish();
}

void RequestExchange::abandon(std::string_view reason) {
  log::debug("Handler stopped in state {}: {}", RequestStateName(_state), reason);
  if (_state == RequestState::Submitted || _state == RequestState::Running) {
    synthesizeErrorResponse(std::string(reason));
  }
  finish();
}

void RequestExchange::synthesizeErrorResponse(std::string diagnostic) {
  ResponseStart start;
  start.status = http::StatusCodeInternalServerError;
  start.headers.emplace_back(http::ContentType, http::ContentTypeTextPlain);
  _channels->status().offer(std::move(start));
  _channels->body().push(std::move(diagnostic));
}

void RequestExchange::finish() {
  // Both channels must be terminated, otherwise the caller would wait forever
  if (!_channels->status().filled()) {
    synthesizeErrorResponse("Response was never started");
  }
  _channels->body().close();
  _state = RequestState::Completed;
}

}  // namespace bridgeway
