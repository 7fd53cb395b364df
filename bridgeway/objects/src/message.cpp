#include "bridgeway/message.hpp"

#include <string_view>
#include <variant>

#include "bridgeway/http-constants.hpp"

namespace bridgeway {

std::string_view MessageTypeName(InboundMessage::Type type) noexcept {
  switch (type) {
    case InboundMessage::Type::Request:
      return kMessageHttpRequest;
    case InboundMessage::Type::Disconnect:
      return kMessageHttpDisconnect;
    default:
      return {};
  }
}

std::string_view MessageTypeName(const OutboundMessage& message) noexcept {
  return std::holds_alternative<ResponseStart>(message) ? kMessageHttpResponseStart : kMessageHttpResponseBody;
}

}  // namespace bridgeway
