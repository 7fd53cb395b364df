#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "bridgeway/http-header.hpp"
#include "bridgeway/http-status-code.hpp"

namespace bridgeway {

// Message returned to a handler by Receive.
struct InboundMessage {
  enum class Type : uint8_t { Request, Disconnect };

  bool operator==(const InboundMessage&) const noexcept = default;

  Type type{Type::Request};
  // Whole request body for a Request message, empty for Disconnect.
  std::string body;
  bool moreBody{false};
};

// First message a handler must send: status and headers of the response.
struct ResponseStart {
  bool operator==(const ResponseStart&) const noexcept = default;

  http::StatusCode status{http::StatusCodeOK};
  http::HeaderList headers;
};

// A piece of the response body. The last one of a response has moreBody == false.
struct ResponseBody {
  bool operator==(const ResponseBody&) const noexcept = default;

  std::string body;
  bool moreBody{false};
};

using OutboundMessage = std::variant<ResponseStart, ResponseBody>;

// Versioned type name of a message ("http.request", "http.response.start", ...).
[[nodiscard]] std::string_view MessageTypeName(InboundMessage::Type type) noexcept;

[[nodiscard]] std::string_view MessageTypeName(const OutboundMessage& message) noexcept;

}  // namespace bridgeway
