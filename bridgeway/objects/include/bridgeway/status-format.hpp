#pragma once

#include <cstdint>
#include <string>

#include "bridgeway/http-status-code.hpp"

namespace bridgeway {

// How the status of a response is rendered for the synchronous side.
enum class StatusFormat : uint8_t {
  Numeric,    // "200"
  WithPhrase  // "200 OK"
};

// Renders 'status' according to 'format'.
// With WithPhrase, codes without a known reason phrase are rendered as in Numeric.
[[nodiscard]] std::string FormatStatus(http::StatusCode status, StatusFormat format);

}  // namespace bridgeway
