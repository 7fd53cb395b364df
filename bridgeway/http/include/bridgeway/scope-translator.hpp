#pragma once

#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "bridgeway/bridge-config.hpp"
#include "bridgeway/scope.hpp"
#include "bridgeway/sync-request.hpp"

namespace bridgeway {

// Result of the translation of one synchronous request.
struct TranslatedRequest {
  std::shared_ptr<const Scope> scope;
  std::string body;
};

// Builds the Scope and reads the body of 'request'.
// Never throws on malformed request metadata: bad ports become 0, a bad content length gives an empty body.
// The body is read eagerly, at most config.maxBodyBytes bytes.
[[nodiscard]] TranslatedRequest TranslateRequest(const SyncRequest& request, const BridgeConfig& config);

// Converts a header meta-variable name to its header name in a Scope:
// the "HTTP_" prefix is stripped if present, '_' become '-' and letters are lower-cased.
//   HTTP_X_FORWARDED_FOR -> x-forwarded-for
//   CONTENT_TYPE         -> content-type
[[nodiscard]] std::string MetaVariableToHeaderName(std::string_view name);

// Reads the request body from 'input' according to the declared 'contentLength'.
// Reads min(contentLength, maxBodyBytes) bytes (fewer if the stream ends before).
// Returns an empty body if there is no stream, no declared length, or if it is not a non-negative integer.
[[nodiscard]] std::string ReadRequestBody(std::istream* input, std::optional<std::string_view> contentLength,
                                          std::size_t maxBodyBytes);

}  // namespace bridgeway
