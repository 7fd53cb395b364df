#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "bridgeway/http-constants.hpp"
#include "bridgeway/http-header.hpp"

namespace bridgeway {

// A host / port pair (server or client side of the connection).
struct Endpoint {
  bool operator==(const Endpoint&) const noexcept = default;

  std::string host;
  uint16_t port{};
};

// Per-request metadata handed to a handler.
// Built once by the scope translator, then shared read-only with exactly one handler invocation.
struct Scope {
  // Returns the first header named 'name' (expected in lower case), or nullptr if absent.
  [[nodiscard]] const http::Header* findHeader(std::string_view name) const noexcept;

  std::string_view type{kScopeTypeHttp};
  std::string_view version{kInterfaceVersion};
  std::string_view specVersion{kInterfaceSpecVersion};

  // "1.0", "1.1", ...
  std::string httpVersion;
  std::string method;
  std::string scheme;

  // Path as given by the gateway (PATH_INFO), never empty.
  std::string path;
  // Bytes of the path before any decoding.
  std::string rawPath;
  std::string queryString;
  // Mount point of the handler (SCRIPT_NAME), possibly empty.
  std::string rootPath;

  http::HeaderList headers;

  Endpoint server;
  Endpoint client;

  // Protocol extensions supported by the adapter. Always empty for now.
  std::map<std::string, std::string, std::less<>> extensions;
};

}  // namespace bridgeway
