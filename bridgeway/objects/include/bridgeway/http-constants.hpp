#pragma once

#include <cstddef>
#include <string_view>

namespace bridgeway::http {

// Header names as they appear in a Scope: always lower case.
inline constexpr std::string_view ContentLength = "content-length";
inline constexpr std::string_view ContentType = "content-type";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain";

inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Defaults applied by the scope translator when the gateway does not provide a value.
inline constexpr std::string_view DefaultPath = "/";
inline constexpr std::string_view DefaultMethod = "GET";
inline constexpr std::string_view DefaultHttpVersion = "1.1";
inline constexpr std::string_view DefaultScheme = "http";
inline constexpr std::string_view LoopbackAddress = "127.0.0.1";

}  // namespace bridgeway::http

namespace bridgeway {

// Version marker of the message contract exposed to handlers, reported in every Scope.
inline constexpr std::string_view kInterfaceVersion = "3.0";
inline constexpr std::string_view kInterfaceSpecVersion = "2.1";

inline constexpr std::string_view kScopeTypeHttp = "http";

// Versioned message type names.
inline constexpr std::string_view kMessageHttpRequest = "http.request";
inline constexpr std::string_view kMessageHttpDisconnect = "http.disconnect";
inline constexpr std::string_view kMessageHttpResponseStart = "http.response.start";
inline constexpr std::string_view kMessageHttpResponseBody = "http.response.body";

inline constexpr std::size_t kDefaultMaxBodyBytes = 10UL * 1024UL * 1024UL;

}  // namespace bridgeway
