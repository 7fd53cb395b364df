#pragma once

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "bridgeway/vector.hpp"

namespace bridgeway {

// Request as seen by the synchronous side: CGI-style meta-variables (RFC 3875), an optional URL scheme and a
// readable body stream. This is what the outer server hands to SyncBridge once per request.
//
// Usage:
//   SyncRequest req;
//   req.set(SyncRequest::kRequestMethod, "POST")
//       .set(SyncRequest::kPathInfo, "/items")
//       .set("HTTP_ACCEPT", "application/json")
//       .withBody(R"({"id":3})");
class SyncRequest {
 public:
  static constexpr std::string_view kRequestMethod = "REQUEST_METHOD";
  static constexpr std::string_view kScriptName = "SCRIPT_NAME";
  static constexpr std::string_view kPathInfo = "PATH_INFO";
  static constexpr std::string_view kQueryString = "QUERY_STRING";
  static constexpr std::string_view kContentType = "CONTENT_TYPE";
  static constexpr std::string_view kContentLength = "CONTENT_LENGTH";
  static constexpr std::string_view kServerName = "SERVER_NAME";
  static constexpr std::string_view kServerPort = "SERVER_PORT";
  static constexpr std::string_view kServerProtocol = "SERVER_PROTOCOL";
  static constexpr std::string_view kRemoteAddr = "REMOTE_ADDR";
  static constexpr std::string_view kRemotePort = "REMOTE_PORT";

  // Prefix of the meta-variables carrying request headers ("HTTP_USER_AGENT" for "User-Agent").
  static constexpr std::string_view kHttpHeaderPrefix = "HTTP_";

  struct Variable {
    std::string name;
    std::string value;
  };

  SyncRequest() noexcept = default;

  SyncRequest(const SyncRequest&) = delete;
  SyncRequest(SyncRequest&&) noexcept = default;
  SyncRequest& operator=(const SyncRequest&) = delete;
  SyncRequest& operator=(SyncRequest&&) noexcept = default;

  ~SyncRequest() = default;

  // Sets meta-variable 'name' to 'value', replacing a previous value of the same name.
  SyncRequest& set(std::string_view name, std::string_view value);

  // Value of meta-variable 'name', std::nullopt if it is not set.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

  // All meta-variables, in insertion order.
  [[nodiscard]] const vector<Variable>& variables() const noexcept { return _variables; }

  // URL scheme of the request ("http", "https"). Empty if unknown.
  [[nodiscard]] std::string_view urlScheme() const noexcept { return _urlScheme; }

  SyncRequest& withUrlScheme(std::string_view scheme);

  // Uses 'input' as body stream. It is not owned and must stay alive until the body has been read
  // (that is, until SyncBridge::handle returns).
  SyncRequest& withBodyStream(std::istream& input);

  // Uses an in-memory copy of 'body' as body stream.
  SyncRequest& withBody(std::string_view body);

  // Body stream, nullptr if the request has none.
  [[nodiscard]] std::istream* bodyStream() const noexcept { return _input; }

 private:
  vector<Variable> _variables;
  std::string _urlScheme;
  std::unique_ptr<std::istream> _ownedInput;
  std::istream* _input{nullptr};
};

}  // namespace bridgeway
