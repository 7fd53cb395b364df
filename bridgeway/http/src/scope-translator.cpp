#include "bridgeway/scope-translator.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <ios>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "bridgeway/bridge-config.hpp"
#include "bridgeway/http-constants.hpp"
#include "bridgeway/log.hpp"
#include "bridgeway/scope.hpp"
#include "bridgeway/string-trim.hpp"
#include "bridgeway/stringconv.hpp"
#include "bridgeway/sync-request.hpp"
#include "bridgeway/toupperlower.hpp"

namespace bridgeway {

namespace {

uint16_t ParsePort(const SyncRequest& request, std::string_view name) {
  const auto value = request.get(name);
  if (!value) {
    return 0;
  }
  const auto port = TryStringToIntegral<uint16_t>(TrimOws(*value));
  if (!port) {
    log::debug("Invalid {} '{}', using 0", name, *value);
    return 0;
  }
  return *port;
}

std::string_view HttpVersionOf(std::string_view serverProtocol) {
  const auto slashPos = serverProtocol.find('/');
  if (slashPos == std::string_view::npos || slashPos + 1U == serverProtocol.size()) {
    log::debug("Unexpected server protocol '{}', assuming {}", serverProtocol, http::DefaultHttpVersion);
    return http::DefaultHttpVersion;
  }
  return serverProtocol.substr(slashPos + 1U);
}

// Digits only, with an optional leading '+'.
bool IsUnsignedDecimal(std::string_view str) {
  if (str.starts_with('+')) {
    str.remove_prefix(1);
  }
  return !str.empty() && std::ranges::all_of(str, [](char ch) { return ch >= '0' && ch <= '9'; });
}

}  // namespace

std::string MetaVariableToHeaderName(std::string_view name) {
  if (name.starts_with(SyncRequest::kHttpHeaderPrefix)) {
    name.remove_prefix(SyncRequest::kHttpHeaderPrefix.size());
  }
  std::string ret(name);
  std::ranges::transform(ret, ret.begin(), [](char ch) { return ch == '_' ? '-' : tolower(ch); });
  return ret;
}

std::string ReadRequestBody(std::istream* input, std::optional<std::string_view> contentLength,
                            std::size_t maxBodyBytes) {
  std::string body;
  if (input == nullptr || !contentLength || contentLength->empty()) {
    return body;
  }
  const auto lengthStr = TrimOws(*contentLength);
  const auto declared = TryStringToIntegral<int64_t>(lengthStr);
  std::size_t nbBytes = maxBodyBytes;
  if (declared && *declared >= 0) {
    nbBytes = std::min(static_cast<std::size_t>(*declared), maxBodyBytes);
    if (std::cmp_less(maxBodyBytes, *declared)) {
      log::debug("Declared content length {} exceeds the limit, reading {} bytes", *declared, nbBytes);
    }
  } else if (!declared && IsUnsignedDecimal(lengthStr)) {
    // too large for int64_t, thus above any limit
    log::debug("Declared content length {} exceeds the limit, reading {} bytes", lengthStr, nbBytes);
  } else {
    log::debug("Invalid content length '{}', ignoring request body", *contentLength);
    return body;
  }

  body.resize(nbBytes);
  try {
    input->read(body.data(), static_cast<std::streamsize>(nbBytes));
  } catch (const std::ios_base::failure& ex) {
    log::debug("Request body stream failure after {} bytes: {}", input->gcount(), ex.what());
  }
  body.resize(static_cast<std::size_t>(input->gcount()));
  return body;
}

TranslatedRequest TranslateRequest(const SyncRequest& request, const BridgeConfig& config) {
  auto scope = std::make_shared<Scope>();

  for (const auto& [name, value] : request.variables()) {
    if (name.starts_with(SyncRequest::kHttpHeaderPrefix)) {
      scope->headers.emplace_back(MetaVariableToHeaderName(name), value);
    }
  }

  // Content type and length are not prefixed by HTTP_ in CGI, fold them into the header list
  for (const auto name : {SyncRequest::kContentType, SyncRequest::kContentLength}) {
    const auto value = request.get(name);
    if (value && !value->empty()) {
      scope->headers.emplace_back(MetaVariableToHeaderName(name), *value);
    }
  }

  scope->httpVersion = HttpVersionOf(request.get(SyncRequest::kServerProtocol).value_or(http::HTTP11Sv));
  scope->method = request.get(SyncRequest::kRequestMethod).value_or(http::DefaultMethod);
  scope->scheme = request.urlScheme().empty() ? std::string_view(config.defaultScheme) : request.urlScheme();

  const auto path = request.get(SyncRequest::kPathInfo).value_or(http::DefaultPath);
  scope->path = path.empty() ? http::DefaultPath : path;
  scope->rawPath = scope->path;
  scope->queryString = request.get(SyncRequest::kQueryString).value_or("");
  scope->rootPath = request.get(SyncRequest::kScriptName).value_or("");

  scope->server.host = request.get(SyncRequest::kServerName).value_or("");
  scope->server.port = ParsePort(request, SyncRequest::kServerPort);

  const auto remoteAddr = request.get(SyncRequest::kRemoteAddr).value_or(http::LoopbackAddress);
  scope->client.host = remoteAddr.empty() ? http::LoopbackAddress : remoteAddr;
  scope->client.port = ParsePort(request, SyncRequest::kRemotePort);

  TranslatedRequest ret;
  ret.body = ReadRequestBody(request.bodyStream(), request.get(SyncRequest::kContentLength), config.maxBodyBytes);
  ret.scope = std::move(scope);
  return ret;
}

}  // namespace bridgeway
