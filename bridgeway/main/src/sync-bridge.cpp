#include "bridgeway/sync-bridge.hpp"

#include <utility>

#include "bridgeway/body-stream.hpp"
#include "bridgeway/bridge-config.hpp"
#include "bridgeway/log.hpp"
#include "bridgeway/message.hpp"
#include "bridgeway/scope-translator.hpp"
#include "bridgeway/status-format.hpp"
#include "bridgeway/sync-request.hpp"

namespace bridgeway {

namespace {

BridgeConfig ValidatedConfig(BridgeConfig config) {
  config.validate();
  if (config.logLevel) {
    log::set_level(*config.logLevel);
  }
  if (!config.logPattern.empty()) {
    log::set_pattern(config.logPattern);
  }
  return config;
}

}  // namespace

SyncBridge::SyncBridge(Handler handler, BridgeConfig config)
    : _config(ValidatedConfig(std::move(config))), _pool(std::move(handler), _config.nbWorkers) {}

SyncResponse SyncBridge::handle(const SyncRequest& request) {
  auto [scope, body] = TranslateRequest(request, _config);
  log::debug("{} {} ({} body bytes)", scope->method, scope->path, body.size());

  auto channels = _pool.submit(std::move(scope), std::move(body));

  // The synchronous side needs the status and headers before it can return, this is the only blocking wait
  ResponseStart start = channels->status().wait();

  SyncResponse response;
  response.status = FormatStatus(start.status, _config.statusFormat);
  // Header bytes are passed as is: decoding them as a single-byte encoding is the identity
  response.headers = std::move(start.headers);
  response.body = BodyStream(std::move(channels));
  return response;
}

BodyStream SyncBridge::operator()(const SyncRequest& request, const StartResponse& startResponse) {
  SyncResponse response = handle(request);
  startResponse(response.status, response.headers);
  return std::move(response.body);
}

}  // namespace bridgeway
