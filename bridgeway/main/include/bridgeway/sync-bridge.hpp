#pragma once

#include <functional>
#include <string>
#include <string_view>

#include "bridgeway/body-stream.hpp"
#include "bridgeway/bridge-config.hpp"
#include "bridgeway/http-header.hpp"
#include "bridgeway/request-exchange.hpp"
#include "bridgeway/sync-request.hpp"
#include "bridgeway/worker-pool.hpp"

namespace bridgeway {

// Response handed back to the synchronous side.
// 'status' and 'headers' are final when handle() returns, 'body' is pulled lazily.
struct SyncResponse {
  // Stops the handler cooperatively and releases the body without reading it.
  void cancel() noexcept { body = BodyStream{}; }

  std::string status;
  http::HeaderList headers;
  BodyStream body;
};

// Entry point of the synchronous side: lets a blocking, one-call-per-request server run an asynchronous Handler.
//
// Each call translates the request into a Scope, hands it to a worker of the internal pool, then blocks until the
// handler has sent its response start (or failed). The body is then streamed as the handler produces it.
//
// Usage:
//   SyncBridge bridge([](const Scope& scope, Receive receive, Send send) -> Task<void> {
//     InboundMessage request = co_await receive();
//     co_await send(ResponseStart{200, {{"content-type", "text/plain"}}});
//     co_await send(ResponseBody{"echo: " + request.body});
//   });
//   BodyStream body = bridge(request, [](std::string_view status, const http::HeaderList& headers) { ... });
//   for (const std::string& chunk : body) { ... }
//
// handle() and operator() are thread safe: the outer server may call them from several threads at once.
class SyncBridge {
 public:
  using StartResponse = std::function<void(std::string_view status, const http::HeaderList& headers)>;

  // Validates 'config' (throws std::invalid_argument) and applies its logging settings.
  explicit SyncBridge(Handler handler, BridgeConfig config = {});

  SyncBridge(const SyncBridge&) = delete;
  SyncBridge(SyncBridge&&) = delete;
  SyncBridge& operator=(const SyncBridge&) = delete;
  SyncBridge& operator=(SyncBridge&&) = delete;

  ~SyncBridge() = default;

  // Runs the handler on 'request' and waits for its status and headers.
  // The body stream of 'request' is fully read before this returns.
  [[nodiscard]] SyncResponse handle(const SyncRequest& request);

  // Same as handle(), calling 'startResponse' with the status and headers before returning the body.
  [[nodiscard]] BodyStream operator()(const SyncRequest& request, const StartResponse& startResponse);

  [[nodiscard]] const BridgeConfig& config() const noexcept { return _config; }

 private:
  BridgeConfig _config;
  WorkerPool _pool;
};

}  // namespace bridgeway
