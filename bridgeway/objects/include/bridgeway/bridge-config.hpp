#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "bridgeway/http-constants.hpp"
#include "bridgeway/log.hpp"
#include "bridgeway/status-format.hpp"

namespace bridgeway {

struct BridgeConfig {
  static constexpr uint32_t kDefaultNbWorkers = 1;
  static constexpr uint32_t kMaxNbWorkers = 64;

  // Throws std::invalid_argument if the configuration is not usable.
  void validate() const;

  // ==================
  // Execution settings
  // ==================

  // Number of worker threads running handlers. This bounds the number of requests handled concurrently.
  // Each worker keeps its own execution context alive across the requests it runs.
  BridgeConfig& withNbWorkers(uint32_t nbWorkers);

  // =======================
  // Request / response shape
  // =======================

  // Upper bound of the request body bytes read from the gateway. A larger declared content length is truncated.
  BridgeConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  // Rendering of the status passed to the synchronous side ("200" or "200 OK").
  BridgeConfig& withStatusFormat(StatusFormat statusFormat);

  // URL scheme reported in the Scope when the request does not carry one.
  BridgeConfig& withDefaultScheme(std::string_view scheme);

  // =======
  // Logging
  // =======

  // If set, applied to the global logger when the bridge is constructed.
  BridgeConfig& withLogLevel(log::level::level_enum level);

  // spdlog pattern applied to the global logger when the bridge is constructed. Empty keeps the current one.
  BridgeConfig& withLogPattern(std::string_view pattern);

  bool operator==(const BridgeConfig&) const noexcept = default;

  uint32_t nbWorkers{kDefaultNbWorkers};

  std::size_t maxBodyBytes{kDefaultMaxBodyBytes};

  StatusFormat statusFormat{StatusFormat::Numeric};

  std::string defaultScheme{http::DefaultScheme};

  std::optional<log::level::level_enum> logLevel;

  std::string logPattern;
};

}  // namespace bridgeway
