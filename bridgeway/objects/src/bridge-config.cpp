#include "bridgeway/bridge-config.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string_view>

#include "bridgeway/log.hpp"
#include "bridgeway/status-format.hpp"

namespace bridgeway {

BridgeConfig& BridgeConfig::withNbWorkers(uint32_t nbWorkers) {
  this->nbWorkers = nbWorkers;
  return *this;
}

BridgeConfig& BridgeConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

BridgeConfig& BridgeConfig::withStatusFormat(StatusFormat statusFormat) {
  this->statusFormat = statusFormat;
  return *this;
}

BridgeConfig& BridgeConfig::withDefaultScheme(std::string_view scheme) {
  this->defaultScheme = scheme;
  return *this;
}

BridgeConfig& BridgeConfig::withLogLevel(log::level::level_enum level) {
  this->logLevel = level;
  return *this;
}

BridgeConfig& BridgeConfig::withLogPattern(std::string_view pattern) {
  this->logPattern = pattern;
  return *this;
}

void BridgeConfig::validate() const {
  if (nbWorkers == 0) {
    throw std::invalid_argument("nbWorkers must be > 0");
  }
  if (nbWorkers > kMaxNbWorkers) {
    throw std::invalid_argument(std::format("nbWorkers must be <= {}", kMaxNbWorkers));
  }
  if (maxBodyBytes == 0) {
    throw std::invalid_argument("maxBodyBytes must be > 0");
  }
  if (defaultScheme.empty()) {
    throw std::invalid_argument("defaultScheme must not be empty");
  }
  if (statusFormat != StatusFormat::Numeric && statusFormat != StatusFormat::WithPhrase) {
    throw std::invalid_argument("unknown status format");
  }
}

}  // namespace bridgeway
