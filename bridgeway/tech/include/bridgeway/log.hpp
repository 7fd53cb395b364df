#pragma once

// Logging goes through spdlog. Code refers to it as bridgeway::log so that the backend stays swappable.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace bridgeway {

namespace log = spdlog;

}  // namespace bridgeway
