#pragma once

// IWYU pragma: begin_exports
#include "bridgeway/body-stream.hpp"
#include "bridgeway/bridge-config.hpp"
#include "bridgeway/execution-context.hpp"
#include "bridgeway/http-constants.hpp"
#include "bridgeway/http-header.hpp"
#include "bridgeway/http-status-code.hpp"
#include "bridgeway/message.hpp"
#include "bridgeway/request-exchange.hpp"
#include "bridgeway/scope.hpp"
#include "bridgeway/status-format.hpp"
#include "bridgeway/sync-bridge.hpp"
#include "bridgeway/sync-request.hpp"
#include "bridgeway/task.hpp"
// IWYU pragma: end_exports
