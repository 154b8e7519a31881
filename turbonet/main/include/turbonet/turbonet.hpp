// turbonet umbrella header
//
// Pulls in the public API needed to write a server:
//   - App, the registration facade, and ServerConfig with its nested configurations
//   - HttpRequest / HttpResponse / HandlerResult and the hook types
//   - WebSocket endpoints, sessions and native modes
//   - HTTP methods, headers and status codes
//   - ServerStats
//
// Lower level pieces (WorkerServer, WorkerTopology, the frame codec, the event loop) are available through their
// own headers.
#pragma once

// IWYU pragma: begin_exports
#include "turbonet/app.hpp"
#include "turbonet/execution-lock.hpp"
#include "turbonet/handler-bridge.hpp"
#include "turbonet/handler-result.hpp"
#include "turbonet/http-header.hpp"
#include "turbonet/http-method.hpp"
#include "turbonet/http-request.hpp"
#include "turbonet/http-response.hpp"
#include "turbonet/http-status-code.hpp"
#include "turbonet/middleware.hpp"
#include "turbonet/path-params.hpp"
#include "turbonet/rate-limit-config.hpp"
#include "turbonet/router-config.hpp"
#include "turbonet/server-config.hpp"
#include "turbonet/server-stats.hpp"
#include "turbonet/websocket-config.hpp"
#include "turbonet/websocket-constants.hpp"
#include "turbonet/websocket-endpoint.hpp"
#include "turbonet/websocket-session.hpp"
// IWYU pragma: end_exports
