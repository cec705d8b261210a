#pragma once

/// Umbrella header for the mcptk MCP toolkit server library.

#include "version.hpp"
#include "error.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "types.hpp"
#include "validation.hpp"
#include "tool.hpp"
#include "tool_registry.hpp"
#include "processor.hpp"
#include "log.hpp"
#include "config.hpp"
#include "server.hpp"
#include "tools/echo_tool.hpp"
#include "transport/transport.hpp"
#include "transport/cors.hpp"
#include "transport/http_transport.hpp"
#include "transport/sse_transport.hpp"
#include "transport/websocket_transport.hpp"
