#pragma once
#include "log.hpp"
#include "tool_registry.hpp"
#include "transport/http_transport.hpp"
#include "transport/sse_transport.hpp"
#include "transport/websocket_transport.hpp"
#include <string>

namespace mcptk {

struct ServerConfig {
    // server:
    std::string host = "127.0.0.1";
    std::string name = "mcptk";
    std::string title = "mcptk MCP Toolkit Server";
    std::string version = "0.1.0";
    std::string instructions = "MCP toolkit server exposing registered tools over HTTP, SSE and WebSocket";

    bool http_enabled = true;
    HttpServerTransport::Options http;

    bool websocket_enabled = true;
    WebSocketServerTransport::Options websocket;

    bool sse_enabled = true;
    SseServerTransport::Options sse;

    ToolRegistry::Options tools;
    log::LogOptions logging;

    /// Push `host` into every transport section.
    void apply_host(const std::string& h);
};

/// Load a YAML file. Throws McpConfigError when the file cannot be read or a
/// value has the wrong type. Unknown keys are ignored.
[[nodiscard]] ServerConfig load_config(const std::string& path);

/// Parse YAML text; same rules as load_config.
[[nodiscard]] ServerConfig parse_config(const std::string& yaml);

} // namespace mcptk
