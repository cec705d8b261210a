#pragma once
#include <stdexcept>
#include <string>

namespace mcptk {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class McpParseError : public McpError {
public:
    using McpError::McpError;
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

class McpConfigError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError         = -32700;
    constexpr int InvalidRequest     = -32600;
    constexpr int MethodNotFound     = -32601;
    constexpr int InvalidParams      = -32602;
    constexpr int InternalError      = -32603;

    // Tool-domain range -32000..-32099
    constexpr int McpErrorBase       = -32000;
    constexpr int ToolNotFound       = -32001;
    constexpr int ToolExecutionError = -32002;
    constexpr int PermissionDenied   = -32003;
} // namespace error

/// String codes carried by ToolError.
namespace tool_error {
    constexpr const char* ToolNotFound      = "TOOL_NOT_FOUND";
    constexpr const char* ToolUnavailable   = "TOOL_UNAVAILABLE";
    constexpr const char* PermissionDenied  = "PERMISSION_DENIED";
    constexpr const char* InvalidParameters = "INVALID_PARAMETERS";
    constexpr const char* ExecutionTimeout  = "EXECUTION_TIMEOUT";
    constexpr const char* ExecutionError    = "EXECUTION_ERROR";
} // namespace tool_error

} // namespace mcptk
