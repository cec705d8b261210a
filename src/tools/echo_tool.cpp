#include "mcptk/tools/echo_tool.hpp"
#include "mcptk/log.hpp"

namespace mcptk::tools {

ToolDefinition EchoTool::definition() const {
    ToolDefinition def;
    def.name = "echo";
    def.description = "Echo the input text back, for testing tool calls";
    def.parameters = {
        {"type", "object"},
        {"properties", {
            {"message", {{"type", "string"}, {"description", "Message to echo"}}}
        }},
        {"required", {"message"}}
    };
    return def;
}

ToolExecutionResult EchoTool::execute(const ToolExecutionRequest& request) {
    auto message = request.parameters.value("message", std::string{});
    if (message.empty()) {
        return ToolExecutionResult::fail("MISSING_MESSAGE", "Missing required parameter 'message'");
    }
    log::get("mcptk.tools")->debug("echo: {}", message);
    return ToolExecutionResult::ok("Echo: " + message);
}

} // namespace mcptk::tools
