/// Echo server - minimal mcptk server demonstrating a custom tool.
/// Usage: ./echo_server [port]
/// Serves JSON-RPC over plain HTTP POST on /mcp.

#include <mcptk/mcptk.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

/// Reverses a string; shows how a tool declares its schema.
class ReverseTool : public mcptk::ITool {
public:
    mcptk::ToolDefinition definition() const override {
        mcptk::ToolDefinition def;
        def.name = "reverse";
        def.description = "Reverse the input text";
        def.parameters = {
            {"type", "object"},
            {"properties", {
                {"text", {{"type", "string"}, {"description", "The text to reverse"}}}
            }},
            {"required", {"text"}}
        };
        return def;
    }

    mcptk::ToolExecutionResult execute(const mcptk::ToolExecutionRequest& request) override {
        auto text = request.parameters.at("text").get<std::string>();
        std::reverse(text.begin(), text.end());
        return mcptk::ToolExecutionResult::ok(text);
    }
};

std::atomic<bool> g_stop{false};

} // anonymous namespace

int main(int argc, char** argv) {
    mcptk::ServerConfig config;
    config.name = "echo-server";
    config.instructions = "A simple echo server that returns whatever you send it.";
    config.sse_enabled = false;
    config.websocket_enabled = false;
    if (argc > 1) {
        try {
            config.http.port = static_cast<uint16_t>(std::stoi(argv[1]));
        } catch (const std::exception&) {
            std::cerr << "Invalid port: " << argv[1] << std::endl;
            return 1;
        }
    }

    mcptk::McpServer server{config};
    server.add_tool(std::make_shared<mcptk::tools::EchoTool>());
    server.add_tool(std::make_shared<ReverseTool>());

    try {
        server.start();
    } catch (const mcptk::McpTransportError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    std::cerr << "echo_server listening on port " << server.transport("http")->port() << std::endl;

    std::signal(SIGINT, [](int) { g_stop = true; });
    while (!g_stop) std::this_thread::sleep_for(std::chrono::milliseconds(200));
    server.stop();
    return 0;
}
