#pragma once
#include "config.hpp"
#include "processor.hpp"
#include "tool.hpp"
#include "tool_registry.hpp"
#include "transport/transport.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcptk {

/// Owns one tool registry, one JSON-RPC processor and the transports that feed it.
class McpServer {
public:
    explicit McpServer(ServerConfig config = {});
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // ---- Tools ----
    void add_tool(std::shared_ptr<ITool> tool,
                  const std::optional<std::string>& category = std::nullopt);
    bool remove_tool(const std::string& name);

    [[nodiscard]] ToolRegistry& registry();
    [[nodiscard]] JsonRpcProcessor& processor();
    [[nodiscard]] std::shared_ptr<JsonRpcProcessor> shared_processor() const;
    [[nodiscard]] const ServerConfig& config() const;

    // ---- Transports ----

    /// Add a transport; when none are added, start() builds them from the config.
    void add_transport(std::unique_ptr<ITransport> transport);

    /// Start every transport. If one fails to bind, the others are stopped
    /// and the McpTransportError is rethrown.
    void start();

    /// Stop all transports. Idempotent. Tools are cleaned up on destruction.
    void stop();

    /// Block until stop() is called from another thread.
    void wait();

    [[nodiscard]] bool is_running() const;

    /// Transport by name ("http", "sse", "websocket"), or nullptr.
    [[nodiscard]] ITransport* transport(const std::string& name) const;

    /// Process a message directly through the processor.
    [[nodiscard]] std::string handle_message(std::string_view raw);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcptk
