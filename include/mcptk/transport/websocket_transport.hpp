#pragma once
#include "transport.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace mcptk {

class JsonRpcProcessor;

/// JSON-RPC over WebSocket (websocketpp on Asio). Frames of one connection are
/// processed in arrival order on a worker pool; replies go back on the same socket.
class WebSocketServerTransport : public ITransport {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8081;  // 0 binds an ephemeral port
        size_t max_connections = 500;
        std::chrono::milliseconds ping_interval{30000};
        std::chrono::milliseconds pong_timeout{10000};
        size_t max_message_size = 1024 * 1024;
        int worker_threads = 4;
        std::vector<std::string> paths{"/", "/mcp", "/ws"};
    };

    WebSocketServerTransport(std::shared_ptr<JsonRpcProcessor> processor, Options opts);
    ~WebSocketServerTransport() override;

    void start() override;
    void stop() override;
    bool is_running() const override;
    std::string handle_request(std::string_view body) override;
    uint16_t port() const override;
    std::string name() const override { return "websocket"; }

    [[nodiscard]] size_t connection_count() const;
    [[nodiscard]] std::vector<std::string> connection_ids() const;

    /// Send a text frame to every open connection.
    void broadcast(const std::string& message);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcptk
