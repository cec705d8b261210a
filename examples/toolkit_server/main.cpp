/// mcptk_server: serves the registered tools over HTTP, SSE and WebSocket.
/// Usage: ./mcptk_server [-c config.yaml] [--host 0.0.0.0] [-p 8080] [--ws-port 8081] [--sse-port 8082]

#include <mcptk/mcptk.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

namespace {
    std::atomic<bool> shutdown_requested{false};

    void signal_handler(int /*signal*/) {
        shutdown_requested = true;
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    constexpr const char* kDefaultConfig = "config/mcptk.yaml";
}

int main(int argc, char** argv) {
    CLI::App app{"mcptk - MCP toolkit server"};

    std::string config_path;
    app.add_option("-c,--config", config_path, "YAML configuration file");

    std::string host;
    app.add_option("--host", host, "Bind address for every transport");

    int http_port = -1;
    app.add_option("-p,--port", http_port, "HTTP port")->check(CLI::Range(0, 65535));

    int ws_port = -1;
    app.add_option("--ws-port", ws_port, "WebSocket port")->check(CLI::Range(0, 65535));

    int sse_port = -1;
    app.add_option("--sse-port", sse_port, "SSE port")->check(CLI::Range(0, 65535));

    bool no_http = false, no_ws = false, no_sse = false;
    app.add_flag("--no-http", no_http, "Disable the HTTP transport");
    app.add_flag("--no-ws", no_ws, "Disable the WebSocket transport");
    app.add_flag("--no-sse", no_sse, "Disable the SSE transport");

    bool debug = false;
    app.add_flag("-d,--debug", debug, "Shortcut for --log-level debug");

    std::string log_level;
    app.add_option("-l,--log-level", log_level,
                   "Log level (trace, debug, info, warning, error, critical)");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << mcptk::SERVER_NAME << " version " << mcptk::LIBRARY_VERSION << std::endl;
        return 0;
    }

    mcptk::ServerConfig config;
    try {
        if (!config_path.empty()) {
            config = mcptk::load_config(config_path);
        } else if (std::filesystem::exists(kDefaultConfig)) {
            config = mcptk::load_config(kDefaultConfig);
        }

        if (!host.empty()) config.apply_host(host);
        if (http_port >= 0) config.http.port = static_cast<uint16_t>(http_port);
        if (ws_port >= 0) config.websocket.port = static_cast<uint16_t>(ws_port);
        if (sse_port >= 0) config.sse.port = static_cast<uint16_t>(sse_port);
        if (no_http) config.http_enabled = false;
        if (no_ws) config.websocket_enabled = false;
        if (no_sse) config.sse_enabled = false;
        if (debug) config.logging.level = "debug";
        if (!log_level.empty()) config.logging.level = log_level;

        mcptk::log::configure(config.logging);
    } catch (const mcptk::McpConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    auto logger = mcptk::log::get("mcptk.server");

    try {
        setup_signal_handlers();

        mcptk::McpServer server{config};
        server.add_tool(std::make_shared<mcptk::tools::EchoTool>(), "basic");
        server.start();

        if (auto* t = server.transport("http")) {
            logger->info("HTTP server: http://{}:{}", config.host, t->port());
        }
        if (auto* t = server.transport("websocket")) {
            logger->info("WebSocket server: ws://{}:{}", config.host, t->port());
        }
        if (auto* t = server.transport("sse")) {
            logger->info("SSE server: http://{}:{}", config.host, t->port());
        }

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        logger->info("Shutdown requested, stopping server");
        server.stop();
        logger->info("Server stopped cleanly");
        return 0;
    } catch (const std::exception& e) {
        logger->critical("Fatal error: {}", e.what());
        return 1;
    }
}
