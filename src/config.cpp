#include "mcptk/config.hpp"
#include "mcptk/error.hpp"
#include <yaml-cpp/yaml.h>
#include <chrono>
#include <cmath>

namespace mcptk {

namespace {

template <typename T>
void read(const YAML::Node& node, const char* key, T& out, const std::string& section) {
    if (!node[key]) return;
    try {
        out = node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw McpConfigError("Invalid value for '" + section + "." + key + "': " + e.what());
    }
}

// Durations are written in seconds and may be fractional; zero would spin the ping loops
void read_seconds(const YAML::Node& node, const char* key, std::chrono::milliseconds& out,
                  const std::string& section) {
    if (!node[key]) return;
    double seconds = 0;
    read(node, key, seconds, section);
    const auto ms = std::llround(seconds * 1000.0);
    if (!(seconds > 0) || ms < 1) {
        throw McpConfigError("'" + section + "." + key + "' must be a positive number of seconds");
    }
    out = std::chrono::milliseconds(static_cast<long long>(ms));
}

void read_port(const YAML::Node& node, const std::string& section, uint16_t& out) {
    int port = out;
    read(node, "port", port, section);
    if (port < 0 || port > 65535) {
        throw McpConfigError("'" + section + ".port' out of range: " + std::to_string(port));
    }
    out = static_cast<uint16_t>(port);
}

ServerConfig from_node(const YAML::Node& root) {
    ServerConfig config;
    if (!root || root.IsNull()) return config;
    if (!root.IsMap()) throw McpConfigError("Configuration root must be a mapping");

    // -- Server --
    if (auto server = root["server"]) {
        std::string host = config.host;
        read(server, "host", host, "server");
        config.apply_host(host);
        read(server, "name", config.name, "server");
        read(server, "title", config.title, "server");
        read(server, "version", config.version, "server");
        read(server, "instructions", config.instructions, "server");
    } else {
        config.apply_host(config.host);
    }

    // -- HTTP --
    if (auto http = root["http"]) {
        read(http, "enabled", config.http_enabled, "http");
        read_port(http, "http", config.http.port);
        read(http, "allowed_origins", config.http.allowed_origins, "http");
        read(http, "max_request_size", config.http.max_request_size, "http");
    }

    // -- WebSocket --
    if (auto ws = root["websocket"]) {
        read(ws, "enabled", config.websocket_enabled, "websocket");
        read_port(ws, "websocket", config.websocket.port);
        read(ws, "max_connections", config.websocket.max_connections, "websocket");
        read_seconds(ws, "ping_interval", config.websocket.ping_interval, "websocket");
        read_seconds(ws, "pong_timeout", config.websocket.pong_timeout, "websocket");
        read(ws, "max_message_size", config.websocket.max_message_size, "websocket");
    }

    // -- SSE --
    if (auto sse = root["sse"]) {
        read(sse, "enabled", config.sse_enabled, "sse");
        read_port(sse, "sse", config.sse.port);
        read(sse, "max_connections", config.sse.max_connections, "sse");
        read_seconds(sse, "ping_interval", config.sse.ping_interval, "sse");
        read_seconds(sse, "connection_timeout", config.sse.connection_timeout, "sse");
        read(sse, "allowed_origins", config.sse.allowed_origins, "sse");
    }

    // -- Tools --
    if (auto tools = root["tools"]) {
        read_seconds(tools, "default_timeout", config.tools.default_timeout, "tools");
        read(tools, "worker_threads", config.tools.worker_threads, "tools");
        if (config.tools.worker_threads < 1) {
            throw McpConfigError("'tools.worker_threads' must be at least 1");
        }
    }
    config.websocket.worker_threads = config.tools.worker_threads;

    // -- Logging --
    if (auto logging = root["logging"]) {
        read(logging, "level", config.logging.level, "logging");
        read(logging, "file_path", config.logging.file_path, "logging");
        read(logging, "pattern", config.logging.pattern, "logging");
        read(logging, "max_bytes", config.logging.max_bytes, "logging");
        read(logging, "backup_count", config.logging.backup_count, "logging");
        read(logging, "module_levels", config.logging.module_levels, "logging");
        log::level_from_string(config.logging.level);
        for (const auto& [name, level] : config.logging.module_levels) {
            log::level_from_string(level);
        }
    }

    config.http.server_name = config.name;
    config.http.server_version = config.version;
    return config;
}

} // anonymous namespace

void ServerConfig::apply_host(const std::string& h) {
    host = h;
    http.host = h;
    websocket.host = h;
    sse.host = h;
}

ServerConfig parse_config(const std::string& yaml) {
    try {
        return from_node(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw McpConfigError(std::string("Failed to parse YAML: ") + e.what());
    }
}

ServerConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw McpConfigError("Failed to load config file '" + path + "': " + e.what());
    }
    return from_node(root);
}

} // namespace mcptk
