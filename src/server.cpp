#include "mcptk/server.hpp"
#include "mcptk/error.hpp"
#include "mcptk/log.hpp"
#include "mcptk/uuid.hpp"
#include "mcptk/version.hpp"
#include "mcptk/transport/http_transport.hpp"
#include "mcptk/transport/sse_transport.hpp"
#include "mcptk/transport/websocket_transport.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace mcptk {

namespace {

int rpc_code_for(const std::string& tool_code) {
    if (tool_code == tool_error::ToolNotFound) return error::ToolNotFound;
    if (tool_code == tool_error::PermissionDenied) return error::PermissionDenied;
    if (tool_code == tool_error::InvalidParameters) return error::InvalidParams;
    return error::ToolExecutionError;
}

std::string negotiate_version(const std::optional<nlohmann::json>& params) {
    if (params && params->is_object()) {
        auto it = params->find("protocolVersion");
        if (it != params->end() && it->is_string()) {
            const auto& requested = it->get_ref<const std::string&>();
            for (auto supported : SUPPORTED_PROTOCOL_VERSIONS) {
                if (requested == supported) return requested;
            }
        }
    }
    return std::string(DEFAULT_PROTOCOL_VERSION);
}

} // anonymous namespace

struct McpServer::Impl {
    ServerConfig config;
    ToolRegistry registry;
    std::shared_ptr<JsonRpcProcessor> processor = std::make_shared<JsonRpcProcessor>();
    std::shared_ptr<spdlog::logger> logger = log::get("mcptk.server");

    mutable std::mutex mutex;
    std::condition_variable stopped_cv;
    std::vector<std::unique_ptr<ITransport>> transports;
    bool running = false;

    explicit Impl(ServerConfig c) : config(std::move(c)), registry(config.tools) {}

    void build_transports() {
        if (config.http_enabled) {
            auto opts = config.http;
            opts.server_name = config.name;
            opts.server_version = config.version;
            transports.push_back(std::make_unique<HttpServerTransport>(processor, opts));
        }
        if (config.sse_enabled) {
            transports.push_back(std::make_unique<SseServerTransport>(processor, config.sse));
        }
        if (config.websocket_enabled) {
            transports.push_back(std::make_unique<WebSocketServerTransport>(processor, config.websocket));
        }
    }

    HandlerResult handle_initialize(const std::optional<nlohmann::json>& params) {
        auto version = negotiate_version(params);
        if (params && params->is_object() && params->contains("clientInfo")) {
            logger->info("Initialize from client {} (protocol {})",
                         params->at("clientInfo").dump(), version);
        }
        return nlohmann::json{
            {"protocolVersion", version},
            {"capabilities", {
                {"tools", {{"listChanged", true}}},
                {"logging", nlohmann::json::object()}
            }},
            {"serverInfo", {
                {"name", config.name},
                {"title", config.title},
                {"version", config.version}
            }},
            {"instructions", config.instructions}
        };
    }

    HandlerResult handle_tools_list(const std::optional<nlohmann::json>& params) {
        std::optional<std::string> category;
        if (params && params->is_object()) {
            auto it = params->find("category");
            if (it != params->end() && it->is_string()) category = it->get<std::string>();
        }
        nlohmann::json tools = nlohmann::json::array();
        for (const auto& def : registry.definitions(category)) {
            tools.push_back(to_mcp_tool(def));
        }
        return nlohmann::json{{"tools", tools}};
    }

    HandlerResult handle_tools_call(const std::optional<nlohmann::json>& params) {
        if (!params || !params->is_object()) {
            return JsonRpcError{error::InvalidParams, "Missing required parameter: name", std::nullopt};
        }
        auto name_it = params->find("name");
        if (name_it == params->end()) name_it = params->find("tool_name");
        if (name_it == params->end() || !name_it->is_string()) {
            return JsonRpcError{error::InvalidParams, "Missing required parameter: name", std::nullopt};
        }

        ToolExecutionRequest request;
        request.tool_name = name_it->get<std::string>();
        request.parameters = params->value("arguments", nlohmann::json::object());
        request.execution_context.request_id = "req_" + generate_uuid();

        auto result = registry.execute_tool(std::move(request));
        if (!result.success) {
            const auto& err = result.error ? *result.error
                                           : ToolError{tool_error::ExecutionError, "Tool execution failed", std::nullopt};
            nlohmann::json data = {{"code", err.code}};
            if (err.details) data["details"] = *err.details;
            return JsonRpcError{rpc_code_for(err.code), err.message, data};
        }

        nlohmann::json content = result.content ? *result.content : nlohmann::json(nullptr);
        std::string text = content.is_string() ? content.get<std::string>() : content.dump();
        nlohmann::json reply = {
            {"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})},
            {"structuredContent", content},
            {"isError", false}
        };
        if (result.metadata) {
            reply["_meta"] = {{"executionTime", result.metadata->execution_time}};
        }
        return reply;
    }

    void setup_handlers() {
        processor->register_sync_method("initialize", [this](const auto& params) {
            return handle_initialize(params);
        });

        processor->register_sync_method("notifications/initialized", [this](const auto&) -> HandlerResult {
            logger->info("Client reported initialization complete");
            return nlohmann::json::object();
        });

        processor->register_sync_method("ping", [](const auto&) -> HandlerResult {
            return nlohmann::json::object();
        });

        processor->register_sync_method("tools/list", [this](const auto& params) {
            return handle_tools_list(params);
        });

        processor->register_sync_method("tools/call", [this](const auto& params) {
            return handle_tools_call(params);
        });
    }
};

McpServer::McpServer(ServerConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {
    impl_->setup_handlers();
}

McpServer::~McpServer() {
    stop();
    impl_->registry.clear();
}

void McpServer::add_tool(std::shared_ptr<ITool> tool, const std::optional<std::string>& category) {
    impl_->registry.register_tool(std::move(tool), category);
}

bool McpServer::remove_tool(const std::string& name) {
    return impl_->registry.unregister_tool(name);
}

ToolRegistry& McpServer::registry() { return impl_->registry; }
JsonRpcProcessor& McpServer::processor() { return *impl_->processor; }
std::shared_ptr<JsonRpcProcessor> McpServer::shared_processor() const { return impl_->processor; }
const ServerConfig& McpServer::config() const { return impl_->config; }

void McpServer::add_transport(std::unique_ptr<ITransport> transport) {
    if (!transport) throw McpError("Cannot add a null transport");
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->running) throw McpError("Cannot add a transport while the server is running");
    impl_->transports.push_back(std::move(transport));
}

void McpServer::start() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->running) return;
    if (impl_->transports.empty()) impl_->build_transports();
    if (impl_->transports.empty()) {
        throw McpError("No transports enabled");
    }

    for (size_t i = 0; i < impl_->transports.size(); ++i) {
        try {
            impl_->transports[i]->start();
        } catch (const McpTransportError& e) {
            impl_->logger->error("Failed to start {} transport: {}",
                                 impl_->transports[i]->name(), e.what());
            for (size_t j = 0; j < i; ++j) impl_->transports[j]->stop();
            throw;
        }
    }
    impl_->running = true;
    impl_->logger->info("{} {} started with {} tool(s)", impl_->config.name,
                        impl_->config.version, impl_->registry.size());
}

void McpServer::stop() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->running) return;
        for (auto& t : impl_->transports) t->stop();
        impl_->running = false;
    }
    impl_->stopped_cv.notify_all();
    impl_->logger->info("Server stopped");
}

void McpServer::wait() {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->stopped_cv.wait(lock, [this] { return !impl_->running; });
}

bool McpServer::is_running() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->running;
}

ITransport* McpServer::transport(const std::string& name) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (const auto& t : impl_->transports) {
        if (t->name() == name) return t.get();
    }
    return nullptr;
}

std::string McpServer::handle_message(std::string_view raw) {
    return impl_->processor->process_message(raw);
}

} // namespace mcptk
