#include "mcptk/transport/http_transport.hpp"
#include "mcptk/error.hpp"
#include "mcptk/log.hpp"
#include "mcptk/processor.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>

namespace mcptk {

namespace {

void set_json_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(nlohmann::json{{"error", message}}.dump(), "application/json");
}

} // anonymous namespace

HttpServerTransport::HttpServerTransport(std::shared_ptr<JsonRpcProcessor> processor, Options opts)
    : processor_(std::move(processor))
    , opts_(std::move(opts))
    , cors_(opts_.allowed_origins)
    , logger_(log::get("mcptk.http"))
    , bound_port_(opts_.port) {
    if (!processor_) throw McpError("HttpServerTransport requires a processor");
}

HttpServerTransport::~HttpServerTransport() {
    stop();
}

std::string HttpServerTransport::handle_request(std::string_view body) {
    return processor_->process_message(body);
}

void HttpServerTransport::apply_cors(const httplib::Request& req, httplib::Response& res) const {
    for (const auto& [key, value] : cors_.headers(req.get_header_value("Origin"))) {
        res.set_header(key, value);
    }
}

void HttpServerTransport::handle_post(const httplib::Request& req, httplib::Response& res) {
    const auto started = std::chrono::steady_clock::now();
    apply_cors(req, res);

    auto content_type = req.get_header_value("Content-Type");
    if (content_type.rfind("application/json", 0) != 0) {
        set_json_error(res, 400, "Content-Type must be application/json");
    } else if (req.body.empty()) {
        set_json_error(res, 400, "Empty request body");
    } else {
        auto reply = processor_->process_message(req.body);
        res.status = 200;
        res.set_content(reply.empty() ? "{}" : reply, "application/json");
    }

    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - started).count();
    logger_->debug("{} {} -> {} ({:.2f} ms)", req.method, req.path, res.status, elapsed);
}

void HttpServerTransport::setup_routes() {
    auto post = [this](const httplib::Request& req, httplib::Response& res) {
        handle_post(req, res);
    };
    server_->Post("/mcp", post);
    server_->Post("/", post);

    server_->Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        apply_cors(req, res);
        nlohmann::json body = {
            {"status", "healthy"},
            {"server", opts_.server_name},
            {"version", opts_.server_version},
            {"registered_methods", processor_->registered_methods()}
        };
        res.set_content(body.dump(), "application/json");
    });

    server_->Get("/methods", [this](const httplib::Request& req, httplib::Response& res) {
        apply_cors(req, res);
        nlohmann::json body = {{"methods", processor_->registered_methods()}};
        res.set_content(body.dump(), "application/json");
    });

    auto preflight = [this](const httplib::Request& req, httplib::Response& res) {
        apply_cors(req, res);
        res.status = 200;
    };
    server_->Options("/mcp", preflight);
    server_->Options("/", preflight);

    server_->set_exception_handler(
        [this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                logger_->error("{} {} failed: {}", req.method, req.path, e.what());
            } catch (...) {
                logger_->error("{} {} failed with a non-standard exception", req.method, req.path);
            }
            apply_cors(req, res);
            set_json_error(res, 500, "Internal server error");
        });

    // Oversized bodies are rejected by httplib with 413 before routing
    server_->set_error_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) return;
        apply_cors(req, res);
        if (res.status == 413) {
            set_json_error(res, 413, "Request body too large");
        }
    });
}

void HttpServerTransport::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) return;

    server_ = std::make_unique<httplib::Server>();
    server_->set_payload_max_length(opts_.max_request_size);
    setup_routes();

    int port = opts_.port;
    if (opts_.port == 0) {
        port = server_->bind_to_any_port(opts_.host);
    } else if (!server_->bind_to_port(opts_.host, opts_.port)) {
        port = -1;
    }
    if (port < 0) {
        server_.reset();
        throw McpTransportError("Failed to bind HTTP server on " + opts_.host + ":" +
                                std::to_string(opts_.port));
    }
    bound_port_ = static_cast<uint16_t>(port);

    listen_thread_ = std::thread([this] { server_->listen_after_bind(); });
    server_->wait_until_ready();
    running_ = true;
    logger_->info("HTTP transport listening on http://{}:{}", opts_.host, bound_port_.load());
}

void HttpServerTransport::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.exchange(false)) return;
    server_->stop();
    if (listen_thread_.joinable()) listen_thread_.join();
    server_.reset();
    bound_port_ = opts_.port;
    logger_->info("HTTP transport stopped");
}

} // namespace mcptk
