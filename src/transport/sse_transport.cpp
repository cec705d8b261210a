#include "mcptk/transport/sse_transport.hpp"
#include "mcptk/codec.hpp"
#include "mcptk/error.hpp"
#include "mcptk/log.hpp"
#include "mcptk/processor.hpp"
#include "mcptk/uuid.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <sstream>

namespace mcptk {

namespace {

constexpr auto kDrainWait = std::chrono::milliseconds(250);

const char* kUsage =
    "MCP Server Streamable HTTP Endpoint\n"
    "POST with Accept: application/json, text/event-stream for MCP requests\n"
    "GET with Accept: text/event-stream for SSE connection";

bool method_matches(const nlohmann::json& body, bool (*pred)(const std::string&)) {
    auto check = [pred](const nlohmann::json& item) {
        if (!item.is_object()) return false;
        auto m = item.find("method");
        return m != item.end() && m->is_string() && pred(m->get_ref<const std::string&>());
    };
    if (body.is_object()) return check(body);
    if (body.is_array()) {
        for (const auto& item : body) {
            if (check(item)) return true;
        }
    }
    return false;
}

bool is_initialize(const std::string& m) { return m == "initialize"; }
bool is_notification(const std::string& m) { return m.rfind("notifications/", 0) == 0; }
bool is_tools(const std::string& m) { return m.rfind("tools/", 0) == 0; }

} // anonymous namespace

// ---------- SseConnection ----------

SseConnection::SseConnection(std::string id, uint64_t sequence)
    : id_(std::move(id)), sequence_(sequence), last_ping_(std::chrono::steady_clock::now()) {}

std::string SseConnection::format_event(const std::string& event, const std::string& data) {
    std::string out = "event: " + event + "\n";
    std::istringstream lines(data);
    std::string line;
    bool any = false;
    while (std::getline(lines, line)) {
        out += "data: " + line + "\n";
        any = true;
    }
    if (!any) out += "data: \n";
    out += "\n";
    return out;
}

bool SseConnection::send_event(const std::string& event, const std::string& data) {
    return queue(format_event(event, data), false);
}

bool SseConnection::queue(std::string payload, bool is_ping) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) return false;
        pending_.push_back({std::move(payload), is_ping});
    }
    cv_.notify_all();
    return true;
}

void SseConnection::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = false;
    }
    cv_.notify_all();
}

std::chrono::steady_clock::time_point SseConnection::last_ping() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_ping_;
}

void SseConnection::touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_ping_ = std::chrono::steady_clock::now();
}

// ---------- SseServerTransport ----------

SseServerTransport::SseServerTransport(std::shared_ptr<JsonRpcProcessor> processor, Options opts)
    : processor_(std::move(processor))
    , opts_(std::move(opts))
    , cors_(opts_.allowed_origins)
    , logger_(log::get("mcptk.sse"))
    , bound_port_(opts_.port) {
    if (!processor_) throw McpError("SseServerTransport requires a processor");
    if (opts_.ping_interval.count() <= 0 || opts_.connection_timeout.count() <= 0) {
        throw McpError("SSE ping_interval and connection_timeout must be positive");
    }
}

SseServerTransport::~SseServerTransport() {
    stop();
}

std::string SseServerTransport::handle_request(std::string_view body) {
    return processor_->process_message(body);
}

void SseServerTransport::apply_cors(const httplib::Request& req, httplib::Response& res) const {
    for (const auto& [key, value] : cors_.headers(req.get_header_value("Origin"), true)) {
        res.set_header(key, value);
    }
}

size_t SseServerTransport::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    size_t n = 0;
    for (const auto& [id, conn] : connections_) {
        if (conn->is_active()) ++n;
    }
    return n;
}

void SseServerTransport::broadcast(const std::string& message) {
    std::vector<std::shared_ptr<SseConnection>> targets;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (const auto& [id, conn] : connections_) targets.push_back(conn);
    }
    for (const auto& conn : targets) {
        if (!conn->send_event("message", message)) evict(conn);
    }
}

std::shared_ptr<SseConnection> SseServerTransport::open_connection(const std::string& session_id) {
    std::shared_ptr<SseConnection> replaced;
    std::shared_ptr<SseConnection> conn;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        // The stream being replaced by a reopened session does not count against the limit
        size_t active = 0;
        for (const auto& [id, c] : connections_) {
            if (id != session_id && c->is_active()) ++active;
        }
        if (active >= opts_.max_connections) return nullptr;

        auto it = connections_.find(session_id);
        if (it != connections_.end()) replaced = it->second;
        conn = std::make_shared<SseConnection>(session_id, next_sequence_++);
        connections_[session_id] = conn;
    }
    if (replaced) {
        logger_->info("Session {} reopened, closing previous stream", session_id);
        replaced->close();
    }
    return conn;
}

std::shared_ptr<SseConnection> SseServerTransport::find_connection(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(session_id);
    return it == connections_.end() ? nullptr : it->second;
}

std::shared_ptr<SseConnection> SseServerTransport::latest_active_connection() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    std::shared_ptr<SseConnection> latest;
    for (const auto& [id, conn] : connections_) {
        if (!conn->is_active()) continue;
        if (!latest || conn->sequence() > latest->sequence()) latest = conn;
    }
    return latest;
}

void SseServerTransport::evict(const std::shared_ptr<SseConnection>& conn) {
    conn->close();
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(conn->id());
    // A reopened session may already hold a newer connection under the same id
    if (it != connections_.end() && it->second == conn) {
        connections_.erase(it);
        logger_->info("SSE connection closed: {}", conn->id());
    }
}

void SseServerTransport::close_all() {
    std::map<std::string, std::shared_ptr<SseConnection>> all;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        all.swap(connections_);
    }
    for (auto& [id, conn] : all) conn->close();
}

void SseServerTransport::handle_get(const httplib::Request& req, httplib::Response& res) {
    apply_cors(req, res);

    if (req.get_header_value("Accept").find("text/event-stream") == std::string::npos) {
        res.set_content(kUsage, "text/plain");
        return;
    }

    auto session_id = req.get_header_value("Mcp-Session-Id");
    if (session_id.empty()) {
        session_id = generate_uuid();
        logger_->info("Creating new SSE session for {}: {}", req.remote_addr, session_id);
    } else {
        logger_->info("Using existing session for SSE stream: {}", session_id);
    }

    auto conn = open_connection(session_id);
    if (!conn) {
        logger_->warn("Connection limit reached, rejecting {}", req.remote_addr);
        res.status = 503;
        res.set_content("Too many connections", "text/plain");
        return;
    }

    res.set_header("Cache-Control", "no-cache, no-store, must-revalidate");
    res.set_header("Mcp-Session-Id", session_id);
    res.set_header("X-Accel-Buffering", "no");

    conn->send_event("endpoint", "/");

    res.set_chunked_content_provider(
        "text/event-stream",
        [conn](size_t /*offset*/, httplib::DataSink& sink) -> bool {
            if (sink.is_writable && !sink.is_writable()) {
                conn->close();
                return false;
            }
            return conn->drain(kDrainWait, [&sink](const std::string& payload) {
                return sink.write(payload.data(), payload.size());
            });
        },
        [this, conn](bool /*success*/) { evict(conn); });

    logger_->info("SSE stream established for session: {}", session_id);
}

void SseServerTransport::handle_post(const httplib::Request& req, httplib::Response& res) {
    apply_cors(req, res);

    nlohmann::json body;
    try {
        body = Codec::parse_document(req.body);
    } catch (const McpParseError& e) {
        logger_->error("Invalid JSON in request body: {}", e.what());
        res.status = 400;
        res.set_content(Codec::serialize(make_error(std::nullopt, error::ParseError, "Parse error",
                                                    nlohmann::json(e.what()))),
                        "application/json");
        return;
    }

    auto session_id = req.get_header_value("Mcp-Session-Id");
    const bool classified = method_matches(body, is_initialize) ||
                            method_matches(body, is_notification) ||
                            method_matches(body, is_tools);

    if (!session_id.empty()) {
        auto reply = processor_->process_message(req.body);
        auto conn = find_connection(session_id);
        if (conn && conn->is_active() && !reply.empty()) {
            if (!conn->send_event("message", reply)) evict(conn);
        }
        res.status = 202;
        res.set_header("Mcp-Session-Id", session_id);
        return;
    }

    if (!classified) {
        res.status = 400;
        res.set_content("Bad Request: Mcp-Session-Id header required or initialize request expected",
                        "text/plain");
        return;
    }

    auto conn = latest_active_connection();
    if (!conn) {
        res.status = 400;
        res.set_content("No active SSE connection found", "text/plain");
        return;
    }
    logger_->info("Routing session-less POST to most recent SSE session: {}", conn->id());

    auto reply = processor_->process_message(req.body);
    if (reply.empty()) {
        logger_->debug("No response data to send for request");
    } else if (!conn->send_event("message", reply)) {
        logger_->error("Failed to queue SSE response for session {}", conn->id());
        evict(conn);
    }
    res.status = 202;
}

void SseServerTransport::setup_routes() {
    server_->Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        apply_cors(req, res);
        nlohmann::json body = {
            {"status", "healthy"},
            {"connections", connection_count()},
            {"max_connections", opts_.max_connections}
        };
        res.set_content(body.dump(), "application/json");
    });

    server_->Get(R"(/(.*))", [this](const httplib::Request& req, httplib::Response& res) {
        handle_get(req, res);
    });

    server_->Post(R"(/(.*))", [this](const httplib::Request& req, httplib::Response& res) {
        handle_post(req, res);
    });

    server_->Options(R"(/(.*))", [this](const httplib::Request& req, httplib::Response& res) {
        apply_cors(req, res);
        res.status = 200;
    });

    auto not_allowed = [this](const httplib::Request& req, httplib::Response& res) {
        logger_->warn("Unsupported method '{}' from {}", req.method, req.remote_addr);
        apply_cors(req, res);
        res.status = 405;
        res.set_header("Allow", "GET, POST, OPTIONS");
        res.set_content("Method Not Allowed", "text/plain");
    };
    server_->Put(R"(/(.*))", not_allowed);
    server_->Delete(R"(/(.*))", not_allowed);
    server_->Patch(R"(/(.*))", not_allowed);

    server_->set_exception_handler(
        [this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string what = "unknown error";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            } catch (...) {
                what = "non-standard exception";
            }
            logger_->error("Error processing {} {}: {}", req.method, req.path, what);
            apply_cors(req, res);
            res.status = 500;
            res.set_content(Codec::serialize(make_error(std::nullopt, error::InternalError,
                                                        "Internal error", nlohmann::json(what))),
                            "application/json");
        });
}

void SseServerTransport::ping_loop() {
    std::unique_lock<std::mutex> lock(ping_mutex_);
    while (!ping_stop_) {
        ping_cv_.wait_for(lock, opts_.ping_interval, [this] { return ping_stop_; });
        if (ping_stop_) break;
        lock.unlock();

        std::vector<std::shared_ptr<SseConnection>> snapshot;
        {
            std::lock_guard<std::mutex> conn_lock(connections_mutex_);
            for (const auto& [id, conn] : connections_) snapshot.push_back(conn);
        }
        const auto now = std::chrono::steady_clock::now();
        for (const auto& conn : snapshot) {
            if (!conn->is_active()) {
                evict(conn);
            } else if (now - conn->last_ping() > opts_.connection_timeout) {
                logger_->info("Session {} timed out", conn->id());
                evict(conn);
            } else if (!conn->send_ping()) {
                evict(conn);
            }
        }

        lock.lock();
    }
}

void SseServerTransport::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) return;

    server_ = std::make_unique<httplib::Server>();
    server_->set_payload_max_length(opts_.max_request_size);
    // Every open stream pins a worker thread
    server_->new_task_queue = [this] {
        return new httplib::ThreadPool(opts_.max_connections + 8);
    };
    setup_routes();

    int port = opts_.port;
    if (opts_.port == 0) {
        port = server_->bind_to_any_port(opts_.host);
    } else if (!server_->bind_to_port(opts_.host, opts_.port)) {
        port = -1;
    }
    if (port < 0) {
        server_.reset();
        throw McpTransportError("Failed to bind SSE server on " + opts_.host + ":" +
                                std::to_string(opts_.port));
    }
    bound_port_ = static_cast<uint16_t>(port);

    listen_thread_ = std::thread([this] { server_->listen_after_bind(); });
    server_->wait_until_ready();

    {
        std::lock_guard<std::mutex> ping_lock(ping_mutex_);
        ping_stop_ = false;
    }
    ping_thread_ = std::thread([this] { ping_loop(); });

    running_ = true;
    logger_->info("SSE transport listening on http://{}:{}", opts_.host, bound_port_.load());
}

void SseServerTransport::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.exchange(false)) return;

    {
        std::lock_guard<std::mutex> ping_lock(ping_mutex_);
        ping_stop_ = true;
    }
    ping_cv_.notify_all();
    if (ping_thread_.joinable()) ping_thread_.join();

    // Streams must end before the server can drain its workers
    close_all();
    server_->stop();
    if (listen_thread_.joinable()) listen_thread_.join();
    server_.reset();
    bound_port_ = opts_.port;
    logger_->info("SSE transport stopped");
}

} // namespace mcptk
