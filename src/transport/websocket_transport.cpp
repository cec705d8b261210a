#include "mcptk/transport/websocket_transport.hpp"
#include "mcptk/error.hpp"
#include "mcptk/log.hpp"
#include "mcptk/processor.hpp"
#include "mcptk/worker_pool.hpp"

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>

namespace mcptk {

namespace {

using ws_server = websocketpp::server<websocketpp::config::asio>;
using connection_hdl = websocketpp::connection_hdl;

constexpr auto kCloseGrace = std::chrono::milliseconds(1000);

struct WsConnection {
    WsConnection(std::string i, connection_hdl h) : id(std::move(i)), hdl(std::move(h)) {}

    const std::string id;
    const connection_hdl hdl;
    std::atomic<bool> active{true};

    std::mutex mutex;
    std::deque<std::string> inbox;
    bool draining = false;
};

std::string strip_query(const std::string& resource) {
    auto q = resource.find('?');
    return q == std::string::npos ? resource : resource.substr(0, q);
}

} // anonymous namespace

struct WebSocketServerTransport::Impl {
    std::shared_ptr<JsonRpcProcessor> processor;
    Options opts;
    std::shared_ptr<spdlog::logger> logger = log::get("mcptk.ws");

    std::mutex lifecycle_mutex;
    std::unique_ptr<ws_server> server;
    std::unique_ptr<WorkerPool> pool;
    std::thread io_thread;
    std::atomic<bool> running{false};
    std::atomic<uint16_t> bound_port{0};

    mutable std::mutex connections_mutex;
    std::condition_variable connections_cv;
    std::map<connection_hdl, std::shared_ptr<WsConnection>, std::owner_less<connection_hdl>> connections;
    std::atomic<uint64_t> counter{0};

    std::thread ping_thread;
    std::mutex ping_mutex;
    std::condition_variable ping_cv;
    bool ping_stop = false;

    Impl(std::shared_ptr<JsonRpcProcessor> p, Options o)
        : processor(std::move(p)), opts(std::move(o)), bound_port(opts.port) {}

    std::shared_ptr<WsConnection> find(connection_hdl hdl) const {
        std::lock_guard<std::mutex> lock(connections_mutex);
        auto it = connections.find(hdl);
        return it == connections.end() ? nullptr : it->second;
    }

    void evict(connection_hdl hdl, const std::string& reason) {
        std::shared_ptr<WsConnection> conn;
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            auto it = connections.find(hdl);
            if (it == connections.end()) return;
            conn = it->second;
            connections.erase(it);
        }
        conn->active = false;
        connections_cv.notify_all();
        logger->info("WebSocket connection {} closed ({})", conn->id, reason);
    }

    void close(connection_hdl hdl, websocketpp::close::status::value code, const std::string& reason) {
        websocketpp::lib::error_code ec;
        server->close(hdl, code, reason, ec);
        if (ec) logger->debug("Close failed: {}", ec.message());
    }

    // ---------- Handlers (Asio thread) ----------

    bool on_validate(connection_hdl hdl) {
        auto con = server->get_con_from_hdl(hdl);
        auto path = strip_query(con->get_resource());
        if (std::find(opts.paths.begin(), opts.paths.end(), path) == opts.paths.end()) {
            logger->warn("Rejecting WebSocket upgrade on unknown path {}", path);
            con->set_status(websocketpp::http::status_code::not_found);
            return false;
        }
        return true;
    }

    void on_open(connection_hdl hdl) {
        std::shared_ptr<WsConnection> conn;
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            if (connections.size() >= opts.max_connections) {
                conn = nullptr;
            } else {
                conn = std::make_shared<WsConnection>("ws_" + std::to_string(++counter), hdl);
                connections[hdl] = conn;
            }
        }
        if (!conn) {
            logger->warn("Connection limit ({}) reached, closing new socket", opts.max_connections);
            close(hdl, websocketpp::close::status::try_again_later, "Server overloaded");
            return;
        }
        logger->info("WebSocket connection opened: {}", conn->id);
    }

    void on_message(connection_hdl hdl, ws_server::message_ptr msg) {
        auto conn = find(hdl);
        if (!conn || !conn->active) return;

        bool schedule = false;
        {
            std::lock_guard<std::mutex> lock(conn->mutex);
            conn->inbox.push_back(msg->get_payload());
            if (!conn->draining) {
                conn->draining = true;
                schedule = true;
            }
        }
        if (!schedule) return;

        try {
            pool->post([this, conn] { drain(conn); });
        } catch (const McpError& e) {
            logger->warn("Dropping message on {}: {}", conn->id, e.what());
            std::lock_guard<std::mutex> lock(conn->mutex);
            conn->inbox.clear();
            conn->draining = false;
        }
    }

    // ---------- Processing (worker pool) ----------

    void drain(const std::shared_ptr<WsConnection>& conn) {
        for (;;) {
            std::string payload;
            {
                std::lock_guard<std::mutex> lock(conn->mutex);
                if (conn->inbox.empty() || !conn->active) {
                    conn->inbox.clear();
                    conn->draining = false;
                    return;
                }
                payload = std::move(conn->inbox.front());
                conn->inbox.pop_front();
            }

            std::string reply;
            try {
                reply = processor->process_message(payload);
            } catch (const std::exception& e) {
                logger->error("Processing failed on {}: {}", conn->id, e.what());
                continue;
            } catch (...) {
                logger->error("Processing failed on {} with a non-standard exception", conn->id);
                continue;
            }
            if (!reply.empty()) send(conn, reply);
        }
    }

    void send(const std::shared_ptr<WsConnection>& conn, const std::string& payload) {
        if (!conn->active) return;
        websocketpp::lib::error_code ec;
        server->send(conn->hdl, payload, websocketpp::frame::opcode::text, ec);
        if (ec) {
            logger->warn("Send to {} failed: {}", conn->id, ec.message());
            evict(conn->hdl, "send failed");
        }
    }

    // ---------- Liveness ----------

    void ping_loop() {
        std::unique_lock<std::mutex> lock(ping_mutex);
        while (!ping_stop) {
            ping_cv.wait_for(lock, opts.ping_interval, [this] { return ping_stop; });
            if (ping_stop) break;
            lock.unlock();

            std::vector<std::shared_ptr<WsConnection>> snapshot;
            {
                std::lock_guard<std::mutex> conn_lock(connections_mutex);
                for (const auto& [hdl, conn] : connections) snapshot.push_back(conn);
            }
            for (const auto& conn : snapshot) {
                websocketpp::lib::error_code ec;
                server->ping(conn->hdl, "", ec);
                if (ec) {
                    logger->info("Ping to {} failed: {}", conn->id, ec.message());
                    evict(conn->hdl, "ping failed");
                    close(conn->hdl, websocketpp::close::status::going_away, "Ping failed");
                }
            }

            lock.lock();
        }
    }

    void close_all() {
        std::vector<std::shared_ptr<WsConnection>> snapshot;
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            for (const auto& [hdl, conn] : connections) snapshot.push_back(conn);
        }
        for (const auto& conn : snapshot) {
            conn->active = false;
            close(conn->hdl, websocketpp::close::status::going_away, "Server shutting down");
        }
        std::unique_lock<std::mutex> lock(connections_mutex);
        connections_cv.wait_for(lock, kCloseGrace, [this] { return connections.empty(); });
        connections.clear();
    }

    void setup() {
        server = std::make_unique<ws_server>();
        server->clear_access_channels(websocketpp::log::alevel::all);
        server->clear_error_channels(websocketpp::log::elevel::all);

        websocketpp::lib::error_code ec;
        server->init_asio(ec);
        if (ec) throw McpTransportError("Failed to initialise Asio: " + ec.message());

        server->set_reuse_addr(true);
        server->set_max_message_size(opts.max_message_size);
        server->set_pong_timeout(static_cast<long>(opts.pong_timeout.count()));

        server->set_validate_handler([this](connection_hdl hdl) { return on_validate(hdl); });
        server->set_open_handler([this](connection_hdl hdl) { on_open(hdl); });
        server->set_close_handler([this](connection_hdl hdl) { evict(hdl, "closed by peer"); });
        server->set_fail_handler([this](connection_hdl hdl) { evict(hdl, "connection failed"); });
        server->set_message_handler([this](connection_hdl hdl, ws_server::message_ptr msg) {
            on_message(hdl, msg);
        });
        server->set_pong_timeout_handler([this](connection_hdl hdl, std::string /*payload*/) {
            evict(hdl, "pong timeout");
            close(hdl, websocketpp::close::status::going_away, "Pong timeout");
        });
    }
};

WebSocketServerTransport::WebSocketServerTransport(std::shared_ptr<JsonRpcProcessor> processor,
                                                   Options opts)
    : impl_(std::make_unique<Impl>(std::move(processor), std::move(opts))) {
    if (!impl_->processor) throw McpError("WebSocketServerTransport requires a processor");
    if (impl_->opts.ping_interval.count() <= 0 || impl_->opts.pong_timeout.count() <= 0) {
        throw McpError("WebSocket ping_interval and pong_timeout must be positive");
    }
}

WebSocketServerTransport::~WebSocketServerTransport() {
    stop();
}

bool WebSocketServerTransport::is_running() const {
    return impl_->running;
}

uint16_t WebSocketServerTransport::port() const {
    return impl_->bound_port;
}

std::string WebSocketServerTransport::handle_request(std::string_view body) {
    return impl_->processor->process_message(body);
}

size_t WebSocketServerTransport::connection_count() const {
    std::lock_guard<std::mutex> lock(impl_->connections_mutex);
    return impl_->connections.size();
}

std::vector<std::string> WebSocketServerTransport::connection_ids() const {
    std::lock_guard<std::mutex> lock(impl_->connections_mutex);
    std::vector<std::string> ids;
    ids.reserve(impl_->connections.size());
    for (const auto& [hdl, conn] : impl_->connections) ids.push_back(conn->id);
    return ids;
}

void WebSocketServerTransport::broadcast(const std::string& message) {
    if (!impl_->running) return;
    std::vector<std::shared_ptr<WsConnection>> snapshot;
    {
        std::lock_guard<std::mutex> lock(impl_->connections_mutex);
        for (const auto& [hdl, conn] : impl_->connections) snapshot.push_back(conn);
    }
    for (const auto& conn : snapshot) impl_->send(conn, message);
}

void WebSocketServerTransport::start() {
    auto& d = *impl_;
    std::lock_guard<std::mutex> lock(d.lifecycle_mutex);
    if (d.running) return;

    d.setup();

    websocketpp::lib::error_code ec;
    d.server->listen(d.opts.host, std::to_string(d.opts.port), ec);
    if (!ec) d.server->start_accept(ec);
    if (ec) {
        d.server.reset();
        throw McpTransportError("Failed to bind WebSocket server on " + d.opts.host + ":" +
                                std::to_string(d.opts.port) + ": " + ec.message());
    }

    websocketpp::lib::asio::error_code endpoint_ec;
    auto endpoint = d.server->get_local_endpoint(endpoint_ec);
    d.bound_port = endpoint_ec ? d.opts.port : endpoint.port();

    d.pool = std::make_unique<WorkerPool>(d.opts.worker_threads);
    d.io_thread = std::thread([&d] {
        try {
            d.server->run();
        } catch (const std::exception& e) {
            d.logger->error("WebSocket server error: {}", e.what());
        }
    });

    {
        std::lock_guard<std::mutex> ping_lock(d.ping_mutex);
        d.ping_stop = false;
    }
    d.ping_thread = std::thread([&d] { d.ping_loop(); });

    d.running = true;
    d.logger->info("WebSocket transport listening on ws://{}:{}", d.opts.host, d.bound_port.load());
}

void WebSocketServerTransport::stop() {
    auto& d = *impl_;
    std::lock_guard<std::mutex> lock(d.lifecycle_mutex);
    if (!d.running.exchange(false)) return;

    {
        std::lock_guard<std::mutex> ping_lock(d.ping_mutex);
        d.ping_stop = true;
    }
    d.ping_cv.notify_all();
    if (d.ping_thread.joinable()) d.ping_thread.join();

    websocketpp::lib::error_code ec;
    d.server->stop_listening(ec);
    if (ec) d.logger->debug("stop_listening: {}", ec.message());

    d.close_all();
    d.server->stop();
    if (d.io_thread.joinable()) d.io_thread.join();

    // Workers may still touch the endpoint, so drain them before it goes away
    d.pool->stop();
    d.pool.reset();
    d.server.reset();
    d.bound_port = d.opts.port;
    d.logger->info("WebSocket transport stopped");
}

} // namespace mcptk
