#pragma once
#include "transport.hpp"
#include "cors.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace spdlog { class logger; }

namespace mcptk {

class JsonRpcProcessor;

/// One open event stream. Its id doubles as the MCP session id.
/// Once closed it never becomes active again.
class SseConnection {
public:
    SseConnection(std::string id, uint64_t sequence);

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] uint64_t sequence() const { return sequence_; }
    [[nodiscard]] bool is_active() const { return active_; }

    /// Queue an event for the stream writer. False if the connection is closed.
    bool send_event(const std::string& event, const std::string& data);
    bool send_ping() { return queue(format_event("ping", ""), true); }

    void close();

    [[nodiscard]] std::chrono::steady_clock::time_point last_ping() const;
    void touch();

    /// Block up to `wait` for queued events. Returns false once closed.
    /// Each pending event is handed to `write`; a false return closes the connection.
    template <typename Writer>
    bool drain(std::chrono::milliseconds wait, Writer&& write);

    static std::string format_event(const std::string& event, const std::string& data);

private:
    struct Pending {
        std::string payload;
        bool is_ping = false;
    };

    bool queue(std::string payload, bool is_ping);

    const std::string id_;
    const uint64_t sequence_;
    std::atomic<bool> active_{true};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Pending> pending_;
    std::chrono::steady_clock::time_point last_ping_;
};

template <typename Writer>
bool SseConnection::drain(std::chrono::milliseconds wait, Writer&& write) {
    std::deque<Pending> batch;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, wait, [this] { return !pending_.empty() || !active_; });
        if (!active_) return false;
        batch.swap(pending_);
    }
    for (const auto& p : batch) {
        if (!write(p.payload)) {
            close();
            return false;
        }
        if (p.is_ping) touch();
    }
    return true;
}

/// SSE / Streamable-HTTP transport. Legacy clients open a GET stream and POST
/// without a session header; session-aware clients send Mcp-Session-Id.
/// Replies are delivered as `message` events on the stream, POSTs get 202.
class SseServerTransport : public ITransport {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8082;  // 0 binds an ephemeral port
        size_t max_connections = 100;
        std::chrono::milliseconds ping_interval{30000};
        std::chrono::milliseconds connection_timeout{300000};
        std::vector<std::string> allowed_origins{"*"};
        size_t max_request_size = 1024 * 1024;
    };

    SseServerTransport(std::shared_ptr<JsonRpcProcessor> processor, Options opts);
    ~SseServerTransport() override;

    void start() override;
    void stop() override;
    bool is_running() const override { return running_; }
    std::string handle_request(std::string_view body) override;
    uint16_t port() const override { return bound_port_; }
    std::string name() const override { return "sse"; }

    /// Number of active connections.
    [[nodiscard]] size_t connection_count() const;

    /// Push a `message` event to every active connection.
    void broadcast(const std::string& message);

private:
    void setup_routes();
    void handle_get(const httplib::Request& req, httplib::Response& res);
    void handle_post(const httplib::Request& req, httplib::Response& res);
    void apply_cors(const httplib::Request& req, httplib::Response& res) const;

    std::shared_ptr<SseConnection> open_connection(const std::string& session_id);
    std::shared_ptr<SseConnection> find_connection(const std::string& session_id) const;
    std::shared_ptr<SseConnection> latest_active_connection() const;
    void evict(const std::shared_ptr<SseConnection>& conn);
    void close_all();
    void ping_loop();

    std::shared_ptr<JsonRpcProcessor> processor_;
    Options opts_;
    CorsPolicy cors_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex lifecycle_mutex_;
    std::unique_ptr<httplib::Server> server_;
    std::thread listen_thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};

    mutable std::mutex connections_mutex_;
    std::map<std::string, std::shared_ptr<SseConnection>> connections_;
    uint64_t next_sequence_ = 0;

    std::thread ping_thread_;
    std::mutex ping_mutex_;
    std::condition_variable ping_cv_;
    bool ping_stop_ = false;
};

} // namespace mcptk
