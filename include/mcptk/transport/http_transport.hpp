#pragma once
#include "transport.hpp"
#include "cors.hpp"
#include <atomic>
#include <cstddef>
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

/// Plain request/response JSON-RPC over HTTP POST.
class HttpServerTransport : public ITransport {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8080;  // 0 binds an ephemeral port
        std::vector<std::string> allowed_origins{"*"};
        size_t max_request_size = 1024 * 1024;
        std::string server_name = "mcptk";
        std::string server_version = "0.1.0";
    };

    HttpServerTransport(std::shared_ptr<JsonRpcProcessor> processor, Options opts);
    ~HttpServerTransport() override;

    void start() override;
    void stop() override;
    bool is_running() const override { return running_; }
    std::string handle_request(std::string_view body) override;
    uint16_t port() const override { return bound_port_; }
    std::string name() const override { return "http"; }

private:
    void setup_routes();
    void handle_post(const httplib::Request& req, httplib::Response& res);
    void apply_cors(const httplib::Request& req, httplib::Response& res) const;

    std::shared_ptr<JsonRpcProcessor> processor_;
    Options opts_;
    CorsPolicy cors_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex lifecycle_mutex_;
    std::unique_ptr<httplib::Server> server_;
    std::thread listen_thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};
};

} // namespace mcptk
