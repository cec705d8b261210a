#include <gtest/gtest.h>
#include "mcptk/server.hpp"
#include "mcptk/tools/echo_tool.hpp"
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

using namespace mcptk;

namespace {

using ws_client = websocketpp::client<websocketpp::config::asio_client>;

/// Minimal blocking WebSocket client for the tests.
class WsClient {
public:
    explicit WsClient(uint16_t port, const std::string& path = "/mcp", bool answer_pings = true) {
        client_.clear_access_channels(websocketpp::log::alevel::all);
        client_.clear_error_channels(websocketpp::log::elevel::all);
        client_.init_asio();

        // Returning false suppresses the automatic pong
        client_.set_ping_handler([answer_pings](websocketpp::connection_hdl, std::string) {
            return answer_pings;
        });

        client_.set_open_handler([this](websocketpp::connection_hdl) {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
            cv_.notify_all();
        });
        client_.set_fail_handler([this](websocketpp::connection_hdl hdl) {
            auto con = client_.get_con_from_hdl(hdl);
            std::lock_guard<std::mutex> lock(mutex_);
            failed_ = true;
            http_status_ = con->get_response_code();
            cv_.notify_all();
        });
        client_.set_close_handler([this](websocketpp::connection_hdl hdl) {
            auto con = client_.get_con_from_hdl(hdl);
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            close_code_ = con->get_remote_close_code();
            cv_.notify_all();
        });
        client_.set_message_handler([this](websocketpp::connection_hdl, ws_client::message_ptr msg) {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(msg->get_payload());
            cv_.notify_all();
        });

        websocketpp::lib::error_code ec;
        auto con = client_.get_connection("ws://127.0.0.1:" + std::to_string(port) + path, ec);
        if (ec) {
            failed_ = true;
            return;
        }
        hdl_ = con->get_handle();
        client_.connect(con);
        thread_ = std::thread([this] { client_.run(); });
    }

    ~WsClient() { close(); }

    bool wait_open(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return open_ || failed_ || closed_; });
        return open_ && !failed_;
    }

    bool wait_failed(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return failed_; });
    }

    bool wait_closed(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return closed_ || failed_; });
    }

    int http_status() {
        std::lock_guard<std::mutex> lock(mutex_);
        return http_status_;
    }

    websocketpp::close::status::value close_code() {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_code_;
    }

    void send(const std::string& text,
              websocketpp::frame::opcode::value opcode = websocketpp::frame::opcode::text) {
        websocketpp::lib::error_code ec;
        client_.send(hdl_, text, opcode, ec);
        ASSERT_FALSE(ec) << ec.message();
    }

    std::optional<nlohmann::json> next(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !messages_.empty(); })) return std::nullopt;
        auto payload = std::move(messages_.front());
        messages_.pop_front();
        return nlohmann::json::parse(payload);
    }

    void close() {
        if (!thread_.joinable()) return;
        bool open_now;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_now = open_ && !closed_;
        }
        if (open_now) {
            websocketpp::lib::error_code ec;
            client_.close(hdl_, websocketpp::close::status::normal, "bye", ec);
            wait_closed(std::chrono::seconds(2));
        }
        client_.stop();
        thread_.join();
    }

private:
    ws_client client_;
    websocketpp::connection_hdl hdl_;
    std::thread thread_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> messages_;
    bool open_ = false;
    bool failed_ = false;
    bool closed_ = false;
    int http_status_ = 0;
    websocketpp::close::status::value close_code_ = websocketpp::close::status::blank;
};

nlohmann::json request(int id, const std::string& method, nlohmann::json params = nullptr) {
    nlohmann::json req = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    if (!params.is_null()) req["params"] = std::move(params);
    return req;
}

} // anonymous namespace

class WebSocketE2ETest : public ::testing::Test {
protected:
    std::unique_ptr<McpServer> server_;
    uint16_t port_ = 0;

    void SetUp() override {
        ServerConfig config;
        config.http_enabled = false;
        config.sse_enabled = false;
        config.websocket.port = 0;
        config.websocket.max_connections = 2;
        config.websocket.worker_threads = 2;
        server_ = std::make_unique<McpServer>(config);
        server_->add_tool(std::make_shared<tools::EchoTool>());
        server_->start();
        port_ = server_->transport("websocket")->port();
    }

    void TearDown() override {
        server_->stop();
    }

    WebSocketServerTransport& ws() {
        return static_cast<WebSocketServerTransport&>(*server_->transport("websocket"));
    }

    void wait_for_connections(size_t n) {
        for (int i = 0; i < 200 && ws().connection_count() != n; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
};

TEST_F(WebSocketE2ETest, InitializeAndCallTool) {
    WsClient client(port_);
    ASSERT_TRUE(client.wait_open());

    client.send(request(1, "initialize", {{"protocolVersion", "2024-11-05"}}).dump());
    auto init = client.next();
    ASSERT_TRUE(init.has_value());
    EXPECT_EQ((*init)["id"], 1);
    EXPECT_EQ((*init)["result"]["serverInfo"]["name"], "mcptk");

    client.send(request(2, "tools/call", {{"name", "echo"}, {"arguments", {{"message", "ws"}}}}).dump());
    auto call = client.next();
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ((*call)["result"]["content"][0]["text"], "Echo: ws");
}

TEST_F(WebSocketE2ETest, RepliesKeepArrivalOrder) {
    WsClient client(port_);
    ASSERT_TRUE(client.wait_open());
    for (int i = 0; i < 25; ++i) client.send(request(i, "ping").dump());
    for (int i = 0; i < 25; ++i) {
        auto reply = client.next();
        ASSERT_TRUE(reply.has_value()) << i;
        EXPECT_EQ((*reply)["id"], i);
    }
}

TEST_F(WebSocketE2ETest, NotificationHasNoReply) {
    WsClient client(port_);
    ASSERT_TRUE(client.wait_open());
    client.send(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    client.send(request(5, "ping").dump());
    auto reply = client.next();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["id"], 5);
}

TEST_F(WebSocketE2ETest, BinaryNotificationHasNoReplyAndSocketStaysUsable) {
    WsClient client(port_);
    ASSERT_TRUE(client.wait_open());
    client.send(R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
                websocketpp::frame::opcode::binary);
    EXPECT_FALSE(client.next(std::chrono::milliseconds(300)).has_value());

    client.send(request(6, "ping").dump(), websocketpp::frame::opcode::binary);
    auto reply = client.next();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["id"], 6);

    client.send(request(7, "ping").dump());
    reply = client.next();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["id"], 7);
    EXPECT_EQ(ws().connection_count(), 1u);
}

TEST_F(WebSocketE2ETest, ParseErrorAndBatch) {
    WsClient client(port_);
    ASSERT_TRUE(client.wait_open());

    client.send("{nope");
    auto err = client.next();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ((*err)["error"]["code"], -32700);

    client.send(nlohmann::json::array({request(1, "ping"), request(2, "tools/list")}).dump());
    auto batch = client.next();
    ASSERT_TRUE(batch.has_value());
    ASSERT_TRUE(batch->is_array());
    EXPECT_EQ(batch->size(), 2u);
}

TEST_F(WebSocketE2ETest, UnknownPathRejected) {
    WsClient client(port_, "/elsewhere");
    ASSERT_TRUE(client.wait_failed());
    EXPECT_EQ(client.http_status(), 404);
}

TEST_F(WebSocketE2ETest, AlternatePaths) {
    WsClient root(port_, "/");
    EXPECT_TRUE(root.wait_open());
    WsClient ws_path(port_, "/ws?token=abc");
    EXPECT_TRUE(ws_path.wait_open());
}

TEST_F(WebSocketE2ETest, ConnectionLimit) {
    WsClient a(port_);
    WsClient b(port_);
    ASSERT_TRUE(a.wait_open());
    ASSERT_TRUE(b.wait_open());
    wait_for_connections(2);

    WsClient c(port_);
    ASSERT_TRUE(c.wait_closed());
    EXPECT_EQ(c.close_code(), websocketpp::close::status::try_again_later);
    EXPECT_EQ(ws().connection_count(), 2u);
}

TEST_F(WebSocketE2ETest, ConnectionTracking) {
    WsClient a(port_);
    ASSERT_TRUE(a.wait_open());
    wait_for_connections(1);
    auto ids = ws().connection_ids();
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids[0].rfind("ws_", 0), 0u);

    a.close();
    wait_for_connections(0);
    EXPECT_EQ(ws().connection_count(), 0u);
}

TEST_F(WebSocketE2ETest, Broadcast) {
    WsClient a(port_);
    WsClient b(port_);
    ASSERT_TRUE(a.wait_open());
    ASSERT_TRUE(b.wait_open());
    wait_for_connections(2);

    ws().broadcast(R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})");
    auto ma = a.next();
    auto mb = b.next();
    ASSERT_TRUE(ma.has_value());
    ASSERT_TRUE(mb.has_value());
    EXPECT_EQ((*ma)["method"], "notifications/tools/list_changed");
    EXPECT_EQ((*mb)["method"], "notifications/tools/list_changed");
}

TEST_F(WebSocketE2ETest, StopClosesClients) {
    WsClient client(port_);
    ASSERT_TRUE(client.wait_open());
    wait_for_connections(1);
    server_->stop();
    ASSERT_TRUE(client.wait_closed());
    EXPECT_EQ(client.close_code(), websocketpp::close::status::going_away);
}

class WebSocketLivenessTest : public ::testing::Test {
protected:
    std::unique_ptr<McpServer> server_;
    uint16_t port_ = 0;

    void SetUp() override {
        ServerConfig config;
        config.http_enabled = false;
        config.sse_enabled = false;
        config.websocket.port = 0;
        config.websocket.ping_interval = std::chrono::milliseconds(200);
        config.websocket.pong_timeout = std::chrono::milliseconds(50);
        server_ = std::make_unique<McpServer>(config);
        server_->start();
        port_ = server_->transport("websocket")->port();
    }

    void TearDown() override {
        server_->stop();
    }

    size_t connections() {
        return static_cast<WebSocketServerTransport&>(*server_->transport("websocket")).connection_count();
    }
};

TEST_F(WebSocketLivenessTest, MissingPongEvictsConnection) {
    WsClient silent(port_, "/mcp", false);
    ASSERT_TRUE(silent.wait_open());

    ASSERT_TRUE(silent.wait_closed(std::chrono::seconds(5)));
    EXPECT_EQ(silent.close_code(), websocketpp::close::status::going_away);
    for (int i = 0; i < 100 && connections() != 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(connections(), 0u);
}

TEST_F(WebSocketLivenessTest, AnsweredPingsKeepConnection) {
    WsClient client(port_);
    ASSERT_TRUE(client.wait_open());

    std::this_thread::sleep_for(std::chrono::milliseconds(800));
    EXPECT_EQ(connections(), 1u);
    client.send(request(1, "ping").dump());
    auto reply = client.next();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["id"], 1);
}
