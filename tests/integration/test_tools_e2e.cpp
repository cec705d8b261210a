#include <gtest/gtest.h>
#include "mcptk/server.hpp"
#include "mcptk/error.hpp"
#include "mcptk/tools/echo_tool.hpp"
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <thread>

using namespace mcptk;

namespace {

class CountdownTool : public ITool {
public:
    std::atomic<int> cancelled_runs{0};

    ToolDefinition definition() const override {
        ToolDefinition def;
        def.name = "countdown";
        def.description = "Counts down from n, 10 ms per step";
        def.parameters = {{"type", "object"},
                          {"properties", {{"n", {{"type", "integer"}}},
                                          {"unit", {{"type", "string"}, {"enum", {"ms", "steps"}}}}}},
                          {"required", {"n"}}};
        return def;
    }

    ToolExecutionResult execute(const ToolExecutionRequest& request) override {
        int n = request.parameters.at("n").get<int>();
        for (int i = n; i > 0; --i) {
            if (request.is_cancelled()) {
                ++cancelled_runs;
                return ToolExecutionResult::fail("CANCELLED", "Stopped at " + std::to_string(i));
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return ToolExecutionResult::ok(nlohmann::json{{"remaining", 0}, {"from", n}});
    }
};

} // anonymous namespace

class ToolsE2ETest : public ::testing::Test {
protected:
    std::unique_ptr<McpServer> server_;
    std::shared_ptr<CountdownTool> countdown_ = std::make_shared<CountdownTool>();
    std::unique_ptr<httplib::Client> client_;

    void SetUp() override {
        ServerConfig config;
        config.http.port = 0;
        config.websocket_enabled = false;
        config.sse_enabled = false;
        config.tools.default_timeout = std::chrono::milliseconds(200);
        config.tools.worker_threads = 4;
        server_ = std::make_unique<McpServer>(config);
        server_->add_tool(std::make_shared<tools::EchoTool>(), "basic");
        server_->add_tool(countdown_, "timing");
        server_->start();
        client_ = std::make_unique<httplib::Client>("127.0.0.1", server_->transport("http")->port());
    }

    void TearDown() override {
        client_.reset();
        server_->stop();
    }

    nlohmann::json call_tool(const std::string& name, const nlohmann::json& args, int id = 1) {
        nlohmann::json req = {{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"},
                              {"params", {{"name", name}, {"arguments", args}}}};
        auto res = client_->Post("/mcp", req.dump(), "application/json");
        if (!res) return nullptr;
        return nlohmann::json::parse(res->body);
    }
};

TEST_F(ToolsE2ETest, FastCallSucceeds) {
    auto resp = call_tool("countdown", {{"n", 3}});
    EXPECT_EQ(resp["result"]["structuredContent"]["from"], 3);
    EXPECT_EQ(resp["result"]["isError"], false);
}

TEST_F(ToolsE2ETest, SlowCallTimesOutAndIsCancelled) {
    auto start = std::chrono::steady_clock::now();
    auto resp = call_tool("countdown", {{"n", 500}});
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(resp["error"]["code"], error::ToolExecutionError);
    EXPECT_EQ(resp["error"]["data"]["code"], "EXECUTION_TIMEOUT");
    EXPECT_EQ(resp["error"]["data"]["details"]["timeout_ms"], 200);
    EXPECT_LT(elapsed, std::chrono::seconds(2));

    for (int i = 0; i < 100 && countdown_->cancelled_runs == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(countdown_->cancelled_runs.load(), 1);
}

TEST_F(ToolsE2ETest, EnumViolation) {
    auto resp = call_tool("countdown", {{"n", 1}, {"unit", "hours"}});
    EXPECT_EQ(resp["error"]["code"], error::InvalidParams);
    EXPECT_EQ(resp["error"]["data"]["details"]["validation_errors"][0]["code"], "INVALID_ENUM");
}

TEST_F(ToolsE2ETest, SlowToolDoesNotBlockOthers) {
    std::thread slow([this] {
        httplib::Client c("127.0.0.1", server_->transport("http")->port());
        nlohmann::json req = {{"jsonrpc", "2.0"}, {"id", 99}, {"method", "tools/call"},
                              {"params", {{"name", "countdown"}, {"arguments", {{"n", 15}}}}}};
        auto res = c.Post("/mcp", req.dump(), "application/json");
        EXPECT_TRUE(res);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    auto start = std::chrono::steady_clock::now();
    auto resp = call_tool("echo", {{"message", "quick"}});
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_EQ(resp["result"]["content"][0]["text"], "Echo: quick");
    EXPECT_LT(elapsed, std::chrono::milliseconds(140));
    slow.join();
}

TEST_F(ToolsE2ETest, ToolListChangesAfterRemoval) {
    ASSERT_TRUE(server_->remove_tool("countdown"));
    auto resp = call_tool("countdown", {{"n", 1}});
    EXPECT_EQ(resp["error"]["code"], error::ToolNotFound);
}
