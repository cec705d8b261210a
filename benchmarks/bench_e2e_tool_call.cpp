#include <benchmark/benchmark.h>
#include "mcptk/server.hpp"
#include "mcptk/tools/echo_tool.hpp"
#include "mcptk/transport/http_transport.hpp"

#include <httplib.h>

#include <memory>

using namespace mcptk;

// Server with the echo tool behind an HTTP transport on an ephemeral port
struct E2EFixture {
    std::unique_ptr<McpServer> server;
    std::unique_ptr<httplib::Client> client;

    E2EFixture() {
        ServerConfig config;
        config.http.port = 0;
        config.sse_enabled = false;
        config.websocket_enabled = false;
        config.logging.level = "warning";
        log::configure(config.logging);

        server = std::make_unique<McpServer>(config);
        server->add_tool(std::make_shared<tools::EchoTool>());
        server->start();

        client = std::make_unique<httplib::Client>("127.0.0.1", server->transport("http")->port());
        client->set_keep_alive(true);
    }

    ~E2EFixture() {
        server->stop();
    }
};

static const std::string kEchoCall =
    R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hello benchmark"}}})";

static void BM_ToolCallDirect(benchmark::State& state) {
    ServerConfig config;
    config.logging.level = "warning";
    log::configure(config.logging);
    McpServer server{config};
    server.add_tool(std::make_shared<tools::EchoTool>());

    for (auto _ : state) {
        auto out = server.handle_message(kEchoCall);
        benchmark::DoNotOptimize(out);
    }
    state.SetLabel("in-process tools/call");
}
BENCHMARK(BM_ToolCallDirect)->MinTime(1.0);

static void BM_ToolCallHttp(benchmark::State& state) {
    E2EFixture fixture;

    for (auto _ : state) {
        auto res = fixture.client->Post("/mcp", kEchoCall, "application/json");
        benchmark::DoNotOptimize(res);
    }
    state.SetLabel("HTTP tools/call roundtrip");
}
BENCHMARK(BM_ToolCallHttp)->MinTime(2.0)->UseRealTime();

static void BM_ListToolsHttp(benchmark::State& state) {
    E2EFixture fixture;
    const std::string raw = R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})";

    for (auto _ : state) {
        auto res = fixture.client->Post("/mcp", raw, "application/json");
        benchmark::DoNotOptimize(res);
    }
    state.SetLabel("HTTP tools/list roundtrip");
}
BENCHMARK(BM_ListToolsHttp)->MinTime(2.0)->UseRealTime();
