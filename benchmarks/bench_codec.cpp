#include <benchmark/benchmark.h>
#include "mcptk/codec.hpp"
#include "mcptk/json_rpc.hpp"
#include <string>
#include <vector>

using namespace mcptk;

// Small message (~100 bytes)
static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

// Tool call request
static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"echo","arguments":{"message":"Warsaw"}}})";

// Generate a large tools/list response with N tools
static std::string make_large_response(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "A tool for doing something useful, number " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"param1", {{"type", "string"}, {"description", "First parameter"}}},
                    {"param2", {{"type", "integer"}, {"description", "Second parameter"}}}
                }},
                {"required", {"param1"}}
            }}
        });
    }
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {{"tools", tools}}}
    };
    return resp.dump();
}

static const std::string kLargeResponse = make_large_response(100);

// ---- Parse benchmarks ----

static void BM_ParseSmallMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto doc = Codec::parse_document(kSmallRequest);
        auto req = Codec::parse_request(doc);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_ParseSmallMessage)->MinTime(1.0);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto doc = Codec::parse_document(kToolCallRequest);
        auto req = Codec::parse_request(doc);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest)->MinTime(1.0);

static void BM_ParseLargeDocument(benchmark::State& state) {
    for (auto _ : state) {
        auto doc = Codec::parse_document(kLargeResponse);
        benchmark::DoNotOptimize(doc);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_ParseLargeDocument)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto doc = Codec::parse_document(bad);
            benchmark::DoNotOptimize(doc);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeSmallResponse(benchmark::State& state) {
    auto resp = make_result(RequestId{int64_t{1}}, nlohmann::json::object());
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeSmallResponse)->MinTime(1.0);

static void BM_SerializeBatch(benchmark::State& state) {
    std::vector<JsonRpcResponse> batch;
    for (int i = 0; i < 50; ++i) {
        batch.push_back(make_result(RequestId{int64_t{i}}, nlohmann::json{{"ok", true}}));
    }
    for (auto _ : state) {
        auto s = Codec::serialize_batch(batch);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeBatch)->MinTime(1.0);
