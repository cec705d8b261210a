#include <benchmark/benchmark.h>
#include "mcptk/processor.hpp"
#include <memory>
#include <string>

using namespace mcptk;

// Processor with N methods registered
static std::unique_ptr<JsonRpcProcessor> make_processor(int n_methods) {
    auto processor = std::make_unique<JsonRpcProcessor>();
    for (int i = 0; i < n_methods; ++i) {
        processor->register_sync_method("method_" + std::to_string(i),
            [](const std::optional<nlohmann::json>&) -> HandlerResult {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    processor->register_sync_method("ping", [](const std::optional<nlohmann::json>&) -> HandlerResult {
        return nlohmann::json::object();
    });
    return processor;
}

static void BM_DispatchKnownMethod(benchmark::State& state) {
    auto processor = make_processor(1);
    const std::string raw = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";
    for (auto _ : state) {
        auto out = processor->process_message(raw);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_DispatchKnownMethod)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto processor = make_processor(1);
    const std::string raw = R"({"jsonrpc":"2.0","id":1,"method":"not_registered_method"})";
    for (auto _ : state) {
        auto out = processor->process_message(raw);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_Dispatch100Methods(benchmark::State& state) {
    auto processor = make_processor(100);
    const std::string raw = R"({"jsonrpc":"2.0","id":"x","method":"method_57","params":{}})";
    for (auto _ : state) {
        auto out = processor->process_message(raw);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_Dispatch100Methods)->MinTime(1.0);

static void BM_DispatchBatch(benchmark::State& state) {
    auto processor = make_processor(1);
    nlohmann::json batch = nlohmann::json::array();
    for (int i = 0; i < 50; ++i) {
        batch.push_back({{"jsonrpc", "2.0"}, {"id", i}, {"method", "ping"}});
    }
    const std::string raw = batch.dump();
    for (auto _ : state) {
        auto out = processor->process_message(raw);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations() * 50);
}
BENCHMARK(BM_DispatchBatch)->MinTime(1.0);

static void BM_DispatchNotification(benchmark::State& state) {
    auto processor = make_processor(1);
    const std::string raw = R"({"jsonrpc":"2.0","method":"ping"})";
    for (auto _ : state) {
        auto out = processor->process_message(raw);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_DispatchNotification)->MinTime(1.0);
