#include <benchmark/benchmark.h>
#include "mcplite/codec.hpp"
#include "mcplite/demo_tools.hpp"
#include "mcplite/dispatcher.hpp"
#include "mcplite/logging.hpp"
#include <memory>
#include <string>

using namespace mcplite;

// Dispatcher with the demo tools plus N filler tools
static std::unique_ptr<Dispatcher> make_dispatcher(int extra_tools) {
    // Per-request info logging would dominate the measurement
    logger()->set_level(spdlog::level::warn);

    ToolRegistry::Builder builder;
    register_demo_tools(builder);
    for (int i = 0; i < extra_tools; ++i) {
        builder.add(ToolDefinition{"tool_" + std::to_string(i), std::nullopt,
                                   nlohmann::json{{"type", "object"}}},
                    [](const nlohmann::json&) -> ToolResult { return text_result("ok"); });
    }

    Dispatcher::Options opts;
    opts.server_info = {"bench-server", "1.0"};
    return std::make_unique<Dispatcher>(std::move(opts), builder.build());
}

static JsonRpcRequest make_request(const std::string& method, nlohmann::json params) {
    JsonRpcRequest req;
    req.id = 1;
    req.method = method;
    req.params = std::move(params);
    return req;
}

static void BM_DispatchPing(benchmark::State& state) {
    auto d = make_dispatcher(0);
    auto req = make_request("ping", nlohmann::json::object());
    for (auto _ : state) {
        auto resp = d->dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchPing)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto d = make_dispatcher(0);
    auto req = make_request("not/registered", nlohmann::json::object());
    for (auto _ : state) {
        auto resp = d->dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_DispatchToolsList(benchmark::State& state) {
    auto d = make_dispatcher(static_cast<int>(state.range(0)));
    auto req = make_request("tools/list", nlohmann::json::object());
    for (auto _ : state) {
        auto resp = d->dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolsList)->Arg(0)->Arg(100)->Arg(1000)->MinTime(1.0);

static void BM_DispatchAdd(benchmark::State& state) {
    auto d = make_dispatcher(static_cast<int>(state.range(0)));
    auto req = make_request("tools/call", {{"name", "add"}, {"arguments", {{"a", 2}, {"b", 3}}}});
    for (auto _ : state) {
        auto resp = d->dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchAdd)->Arg(0)->Arg(1000)->MinTime(1.0);

// Full line path minus the transport: parse, dispatch, serialize
static void BM_LineToLine(benchmark::State& state) {
    auto d = make_dispatcher(0);
    const std::string line =
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hi"}}})";
    for (auto _ : state) {
        auto out = Codec::serialize(d->dispatch(Codec::parse(line)));
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_LineToLine)->MinTime(1.0);
