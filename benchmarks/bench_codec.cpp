#include <benchmark/benchmark.h>
#include "mcplite/codec.hpp"
#include "mcplite/error.hpp"
#include "mcplite/json_rpc.hpp"
#include <string>

using namespace mcplite;

static const std::string kPingRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"add","arguments":{"a":2.5,"b":3}}})";

// tools/call carrying a large echo message
static std::string make_large_request(size_t message_size) {
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", "large"},
        {"method", "tools/call"},
        {"params", {{"name", "echo"}, {"arguments", {{"message", std::string(message_size, 'x')}}}}}
    };
    return req.dump();
}

static const std::string kLargeRequest = make_large_request(64 * 1024);

// tools/list-sized response with N catalog entries
static JsonRpcResponse make_listing_response(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "A tool for doing something useful, number " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {{"message", {{"type", "string"}}}}},
                {"required", {"message"}}
            }}
        });
    }
    return JsonRpcSuccess{1, nlohmann::json{{"tools", tools}}};
}

// ---- Parse ----

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kPingRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(kPingRequest.size()));
}
BENCHMARK(BM_ParsePing)->MinTime(1.0);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(kToolCallRequest.size()));
}
BENCHMARK(BM_ParseToolCall)->MinTime(1.0);

static void BM_ParseLargeRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kLargeRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(kLargeRequest.size()));
}
BENCHMARK(BM_ParseLargeRequest)->MinTime(1.0);

static void BM_ParseMalformed(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto req = Codec::parse(bad);
            benchmark::DoNotOptimize(req);
        } catch (const McpParseError& e) {
            auto failure = Codec::failure_for(e);
            benchmark::DoNotOptimize(failure);
        }
    }
}
BENCHMARK(BM_ParseMalformed)->MinTime(1.0);

// ---- Serialize ----

static void BM_SerializeSuccess(benchmark::State& state) {
    JsonRpcResponse resp = JsonRpcSuccess{1, nlohmann::json::object()};
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeSuccess)->MinTime(1.0);

static void BM_SerializeListing(benchmark::State& state) {
    auto resp = make_listing_response(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeListing)->Arg(2)->Arg(100)->MinTime(1.0);
