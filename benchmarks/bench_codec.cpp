#include <benchmark/benchmark.h>
#include "toolsrv/codec.hpp"
#include "toolsrv/json_rpc.hpp"
#include <string>

using namespace toolsrv;

static const std::string kInitialize =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"bench","version":"1.0"}}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"wordcount","arguments":{"text":"Building MCP servers is awesome!"}}})";

// A tool call carrying a large multi-line text argument
static std::string make_large_call(int lines) {
    std::string text;
    for (int i = 0; i < lines; ++i) {
        text += "line " + std::to_string(i) + " of a fairly ordinary paragraph, caf\xC3\xA9 included\n";
    }
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", 7},
        {"method", "tools/call"},
        {"params", {{"name", "reverse"}, {"arguments", {{"text", text}}}}}
    };
    return req.dump();
}

static const std::string kLargeCall = make_large_call(1000);

// ---- Decode benchmarks ----

static void BM_DecodeInitialize(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::to_message(Codec::decode(kInitialize));
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kInitialize.size());
}
BENCHMARK(BM_DecodeInitialize)->MinTime(1.0);

static void BM_DecodeToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::to_message(Codec::decode(kToolCallRequest));
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_DecodeToolCall)->MinTime(1.0);

static void BM_DecodeLargeCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::to_message(Codec::decode(kLargeCall));
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kLargeCall.size());
}
BENCHMARK(BM_DecodeLargeCall)->MinTime(1.0);

static void BM_ValidateUtf8(benchmark::State& state) {
    for (auto _ : state) {
        bool ok = Codec::valid_utf8(kLargeCall);
        benchmark::DoNotOptimize(ok);
    }
    state.SetBytesProcessed(state.iterations() * kLargeCall.size());
}
BENCHMARK(BM_ValidateUtf8)->MinTime(1.0);

static void BM_DecodeInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto j = Codec::decode(bad);
            benchmark::DoNotOptimize(j);
        } catch (const ParseError&) {
            state.counters["errors"]++;
        }
    }
}
BENCHMARK(BM_DecodeInvalidJson)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeResponse(benchmark::State& state) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{1}};
    resp.result = nlohmann::json{{"content", {{{"type", "text"}, {"text", "olleh"}}}}};
    JsonRpcMessage msg = resp;

    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeResponse)->MinTime(1.0);

static void BM_SerializeLargeRequest(benchmark::State& state) {
    auto msg = Codec::to_message(Codec::decode(kLargeCall));

    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kLargeCall.size());
}
BENCHMARK(BM_SerializeLargeRequest)->MinTime(1.0);
