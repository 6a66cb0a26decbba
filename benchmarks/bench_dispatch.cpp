#include <benchmark/benchmark.h>
#include "toolsrv/server.hpp"
#include "toolsrv/tools/catalog.hpp"
#include <memory>
#include <string>

using namespace toolsrv;

namespace {

class CannedWeather : public tools::WeatherSource {
public:
    std::string fetch(const std::string&) override {
        return R"({"current_condition":[{"temp_F":"45","temp_C":"7","weatherDesc":[{"value":"Clear"}],)"
               R"("windspeedMiles":"3","winddir16Point":"N","humidity":"30","visibilityMiles":"10"}]})";
    }
};

// Server past the handshake (returned via unique_ptr, Server is not movable)
std::unique_ptr<Server> make_server() {
    auto server = std::make_unique<Server>(
        Server::default_options(),
        tools::make_registry(std::make_shared<CannedWeather>(), "Frisco, Colorado"));
    auto init = server->handle_frame(
        R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"bench","version":"1.0"}}})");
    benchmark::DoNotOptimize(init);
    return server;
}

void run_frame(benchmark::State& state, const std::string& frame) {
    auto server = make_server();
    for (auto _ : state) {
        auto resp = server->handle_frame(frame);
        benchmark::DoNotOptimize(resp);
    }
}

} // namespace

static void BM_ToolsList(benchmark::State& state) {
    run_frame(state, R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
}
BENCHMARK(BM_ToolsList)->MinTime(1.0);

static void BM_CallReverse(benchmark::State& state) {
    run_frame(state, R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"reverse","arguments":{"text":"hello, world"}}})");
}
BENCHMARK(BM_CallReverse)->MinTime(1.0);

static void BM_CallWordcount(benchmark::State& state) {
    run_frame(state, R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"wordcount","arguments":{"text":"one two\nthree four five\nsix"}}})");
}
BENCHMARK(BM_CallWordcount)->MinTime(1.0);

static void BM_CallWeatherFormatting(benchmark::State& state) {
    run_frame(state, R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"weather","arguments":{}}})");
}
BENCHMARK(BM_CallWeatherFormatting)->MinTime(1.0);

static void BM_UnknownTool(benchmark::State& state) {
    run_frame(state, R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"nope"}})");
}
BENCHMARK(BM_UnknownTool)->MinTime(1.0);

static void BM_InvalidArguments(benchmark::State& state) {
    run_frame(state, R"({"jsonrpc":"2.0","id":6,"method":"tools/call","params":{"name":"echo","arguments":{"text":1}}})");
}
BENCHMARK(BM_InvalidArguments)->MinTime(1.0);

static void BM_Notification(benchmark::State& state) {
    run_frame(state, R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
}
BENCHMARK(BM_Notification)->MinTime(1.0);
