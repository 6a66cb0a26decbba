#include <gtest/gtest.h>
#include "toolsrv/server.hpp"
#include "toolsrv/session.hpp"
#include "toolsrv/shutdown.hpp"
#include "toolsrv/codec.hpp"
#include "toolsrv/error.hpp"
#include "toolsrv/tools/catalog.hpp"
#include <deque>

using namespace toolsrv;

namespace {

class StaticWeather : public tools::WeatherSource {
public:
    std::string fetch(const std::string&) override {
        return R"({"current_condition":[{"temp_F":"60","temp_C":"16","weatherDesc":[{"value":"Clear"}],)"
               R"("windspeedMiles":"5","winddir16Point":"S","humidity":"20","visibility":"10"}]})";
    }
};

/// Feeds scripted frames and records everything written.
class ScriptedTransport : public ITransport {
public:
    explicit ScriptedTransport(std::deque<std::string> frames) : frames_(std::move(frames)) {}

    std::optional<std::string> read_message() override {
        if (interrupted_ || frames_.empty()) return std::nullopt;
        auto f = std::move(frames_.front());
        frames_.pop_front();
        return f;
    }
    void write_message(const JsonRpcMessage& msg) override {
        written.push_back(nlohmann::json::parse(Codec::serialize(msg)));
    }
    void interrupt() override { interrupted_ = true; }
    bool flush(std::chrono::milliseconds) override { return true; }

    std::vector<nlohmann::json> written;

private:
    std::deque<std::string> frames_;
    bool interrupted_{false};
};

class FailingTransport : public ITransport {
public:
    std::optional<std::string> read_message() override {
        throw TransportError("Input frame is not valid UTF-8");
    }
    void write_message(const JsonRpcMessage&) override {}
    void interrupt() override {}
    bool flush(std::chrono::milliseconds) override { return true; }
};

std::unique_ptr<Server> make_server() {
    return std::make_unique<Server>(
        Server::default_options(),
        tools::make_registry(std::make_shared<StaticWeather>(), "Frisco, Colorado"));
}

const char* kInit = R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"test","version":"1"}}})";

nlohmann::json to_json_value(const std::optional<JsonRpcResponse>& resp) {
    nlohmann::json j;
    to_json(j, *resp);
    return j;
}

} // namespace

TEST(Server, InitializeMetadata) {
    auto server = make_server();
    auto resp = server->handle_frame(kInit);
    ASSERT_TRUE(resp.has_value());
    auto j = to_json_value(resp);
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(j["result"]["serverInfo"]["name"], "frisco-weather-server");
    EXPECT_EQ(j["result"]["serverInfo"]["version"], "1.0.0");
    EXPECT_EQ(j["result"]["capabilities"], nlohmann::json({{"tools", nlohmann::json::object()}}));
    EXPECT_EQ(server->session().state(), SessionState::Initialized);
}

TEST(Server, DuplicateInitializeIsIdempotent) {
    auto server = make_server();
    auto first = to_json_value(server->handle_frame(kInit));
    auto second = to_json_value(server->handle_frame(kInit));
    EXPECT_EQ(first, second);
    EXPECT_EQ(server->session().state(), SessionState::Initialized);
}

TEST(Server, InitializeWithoutParams) {
    auto server = make_server();
    auto j = to_json_value(server->handle_frame(R"({"jsonrpc":"2.0","id":"i","method":"initialize"})"));
    EXPECT_EQ(j["result"]["serverInfo"]["name"], "frisco-weather-server");
}

TEST(Server, ToolsListBeforeInitialize) {
    auto server = make_server();
    auto j = to_json_value(server->handle_frame(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})"));
    EXPECT_EQ(j["error"]["code"], error::NotInitialized);
    EXPECT_EQ(j["id"], 2);
}

TEST(Server, ToolsListOrder) {
    auto server = make_server();
    (void)server->handle_frame(kInit);
    auto j = to_json_value(server->handle_frame(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})"));
    const auto& tools = j["result"]["tools"];
    ASSERT_EQ(tools.size(), 4u);
    EXPECT_EQ(tools[0]["name"], "echo");
    EXPECT_EQ(tools[1]["name"], "reverse");
    EXPECT_EQ(tools[2]["name"], "wordcount");
    EXPECT_EQ(tools[3]["name"], "weather");
}

TEST(Server, WeatherCall) {
    auto server = make_server();
    (void)server->handle_frame(kInit);
    auto j = to_json_value(server->handle_frame(
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"weather","arguments":{"city":"Denver"}}})"));
    ASSERT_TRUE(j.contains("result")) << j.dump();
    auto text = j["result"]["content"][0]["text"].get<std::string>();
    EXPECT_EQ(text.rfind("Weather for Denver:\nCurrent: 60°F (16°C)", 0), 0u);
}

TEST(Server, ShutdownRequest) {
    auto server = make_server();
    (void)server->handle_frame(kInit);
    auto j = to_json_value(server->handle_frame(R"({"jsonrpc":"2.0","id":9,"method":"shutdown"})"));
    EXPECT_EQ(j["result"], nlohmann::json::object());
    EXPECT_TRUE(server->shutdown_controller().requested());
    EXPECT_EQ(server->session().state(), SessionState::ShuttingDown);

    auto after = to_json_value(server->handle_frame(R"({"jsonrpc":"2.0","id":10,"method":"tools/list"})"));
    EXPECT_EQ(after["error"]["code"], error::ShuttingDown);
}

TEST(Server, NotificationsProduceNothing) {
    auto server = make_server();
    EXPECT_FALSE(server->handle_frame(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
    EXPECT_FALSE(server->handle_frame(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":3}})").has_value());
    EXPECT_FALSE(server->handle_frame(R"({"jsonrpc":"2.0","method":"something/else"})").has_value());
}

TEST(Server, ServeStopsAfterShutdown) {
    auto server = make_server();
    ScriptedTransport transport({
        kInit,
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"reverse","arguments":{"text":"hello"}}})",
        R"({"jsonrpc":"2.0","id":3,"method":"shutdown"})",
        R"({"jsonrpc":"2.0","id":4,"method":"tools/list"})",
    });

    EXPECT_EQ(server->serve(transport), exit_code::Ok);
    ASSERT_EQ(transport.written.size(), 3u);
    EXPECT_EQ(transport.written[0]["id"], 1);
    EXPECT_EQ(transport.written[1]["id"], 2);
    EXPECT_EQ(transport.written[1]["result"]["content"][0]["text"], "olleh");
    EXPECT_EQ(transport.written[2]["id"], 3);
    EXPECT_EQ(server->shutdown_controller().reason(), ShutdownReason::Request);
}

TEST(Server, ServeEndsAtEndOfInput) {
    auto server = make_server();
    ScriptedTransport transport({kInit});
    EXPECT_EQ(server->serve(transport), exit_code::Ok);
    EXPECT_EQ(transport.written.size(), 1u);
    EXPECT_EQ(server->shutdown_controller().reason(), ShutdownReason::EndOfInput);
}

TEST(Server, ServeAnswersGarbage) {
    auto server = make_server();
    ScriptedTransport transport({"not json at all", kInit});
    EXPECT_EQ(server->serve(transport), exit_code::Ok);
    ASSERT_EQ(transport.written.size(), 2u);
    EXPECT_TRUE(transport.written[0]["id"].is_null());
    EXPECT_EQ(transport.written[0]["error"]["code"], error::ParseError);
    EXPECT_EQ(transport.written[1]["id"], 1);
}

TEST(Server, TransportFailureIsFatal) {
    auto server = make_server();
    FailingTransport transport;
    EXPECT_EQ(server->serve(transport), exit_code::Fatal);
    EXPECT_EQ(server->shutdown_controller().reason(), ShutdownReason::Fatal);
}
