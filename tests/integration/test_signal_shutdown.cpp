#include <gtest/gtest.h>
#include "harness.hpp"
#include "toolsrv/error.hpp"
#include <signal.h>

using namespace toolsrv;
using namespace toolsrv::test;
using namespace std::chrono_literals;

namespace {

std::map<std::string, std::string> quiet_env() {
    return {
        {"TOOLSRV_LOG_LEVEL", "warn"},
        // Never reach the real service from tests.
        {"TOOLSRV_WEATHER_URL", "http://127.0.0.1:9"},
        {"TOOLSRV_WEATHER_TIMEOUT_MS", "500"},
    };
}

// Completing the handshake guarantees the signal watcher is installed.
void handshake(ServerProcess& p) {
    p.send(initialize_request(1));
    auto resp = p.receive();
    ASSERT_TRUE(resp.has_value());
    ASSERT_TRUE(resp->contains("result"));
}

} // namespace

TEST(SignalShutdown, IdleSigtermExitsCleanly) {
    ServerProcess p(quiet_env());
    handshake(p);
    p.signal(SIGTERM);
    EXPECT_EQ(p.wait_exit(3s).value_or(-1), exit_code::Ok);
}

TEST(SignalShutdown, IdleSigintExitsCleanly) {
    ServerProcess p(quiet_env());
    handshake(p);
    p.signal(SIGINT);
    EXPECT_EQ(p.wait_exit(3s).value_or(-1), exit_code::Ok);
}

TEST(SignalShutdown, EndOfInputExitsCleanly) {
    ServerProcess p(quiet_env());
    handshake(p);
    p.close_input();
    EXPECT_EQ(p.wait_exit(3s).value_or(-1), exit_code::Ok);
}

TEST(SignalShutdown, ShutdownRequestExitsCleanly) {
    ServerProcess p(quiet_env());
    handshake(p);
    p.send(request(2, "shutdown"));
    auto resp = p.receive();
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["id"], 2);
    EXPECT_EQ((*resp)["result"], nlohmann::json::object());
    EXPECT_EQ(p.wait_exit(3s).value_or(-1), exit_code::Ok);
}

TEST(SignalShutdown, StuckCallIsForcedAfterGracePeriod) {
    SilentEndpoint endpoint;
    auto env = quiet_env();
    env["TOOLSRV_WEATHER_URL"] = endpoint.url();
    env["TOOLSRV_WEATHER_TIMEOUT_MS"] = "10000";
    env["TOOLSRV_GRACE_PERIOD_MS"] = "200";

    ServerProcess p(env);
    handshake(p);
    p.send(tool_call(2, "weather", {{"city", "Denver"}}));
    std::this_thread::sleep_for(300ms);

    auto started = std::chrono::steady_clock::now();
    p.signal(SIGTERM);
    EXPECT_EQ(p.wait_exit(5s).value_or(-1), exit_code::Forced);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(SignalShutdown, CallFinishingWithinGraceIsAnswered) {
    SilentEndpoint endpoint;
    auto env = quiet_env();
    env["TOOLSRV_WEATHER_URL"] = endpoint.url();
    env["TOOLSRV_WEATHER_TIMEOUT_MS"] = "300";
    env["TOOLSRV_GRACE_PERIOD_MS"] = "3000";

    ServerProcess p(env);
    handshake(p);
    p.send(tool_call(2, "weather", {{"city", "Denver"}}));
    std::this_thread::sleep_for(100ms);
    p.signal(SIGTERM);

    auto resp = p.receive();
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["id"], 2);
    EXPECT_EQ((*resp)["error"]["code"], error::ToolExecutionFailed);
    EXPECT_EQ(p.wait_exit(3s).value_or(-1), exit_code::Ok);
}

TEST(SignalShutdown, InvalidConfigurationIsFatal) {
    auto env = quiet_env();
    env["TOOLSRV_GRACE_PERIOD_MS"] = "abc";
    ServerProcess p(env);
    EXPECT_EQ(p.wait_exit(3s).value_or(-1), exit_code::Fatal);
}
