#include <gtest/gtest.h>
#include "toolsrv/executor.hpp"
#include "toolsrv/error.hpp"
#include "toolsrv/tools/text_tools.hpp"

using namespace toolsrv;

namespace {

class ExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.add(tools::echo_descriptor(), tools::echo);
        registry.add(tools::reverse_descriptor(), tools::reverse);

        ToolDescriptor boom{"boom", "always throws", InputSchema{}};
        registry.add(boom, [](const nlohmann::json&) -> ToolOutcome {
            throw std::runtime_error("kaboom");
        });

        ToolDescriptor weird{"weird", "throws a non-standard value", InputSchema{}};
        registry.add(weird, [](const nlohmann::json&) -> ToolOutcome {
            throw 42;
        });

        ToolDescriptor flaky{"flaky", "reports failure", InputSchema{}};
        registry.add(flaky, [](const nlohmann::json&) -> ToolOutcome {
            return ToolFailure{"upstream timed out"};
        });
    }

    JsonRpcError expect_error(const nlohmann::json& params) {
        auto result = executor.call(params);
        EXPECT_TRUE(std::holds_alternative<JsonRpcError>(result));
        if (auto* err = std::get_if<JsonRpcError>(&result)) return *err;
        return JsonRpcError{0, "", std::nullopt};
    }

    ToolRegistry registry;
    ToolExecutor executor{registry};
};

} // namespace

TEST_F(ExecutorTest, CallsTool) {
    auto result = executor.call(nlohmann::json{{"name", "reverse"}, {"arguments", {{"text", "hello"}}}});
    ASSERT_TRUE(std::holds_alternative<nlohmann::json>(result));
    const auto& j = std::get<nlohmann::json>(result);
    EXPECT_EQ(j["content"][0]["type"], "text");
    EXPECT_EQ(j["content"][0]["text"], "olleh");
    EXPECT_FALSE(j.contains("isError"));
}

TEST_F(ExecutorTest, MissingName) {
    auto err = expect_error(nlohmann::json{{"arguments", nlohmann::json::object()}});
    EXPECT_EQ(err.code, error::InvalidParams);

    err = expect_error(nlohmann::json{{"name", 5}});
    EXPECT_EQ(err.code, error::InvalidParams);
}

TEST_F(ExecutorTest, UnknownToolIsDistinctFromMethodNotFound) {
    auto err = expect_error(nlohmann::json{{"name", "teleport"}, {"arguments", nlohmann::json::object()}});
    EXPECT_EQ(err.code, error::UnknownTool);
    EXPECT_NE(err.code, error::MethodNotFound);
    ASSERT_TRUE(err.data.has_value());
    EXPECT_EQ((*err.data)["tool"], "teleport");
}

TEST_F(ExecutorTest, ValidationBeforeInvocation) {
    auto err = expect_error(nlohmann::json{{"name", "echo"}, {"arguments", nlohmann::json::object()}});
    EXPECT_EQ(err.code, error::InvalidParams);
    ASSERT_TRUE(err.data.has_value());
    EXPECT_EQ((*err.data)["field"], "text");

    err = expect_error(nlohmann::json{{"name", "echo"}, {"arguments", {{"text", 7}}}});
    EXPECT_EQ(err.code, error::InvalidParams);
    EXPECT_EQ((*err.data)["actual"], "integer");
}

TEST_F(ExecutorTest, AbsentArgumentsTreatedAsEmpty) {
    auto err = expect_error(nlohmann::json{{"name", "echo"}});
    EXPECT_EQ(err.code, error::InvalidParams);

    auto result = executor.call(nlohmann::json{{"name", "flaky"}, {"arguments", nullptr}});
    ASSERT_TRUE(std::holds_alternative<JsonRpcError>(result));
    EXPECT_EQ(std::get<JsonRpcError>(result).code, error::ToolExecutionFailed);
}

TEST_F(ExecutorTest, NonObjectArgumentsRejected) {
    auto err = expect_error(nlohmann::json{{"name", "echo"}, {"arguments", "hello"}});
    EXPECT_EQ(err.code, error::InvalidParams);
}

TEST_F(ExecutorTest, ThrowingHandlerIsContained) {
    auto err = expect_error(nlohmann::json{{"name", "boom"}});
    EXPECT_EQ(err.code, error::InternalError);
    EXPECT_EQ(err.message, "Tool execution failed");
    ASSERT_TRUE(err.data.has_value());
    EXPECT_EQ((*err.data)["tool"], "boom");
    EXPECT_EQ((*err.data)["detail"], "kaboom");

    err = expect_error(nlohmann::json{{"name", "weird"}});
    EXPECT_EQ(err.code, error::InternalError);
}

TEST_F(ExecutorTest, ReportedFailure) {
    auto err = expect_error(nlohmann::json{{"name", "flaky"}});
    EXPECT_EQ(err.code, error::ToolExecutionFailed);
    EXPECT_EQ(err.message, "upstream timed out");
    EXPECT_EQ((*err.data)["tool"], "flaky");
}

TEST_F(ExecutorTest, StillUsableAfterFailures) {
    (void)executor.call(nlohmann::json{{"name", "boom"}});
    (void)executor.call(nlohmann::json{{"name", "teleport"}});
    auto result = executor.call(nlohmann::json{{"name", "echo"}, {"arguments", {{"text", "still here"}}}});
    ASSERT_TRUE(std::holds_alternative<nlohmann::json>(result));
    EXPECT_EQ(std::get<nlohmann::json>(result)["content"][0]["text"], "still here");
}
