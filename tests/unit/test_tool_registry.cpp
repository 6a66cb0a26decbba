#include <gtest/gtest.h>
#include "toolsrv/tool_registry.hpp"
#include "toolsrv/tools/catalog.hpp"
#include <stdexcept>

using namespace toolsrv;

namespace {

ToolDescriptor descriptor(const std::string& name) {
    InputSchema schema;
    schema.params.push_back(ParamSpec{"text", ParamType::String, true, std::nullopt});
    return ToolDescriptor{name, "test tool " + name, schema};
}

ToolOutcome ok_handler(const nlohmann::json&) {
    return text_result("ok");
}

class NullWeather : public tools::WeatherSource {
public:
    std::string fetch(const std::string&) override { return "{}"; }
};

} // namespace

TEST(ToolRegistry, PreservesRegistrationOrder) {
    ToolRegistry reg;
    reg.add(descriptor("zeta"), ok_handler);
    reg.add(descriptor("alpha"), ok_handler);
    reg.add(descriptor("mid"), ok_handler);

    ASSERT_EQ(reg.size(), 3u);
    const auto& tools = reg.list_tools();
    EXPECT_EQ(tools[0].name, "zeta");
    EXPECT_EQ(tools[1].name, "alpha");
    EXPECT_EQ(tools[2].name, "mid");
}

TEST(ToolRegistry, LookupExactName) {
    ToolRegistry reg;
    reg.add(descriptor("echo"), ok_handler);

    const auto* entry = reg.lookup("echo");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->descriptor.name, "echo");
    EXPECT_EQ(reg.lookup("Echo"), nullptr);
    EXPECT_EQ(reg.lookup("echo "), nullptr);
    EXPECT_EQ(reg.lookup(""), nullptr);
}

TEST(ToolRegistry, RejectsDuplicatesAndBlanks) {
    ToolRegistry reg;
    reg.add(descriptor("echo"), ok_handler);
    EXPECT_THROW(reg.add(descriptor("echo"), ok_handler), std::invalid_argument);
    EXPECT_THROW(reg.add(descriptor(""), ok_handler), std::invalid_argument);
    EXPECT_THROW(reg.add(descriptor("nohandler"), ToolHandler{}), std::invalid_argument);
    EXPECT_EQ(reg.size(), 1u);
}

TEST(ToolRegistry, ListJsonIsStable) {
    ToolRegistry reg;
    reg.add(descriptor("a"), ok_handler);
    reg.add(descriptor("b"), ok_handler);

    auto first = reg.list_json();
    auto second = reg.list_json();
    EXPECT_EQ(first.dump(), second.dump());
    ASSERT_TRUE(first["tools"].is_array());
    EXPECT_EQ(first["tools"][0]["name"], "a");
    EXPECT_EQ(first["tools"][0]["inputSchema"]["required"][0], "text");
}

TEST(ToolCatalog, FourToolsInOrder) {
    auto reg = tools::make_registry(std::make_shared<NullWeather>(), "Frisco, Colorado");
    ASSERT_EQ(reg.size(), tools::kToolCount);
    const auto& list = reg.list_tools();
    EXPECT_EQ(list[0].name, "echo");
    EXPECT_EQ(list[1].name, "reverse");
    EXPECT_EQ(list[2].name, "wordcount");
    EXPECT_EQ(list[3].name, "weather");
    for (std::size_t i = 0; i < tools::kToolCount; ++i) {
        EXPECT_EQ(list[i].name, tools::tool_name(static_cast<tools::ToolId>(i)));
    }
}

TEST(ToolCatalog, Schemas) {
    auto reg = tools::make_registry(std::make_shared<NullWeather>(), "Frisco, Colorado");
    auto j = reg.list_json();
    for (int i = 0; i < 3; ++i) {
        const auto& schema = j["tools"][i]["inputSchema"];
        EXPECT_EQ(schema["type"], "object");
        EXPECT_EQ(schema["properties"]["text"]["type"], "string");
        EXPECT_EQ(schema["required"], nlohmann::json::array({"text"}));
    }
    const auto& weather = j["tools"][3]["inputSchema"];
    EXPECT_EQ(weather["properties"]["city"]["type"], "string");
    EXPECT_TRUE(weather["required"].empty());
    EXPECT_NE(j["tools"][3]["description"].get<std::string>().find("Frisco, Colorado"),
              std::string::npos);
}
