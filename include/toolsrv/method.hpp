#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace toolsrv {

/// The fixed set of request methods the server answers.
enum class Method {
    Initialize,
    ToolsList,
    ToolsCall,
    Shutdown,
};

constexpr std::size_t kMethodCount = 4;

struct MethodName {
    Method method;
    std::string_view name;
};

inline constexpr std::array<MethodName, kMethodCount> kMethodNames{{
    {Method::Initialize, "initialize"},
    {Method::ToolsList,  "tools/list"},
    {Method::ToolsCall,  "tools/call"},
    {Method::Shutdown,   "shutdown"},
}};

constexpr bool method_table_complete() {
    for (std::size_t i = 0; i < kMethodNames.size(); ++i) {
        if (static_cast<std::size_t>(kMethodNames[i].method) != i) return false;
    }
    return static_cast<std::size_t>(Method::Shutdown) + 1 == kMethodCount;
}
static_assert(method_table_complete(), "kMethodNames must list every Method in declaration order");

constexpr std::string_view method_name(Method m) {
    return kMethodNames[static_cast<std::size_t>(m)].name;
}

constexpr std::optional<Method> parse_method(std::string_view name) {
    for (const auto& entry : kMethodNames) {
        if (entry.name == name) return entry.method;
    }
    return std::nullopt;
}

} // namespace toolsrv
