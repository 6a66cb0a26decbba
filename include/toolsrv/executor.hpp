#pragma once
#include "router.hpp"
#include "tool_registry.hpp"

namespace toolsrv {

/// Runs `tools/call`: resolves the tool, validates its arguments, invokes
/// the handler and maps every outcome to a result or a JSON-RPC error.
/// Nothing a handler throws escapes call().
class ToolExecutor {
public:
    explicit ToolExecutor(const ToolRegistry& registry);

    [[nodiscard]] HandlerResult call(const nlohmann::json& params) const;

private:
    const ToolRegistry& registry_;
};

} // namespace toolsrv
