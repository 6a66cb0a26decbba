#include "toolsrv/executor.hpp"
#include "toolsrv/error.hpp"
#include "toolsrv/schema.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace toolsrv {

namespace {

JsonRpcError execution_fault(const std::string& tool, const std::string& detail) {
    return JsonRpcError{
        error::InternalError,
        "Tool execution failed",
        nlohmann::json{{"tool", tool}, {"detail", detail}}
    };
}

} // anonymous namespace

ToolExecutor::ToolExecutor(const ToolRegistry& registry) : registry_(registry) {}

HandlerResult ToolExecutor::call(const nlohmann::json& params) const {
    if (!params.is_object() || !params.contains("name") || !params.at("name").is_string()) {
        return JsonRpcError{error::InvalidParams, "tools/call requires a string 'name'",
                            nlohmann::json{{"field", "name"}}};
    }
    const std::string name = params.at("name").get<std::string>();

    const auto* entry = registry_.lookup(name);
    if (!entry) {
        spdlog::warn("tools/call: unknown tool '{}'", name);
        return JsonRpcError{error::UnknownTool, "Unknown tool: " + name,
                            nlohmann::json{{"tool", name}}};
    }

    nlohmann::json arguments = nlohmann::json::object();
    if (params.contains("arguments") && !params.at("arguments").is_null()) {
        arguments = params.at("arguments");
    }
    if (auto invalid = validate(entry->descriptor.input_schema, arguments)) {
        spdlog::warn("tools/call {}: {}", name, invalid->message);
        return invalid->to_rpc_error();
    }

    auto started = std::chrono::steady_clock::now();
    ToolOutcome outcome;
    try {
        outcome = entry->handler(arguments);
    } catch (const std::exception& e) {
        spdlog::error("tools/call {}: handler threw: {}", name, e.what());
        return execution_fault(name, e.what());
    } catch (...) {
        spdlog::error("tools/call {}: handler threw a non-standard exception", name);
        return execution_fault(name, "unknown exception");
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (auto* failure = std::get_if<ToolFailure>(&outcome)) {
        spdlog::warn("tools/call {} failed after {} ms: {}", name, elapsed.count(), failure->message);
        return JsonRpcError{error::ToolExecutionFailed, failure->message,
                            nlohmann::json{{"tool", name}}};
    }

    spdlog::debug("tools/call {} completed in {} ms", name, elapsed.count());
    nlohmann::json j;
    to_json(j, std::get<CallToolResult>(outcome));
    return j;
}

} // namespace toolsrv
