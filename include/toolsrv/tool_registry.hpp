#pragma once
#include "types.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace toolsrv {

/// A failure the tool itself reports (bad upstream status, timeout, ...).
struct ToolFailure {
    std::string message;

    bool operator==(const ToolFailure& o) const { return message == o.message; }
};

using ToolOutcome = std::variant<CallToolResult, ToolFailure>;
using ToolHandler = std::function<ToolOutcome(const nlohmann::json& arguments)>;

/// Ordered catalogue of tools. Built once at startup; registration order
/// is the listing order.
class ToolRegistry {
public:
    struct Entry {
        ToolDescriptor descriptor;
        ToolHandler handler;
    };

    /// Throws std::invalid_argument on a duplicate or empty name, or a null handler.
    void add(ToolDescriptor descriptor, ToolHandler handler);

    [[nodiscard]] const std::vector<ToolDescriptor>& list_tools() const { return descriptors_; }

    /// `{"tools": [...]}` payload for tools/list.
    [[nodiscard]] nlohmann::json list_json() const;

    /// Exact-name lookup; nullptr for an unknown tool.
    [[nodiscard]] const Entry* lookup(std::string_view name) const;

    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::vector<Entry> entries_;
    std::vector<ToolDescriptor> descriptors_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace toolsrv
