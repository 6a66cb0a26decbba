#include "toolsrv/tool_registry.hpp"
#include <stdexcept>

namespace toolsrv {

void ToolRegistry::add(ToolDescriptor descriptor, ToolHandler handler) {
    if (descriptor.name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool '" + descriptor.name + "' has no handler");
    }
    if (index_.count(descriptor.name) > 0) {
        throw std::invalid_argument("Duplicate tool name: " + descriptor.name);
    }
    index_.emplace(descriptor.name, entries_.size());
    descriptors_.push_back(descriptor);
    entries_.push_back(Entry{std::move(descriptor), std::move(handler)});
}

nlohmann::json ToolRegistry::list_json() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& d : descriptors_) {
        tools.push_back(d);
    }
    return nlohmann::json{{"tools", std::move(tools)}};
}

const ToolRegistry::Entry* ToolRegistry::lookup(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) return nullptr;
    return &entries_[it->second];
}

} // namespace toolsrv
