#include "toolsrv/types.hpp"
#include <stdexcept>

namespace toolsrv {

CallToolResult text_result(std::string text) {
    CallToolResult result;
    result.content.push_back(TextContent{std::move(text)});
    return result;
}

// ---------- ParamType ----------

std::string_view param_type_name(ParamType type) {
    switch (type) {
        case ParamType::String:  return "string";
        case ParamType::Integer: return "integer";
        case ParamType::Number:  return "number";
        case ParamType::Boolean: return "boolean";
        case ParamType::Object:  return "object";
        case ParamType::Array:   return "array";
    }
    return "string";
}

std::string_view json_type_name(const nlohmann::json& value) {
    if (value.is_number_integer()) return "integer";
    if (value.is_number()) return "number";
    if (value.is_string()) return "string";
    if (value.is_boolean()) return "boolean";
    if (value.is_object()) return "object";
    if (value.is_array()) return "array";
    return "null";
}

const ParamSpec* InputSchema::find(std::string_view name) const {
    for (const auto& p : params) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    const std::string type = j.at("type").get<std::string>();
    if (type != "text") {
        throw std::invalid_argument("Unsupported content type: " + type);
    }
    t.text = j.at("text").get<std::string>();
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        j["content"].push_back(c);
    }
    if (t.is_error) j["isError"] = t.is_error;
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    if (j.contains("content")) {
        t.content = j.at("content").get<std::vector<TextContent>>();
    }
    if (j.contains("isError")) t.is_error = j.at("isError").get<bool>();
}

// ---------- InputSchema / ToolDescriptor ----------

void to_json(nlohmann::json& j, const InputSchema& s) {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& p : s.params) {
        nlohmann::json prop = {{"type", std::string(param_type_name(p.type))}};
        if (p.description) prop["description"] = *p.description;
        properties[p.name] = std::move(prop);
        if (p.required) required.push_back(p.name);
    }
    j = {
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)}
    };
}

void to_json(nlohmann::json& j, const ToolDescriptor& t) {
    j = {
        {"name", t.name},
        {"description", t.description},
        {"inputSchema", t.input_schema}
    };
}

// ---------- Capabilities ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
    if (t.experimental) j["experimental"] = *t.experimental;
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    if (j.contains("tools")) t.tools = j.at("tools");
    if (j.contains("experimental")) t.experimental = j.at("experimental");
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.value("version", std::string());
}

void from_json(const nlohmann::json& j, InitializeParams& t) {
    if (j.contains("protocolVersion") && j.at("protocolVersion").is_string()) {
        t.protocol_version = j.at("protocolVersion").get<std::string>();
    }
    if (j.contains("capabilities") && j.at("capabilities").is_object()) {
        t.capabilities = j.at("capabilities");
    }
    if (j.contains("clientInfo") && j.at("clientInfo").is_object()) {
        t.client_info = j.at("clientInfo").get<Implementation>();
    }
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.at("capabilities").get<ServerCapabilities>();
    t.server_info = j.at("serverInfo").get<Implementation>();
}

} // namespace toolsrv
