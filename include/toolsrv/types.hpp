#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace toolsrv {

// ---------- Content ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

struct CallToolResult {
    std::vector<TextContent> content;
    bool is_error = false;

    bool operator==(const CallToolResult& o) const {
        return content == o.content && is_error == o.is_error;
    }
};

/// Convenience for the common single-text-block result.
CallToolResult text_result(std::string text);

// ---------- Tool schema ----------

enum class ParamType {
    String, Integer, Number, Boolean, Object, Array
};

std::string_view param_type_name(ParamType type);

/// JSON type name of a value as seen by argument validation.
std::string_view json_type_name(const nlohmann::json& value);

struct ParamSpec {
    std::string name;
    ParamType type = ParamType::String;
    bool required = false;
    std::optional<std::string> description;

    bool operator==(const ParamSpec& o) const {
        return name == o.name && type == o.type && required == o.required
               && description == o.description;
    }
};

struct InputSchema {
    std::vector<ParamSpec> params;

    const ParamSpec* find(std::string_view name) const;

    bool operator==(const InputSchema& o) const { return params == o.params; }
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    InputSchema input_schema;

    bool operator==(const ToolDescriptor& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema;
    }
};

// ---------- Handshake ----------

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
    std::optional<nlohmann::json> experimental;

    bool operator==(const ServerCapabilities& o) const {
        return tools == o.tools && experimental == o.experimental;
    }
};

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct InitializeParams {
    std::optional<std::string> protocol_version;
    nlohmann::json capabilities = nlohmann::json::object();
    std::optional<Implementation> client_info;
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;

    bool operator==(const InitializeResult& o) const {
        return protocol_version == o.protocol_version && capabilities == o.capabilities
               && server_info == o.server_info;
    }
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

void to_json(nlohmann::json& j, const InputSchema& s);

void to_json(nlohmann::json& j, const ToolDescriptor& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);
void from_json(const nlohmann::json& j, ServerCapabilities& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void from_json(const nlohmann::json& j, InitializeParams& t);

void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

} // namespace toolsrv
