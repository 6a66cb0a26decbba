#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace toolsrv {

/// Opaque correlation id chosen by the host. Numbers keep the
/// representation they arrived in (signed, unsigned beyond INT64_MAX, or
/// fractional) so the echoed id serializes to the same JSON number.
using RequestId = std::variant<int64_t, uint64_t, double, std::string>;

/// The id carried by `j`, or nullopt when `j` is neither a string nor a number.
std::optional<RequestId> parse_request_id(const nlohmann::json& j);

void to_json(nlohmann::json& j, const RequestId& id);

/// Throws std::invalid_argument for anything parse_request_id rejects.
void from_json(const nlohmann::json& j, RequestId& id);

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

void to_json(nlohmann::json& j, const JsonRpcError& e);
void from_json(const nlohmann::json& j, JsonRpcError& e);

/// Inbound call expecting exactly one response with the same id.
struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;
};

struct JsonRpcResponse {
    // Empty when the originating id could not be determined (serialized as null).
    std::optional<RequestId> id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;
};

struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

JsonRpcResponse make_error_response(std::optional<RequestId> id, JsonRpcError err);

// Requests and notifications are only ever decoded by Codec::to_message;
// responses also arrive inbound and are parsed so they can be logged.
void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void to_json(nlohmann::json& j, const JsonRpcNotification& n);
void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

void to_json(nlohmann::json& j, const JsonRpcMessage& m);

} // namespace toolsrv
