#include "toolsrv/json_rpc.hpp"
#include "toolsrv/version.hpp"
#include <limits>
#include <stdexcept>

namespace toolsrv {

namespace {

nlohmann::json envelope() {
    return nlohmann::json{{"jsonrpc", std::string(JSONRPC_VERSION)}};
}

} // anonymous namespace

// ----------- RequestId -----------

std::optional<RequestId> parse_request_id(const nlohmann::json& j) {
    if (j.is_string()) return RequestId{j.get<std::string>()};
    if (j.is_number_unsigned()) {
        auto u = j.get<uint64_t>();
        if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return RequestId{static_cast<int64_t>(u)};
        }
        return RequestId{u};
    }
    if (j.is_number_integer()) return RequestId{j.get<int64_t>()};
    if (j.is_number_float()) return RequestId{j.get<double>()};
    return std::nullopt;
}

void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

void from_json(const nlohmann::json& j, RequestId& id) {
    auto parsed = parse_request_id(j);
    if (!parsed) {
        throw std::invalid_argument("Request id must be a string or a number");
    }
    id = std::move(*parsed);
}

// ----------- JsonRpcError -----------

void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data")) e.data = j.at("data");
}

// ----------- Messages -----------

JsonRpcResponse make_error_response(std::optional<RequestId> id, JsonRpcError err) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = std::move(err);
    return resp;
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = envelope();
    to_json(j["id"], r.id);
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = envelope();
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = envelope();
    j["id"] = nullptr;
    if (r.id) to_json(j["id"], *r.id);
    if (r.error) {
        to_json(j["error"], *r.error);
    } else {
        j["result"] = r.result ? *r.result : nlohmann::json::object();
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    const auto& id = j.at("id");
    if (!id.is_null()) {
        RequestId parsed;
        from_json(id, parsed);
        r.id = std::move(parsed);
    }
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) {
        JsonRpcError err;
        from_json(j.at("error"), err);
        r.error = std::move(err);
    }
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

} // namespace toolsrv
