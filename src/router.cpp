#include "toolsrv/router.hpp"
#include "toolsrv/codec.hpp"
#include "toolsrv/error.hpp"
#include "toolsrv/session.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace toolsrv {

namespace {

std::string id_to_string(const std::optional<RequestId>& id) {
    if (!id) return "null";
    nlohmann::json j;
    to_json(j, *id);
    return j.dump();
}

} // anonymous namespace

Router::Router(const Session& session) : session_(session) {}

void Router::on_request(Method method, RequestHandler handler) {
    request_handlers_[static_cast<std::size_t>(method)] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(Method method) const {
    return static_cast<bool>(request_handlers_[static_cast<std::size_t>(method)]);
}

bool Router::complete() const {
    return std::all_of(request_handlers_.begin(), request_handlers_.end(),
                       [](const RequestHandler& h) { return static_cast<bool>(h); });
}

std::optional<JsonRpcResponse> Router::dispatch_frame(std::string_view raw) {
    nlohmann::json j;
    try {
        j = Codec::decode(raw);
    } catch (const ParseError& e) {
        spdlog::warn("Rejecting frame: {}", e.what());
        return make_error_response(std::nullopt,
            JsonRpcError{error::ParseError, "Parse error", nlohmann::json{{"detail", e.what()}}});
    }

    JsonRpcMessage msg;
    try {
        msg = Codec::to_message(j);
    } catch (const ProtocolError& e) {
        auto id = Codec::extract_id(j);
        spdlog::warn("Invalid request (id={}): {}", id_to_string(id), e.what());
        return make_error_response(std::move(id), JsonRpcError{e.code, e.what(), std::nullopt});
    }
    return dispatch(msg);
}

std::optional<JsonRpcResponse> Router::dispatch(const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        return dispatch_request(*req);
    } else if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        dispatch_notification(*notif);
        return std::nullopt;
    } else if (const auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
        // The server never issues requests, so nothing is waiting on this.
        spdlog::warn("Dropping unsolicited response (id={})", id_to_string(resp->id));
        return std::nullopt;
    }
    return std::nullopt;
}

JsonRpcResponse Router::dispatch_request(const JsonRpcRequest& req) {
    spdlog::debug("Request {} id={}", req.method, id_to_string(req.id));

    if (auto rejected = session_.admit(req.method)) {
        spdlog::warn("Rejecting '{}' in state {}: {}", req.method,
                     session_state_name(session_.state()), rejected->message);
        return make_error_response(req.id, std::move(*rejected));
    }

    auto method = parse_method(req.method);
    if (!method || !has_handler(*method)) {
        return make_error_response(req.id,
            JsonRpcError{error::MethodNotFound, "Method not found: " + req.method, std::nullopt});
    }

    const auto& handler = request_handlers_[static_cast<std::size_t>(*method)];
    nlohmann::json params = req.params ? *req.params : nlohmann::json::object();

    JsonRpcResponse resp;
    resp.id = req.id;
    try {
        auto result = handler(params);
        if (auto* ok = std::get_if<nlohmann::json>(&result)) {
            resp.result = std::move(*ok);
        } else if (auto* err = std::get_if<JsonRpcError>(&result)) {
            resp.error = std::move(*err);
        }
    } catch (const ProtocolError& e) {
        resp.error = JsonRpcError{e.code, e.what(), std::nullopt};
    } catch (const std::exception& e) {
        spdlog::error("Handler for '{}' failed: {}", req.method, e.what());
        resp.error = JsonRpcError{error::InternalError, e.what(), std::nullopt};
    }
    return resp;
}

void Router::dispatch_notification(const JsonRpcNotification& notif) {
    auto it = notification_handlers_.find(notif.method);
    if (it == notification_handlers_.end()) {
        spdlog::debug("Ignoring notification '{}'", notif.method);
        return;
    }
    nlohmann::json params = notif.params ? *notif.params : nlohmann::json::object();
    try {
        it->second(params);
    } catch (const std::exception& e) {
        // Notifications never produce a response.
        spdlog::warn("Notification handler for '{}' failed: {}", notif.method, e.what());
    }
}

} // namespace toolsrv
