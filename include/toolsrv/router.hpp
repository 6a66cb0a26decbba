#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "method.hpp"
#include <array>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace toolsrv {

class Session;

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Routes decoded JSON-RPC messages to method handlers, gated by the
/// session's handshake state.
class Router {
public:
    explicit Router(const Session& session);

    /// Register the handler for one of the fixed request methods.
    void on_request(Method method, RequestHandler handler);

    /// Register a notification handler. Unregistered notifications are ignored.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Decode, classify and dispatch one raw frame.
    /// Returns the response to emit, or std::nullopt for notifications and
    /// inbound responses.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch_frame(std::string_view raw);

    /// Dispatch an already classified message.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcMessage& msg);

    [[nodiscard]] bool has_handler(Method method) const;

    /// True once every Method has a handler.
    [[nodiscard]] bool complete() const;

private:
    JsonRpcResponse dispatch_request(const JsonRpcRequest& req);
    void dispatch_notification(const JsonRpcNotification& notif);

    const Session& session_;
    std::array<RequestHandler, kMethodCount> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace toolsrv
