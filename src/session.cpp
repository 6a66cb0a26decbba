#include "toolsrv/session.hpp"
#include "toolsrv/error.hpp"
#include <string>

namespace toolsrv {

std::string_view session_state_name(SessionState s) {
    switch (s) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initialized:   return "initialized";
        case SessionState::ShuttingDown:  return "shutting-down";
    }
    return "unknown";
}

Session::Session() = default;

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<JsonRpcError> Session::admit(std::string_view method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case SessionState::ShuttingDown:
            return JsonRpcError{error::ShuttingDown, "Server is shutting down", std::nullopt};
        case SessionState::Uninitialized:
            if (parse_method(method) != Method::Initialize) {
                return JsonRpcError{
                    error::NotInitialized,
                    "Server not initialized: '" + std::string(method)
                        + "' received before 'initialize'",
                    std::nullopt
                };
            }
            return std::nullopt;
        case SessionState::Initialized:
            return std::nullopt;
    }
    return std::nullopt;
}

bool Session::mark_initialized(const InitializeParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Uninitialized) return false;
    client_info_ = params.client_info;
    client_caps_ = params.capabilities;
    requested_protocol_version_ = params.protocol_version;
    state_ = SessionState::Initialized;
    return true;
}

bool Session::begin_shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::ShuttingDown) return false;
    state_ = SessionState::ShuttingDown;
    return true;
}

std::optional<Implementation> Session::client_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_info_;
}

nlohmann::json Session::client_capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_caps_;
}

std::optional<std::string> Session::requested_protocol_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requested_protocol_version_;
}

} // namespace toolsrv
