#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "method.hpp"
#include <mutex>
#include <optional>
#include <string_view>

namespace toolsrv {

enum class SessionState {
    Uninitialized,
    Initialized,
    ShuttingDown
};

std::string_view session_state_name(SessionState s);

/// Handshake state machine for the single connected host.
///
/// Uninitialized -> Initialized on a successful `initialize`;
/// any state -> ShuttingDown on `shutdown` or a termination signal.
/// ShuttingDown is irreversible.
class Session {
public:
    Session();

    SessionState state() const;

    /// Decide whether a request for `method` may be processed in the
    /// current state. Returns the error to answer with when it may not.
    /// Unrecognized names are admitted once initialized so the caller can
    /// report method-not-found.
    [[nodiscard]] std::optional<JsonRpcError> admit(std::string_view method) const;

    /// Apply a successful `initialize`. Returns true on the first
    /// transition, false when already initialized (idempotent repeat).
    bool mark_initialized(const InitializeParams& params);

    /// Enter ShuttingDown. Returns true if this call made the transition.
    bool begin_shutdown();

    std::optional<Implementation> client_info() const;
    nlohmann::json client_capabilities() const;
    std::optional<std::string> requested_protocol_version() const;

private:
    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    std::optional<Implementation> client_info_;
    nlohmann::json client_caps_ = nlohmann::json::object();
    std::optional<std::string> requested_protocol_version_;
};

} // namespace toolsrv
