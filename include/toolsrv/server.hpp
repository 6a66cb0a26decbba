#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "tool_registry.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace toolsrv {

class Session;
class ShutdownController;

/// The tool server: one session, one registry and a strictly sequential
/// read-dispatch-respond loop over a transport.
class Server {
public:
    struct Options {
        Implementation server_info;
        std::string protocol_version;
        std::chrono::milliseconds grace_period{3000};
    };

    /// Options carrying the built-in server identity.
    static Options default_options();

    Server(Options opts, ToolRegistry registry);
    ~Server();

    // Non-copyable, non-movable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Process one raw inbound frame. Returns the response to emit, or
    /// std::nullopt when the frame was a notification or a response.
    [[nodiscard]] std::optional<JsonRpcResponse> handle_frame(std::string_view raw);

    /// Run the loop until shutdown, end of input or a fatal transport
    /// error. Returns the process exit status.
    int serve(ITransport& transport);

    ShutdownController& shutdown_controller();
    const Session& session() const;
    const ToolRegistry& registry() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace toolsrv
