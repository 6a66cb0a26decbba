#include "toolsrv/server.hpp"
#include "toolsrv/error.hpp"
#include "toolsrv/executor.hpp"
#include "toolsrv/router.hpp"
#include "toolsrv/session.hpp"
#include "toolsrv/shutdown.hpp"
#include "toolsrv/version.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace toolsrv {

// ----------- Server::Impl -----------

struct Server::Impl {
    Options opts;
    ToolRegistry registry;
    Session session;
    Router router;
    ToolExecutor executor;
    ShutdownController shutdown;
    nlohmann::json initialize_result;

    Impl(Options o, ToolRegistry r)
        : opts(std::move(o)),
          registry(std::move(r)),
          router(session),
          executor(registry),
          shutdown(session, opts.grace_period) {
        InitializeResult result;
        result.protocol_version = opts.protocol_version;
        result.capabilities.tools = nlohmann::json::object();
        result.server_info = opts.server_info;
        to_json(initialize_result, result);
    }

    void setup_handlers() {
        // initialize
        router.on_request(Method::Initialize, [this](const nlohmann::json& params) -> HandlerResult {
            InitializeParams init;
            try {
                from_json(params, init);
            } catch (const nlohmann::json::exception& e) {
                return JsonRpcError{error::InvalidParams,
                                    std::string("Invalid initialize params: ") + e.what(),
                                    std::nullopt};
            }
            if (session.mark_initialized(init)) {
                spdlog::info("Initialized by {} {} (protocol {})",
                             init.client_info ? init.client_info->name : "unknown client",
                             init.client_info ? init.client_info->version : "",
                             init.protocol_version.value_or("unspecified"));
            } else {
                spdlog::debug("Repeated initialize; returning the same metadata");
            }
            return initialize_result;
        });

        // tools/list
        router.on_request(Method::ToolsList, [this](const nlohmann::json&) -> HandlerResult {
            return registry.list_json();
        });

        // tools/call
        router.on_request(Method::ToolsCall, [this](const nlohmann::json& params) -> HandlerResult {
            auto guard = shutdown.begin_call();
            return executor.call(params);
        });

        // shutdown
        router.on_request(Method::Shutdown, [this](const nlohmann::json&) -> HandlerResult {
            shutdown.request_shutdown(ShutdownReason::Request);
            return nlohmann::json::object();
        });

        router.on_notification("notifications/initialized", [](const nlohmann::json&) {
            spdlog::debug("Client reported initialization complete");
        });

        // Requests are processed one at a time, so there is never anything to cancel.
        router.on_notification("notifications/cancelled", [](const nlohmann::json& params) {
            spdlog::info("Cancellation for request {} ignored: no request is in progress",
                         params.contains("requestId") ? params.at("requestId").dump() : "?");
        });

        if (!router.complete()) {
            throw std::logic_error("Router is missing a request handler");
        }
    }
};

// ----------- Server -----------

Server::Options Server::default_options() {
    Options opts;
    opts.server_info = Implementation{std::string(SERVER_NAME), std::string(SERVER_VERSION)};
    opts.protocol_version = std::string(PROTOCOL_VERSION);
    return opts;
}

Server::Server(Options opts, ToolRegistry registry)
    : impl_(std::make_unique<Impl>(std::move(opts), std::move(registry))) {
    impl_->setup_handlers();
}

Server::~Server() = default;

std::optional<JsonRpcResponse> Server::handle_frame(std::string_view raw) {
    return impl_->router.dispatch_frame(raw);
}

int Server::serve(ITransport& transport) {
    auto& shutdown = impl_->shutdown;
    shutdown.attach(&transport);
    spdlog::info("{} {} serving {} tools", impl_->opts.server_info.name,
                 impl_->opts.server_info.version, impl_->registry.size());

    int status = exit_code::Ok;
    try {
        while (!shutdown.requested()) {
            auto frame = transport.read_message();
            if (!frame) {
                if (!shutdown.requested()) {
                    shutdown.request_shutdown(ShutdownReason::EndOfInput);
                }
                break;
            }
            auto response = handle_frame(*frame);
            if (response) {
                transport.write_message(*response);
            }
        }
        if (!transport.flush(impl_->opts.grace_period)) {
            spdlog::warn("Output still blocked after {} ms", impl_->opts.grace_period.count());
        }
    } catch (const TransportError& e) {
        spdlog::critical("Transport failure: {}", e.what());
        shutdown.request_shutdown(ShutdownReason::Fatal);
        status = exit_code::Fatal;
    }

    shutdown.attach(nullptr);
    spdlog::info("Server stopped ({})", shutdown_reason_name(shutdown.reason()));
    return status;
}

ShutdownController& Server::shutdown_controller() {
    return impl_->shutdown;
}

const Session& Server::session() const {
    return impl_->session;
}

const ToolRegistry& Server::registry() const {
    return impl_->registry;
}

} // namespace toolsrv
