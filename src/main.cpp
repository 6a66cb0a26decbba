/// toolsrv-server: tool server speaking newline-delimited JSON-RPC over stdio.
/// Configuration comes from TOOLSRV_* environment variables; diagnostics
/// go to stderr.

#include <toolsrv/toolsrv.hpp>
#include <spdlog/spdlog.h>
#include <csignal>

int main() {
    // A host that closes its end mid-write must surface as a write error.
    std::signal(SIGPIPE, SIG_IGN);

    toolsrv::Config config;
    try {
        config = toolsrv::load_config();
    } catch (const toolsrv::ConfigError& e) {
        toolsrv::init_logging("info");
        spdlog::critical("Invalid configuration: {}", e.what());
        return toolsrv::exit_code::Fatal;
    }
    toolsrv::init_logging(config.log_level);

    auto opts = toolsrv::Server::default_options();
    opts.grace_period = config.grace_period;

    int status = toolsrv::exit_code::Ok;
    try {
        toolsrv::Server server{opts, toolsrv::tools::make_default_registry(config)};

        // Before any other thread exists, so every thread inherits the mask.
        server.shutdown_controller().watch_signals();

        toolsrv::StdioTransport transport;
        status = server.serve(transport);
    } catch (const toolsrv::Error& e) {
        spdlog::critical("Startup failed: {}", e.what());
        status = toolsrv::exit_code::Fatal;
    }

    spdlog::shutdown();
    return status;
}
