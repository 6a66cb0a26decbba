#include "toolsrv/log.hpp"
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace toolsrv {

void init_logging(const std::string& level) {
    // stdout carries protocol frames; diagnostics must stay on stderr.
    auto logger = spdlog::get("toolsrv");
    if (!logger) {
        logger = spdlog::stderr_color_mt("toolsrv");
    }
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
    spdlog::flush_on(spdlog::level::warn);
    spdlog::cfg::load_env_levels();
}

} // namespace toolsrv
