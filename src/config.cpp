#include "toolsrv/config.hpp"
#include "toolsrv/error.hpp"
#include <spdlog/common.h>
#include <cstdlib>
#include <string_view>

namespace toolsrv {

namespace {

std::chrono::milliseconds parse_millis(const char* name, std::string_view value) {
    long long ms = 0;
    size_t pos = 0;
    try {
        ms = std::stoll(std::string(value), &pos);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + ": expected milliseconds, got '" + std::string(value) + "'");
    }
    if (pos != value.size() || ms <= 0) {
        throw ConfigError(std::string(name) + ": expected a positive number of milliseconds, got '"
                          + std::string(value) + "'");
    }
    return std::chrono::milliseconds(ms);
}

} // anonymous namespace

Config load_config() {
    return load_config([](const char* name) -> const char* { return std::getenv(name); });
}

Config load_config(const EnvLookup& getenv) {
    Config config;

    if (const char* v = getenv("TOOLSRV_WEATHER_URL"); v && *v) {
        std::string_view url(v);
        if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
            throw ConfigError("TOOLSRV_WEATHER_URL: expected an http:// or https:// URL, got '"
                              + std::string(url) + "'");
        }
        config.weather_url = v;
    }
    if (const char* v = getenv("TOOLSRV_WEATHER_TIMEOUT_MS"); v && *v) {
        config.weather_timeout = parse_millis("TOOLSRV_WEATHER_TIMEOUT_MS", v);
    }
    if (const char* v = getenv("TOOLSRV_DEFAULT_CITY"); v && *v) {
        config.default_city = v;
    }
    if (const char* v = getenv("TOOLSRV_GRACE_PERIOD_MS"); v && *v) {
        config.grace_period = parse_millis("TOOLSRV_GRACE_PERIOD_MS", v);
    }
    if (const char* v = getenv("TOOLSRV_LOG_LEVEL"); v && *v) {
        std::string level(v);
        if (spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
            throw ConfigError("TOOLSRV_LOG_LEVEL: unknown level '" + level + "'");
        }
        config.log_level = level;
    }
    return config;
}

} // namespace toolsrv
