#pragma once
#include <chrono>
#include <functional>
#include <string>

namespace toolsrv {

struct Config {
    std::string weather_url = "https://wttr.in";
    std::chrono::milliseconds weather_timeout{5000};
    std::string default_city = "Frisco, Colorado";
    std::chrono::milliseconds grace_period{3000};
    std::string log_level = "info";
};

/// Returns the value of an environment variable, or nullptr when unset.
using EnvLookup = std::function<const char*(const char* name)>;

/// Load configuration from TOOLSRV_* environment variables on top of the
/// defaults. Throws ConfigError on malformed values.
Config load_config();
Config load_config(const EnvLookup& getenv);

} // namespace toolsrv
