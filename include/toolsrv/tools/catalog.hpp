#pragma once
#include "../tool_registry.hpp"
#include "weather.hpp"
#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace toolsrv {
struct Config;
}

namespace toolsrv::tools {

/// The fixed tool set, in listing order.
enum class ToolId {
    Echo,
    Reverse,
    Wordcount,
    Weather,
};

constexpr std::size_t kToolCount = 4;

inline constexpr std::array<std::string_view, kToolCount> kToolNames{{
    "echo", "reverse", "wordcount", "weather"
}};

static_assert(static_cast<std::size_t>(ToolId::Weather) + 1 == kToolCount,
              "kToolNames must name every ToolId");

constexpr std::string_view tool_name(ToolId id) {
    return kToolNames[static_cast<std::size_t>(id)];
}

/// Build the registry with all four tools, using `weather_source` for
/// outbound weather lookups.
ToolRegistry make_registry(std::shared_ptr<WeatherSource> weather_source,
                           const std::string& default_city);

/// Build the registry from configuration (HTTP weather source).
ToolRegistry make_default_registry(const Config& config);

} // namespace toolsrv::tools
