#pragma once
#include <string_view>

namespace toolsrv {

constexpr std::string_view SERVER_NAME         = "frisco-weather-server";
constexpr std::string_view SERVER_VERSION      = "1.0.0";
constexpr std::string_view PROTOCOL_VERSION    = "2024-11-05";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

} // namespace toolsrv
