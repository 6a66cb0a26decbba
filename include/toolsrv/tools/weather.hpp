#pragma once
#include "../tool_registry.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace toolsrv::tools {

/// Fetches the raw wttr.in-style JSON report for a city.
class WeatherSource {
public:
    virtual ~WeatherSource() = default;

    /// Throws WeatherError on transport failure, timeout or non-200 status.
    virtual std::string fetch(const std::string& city) = 0;
};

/// One blocking HTTP GET per fetch against `{base_url}/{city}?format=j1`.
/// The connection lives only for the duration of the call, and `timeout`
/// bounds the whole call rather than each socket operation.
class HttpWeatherSource : public WeatherSource {
public:
    /// `base_url` is scheme://host[:port]; https requires OpenSSL support.
    HttpWeatherSource(std::string base_url, std::chrono::milliseconds timeout);

    std::string fetch(const std::string& city) override;

    const std::string& base_url() const { return base_url_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::string base_url_;
    std::chrono::milliseconds timeout_;
};

struct WeatherReport {
    std::string temp_f;
    std::string temp_c;
    std::string condition;
    std::string wind_mph;
    std::string wind_direction;
    std::string humidity;
    std::string visibility;
    std::string feels_like_f;
    std::optional<std::string> today_pattern;
    std::optional<std::string> tomorrow;
};

/// Parse a wttr.in `format=j1` body. Throws WeatherError on malformed
/// JSON or missing current-condition fields.
WeatherReport parse_weather(std::string_view body);

std::string format_weather(const std::string& city, const WeatherReport& report);

/// Percent-encode a path segment (RFC 3986 unreserved characters kept).
std::string url_encode(std::string_view s);

ToolDescriptor weather_descriptor(const std::string& default_city);

class WeatherTool {
public:
    WeatherTool(std::shared_ptr<WeatherSource> source, std::string default_city);

    ToolOutcome operator()(const nlohmann::json& arguments) const;

private:
    std::shared_ptr<WeatherSource> source_;
    std::string default_city_;
};

} // namespace toolsrv::tools
