#include "toolsrv/tools/weather.hpp"
#include "toolsrv/error.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace toolsrv::tools {

namespace {

std::string trim(std::string_view s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(begin, end - begin + 1));
}

std::string field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        throw WeatherError(std::string("missing '") + key + "'");
    }
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

// wttr.in nests descriptions as [{"value": "..."}].
std::string description(const nlohmann::json& obj) {
    auto it = obj.find("weatherDesc");
    if (it == obj.end() || !it->is_array() || it->empty()) {
        throw WeatherError("missing 'weatherDesc'");
    }
    return field(it->front(), "value");
}

std::optional<int> to_int(const nlohmann::json& v) {
    if (v.is_number_integer()) return v.get<int>();
    if (!v.is_string()) return std::nullopt;
    try {
        return std::stoi(v.get<std::string>());
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::string> today_pattern(const nlohmann::json& today) {
    auto hourly = today.find("hourly");
    if (hourly == today.end() || !hourly->is_array()) return std::nullopt;

    std::vector<int> temps;
    for (const auto& h : *hourly) {
        if (!h.is_object() || !h.contains("tempF")) continue;
        if (auto t = to_int(h.at("tempF"))) temps.push_back(*t);
    }
    if (temps.empty()) return std::nullopt;

    auto [lo, hi] = std::minmax_element(temps.begin(), temps.end());
    int range = *hi - *lo;
    if (range > 20) {
        return "Variable day: " + std::to_string(*lo) + "°F to " + std::to_string(*hi) + "°F swing";
    }
    if (range > 10) {
        return "Moderate range: " + std::to_string(*lo) + "°F to " + std::to_string(*hi) + "°F";
    }
    return "Steady temps: around " + std::to_string(*hi) + "°F";
}

std::optional<std::string> tomorrow_summary(const nlohmann::json& tomorrow) {
    if (!tomorrow.is_object() || !tomorrow.contains("maxtempF") || !tomorrow.contains("mintempF")) {
        return std::nullopt;
    }
    std::string desc = "Unknown";
    auto hourly = tomorrow.find("hourly");
    if (hourly != tomorrow.end() && hourly->is_array() && !hourly->empty()) {
        try {
            desc = description(hourly->front());
        } catch (const WeatherError&) {
            desc = "Unknown";
        }
    }
    return desc + ", " + field(tomorrow, "mintempF") + "°F to " + field(tomorrow, "maxtempF") + "°F";
}

} // anonymous namespace

// ---------- HttpWeatherSource ----------

HttpWeatherSource::HttpWeatherSource(std::string base_url, std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url)), timeout_(timeout) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string HttpWeatherSource::fetch(const std::string& city) {
    std::unique_ptr<httplib::Client> client;
    try {
        client = std::make_unique<httplib::Client>(base_url_);
    } catch (const std::invalid_argument& e) {
        throw WeatherError("Unsupported weather endpoint " + base_url_ + ": " + e.what());
    }
    if (!client->is_valid()) {
        throw WeatherError("Unsupported weather endpoint: " + base_url_);
    }
    client->set_connection_timeout(timeout_);
    client->set_read_timeout(timeout_);
    client->set_write_timeout(timeout_);
    // The per-phase timeouts above restart on every recv; this caps the whole
    // exchange, redirects included.
    client->set_max_timeout(timeout_);
    client->set_follow_location(true);

    const std::string path = "/" + url_encode(city) + "?format=j1";
    httplib::Headers headers = {
        {"Accept", "application/json"},
        {"User-Agent", "frisco-weather-server/1.0"}
    };

    spdlog::debug("weather: GET {}{}", base_url_, path);
    auto result = client->Get(path, headers);
    if (!result) {
        throw WeatherError("Network error getting weather for " + city + ": "
                           + httplib::to_string(result.error()));
    }
    if (result->status != 200) {
        throw WeatherError("Weather service returned HTTP " + std::to_string(result->status)
                           + " for " + city);
    }
    return result->body;
}

// ---------- Parsing and formatting ----------

WeatherReport parse_weather(std::string_view body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw WeatherError(std::string("invalid response format: ") + e.what());
    }

    auto current_list = j.find("current_condition");
    if (!j.is_object() || current_list == j.end() || !current_list->is_array()
        || current_list->empty()) {
        throw WeatherError("missing 'current_condition'");
    }
    const auto& current = current_list->front();

    WeatherReport report;
    report.temp_f = field(current, "temp_F");
    report.temp_c = field(current, "temp_C");
    report.condition = description(current);
    report.wind_mph = field(current, "windspeedMiles");
    report.wind_direction = current.contains("winddir16Point") ? field(current, "winddir16Point") : "";
    report.humidity = field(current, "humidity");
    report.visibility = current.contains("visibilityMiles") ? field(current, "visibilityMiles")
                                                            : field(current, "visibility");
    report.feels_like_f = current.contains("FeelsLikeF") ? field(current, "FeelsLikeF") : report.temp_f;

    auto days = j.find("weather");
    if (days != j.end() && days->is_array()) {
        if (!days->empty()) report.today_pattern = today_pattern(days->at(0));
        if (days->size() > 1) report.tomorrow = tomorrow_summary(days->at(1));
    }
    return report;
}

std::string format_weather(const std::string& city, const WeatherReport& report) {
    std::string out = "Weather for " + city + ":\n";
    out += "Current: " + report.temp_f + "°F (" + report.temp_c + "°C)\n";
    out += "Condition: " + report.condition + "\n";
    out += "Wind: " + report.wind_mph + " mph";
    if (!report.wind_direction.empty()) out += " from " + report.wind_direction;
    out += "\n";
    out += "Humidity: " + report.humidity + "%\n";
    out += "Visibility: " + report.visibility + " miles\n";
    out += "Feels like: " + report.feels_like_f + "°F";
    if (report.today_pattern || report.tomorrow) out += "\n";
    if (report.today_pattern) out += "\nToday's pattern: " + *report.today_pattern;
    if (report.tomorrow) out += "\nTomorrow: " + *report.tomorrow;
    return out;
}

std::string url_encode(std::string_view s) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

// ---------- WeatherTool ----------

ToolDescriptor weather_descriptor(const std::string& default_city) {
    InputSchema schema;
    schema.params.push_back(ParamSpec{
        "city", ParamType::String, false,
        std::string("City name (e.g., 'Las Vegas' or 'Denver'); defaults to ") + default_city
    });
    return ToolDescriptor{"weather",
                          "Get current weather for a city (defaults to " + default_city + ")",
                          std::move(schema)};
}

WeatherTool::WeatherTool(std::shared_ptr<WeatherSource> source, std::string default_city)
    : source_(std::move(source)), default_city_(std::move(default_city)) {
    if (!source_) throw std::invalid_argument("WeatherTool requires a weather source");
}

ToolOutcome WeatherTool::operator()(const nlohmann::json& arguments) const {
    std::string city;
    auto it = arguments.find("city");
    if (it != arguments.end() && it->is_string()) city = trim(it->get<std::string>());
    if (city.empty()) city = default_city_;

    std::string body;
    try {
        body = source_->fetch(city);
    } catch (const WeatherError& e) {
        return ToolFailure{e.what()};
    }

    try {
        return text_result(format_weather(city, parse_weather(body)));
    } catch (const WeatherError& e) {
        return ToolFailure{"Error parsing weather data for " + city + ": " + e.what()};
    }
}

} // namespace toolsrv::tools
