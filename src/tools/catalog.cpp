#include "toolsrv/tools/catalog.hpp"
#include "toolsrv/tools/text_tools.hpp"
#include "toolsrv/config.hpp"
#include <stdexcept>

namespace toolsrv::tools {

ToolRegistry make_registry(std::shared_ptr<WeatherSource> weather_source,
                           const std::string& default_city) {
    ToolRegistry registry;
    for (std::size_t i = 0; i < kToolCount; ++i) {
        const auto id = static_cast<ToolId>(i);
        ToolDescriptor descriptor;
        ToolHandler handler;
        switch (id) {
            case ToolId::Echo:
                descriptor = echo_descriptor();
                handler = echo;
                break;
            case ToolId::Reverse:
                descriptor = reverse_descriptor();
                handler = reverse;
                break;
            case ToolId::Wordcount:
                descriptor = wordcount_descriptor();
                handler = wordcount;
                break;
            case ToolId::Weather:
                descriptor = weather_descriptor(default_city);
                handler = WeatherTool(weather_source, default_city);
                break;
        }
        if (descriptor.name != tool_name(id)) {
            throw std::logic_error("Tool descriptor '" + descriptor.name
                                   + "' registered under the wrong id");
        }
        registry.add(std::move(descriptor), std::move(handler));
    }
    return registry;
}

ToolRegistry make_default_registry(const Config& config) {
    auto source = std::make_shared<HttpWeatherSource>(config.weather_url, config.weather_timeout);
    return make_registry(std::move(source), config.default_city);
}

} // namespace toolsrv::tools
