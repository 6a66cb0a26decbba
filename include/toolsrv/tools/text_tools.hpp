#pragma once
#include "../tool_registry.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace toolsrv::tools {

struct TextStats {
    size_t words = 0;
    size_t characters = 0;
    size_t characters_no_spaces = 0;
    size_t lines = 0;

    bool operator==(const TextStats& o) const {
        return words == o.words && characters == o.characters
               && characters_no_spaces == o.characters_no_spaces && lines == o.lines;
    }
};

/// Word, code point and line counts for UTF-8 text.
TextStats analyze_text(std::string_view text);

std::string format_text_stats(const TextStats& stats);

/// Reverse by code point, keeping multi-byte sequences intact.
std::string reverse_utf8(std::string_view text);

ToolDescriptor echo_descriptor();
ToolDescriptor reverse_descriptor();
ToolDescriptor wordcount_descriptor();

ToolOutcome echo(const nlohmann::json& arguments);
ToolOutcome reverse(const nlohmann::json& arguments);
ToolOutcome wordcount(const nlohmann::json& arguments);

} // namespace toolsrv::tools
