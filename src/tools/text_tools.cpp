#include "toolsrv/tools/text_tools.hpp"
#include <vector>

namespace toolsrv::tools {

namespace {

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Decode the code point starting at text[i] and advance i past it. A
// malformed sequence yields its lead byte alone.
char32_t next_code_point(std::string_view text, size_t& i) {
    auto lead = static_cast<unsigned char>(text[i++]);
    size_t extra = lead >= 0xF0 ? 3 : lead >= 0xE0 ? 2 : lead >= 0xC0 ? 1 : 0;
    char32_t cp = extra == 3 ? (lead & 0x07) : extra == 2 ? (lead & 0x0F)
                : extra == 1 ? (lead & 0x1F) : lead;
    size_t end = i + extra;
    if (end > text.size()) return lead;
    for (size_t k = i; k < end; ++k) {
        auto c = static_cast<unsigned char>(text[k]);
        if (!is_continuation(c)) return lead;
        cp = (cp << 6) | (c & 0x3F);
    }
    i = end;
    return cp;
}

// Unicode White_Space plus the ASCII separators str.split() breaks on.
bool is_word_space(char32_t cp) {
    if (cp == ' ' || (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x1F)) return true;
    if (cp < 0x85) return false;
    return cp == 0x85 || cp == 0xA0 || cp == 0x1680
        || (cp >= 0x2000 && cp <= 0x200A)
        || cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

InputSchema text_schema(const std::string& description) {
    InputSchema schema;
    schema.params.push_back(ParamSpec{"text", ParamType::String, true, description});
    return schema;
}

} // anonymous namespace

TextStats analyze_text(std::string_view text) {
    TextStats stats;

    bool in_word = false;
    for (size_t i = 0; i < text.size();) {
        char32_t cp = next_code_point(text, i);
        ++stats.characters;
        if (cp != U' ') ++stats.characters_no_spaces;
        if (is_word_space(cp)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++stats.words;
        }
    }

    // "\r\n", "\r" and "\n" each end a line; a final unterminated
    // segment is a line of its own.
    size_t breaks = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            ++breaks;
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else if (text[i] == '\n') {
            ++breaks;
        }
    }
    if (!text.empty()) {
        char last = text.back();
        stats.lines = breaks + ((last == '\n' || last == '\r') ? 0 : 1);
    }
    return stats;
}

std::string format_text_stats(const TextStats& stats) {
    return "Text Analysis:\n"
           "Words: " + std::to_string(stats.words) + "\n"
           "Characters: " + std::to_string(stats.characters) + "\n"
           "Characters (no spaces): " + std::to_string(stats.characters_no_spaces) + "\n"
           "Lines: " + std::to_string(stats.lines);
}

std::string reverse_utf8(std::string_view text) {
    std::vector<std::string_view> code_points;
    code_points.reserve(text.size());
    size_t start = 0;
    for (size_t i = 1; i <= text.size(); ++i) {
        if (i == text.size() || !is_continuation(static_cast<unsigned char>(text[i]))) {
            code_points.push_back(text.substr(start, i - start));
            start = i;
        }
    }

    std::string out;
    out.reserve(text.size());
    for (auto it = code_points.rbegin(); it != code_points.rend(); ++it) {
        out.append(it->data(), it->size());
    }
    return out;
}

ToolDescriptor echo_descriptor() {
    return ToolDescriptor{"echo", "Echo back text", text_schema("Text to echo back")};
}

ToolDescriptor reverse_descriptor() {
    return ToolDescriptor{"reverse", "Reverse the order of characters in text",
                          text_schema("Text to reverse")};
}

ToolDescriptor wordcount_descriptor() {
    return ToolDescriptor{"wordcount", "Count words, characters, and lines in text",
                          text_schema("Text to analyze")};
}

ToolOutcome echo(const nlohmann::json& arguments) {
    return text_result(arguments.at("text").get<std::string>());
}

ToolOutcome reverse(const nlohmann::json& arguments) {
    return text_result(reverse_utf8(arguments.at("text").get<std::string>()));
}

ToolOutcome wordcount(const nlohmann::json& arguments) {
    auto stats = analyze_text(arguments.at("text").get<std::string>());
    return text_result(format_text_stats(stats));
}

} // namespace toolsrv::tools
