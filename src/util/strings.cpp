//! # String Helpers Implementation

#include "util/strings.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace jig::util {

auto quoted(std::string_view text) -> std::string {
    std::string result;
    result.reserve(text.size() + 2);
    result += '"';
    for (char c : text) {
        switch (c) {
        case '\\':
            result += "\\\\";
            break;
        case '"':
            result += "\\\"";
            break;
        default:
            result += c;
        }
    }
    result += '"';
    return result;
}

auto worded_list(const std::vector<std::string>& words, std::string_view connector,
                 std::string_view last_connector) -> std::string {
    if (words.empty()) {
        return "";
    }

    std::string result = words.front();
    for (size_t i = 1; i < words.size(); ++i) {
        result += (i + 1 == words.size()) ? last_connector : connector;
        result += words[i];
    }
    return result;
}

auto left_pad(std::string_view content, size_t width, char pad) -> std::string {
    if (content.size() >= width) {
        return std::string(content);
    }
    std::string result(width - content.size(), pad);
    result += content;
    return result;
}

auto index_of_line(std::string_view content, size_t line_number) -> size_t {
    if (line_number == 0) {
        return std::string::npos;
    }

    size_t current_line = 1;
    size_t index = 0;
    for (; current_line < line_number && index < content.size(); ++index) {
        if (content[index] == '\n') {
            ++current_line;
        }
    }

    return current_line == line_number ? index : std::string::npos;
}

auto index_of_end_of_line(std::string_view content, size_t start_at) -> size_t {
    auto index = content.find('\n', start_at);
    return index == std::string_view::npos ? content.size() : index;
}

auto format_nanos(int64_t nanos) -> std::string {
    static constexpr std::array<const char*, 4> units = {"ns", "\xC2\xB5s", "ms", "s"};

    double value = static_cast<double>(nanos);
    size_t unit = 0;
    for (; std::fabs(value) >= 1000.0 && unit < units.size() - 1; ++unit) {
        // Each step rounds half-up to two decimals.
        value = std::round(value / 1000.0 * 100.0) / 100.0;
    }

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    std::string text(buffer);
    while (!text.empty() && text.back() == '0') {
        text.pop_back();
    }
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text + units[unit];
}

auto to_lower(std::string_view text) -> std::string {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto ends_with_ignore_case(std::string_view text, std::string_view suffix) -> bool {
    if (suffix.size() > text.size()) {
        return false;
    }
    return to_lower(text.substr(text.size() - suffix.size())) == to_lower(suffix);
}

} // namespace jig::util
