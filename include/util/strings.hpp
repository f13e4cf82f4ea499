//! # String Helpers
//!
//! Small text utilities used when building failure messages: quoting,
//! worded lists, padding, line lookup and duration formatting.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace jig::util {

/// Wraps `text` in double quotes, escaping backslashes and double quotes.
///
/// `quoted("a\"b")` is `"a\"b"` with the inner quote escaped.
auto quoted(std::string_view text) -> std::string;

/// Joins `words` so that the last pair uses `last_connector`.
///
/// `worded_list({"foo", "bar", "baz"}, ", ", ", or ")` is `"foo, bar, or baz"`.
/// An empty list yields an empty string.
auto worded_list(const std::vector<std::string>& words, std::string_view connector,
                 std::string_view last_connector) -> std::string;

/// Left-pads `content` with `pad` until it is at least `width` characters long.
auto left_pad(std::string_view content, size_t width, char pad = ' ') -> std::string;

/// Index of the first character of the 1-based line `line_number`,
/// or `std::string::npos` when the content has fewer lines.
auto index_of_line(std::string_view content, size_t line_number) -> size_t;

/// Index of the next '\n' at or after `start_at`, or the content length.
auto index_of_end_of_line(std::string_view content, size_t start_at) -> size_t;

/// Formats a nanosecond duration with the largest fitting unit
/// (ns, µs, ms, s) and at most two decimals, e.g. "12.5ms".
auto format_nanos(int64_t nanos) -> std::string;

/// Lower-cases ASCII letters.
auto to_lower(std::string_view text) -> std::string;

/// True if `text` ends with `suffix`, ignoring ASCII case.
auto ends_with_ignore_case(std::string_view text, std::string_view suffix) -> bool;

} // namespace jig::util
