//! # Snippet Renderer Implementation

#include "diag/snippet_renderer.hpp"

#include "log/log.hpp"
#include "util/strings.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace jig::diag {

namespace {

constexpr const char* MESSAGE_PADDING = "    ";

/// 1-based line holding `offset`.
size_t line_of(std::string_view source, size_t offset) {
    return 1 + static_cast<size_t>(std::count(source.begin(),
                                              source.begin() + std::min(offset, source.size()),
                                              '\n'));
}

size_t digit_count(size_t number) {
    size_t digits = 1;
    while (number >= 10) {
        number /= 10;
        ++digits;
    }
    return digits;
}

} // namespace

SnippetRenderer::SnippetRenderer(SnippetOptions options) : options_(options) {}

std::string SnippetRenderer::render(std::string_view source, std::optional<size_t> start,
                                    std::optional<size_t> end,
                                    std::optional<size_t> reported_line) const {
    if (!start || !end || *end < *start || *start > source.size()) {
        return "";
    }

    const size_t span_start = *start;
    const size_t span_end = std::min(*end, source.size());
    const size_t last_covered = span_end > span_start ? span_end - 1 : span_start;

    // A trailing newline does not open another line.
    size_t total_lines = line_of(source, source.size());
    if (!source.empty() && source.back() == '\n') {
        --total_lines;
    }

    const size_t first_line = line_of(source, span_start);
    const size_t last_line = line_of(source, last_covered);
    // The window opens at the reported line, never below the span itself.
    const size_t anchor_line =
        reported_line && *reported_line >= 1 ? std::min(*reported_line, first_line) : first_line;
    const size_t window_start =
        anchor_line > options_.context_lines ? anchor_line - options_.context_lines : 1;
    const size_t window_end =
        std::min(last_line + options_.context_lines, std::max(total_lines, last_line));
    const size_t width = std::max(options_.min_gutter_width, digit_count(window_end));

    std::ostringstream out;
    for (size_t line = window_start; line <= window_end; ++line) {
        size_t line_start = util::index_of_line(source, line);
        if (line_start == std::string::npos) {
            break;
        }
        size_t line_end = util::index_of_end_of_line(source, line_start);

        out << std::setw(static_cast<int>(width)) << line << " | "
            << source.substr(line_start, line_end - line_start) << "\n";

        size_t caret_from = std::max(span_start, line_start);
        size_t caret_to = std::min(span_end, line_end);
        bool holds_start = span_start >= line_start && span_start <= line_end;
        if (caret_from >= caret_to) {
            // Zero-width spans, and spans covering only a line break, still get one caret.
            if (!holds_start) {
                continue;
            }
            caret_from = span_start;
            caret_to = span_start + 1;
        }

        out << std::string(width, ' ') << " | " << std::string(caret_from - line_start, ' ')
            << std::string(caret_to - caret_from, '^') << "\n";
    }
    return out.str();
}

std::string SnippetRenderer::render(const Diagnostic& diagnostic, std::string_view source) const {
    return render(source, diagnostic.start, diagnostic.end, diagnostic.line);
}

std::optional<std::string> read_source_text(const Diagnostic& diagnostic) {
    if (!diagnostic.source) {
        return std::nullopt;
    }

    try {
        auto text = diagnostic.source->read_text();
        if (!text) {
            JIG_LOG_DEBUG("diag", "Source " << diagnostic.source->uri() << " no longer exists");
        }
        return text;
    } catch (const std::exception& e) {
        JIG_LOG_DEBUG("diag", "Failed to read source " << diagnostic.source->uri() << ": "
                                                       << e.what());
        return std::nullopt;
    }
}

std::string format_trace_diagnostic(const TraceDiagnostic& diagnostic,
                                    std::optional<std::string_view> source_text,
                                    const SnippetRenderer& renderer) {
    const auto& d = diagnostic.diagnostic();

    std::ostringstream out;
    out << "[" << diagnostic_kind_name(d.kind) << "]";
    if (!d.code.empty()) {
        out << " " << d.code;
    }
    if (d.source) {
        out << " " << d.source->name() << " (at line ";
        if (d.line) {
            out << *d.line;
        } else {
            out << "?";
        }
        out << ", col ";
        if (d.column) {
            out << *d.column;
        } else {
            out << "?";
        }
        out << ")";
    }
    out << "\n\n";

    if (source_text) {
        auto snippet = renderer.render(d, *source_text);
        if (!snippet.empty()) {
            out << snippet << "\n";
        }
    }

    out << MESSAGE_PADDING << d.message;
    return out.str();
}

std::string format_trace_diagnostic(const TraceDiagnostic& diagnostic) {
    auto text = read_source_text(diagnostic.diagnostic());
    if (!text) {
        return format_trace_diagnostic(diagnostic, std::nullopt);
    }
    return format_trace_diagnostic(diagnostic, std::string_view(*text));
}

} // namespace jig::diag
