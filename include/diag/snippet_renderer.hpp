//! # Snippet Renderer
//!
//! Renders the source excerpt of a diagnostic with a line-number gutter and
//! carets under the offending span:
//!
//! ```text
//!   1 | class A {
//!   2 |   int x
//!     |       ^
//!   3 | }
//! ```
//!
//! ## Window
//!
//! The window starts `context_lines` lines before the line holding the
//! span start and ends `context_lines` lines after the line holding the
//! last character of the span, clamped to the source.
//!
//! ## Carets
//!
//! Carets cover the half-open range `[start, end)`, clamped to each line.
//! A zero-width span renders a single caret at `start`.
//!
//! Rendering is a pure function of its inputs.

#pragma once

#include "diag/diagnostic.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace jig::diag {

struct SnippetOptions {
    size_t context_lines = 2;     ///< Lines shown before and after the span
    size_t min_gutter_width = 3;  ///< Minimum width of the line-number column
};

class SnippetRenderer {
public:
    explicit SnippetRenderer(SnippetOptions options = {});

    const SnippetOptions& options() const {
        return options_;
    }

    /// Renders `source` around `[start, end)`. Returns an empty string when
    /// either offset is missing, `end < start`, or `start` lies beyond the
    /// source.
    ///
    /// Context starts before `reported_line` when it is given, clamped so
    /// the first line of the span is always shown.
    std::string render(std::string_view source, std::optional<size_t> start,
                       std::optional<size_t> end,
                       std::optional<size_t> reported_line = std::nullopt) const;

    /// Renders the span of `diagnostic` over `source`, anchored at its
    /// reported line.
    std::string render(const Diagnostic& diagnostic, std::string_view source) const;

private:
    SnippetOptions options_;
};

/// Reads the text of a diagnostic's source file. Best effort: failures are
/// logged at debug level and yield nullopt.
std::optional<std::string> read_source_text(const Diagnostic& diagnostic);

/// Full failure-report rendering of a traced diagnostic:
///
/// ```text
/// [ERROR] compiler.err.expected Foo.java (at line 2, col 7)
///
/// <snippet>
///
///     ';' expected
/// ```
///
/// The snippet is omitted when no source text or span is available.
std::string format_trace_diagnostic(const TraceDiagnostic& diagnostic,
                                    std::optional<std::string_view> source_text,
                                    const SnippetRenderer& renderer = SnippetRenderer());

/// As above, reading the source text through the diagnostic's file handle.
std::string format_trace_diagnostic(const TraceDiagnostic& diagnostic);

} // namespace jig::diag
