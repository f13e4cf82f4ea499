//! # Diagnostics
//!
//! The data a hosted compilation reports (`Diagnostic`) and the traced,
//! immutable record the collector keeps for it (`TraceDiagnostic`).
//!
//! Offsets are 0-based byte offsets into the source; `line` and `column`
//! are 1-based. A missing value is represented by `std::nullopt`.

#pragma once

#include "vfs/file_handle.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace jig::diag {

enum class DiagnosticKind {
    Error,
    Warning,
    MandatoryWarning,
    Note,
    Other,
};

/// Returns "ERROR", "WARNING", "MANDATORY_WARNING", "NOTE" or "OTHER".
const char* diagnostic_kind_name(DiagnosticKind kind);

/// A diagnostic as reported by a compilation step.
struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::Other;
    std::optional<vfs::FileHandle> source; ///< File the diagnostic refers to
    std::optional<size_t> position;        ///< Offset of the reported position
    std::optional<size_t> start;           ///< Offset of the first character of the span
    std::optional<size_t> end;             ///< Offset one past the last character
    std::optional<size_t> line;            ///< 1-based line of `position`
    std::optional<size_t> column;          ///< 1-based column of `position`
    std::string message;
    std::string code; ///< Compiler-specific code, e.g. "compiler.err.expected"
};

/// One frame of a captured call stack.
struct StackFrame {
    uintptr_t address = 0; ///< Return address
    std::string symbol;    ///< Demangled symbol, empty if unknown
    std::string module;    ///< Shared object or executable containing the frame
    uintptr_t offset = 0;  ///< Offset from the symbol (or module) start
};

/// A diagnostic together with when, where and from which thread it was
/// reported. Immutable once created.
class TraceDiagnostic {
public:
    TraceDiagnostic(Diagnostic diagnostic, int64_t timestamp_nanos, uint64_t thread_id,
                    std::string thread_name, std::vector<StackFrame> call_stack);

    const Diagnostic& diagnostic() const {
        return diagnostic_;
    }

    DiagnosticKind kind() const {
        return diagnostic_.kind;
    }

    const std::string& message() const {
        return diagnostic_.message;
    }

    const std::string& code() const {
        return diagnostic_.code;
    }

    const std::optional<vfs::FileHandle>& source() const {
        return diagnostic_.source;
    }

    /// Nanoseconds since the epoch at capture time.
    int64_t timestamp_nanos() const {
        return timestamp_nanos_;
    }

    uint64_t thread_id() const {
        return thread_id_;
    }

    const std::string& thread_name() const {
        return thread_name_;
    }

    const std::vector<StackFrame>& call_stack() const {
        return call_stack_;
    }

private:
    Diagnostic diagnostic_;
    int64_t timestamp_nanos_;
    uint64_t thread_id_;
    std::string thread_name_;
    std::vector<StackFrame> call_stack_;
};

} // namespace jig::diag
