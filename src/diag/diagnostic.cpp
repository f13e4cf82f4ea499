//! # Diagnostics Implementation

#include "diag/diagnostic.hpp"

namespace jig::diag {

const char* diagnostic_kind_name(DiagnosticKind kind) {
    switch (kind) {
    case DiagnosticKind::Error:
        return "ERROR";
    case DiagnosticKind::Warning:
        return "WARNING";
    case DiagnosticKind::MandatoryWarning:
        return "MANDATORY_WARNING";
    case DiagnosticKind::Note:
        return "NOTE";
    case DiagnosticKind::Other:
        return "OTHER";
    }
    return "OTHER";
}

TraceDiagnostic::TraceDiagnostic(Diagnostic diagnostic, int64_t timestamp_nanos,
                                 uint64_t thread_id, std::string thread_name,
                                 std::vector<StackFrame> call_stack)
    : diagnostic_(std::move(diagnostic)), timestamp_nanos_(timestamp_nanos),
      thread_id_(thread_id), thread_name_(std::move(thread_name)),
      call_stack_(std::move(call_stack)) {}

} // namespace jig::diag
