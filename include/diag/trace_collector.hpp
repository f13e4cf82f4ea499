//! # Diagnostic Trace Collector
//!
//! Thread-safe sink for the diagnostics of one compilation run. Each
//! recorded diagnostic is wrapped with the capture time, the reporting
//! thread and (optionally) its call stack, then appended to an ordered log.
//!
//! ## Lifecycle
//!
//! ```text
//! Open --close()--> Closed
//! ```
//!
//! While open, every successful `record` appears exactly once in the log,
//! in the order the appends took the lock. Once closed, `record` throws
//! `vfs::UsageError` and the log never changes again, so `drain()` returns
//! the same snapshot every time.

#pragma once

#include "diag/diagnostic.hpp"

#include <atomic>
#include <mutex>
#include <vector>

namespace jig::diag {

/// Tracing behaviour of a collector.
struct TraceOptions {
    bool log_diagnostics = false;      ///< Log each diagnostic under the "diag" module
    bool capture_stack_traces = true;  ///< Capture the reporting call stack
    bool log_stack_traces = false;     ///< Append the call stack to logged diagnostics
    size_t max_stack_depth = 32;       ///< Frames captured per diagnostic
};

class DiagnosticTraceCollector {
public:
    explicit DiagnosticTraceCollector(TraceOptions options = {});

    DiagnosticTraceCollector(const DiagnosticTraceCollector&) = delete;
    DiagnosticTraceCollector& operator=(const DiagnosticTraceCollector&) = delete;

    const TraceOptions& options() const {
        return options_;
    }

    /// Wraps and appends `diagnostic`. Throws `vfs::UsageError` once closed.
    void record(Diagnostic diagnostic);

    /// Snapshot of the log in append order.
    std::vector<TraceDiagnostic> drain() const;

    size_t size() const;

    /// Number of recorded diagnostics of `kind`.
    size_t count(DiagnosticKind kind) const;

    /// Stops accepting diagnostics. Idempotent.
    void close();

    bool is_closed() const {
        return closed_.load(std::memory_order_acquire);
    }

private:
    void log_diagnostic(const TraceDiagnostic& traced) const;

    TraceOptions options_;

    mutable std::mutex mutex_;
    std::vector<TraceDiagnostic> log_;
    std::atomic<bool> closed_{false};
};

} // namespace jig::diag
