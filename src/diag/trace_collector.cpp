//! # Diagnostic Trace Collector Implementation

#include "diag/trace_collector.hpp"

#include "diag/call_context.hpp"
#include "log/log.hpp"
#include "vfs/errors.hpp"

#include <algorithm>
#include <chrono>

namespace jig::diag {

namespace {

log::LogLevel level_for(DiagnosticKind kind) {
    switch (kind) {
    case DiagnosticKind::Error:
        return log::LogLevel::Error;
    case DiagnosticKind::Warning:
    case DiagnosticKind::MandatoryWarning:
        return log::LogLevel::Warn;
    case DiagnosticKind::Note:
    case DiagnosticKind::Other:
        return log::LogLevel::Info;
    }
    return log::LogLevel::Info;
}

int64_t now_nanos() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

DiagnosticTraceCollector::DiagnosticTraceCollector(TraceOptions options) : options_(options) {}

void DiagnosticTraceCollector::record(Diagnostic diagnostic) {
    if (is_closed()) {
        throw vfs::UsageError("cannot record diagnostic after the collector was closed: " +
                              diagnostic.message);
    }

    // Captured on the reporting thread, before taking the lock.
    auto timestamp = now_nanos();
    auto thread_id = current_thread_id();
    auto thread_name = current_thread_name();
    std::vector<StackFrame> stack;
    if (options_.capture_stack_traces) {
        stack = capture_stack_trace(1, options_.max_stack_depth);
    }

    TraceDiagnostic traced(std::move(diagnostic), timestamp, thread_id, std::move(thread_name),
                           std::move(stack));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Re-checked under the lock so nothing is appended after close() returns.
        if (closed_.load(std::memory_order_acquire)) {
            throw vfs::UsageError("cannot record diagnostic after the collector was closed: " +
                                  traced.message());
        }
        log_.push_back(traced);
    }

    if (options_.log_diagnostics) {
        log_diagnostic(traced);
    }
}

void DiagnosticTraceCollector::log_diagnostic(const TraceDiagnostic& traced) const {
    auto level = level_for(traced.kind());
    auto& logger = log::Logger::instance();
    if (!logger.should_log(level, "diag")) {
        return;
    }

    std::string message = traced.message();
    if (options_.log_stack_traces) {
        message += format_stack_trace(traced.call_stack());
    }
    logger.log(level, "diag", message, __FILE__, __LINE__);
}

std::vector<TraceDiagnostic> DiagnosticTraceCollector::drain() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
}

size_t DiagnosticTraceCollector::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_.size();
}

size_t DiagnosticTraceCollector::count(DiagnosticKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(log_.begin(), log_.end(), [kind](const auto& d) {
        return d.kind() == kind;
    }));
}

void DiagnosticTraceCollector::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_.exchange(true, std::memory_order_acq_rel)) {
        JIG_LOG_DEBUG("diag", "Diagnostic collector closed with " << log_.size() << " entries");
    }
}

} // namespace jig::diag
