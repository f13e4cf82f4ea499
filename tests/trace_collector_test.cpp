//! # Diagnostic Trace Collector Tests
//!
//! Ordering under concurrent appends, rejection after close, captured
//! thread and stack context, and logging of recorded diagnostics.

#include "diag/call_context.hpp"
#include "diag/trace_collector.hpp"
#include "log/log.hpp"
#include "vfs/errors.hpp"

#include <gtest/gtest.h>
#include <map>
#include <string>
#include <thread>
#include <vector>

using namespace jig;
using namespace jig::diag;

namespace {

Diagnostic make_diagnostic(DiagnosticKind kind, std::string message) {
    Diagnostic d;
    d.kind = kind;
    d.message = std::move(message);
    d.code = "test.code";
    return d;
}

} // namespace

// ============================================================================
// Recording
// ============================================================================

TEST(TraceCollectorTest, RecordsInOrder) {
    DiagnosticTraceCollector collector;
    collector.record(make_diagnostic(DiagnosticKind::Error, "first"));
    collector.record(make_diagnostic(DiagnosticKind::Warning, "second"));
    collector.record(make_diagnostic(DiagnosticKind::Note, "third"));

    auto log = collector.drain();
    ASSERT_EQ(log.size(), 3u);
    EXPECT_EQ(log[0].message(), "first");
    EXPECT_EQ(log[1].message(), "second");
    EXPECT_EQ(log[2].message(), "third");
    EXPECT_EQ(log[0].code(), "test.code");
    EXPECT_LE(log[0].timestamp_nanos(), log[2].timestamp_nanos());
    EXPECT_EQ(collector.count(DiagnosticKind::Warning), 1u);
    EXPECT_EQ(collector.count(DiagnosticKind::MandatoryWarning), 0u);
}

TEST(TraceCollectorTest, DrainDoesNotConsume) {
    DiagnosticTraceCollector collector;
    collector.record(make_diagnostic(DiagnosticKind::Error, "kept"));

    EXPECT_EQ(collector.drain().size(), 1u);
    EXPECT_EQ(collector.drain().size(), 1u);
    EXPECT_EQ(collector.size(), 1u);
}

TEST(TraceCollectorTest, CapturesCallerContext) {
    DiagnosticTraceCollector collector;
    collector.record(make_diagnostic(DiagnosticKind::Error, "here"));

    auto traced = collector.drain().at(0);
    EXPECT_EQ(traced.thread_id(), current_thread_id());
    EXPECT_FALSE(traced.thread_name().empty());
    EXPECT_FALSE(traced.call_stack().empty());
    EXPECT_LE(traced.call_stack().size(), collector.options().max_stack_depth);
}

TEST(TraceCollectorTest, StackCaptureCanBeDisabled) {
    TraceOptions options;
    options.capture_stack_traces = false;
    DiagnosticTraceCollector collector(options);
    collector.record(make_diagnostic(DiagnosticKind::Note, "quiet"));

    EXPECT_TRUE(collector.drain().at(0).call_stack().empty());
}

TEST(TraceCollectorTest, UsesThreadNameOverride) {
    DiagnosticTraceCollector collector;
    std::thread worker([&] {
        set_current_thread_name("javac-worker-1");
        collector.record(make_diagnostic(DiagnosticKind::Warning, "from worker"));
    });
    worker.join();

    EXPECT_EQ(collector.drain().at(0).thread_name(), "javac-worker-1");
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(TraceCollectorTest, ConcurrentAppendsKeepPerThreadOrder) {
    constexpr int num_threads = 8;
    constexpr int per_thread = 50;

    TraceOptions options;
    options.capture_stack_traces = false;
    DiagnosticTraceCollector collector(options);

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&collector, t] {
            for (int i = 0; i < per_thread; ++i) {
                collector.record(make_diagnostic(DiagnosticKind::Error,
                                                 std::to_string(t) + ":" + std::to_string(i)));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto log = collector.drain();
    ASSERT_EQ(log.size(), static_cast<size_t>(num_threads * per_thread));

    std::map<int, int> next_index;
    std::map<int, uint64_t> thread_of;
    for (const auto& traced : log) {
        const auto& message = traced.message();
        auto colon = message.find(':');
        int t = std::stoi(message.substr(0, colon));
        int i = std::stoi(message.substr(colon + 1));

        EXPECT_EQ(i, next_index[t]) << "out of order for thread " << t;
        next_index[t] = i + 1;

        auto [it, inserted] = thread_of.emplace(t, traced.thread_id());
        if (!inserted) {
            EXPECT_EQ(it->second, traced.thread_id());
        }
    }
    EXPECT_EQ(next_index.size(), static_cast<size_t>(num_threads));
}

// ============================================================================
// Closing
// ============================================================================

TEST(TraceCollectorTest, RejectsAfterClose) {
    DiagnosticTraceCollector collector;
    collector.record(make_diagnostic(DiagnosticKind::Error, "before"));
    collector.close();
    collector.close();

    EXPECT_TRUE(collector.is_closed());
    EXPECT_THROW(collector.record(make_diagnostic(DiagnosticKind::Error, "after")),
                 vfs::UsageError);

    auto log = collector.drain();
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].message(), "before");
}

// ============================================================================
// Logging
// ============================================================================

class TraceCollectorLoggingTest : public ::testing::Test {
protected:
    jig::log::MemorySink* sink = nullptr;

    void SetUp() override {
        jig::log::LogConfig config;
        config.console = false;
        config.level = jig::log::LogLevel::Trace;
        jig::log::Logger::init(config);

        auto memory = std::make_unique<jig::log::MemorySink>();
        sink = memory.get();
        jig::log::Logger::instance().add_sink(std::move(memory));
    }

    void TearDown() override {
        jig::log::LogConfig config;
        config.console = false;
        jig::log::Logger::init(config);
    }
};

TEST_F(TraceCollectorLoggingTest, LogsAtMappedLevels) {
    TraceOptions options;
    options.log_diagnostics = true;
    DiagnosticTraceCollector collector(options);

    collector.record(make_diagnostic(DiagnosticKind::Error, "broken"));
    collector.record(make_diagnostic(DiagnosticKind::MandatoryWarning, "deprecated"));
    collector.record(make_diagnostic(DiagnosticKind::Note, "fyi"));

    std::map<std::string, jig::log::LogLevel> levels;
    for (const auto& entry : sink->entries()) {
        if (entry.module == "diag") {
            levels[entry.message] = entry.level;
        }
    }
    EXPECT_EQ(levels["broken"], jig::log::LogLevel::Error);
    EXPECT_EQ(levels["deprecated"], jig::log::LogLevel::Warn);
    EXPECT_EQ(levels["fyi"], jig::log::LogLevel::Info);
}

TEST_F(TraceCollectorLoggingTest, AppendsStackWhenRequested) {
    TraceOptions options;
    options.log_diagnostics = true;
    options.log_stack_traces = true;
    DiagnosticTraceCollector collector(options);

    collector.record(make_diagnostic(DiagnosticKind::Error, "with stack"));

    EXPECT_EQ(sink->count_containing("with stack\n\tat "), 1u);
}

TEST_F(TraceCollectorLoggingTest, SilentByDefault) {
    DiagnosticTraceCollector collector;
    collector.record(make_diagnostic(DiagnosticKind::Error, "unlogged"));

    EXPECT_EQ(sink->count_containing("unlogged"), 0u);
}

// ============================================================================
// Call Context Helpers
// ============================================================================

TEST(CallContextTest, Demangle) {
    EXPECT_EQ(demangle("_ZN3jig4diag8demangleEPKc"), "jig::diag::demangle(char const*)");
    EXPECT_EQ(demangle("main"), "main");
    EXPECT_EQ(demangle(nullptr), "");
}

TEST(CallContextTest, FormatStackTrace) {
    std::vector<StackFrame> frames = {
        {0x1000, "jig::vfs::Workspace::close()", "/usr/lib/libjig.so", 0x2a},
        {0xbeef, "", "/usr/bin/app", 0x10},
    };

    EXPECT_EQ(format_stack_trace(frames), "\n\tat jig::vfs::Workspace::close()+0x2a (/usr/lib/libjig.so)"
                                          "\n\tat 0xbeef (/usr/bin/app)");
    EXPECT_EQ(format_stack_trace({}), "");
}

TEST(CallContextTest, CaptureRespectsDepth) {
    auto frames = capture_stack_trace(0, 2);
    EXPECT_LE(frames.size(), 2u);
    EXPECT_FALSE(frames.empty());
}
