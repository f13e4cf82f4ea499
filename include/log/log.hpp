//! # jig Logging
//!
//! Structured, module-tagged logging used by the workspace and the
//! diagnostic pipeline:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Per-module filtering ("vfs=debug,diag=trace,*=warn")
//! - Console, file and in-memory sinks
//! - Thread-safe dispatch
//! - Compile-time level elision via JIG_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! JIG_LOG_DEBUG("vfs", "Resolved " << path << " in " << container.name());
//! JIG_LOG_WARN("archive", "Skipping encrypted entry " << entry);
//! ```
//!
//! Module tags used by the library: `vfs`, `output`, `archive`, `diag`.

#ifndef JIG_LOG_HPP
#define JIG_LOG_HPP

#include <atomic>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

namespace jig::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Severities, ordered so that `a < b` means `a` is more verbose.
enum class LogLevel : int {
    Trace = 0, ///< Per-lookup detail (class fetches, skipped entries)
    Debug = 1, ///< Container, group and output lifecycle
    Info = 2,
    Warn = 3,  ///< Degraded results such as empty module roots
    Error = 4, ///< Failures swallowed by destructors
    Fatal = 5,
    Off = 6
};

/// Returns the upper-case name for a log level (e.g., "TRACE", "DEBUG").
const char* level_name(LogLevel level);

/// Parses a log level name (case-insensitive).
/// Returns LogLevel::Info if the string is not recognized.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// One emitted message. `module` points at a string literal tag.
struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms;
    std::thread::id thread;
};

/// Selected by JIG_LOG_FORMAT.
enum class LogFormat {
    Text, ///< "HH:MM:SS.mmm LEVEL [module] message"
    JSON  ///< {"ts":..,"level":..,"module":..,"msg":..} per line
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Destination for records. Calls are serialized by the Logger.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr with optional ANSI colors.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends to a file. Flushes on Error and Fatal.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Keeps every record in memory so a test harness can assert on log output.
class MemorySink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    void write(const LogRecord& record) override;
    void flush() override {}

    /// Snapshot of the records written so far.
    std::vector<Entry> entries() const;

    /// Number of records whose message contains `needle`.
    size_t count_containing(std::string_view needle) const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "vfs=trace,archive=debug,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Format: "module1=level,module2=level,*=default_level".
    /// A module name without "=level" enables Trace for that module.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured for any module or the default.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Everything `Logger::init` needs. The defaults log warnings and above
/// to stderr.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Overrides `level` per module when set
    std::string log_file;    ///< Extra file sink, appended to
    bool console = true;
    bool colors = true; ///< Only honoured when stderr is a terminal
};

/// Builds a LogConfig from the JIG_LOG and JIG_LOG_FILE environment variables.
///
/// JIG_LOG is either a level name ("debug") or a filter spec
/// ("vfs=debug,*=warn"). JIG_LOG_FORMAT=json selects JSON output.
LogConfig config_from_env();

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Uses `config_from_env()` on first access unless `Logger::init()` is
/// called explicitly.
class Logger {
public:
    /// Replace the configuration and sinks of the global logger.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    void set_level(LogLevel level);

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    void configure(const LogConfig& config);

    std::atomic<LogLevel> level_{LogLevel::Warn};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Returns milliseconds since epoch.
int64_t epoch_ms();

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef JIG_MIN_LOG_LEVEL
#define JIG_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific macros below.
#define JIG_LOG_IMPL(level, module_str, msg)                                                       \
    do {                                                                                           \
        if (static_cast<int>(level) >= JIG_MIN_LOG_LEVEL) {                                        \
            auto& logger_ = ::jig::log::Logger::instance();                                        \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: JIG_LOG_TRACE("module", "message " << value);
#define JIG_LOG_TRACE(module, msg) JIG_LOG_IMPL(::jig::log::LogLevel::Trace, module, msg)
#define JIG_LOG_DEBUG(module, msg) JIG_LOG_IMPL(::jig::log::LogLevel::Debug, module, msg)
#define JIG_LOG_INFO(module, msg) JIG_LOG_IMPL(::jig::log::LogLevel::Info, module, msg)
#define JIG_LOG_WARN(module, msg) JIG_LOG_IMPL(::jig::log::LogLevel::Warn, module, msg)
#define JIG_LOG_ERROR(module, msg) JIG_LOG_IMPL(::jig::log::LogLevel::Error, module, msg)
#define JIG_LOG_FATAL(module, msg) JIG_LOG_IMPL(::jig::log::LogLevel::Fatal, module, msg)

} // namespace jig::log

#endif // JIG_LOG_HPP
