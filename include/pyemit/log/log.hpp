//! # pyemit Logging
//!
//! Module-tagged structured logging shared by every pyemit component.
//!
//! - Six severities (Trace, Debug, Info, Warn, Error, Fatal) plus Off
//! - Per-module filtering (`"printer=trace,emit=debug,*=warn"`)
//! - Console, file, null and fan-out sinks
//! - Thread-safe dispatch; independent compilation units may log concurrently
//! - Compile-time elision via `PYEMIT_MIN_LOG_LEVEL`
//!
//! ## Usage
//!
//! ```cpp
//! PYEMIT_LOG_DEBUG("driver", "Flushed declaration " << index);
//! PYEMIT_LOG_WARN("diag", code << ": " << message);
//! ```
//!
//! Module tags in use: `driver`, `printer`, `emit`, `builder`, `diag`,
//! `sourcemap`.

#ifndef PYEMIT_LOG_HPP
#define PYEMIT_LOG_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pyemit::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Severities in ascending order. A minimum level filters out everything below it.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a level name in lower or upper case. Unknown names map to Info.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN" || s == "warning")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "fatal" || s == "FATAL")
        return LogLevel::Fatal;
    if (s == "off" || s == "OFF")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

struct LogRecord {
    LogLevel level;          ///< Severity
    std::string_view module; ///< Component tag (e.g. "printer")
    std::string message;     ///< Formatted message text
    const char* file;        ///< __FILE__ of the call site
    int line;                ///< __LINE__ of the call site
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One JSON object per line
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Destination for log records.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, coloured when stderr is a capable terminal.
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

    const char* level_color(LogLevel level) const;
};

/// Appends to a file. Error and Fatal records are flushed immediately.
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

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Fans records out to several child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

/// Renders a record as a single text line (no trailing newline).
std::string format_text(const LogRecord& record);

/// Renders a record as a single JSON object (no trailing newline).
std::string format_json(const LogRecord& record);

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module level filter.
///
/// Spec strings are comma separated `module=level` pairs; `*=level` sets the
/// default and a bare module name enables Trace for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level accepted by any module; used for the fast-path check.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter spec
    std::string log_file;               ///< Log file path (empty = none)
    bool console = true;                ///< Log to stderr
    bool colors = true;                 ///< ANSI colours on stderr
};

/// Process-wide logger. Auto-initialises with a Warn-level console sink.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check the macros run before building the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink; records are dropped until a sink is added.
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    std::atomic<LogLevel> level_{LogLevel::Warn};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Time Helpers
// ============================================================================

/// Current local time as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Configuration
// ============================================================================

/// Builds a LogConfig from command-line style arguments.
///
/// Recognises `--log-level=`, `--log-filter=`, `--log-file=`,
/// `--log-format=text|json`, `-v`/`-vv`/`-vvv`, `--verbose`, `-q`/`--quiet`.
/// Falls back to the `PYEMIT_LOG` environment variable when neither a level
/// nor a filter was given.
LogConfig parse_log_options(int argc, const char* const argv[]);

// ============================================================================
// Logging Macros
// ============================================================================

// 0=Trace .. 6=Off. Calls below this level compile to nothing.
#ifndef PYEMIT_MIN_LOG_LEVEL
#define PYEMIT_MIN_LOG_LEVEL 0
#endif

#define PYEMIT_LOG_IMPL(level, module_str, msg)                                                    \
    do {                                                                                           \
        if (static_cast<int>(level) >= PYEMIT_MIN_LOG_LEVEL) {                                     \
            auto& logger_ = ::pyemit::log::Logger::instance();                                     \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define PYEMIT_LOG_TRACE(module, msg) PYEMIT_LOG_IMPL(::pyemit::log::LogLevel::Trace, module, msg)
#define PYEMIT_LOG_DEBUG(module, msg) PYEMIT_LOG_IMPL(::pyemit::log::LogLevel::Debug, module, msg)
#define PYEMIT_LOG_INFO(module, msg) PYEMIT_LOG_IMPL(::pyemit::log::LogLevel::Info, module, msg)
#define PYEMIT_LOG_WARN(module, msg) PYEMIT_LOG_IMPL(::pyemit::log::LogLevel::Warn, module, msg)
#define PYEMIT_LOG_ERROR(module, msg) PYEMIT_LOG_IMPL(::pyemit::log::LogLevel::Error, module, msg)
#define PYEMIT_LOG_FATAL(module, msg) PYEMIT_LOG_IMPL(::pyemit::log::LogLevel::Fatal, module, msg)

} // namespace pyemit::log

#endif // PYEMIT_LOG_HPP
