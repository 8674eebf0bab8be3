//! # todo Logging
//!
//! Diagnostic logging for the `todo` tool, kept separate from the messages
//! the commands print for the user on stdout.
//!
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages with per-module filtering
//! - Console (stderr), file and null sinks
//! - Text or JSON-lines output
//! - Compile-time level elision via TODO_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! TODO_LOG_DEBUG("storage", "Loaded " << list.size() << " items from " << path);
//! TODO_LOG_INFO("complete", "No open item with id " << id);
//! ```

#ifndef TODO_LOG_HPP
#define TODO_LOG_HPP

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

namespace todo::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6 ///< Disables all logging
};

/// Returns the upper-case name of a level (e.g. "DEBUG").
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

/// Parses a level name, ignoring case. Unknown names yield LogLevel::Info.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "storage", "cli")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One JSON object per line
};

/// Renders a record as a single line without the trailing newline.
std::string format_record(const LogRecord& record, LogFormat format);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr (or another stream), with ANSI colors when the
/// destination is a color-capable terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    ConsoleSink(std::ostream& out, bool use_colors);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ostream& out_;
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends log lines to a file. Flushes after every Error and Fatal record.
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

/// Discards all messages.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter built from specs like "storage=debug,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Parses "module=level" pairs separated by commas. `*` sets the default
    /// level; a bare module name enables everything for that module.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level any module (or the default) accepts.
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

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

/// Process-wide logger. Safe to call from any thread.
///
/// Logs through a default console sink at Warn until `init()` is called.
class Logger {
public:
    /// Replaces sinks, level and filter according to `config`.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Cheap check used by the macros before the message is formatted.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink. Subsequent records are dropped until one is added.
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
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

/// Milliseconds since epoch (for LogRecord timestamps).
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts logging options from argv: --log-level=, --log-filter=,
/// --log-file=, --log-format=, -q/--quiet. Falls back to the TODO_LOG
/// environment variable when none of them is given.
///
/// `-v`/`--verbose` are deliberately not logging flags: `todo list` owns them.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns `true` for arguments consumed by parse_log_options().
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef TODO_MIN_LOG_LEVEL
#define TODO_MIN_LOG_LEVEL 0
#endif

/// Internal macro; use the level-specific macros below.
#define TODO_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= TODO_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::todo::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define TODO_LOG_TRACE(module, msg) TODO_LOG_IMPL(::todo::log::LogLevel::Trace, module, msg)
#define TODO_LOG_DEBUG(module, msg) TODO_LOG_IMPL(::todo::log::LogLevel::Debug, module, msg)
#define TODO_LOG_INFO(module, msg) TODO_LOG_IMPL(::todo::log::LogLevel::Info, module, msg)
#define TODO_LOG_WARN(module, msg) TODO_LOG_IMPL(::todo::log::LogLevel::Warn, module, msg)
#define TODO_LOG_ERROR(module, msg) TODO_LOG_IMPL(::todo::log::LogLevel::Error, module, msg)
#define TODO_LOG_FATAL(module, msg) TODO_LOG_IMPL(::todo::log::LogLevel::Fatal, module, msg)

} // namespace todo::log

#endif // TODO_LOG_HPP
