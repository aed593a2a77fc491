//! # pypack Logging
//!
//! Structured logging for the packager:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//!   (`scan`, `deps`, `plan`, `backend`, `build`, `assemble`, `cache`, `config`)
//! - Console, file and null sinks
//! - Thread-safe output (workers log concurrently)
//! - Compile-time level elision via PYPACK_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! PYPACK_LOG_INFO("deps", "Resolved " << graph.size() << " units");
//! PYPACK_LOG_DEBUG("backend", "Running " << program);
//! PYPACK_LOG_WARN("assemble", "Banner not applied to " << path);
//! ```

#ifndef PYPACK_LOG_HPP
#define PYPACK_LOG_HPP

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

namespace pypack::log {

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
    Off = 6
};

/// Returns the upper-case name for a log level (e.g., "TRACE", "DEBUG").
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

/// Parses a log level name. Unknown names map to LogLevel::Info.
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

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "deps", "backend")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

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

/// Writes to stderr, colored when stderr is a terminal.
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

/// Appends log lines to a file. Flushes on Error and Fatal.
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

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses specs like "deps=trace,backend=debug,*=warn". A bare module name
/// enables Trace for that module.
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

    /// Lowest level configured for any module, or the default.
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
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Module filter string
    std::string log_file;    ///< Path to log file (empty = no file)
    bool console = true;     ///< Enable stderr output
    bool colors = true;      ///< Enable ANSI colors on stderr
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Auto-initializes with a Warn-level console sink on first use.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink (messages are dropped until one is added).
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
// Timestamp Helpers
// ============================================================================

/// Returns current time formatted as "HH:MM:SS.mmm".
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

/// Renders a record as one line of text or JSON (newline included).
std::string format_record(const LogRecord& record, LogFormat format);

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv, -q
/// from argv. Falls back to the PYPACK_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// True if `arg` is one of the options consumed by parse_log_options().
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef PYPACK_MIN_LOG_LEVEL
#define PYPACK_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific ones.
#define PYPACK_LOG_IMPL(level, module_str, msg)                                                    \
    do {                                                                                           \
        if (static_cast<int>(level) >= PYPACK_MIN_LOG_LEVEL) {                                     \
            auto& logger_ = ::pypack::log::Logger::instance();                                     \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define PYPACK_LOG_TRACE(module, msg) PYPACK_LOG_IMPL(::pypack::log::LogLevel::Trace, module, msg)
#define PYPACK_LOG_DEBUG(module, msg) PYPACK_LOG_IMPL(::pypack::log::LogLevel::Debug, module, msg)
#define PYPACK_LOG_INFO(module, msg) PYPACK_LOG_IMPL(::pypack::log::LogLevel::Info, module, msg)
#define PYPACK_LOG_WARN(module, msg) PYPACK_LOG_IMPL(::pypack::log::LogLevel::Warn, module, msg)
#define PYPACK_LOG_ERROR(module, msg) PYPACK_LOG_IMPL(::pypack::log::LogLevel::Error, module, msg)
#define PYPACK_LOG_FATAL(module, msg) PYPACK_LOG_IMPL(::pypack::log::LogLevel::Fatal, module, msg)

} // namespace pypack::log

#endif // PYPACK_LOG_HPP
