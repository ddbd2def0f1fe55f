#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <unordered_map>
#include <map>
#include <vector>
#include <mutex>
#include <atomic>
#include <thread>
#include <fstream>

namespace liftoff {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

[[nodiscard]] std::string to_string(LogLevel level);

/**
 * @brief Parse a level name (case-insensitive, "WARNING" accepted)
 * @return Parsed level, INFO for unknown names
 */
[[nodiscard]] LogLevel from_string(const std::string& level_str);

/**
 * @brief Output encoding of formatted log lines
 */
enum class LogFormat : int {
    TEXT = 0,   ///< Human-readable single line
    JSON = 1    ///< One JSON object per line
};

[[nodiscard]] std::string to_string(LogFormat format);

// ============================================================================
// Log Message
// ============================================================================

struct LogMessage {
    LogLevel level = LogLevel::INFO;
    std::string component;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id thread_id;

    // Structured fields, ordered for stable output
    std::map<std::string, std::string> fields;

    LogMessage() = default;
    LogMessage(LogLevel lvl, std::string comp, std::string msg,
               std::chrono::system_clock::time_point ts = std::chrono::system_clock::now());
};

// ============================================================================
// Formatters
// ============================================================================

class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogMessage& message) = 0;
};

/**
 * @brief Single-line text layout
 *
 * `2026-01-01T10:00:00.000Z  INFO 4321 --- [component] message {k=v}`
 *
 * The process id column is omitted when no pid was configured.
 */
class TextFormatter : public ILogFormatter {
public:
    explicit TextFormatter(std::string pid = "", bool include_thread_id = false);
    std::string format(const LogMessage& message) override;

private:
    std::string pid_;
    bool include_thread_id_;
};

#ifdef LIFTOFF_HAS_JSON
/**
 * @brief One JSON object per line (timestamp, level, pid, component, message, fields)
 */
class JsonFormatter : public ILogFormatter {
public:
    explicit JsonFormatter(std::string pid = "", bool pretty_print = false);
    std::string format(const LogMessage& message) override;

private:
    std::string pid_;
    bool pretty_print_;
};
#endif

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(LogLevel level, const std::string& formatted_message) = 0;
    virtual void flush() = 0;
};

class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(bool use_colors = false);
    void write(LogLevel level, const std::string& formatted_message) override;
    void flush() override;

private:
    bool use_colors_;
    std::mutex mutex_;

    std::string get_color_code(LogLevel level) const;
};

class FileSink : public ILogSink {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit FileSink(const std::string& filename, bool append = true);
    ~FileSink() override;

    void write(LogLevel level, const std::string& formatted_message) override;
    void flush() override;

    [[nodiscard]] const std::string& filename() const noexcept { return filename_; }

private:
    std::string filename_;
    std::ofstream file_;
    std::mutex mutex_;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * @brief Component logger writing to a set of sinks through one formatter
 *
 * A fresh logger writes plain text to the console at INFO. LoggerFactory
 * replaces sinks and formatter according to the active LoggingConfig.
 */
class Logger {
public:
    explicit Logger(std::string component);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    ~Logger();

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);
    void log(LogLevel level, const std::string& message);

    Logger& with_field(const std::string& key, const std::string& value);
    Logger& clear_fields();

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel get_level() const;
    [[nodiscard]] bool is_enabled(LogLevel level) const;

    void add_sink(std::shared_ptr<ILogSink> sink);
    void clear_sinks();
    void set_formatter(std::shared_ptr<ILogFormatter> formatter);
    void flush();

    [[nodiscard]] const std::string& component() const;

private:
    std::string component_;
    std::atomic<LogLevel> min_level_{LogLevel::INFO};

    std::map<std::string, std::string> fields_;
    mutable std::mutex fields_mutex_;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    std::shared_ptr<ILogFormatter> formatter_;
    mutable std::mutex config_mutex_;

    void do_log(LogLevel level, const std::string& message);
};

// ============================================================================
// Logging Configuration
// ============================================================================

/**
 * @brief Settings applied by LoggerFactory::configure()
 *
 * `pid` is rendered into every formatted line. Whoever configures logging
 * supplies it (AppRunner reads it from the system probe), so no process-wide
 * property store is involved.
 */
struct LoggingConfig {
    LogLevel level = LogLevel::INFO;    ///< Minimum level for every logger
    LogFormat format = LogFormat::TEXT; ///< Line encoding
    bool use_colors = false;            ///< ANSI colours on the console sink
    bool include_thread_id = false;     ///< Thread column in text output
    std::string file;                   ///< Log file path, console when empty
    std::string pid;                    ///< Process id rendered in each line
};

/**
 * @brief Build the formatter selected by a logging configuration
 * @throws std::invalid_argument for JSON when JSON support is not compiled in
 */
[[nodiscard]] std::shared_ptr<ILogFormatter> make_formatter(const LoggingConfig& config);

// ============================================================================
// Logger Registry
// ============================================================================

class LoggerFactory {
public:
    static Logger& get_default();
    static Logger& get_logger(const std::string& component);

    /**
     * @brief Apply a logging configuration to all current and future loggers
     * @param config Level, format, destination and pid
     * @param sink Destination used instead of `config.file` and the console
     * @throws std::runtime_error if the configured log file cannot be opened
     */
    static void configure(const LoggingConfig& config, std::shared_ptr<ILogSink> sink = nullptr);

    static void set_global_level(LogLevel level);

    /**
     * @brief Flush every sink reachable from a registered logger
     */
    static void flush_all();

    /**
     * @brief Drop all registered loggers and defaults
     * @note References returned by get_logger() are invalidated
     */
    static void reset();

private:
    static std::unordered_map<std::string, std::unique_ptr<Logger>> loggers_;
    static std::shared_ptr<ILogSink> default_sink_;
    static std::shared_ptr<ILogFormatter> default_formatter_;
    static LogLevel global_level_;
    static std::mutex loggers_mutex_;

    static void apply_defaults(Logger& logger);
};

} // namespace liftoff
