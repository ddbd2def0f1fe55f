#include "liftoff/utils/logger.h"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>

#ifdef LIFTOFF_HAS_JSON
#include <nlohmann/json.hpp>
#endif

namespace liftoff {

namespace {

/**
 * @brief ISO 8601 UTC timestamp with millisecond precision
 */
std::string format_timestamp(std::chrono::system_clock::time_point timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// LogLevel / LogFormat
// ============================================================================

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
        default: return "UNKNOWN";
    }
}

LogLevel from_string(const std::string& level_str) {
    std::string upper_str = level_str;
    std::transform(upper_str.begin(), upper_str.end(), upper_str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper_str == "TRACE") return LogLevel::TRACE;
    if (upper_str == "DEBUG") return LogLevel::DEBUG;
    if (upper_str == "INFO")  return LogLevel::INFO;
    if (upper_str == "WARN" || upper_str == "WARNING") return LogLevel::WARN;
    if (upper_str == "ERROR") return LogLevel::ERROR;
    if (upper_str == "FATAL") return LogLevel::FATAL;
    if (upper_str == "OFF")   return LogLevel::OFF;

    return LogLevel::INFO;
}

std::string to_string(LogFormat format) {
    switch (format) {
        case LogFormat::TEXT: return "text";
        case LogFormat::JSON: return "json";
        default: return "unknown";
    }
}

// ============================================================================
// LogMessage
// ============================================================================

LogMessage::LogMessage(LogLevel lvl, std::string comp, std::string msg,
                       std::chrono::system_clock::time_point ts)
    : level(lvl)
    , component(std::move(comp))
    , message(std::move(msg))
    , timestamp(ts)
    , thread_id(std::this_thread::get_id()) {
}

// ============================================================================
// TextFormatter
// ============================================================================

TextFormatter::TextFormatter(std::string pid, bool include_thread_id)
    : pid_(std::move(pid))
    , include_thread_id_(include_thread_id) {
}

std::string TextFormatter::format(const LogMessage& message) {
    std::ostringstream oss;

    oss << format_timestamp(message.timestamp) << " ";
    oss << std::setw(5) << std::right << to_string(message.level) << " ";

    if (!pid_.empty()) {
        oss << pid_ << " ";
    }
    oss << "--- ";

    if (include_thread_id_) {
        oss << "[thread=" << message.thread_id << "] ";
    }

    if (!message.component.empty()) {
        oss << "[" << message.component << "] ";
    }

    oss << message.message;

    if (!message.fields.empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [key, value] : message.fields) {
            if (!first) oss << ", ";
            oss << key << "=" << value;
            first = false;
        }
        oss << "}";
    }

    return oss.str();
}

// ============================================================================
// JsonFormatter
// ============================================================================

#ifdef LIFTOFF_HAS_JSON

JsonFormatter::JsonFormatter(std::string pid, bool pretty_print)
    : pid_(std::move(pid))
    , pretty_print_(pretty_print) {
}

std::string JsonFormatter::format(const LogMessage& message) {
    nlohmann::json j;
    j["timestamp"] = format_timestamp(message.timestamp);
    j["level"] = to_string(message.level);
    if (!pid_.empty()) {
        j["pid"] = pid_;
    }
    if (!message.component.empty()) {
        j["component"] = message.component;
    }

    std::ostringstream thread;
    thread << message.thread_id;
    j["thread_id"] = thread.str();
    j["message"] = message.message;

    if (!message.fields.empty()) {
        j["fields"] = message.fields;
    }

    return j.dump(pretty_print_ ? 2 : -1);
}

#endif

std::shared_ptr<ILogFormatter> make_formatter(const LoggingConfig& config) {
    switch (config.format) {
        case LogFormat::JSON:
#ifdef LIFTOFF_HAS_JSON
            return std::make_shared<JsonFormatter>(config.pid);
#else
            throw std::invalid_argument("JSON log format requires nlohmann_json support");
#endif
        case LogFormat::TEXT:
        default:
            return std::make_shared<TextFormatter>(config.pid, config.include_thread_id);
    }
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : use_colors_(use_colors) {
}

void ConsoleSink::write(LogLevel level, const std::string& formatted_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (use_colors_) {
        std::cout << get_color_code(level) << formatted_message << "\033[0m" << '\n';
    } else {
        std::cout << formatted_message << '\n';
    }
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
}

std::string ConsoleSink::get_color_code(LogLevel level) const {
    switch (level) {
        case LogLevel::TRACE: return "\033[37m";    // White
        case LogLevel::DEBUG: return "\033[36m";    // Cyan
        case LogLevel::INFO:  return "\033[32m";    // Green
        case LogLevel::WARN:  return "\033[33m";    // Yellow
        case LogLevel::ERROR: return "\033[31m";    // Red
        case LogLevel::FATAL: return "\033[35m";    // Magenta
        default: return "\033[0m";
    }
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& filename, bool append)
    : filename_(filename) {

    auto parent_path = std::filesystem::path(filename).parent_path();
    if (!parent_path.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent_path, ec);
    }

    auto mode = append ? std::ios::out | std::ios::app : std::ios::out | std::ios::trunc;
    file_.open(filename_, mode);

    if (!file_.is_open()) {
        throw std::runtime_error("Failed to open log file: " + filename_);
    }
}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.close();
    }
}

void FileSink::write(LogLevel /*level*/, const std::string& formatted_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) return;
    file_ << formatted_message << "\n";
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(std::string component)
    : component_(std::move(component))
    , formatter_(std::make_shared<TextFormatter>()) {
    add_sink(std::make_shared<ConsoleSink>());
}

Logger::~Logger() {
    flush();
}

void Logger::trace(const std::string& message) {
    log(LogLevel::TRACE, message);
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::FATAL, message);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!is_enabled(level)) {
        return;
    }
    do_log(level, message);
}

Logger& Logger::with_field(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(fields_mutex_);
    fields_[key] = value;
    return *this;
}

Logger& Logger::clear_fields() {
    std::lock_guard<std::mutex> lock(fields_mutex_);
    fields_.clear();
    return *this;
}

void Logger::set_level(LogLevel level) {
    min_level_ = level;
}

LogLevel Logger::get_level() const {
    return min_level_.load();
}

bool Logger::is_enabled(LogLevel level) const {
    return level != LogLevel::OFF && level >= min_level_.load();
}

void Logger::add_sink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;

    std::lock_guard<std::mutex> lock(config_mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    sinks_.clear();
}

void Logger::set_formatter(std::shared_ptr<ILogFormatter> formatter) {
    if (!formatter) return;

    std::lock_guard<std::mutex> lock(config_mutex_);
    formatter_ = std::move(formatter);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    for (auto& sink : sinks_) {
        if (sink) {
            sink->flush();
        }
    }
}

const std::string& Logger::component() const {
    return component_;
}

void Logger::do_log(LogLevel level, const std::string& message) {
    LogMessage log_msg(level, component_, message);

    {
        std::lock_guard<std::mutex> lock(fields_mutex_);
        log_msg.fields = fields_;
    }

    // Snapshot configuration, then write outside the lock
    std::shared_ptr<ILogFormatter> formatter;
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        formatter = formatter_;
        sinks = sinks_;
    }

    std::string formatted_message = formatter ? formatter->format(log_msg) : message;

    for (auto& sink : sinks) {
        if (sink) {
            sink->write(level, formatted_message);
        }
    }
}

// ============================================================================
// LoggerFactory
// ============================================================================

std::unordered_map<std::string, std::unique_ptr<Logger>> LoggerFactory::loggers_;
std::shared_ptr<ILogSink> LoggerFactory::default_sink_;
std::shared_ptr<ILogFormatter> LoggerFactory::default_formatter_;
LogLevel LoggerFactory::global_level_ = LogLevel::INFO;
std::mutex LoggerFactory::loggers_mutex_;

Logger& LoggerFactory::get_default() {
    return get_logger("liftoff");
}

Logger& LoggerFactory::get_logger(const std::string& component) {
    std::lock_guard<std::mutex> lock(loggers_mutex_);

    auto it = loggers_.find(component);
    if (it != loggers_.end()) {
        return *it->second;
    }

    auto logger = std::make_unique<Logger>(component);
    apply_defaults(*logger);

    Logger& logger_ref = *logger;
    loggers_[component] = std::move(logger);

    return logger_ref;
}

void LoggerFactory::configure(const LoggingConfig& config, std::shared_ptr<ILogSink> sink) {
    // Build everything before touching shared state so a bad file path leaves
    // the previous configuration in place
    auto formatter = make_formatter(config);

    if (!sink) {
        if (!config.file.empty()) {
            sink = std::make_shared<FileSink>(config.file);
        } else {
            sink = std::make_shared<ConsoleSink>(config.use_colors);
        }
    }

    std::lock_guard<std::mutex> lock(loggers_mutex_);
    global_level_ = config.level;
    default_formatter_ = std::move(formatter);
    default_sink_ = std::move(sink);

    for (auto& [name, logger] : loggers_) {
        apply_defaults(*logger);
    }
}

void LoggerFactory::set_global_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(loggers_mutex_);
    global_level_ = level;

    for (auto& [name, logger] : loggers_) {
        logger->set_level(level);
    }
}

void LoggerFactory::flush_all() {
    std::lock_guard<std::mutex> lock(loggers_mutex_);
    for (auto& [name, logger] : loggers_) {
        logger->flush();
    }
}

void LoggerFactory::reset() {
    std::lock_guard<std::mutex> lock(loggers_mutex_);
    loggers_.clear();
    default_sink_.reset();
    default_formatter_.reset();
    global_level_ = LogLevel::INFO;
}

void LoggerFactory::apply_defaults(Logger& logger) {
    logger.set_level(global_level_);

    if (default_sink_) {
        logger.clear_sinks();
        logger.add_sink(default_sink_);
    }

    if (default_formatter_) {
        logger.set_formatter(default_formatter_);
    }
}

} // namespace liftoff
