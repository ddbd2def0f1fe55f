#include "liftoff/config/launch_config.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <cstdlib>
#include <limits>
#include <regex>
#include <sstream>

#ifdef LIFTOFF_HAS_TOML11
#include <toml.hpp>
#endif

namespace liftoff {

// ============================================================================
// Internal Utilities
// ============================================================================

namespace {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? std::optional<std::string>(value) : std::nullopt;
}

bool is_known_level(const std::string& level_str) {
    static const std::vector<std::string> known = {
        "trace", "debug", "info", "warn", "warning", "error", "fatal", "off"
    };
    return std::find(known.begin(), known.end(), to_lower(trim(level_str))) != known.end();
}

/**
 * @brief TOML basic string literal, quotes included
 */
std::string quote_toml(const std::string& value) {
    std::ostringstream oss;
    oss << '"';
    for (char c : value) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
                    oss << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec << std::nouppercase << std::setfill(' ');
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
    return oss.str();
}

void apply_environment(LaunchConfig& config) {
    if (auto level_str = get_env("LIFTOFF_LOG_LEVEL")) {
        if (is_known_level(*level_str)) {
            config.logging.level = from_string(trim(*level_str));
        }
    }

    if (auto format_str = get_env("LIFTOFF_LOG_FORMAT")) {
        if (auto format = log_format_from_string(*format_str)) {
            config.logging.format = *format;
        }
    }

    if (auto file_str = get_env("LIFTOFF_LOG_FILE")) {
        config.logging.file = trim(*file_str);
    }

    if (auto colors_str = get_env("LIFTOFF_LOG_COLORS")) {
        if (auto colors = parse_bool(*colors_str)) {
            config.logging.use_colors = *colors;
        }
    }

    if (auto thread_str = get_env("LIFTOFF_LOG_THREAD_ID")) {
        if (auto thread_id = parse_bool(*thread_str)) {
            config.logging.include_thread_id = *thread_id;
        }
    }

    if (auto runtime_str = get_env("LIFTOFF_RUNTIME_NAME")) {
        config.startup.runtime_name = trim(*runtime_str);
    }

    if (auto threshold_str = get_env("LIFTOFF_HOST_RESOLVE_THRESHOLD")) {
        if (auto threshold = parse_duration(trim(*threshold_str))) {
            config.startup.host_name_resolve_threshold = *threshold;
        }
    }

    if (auto harness_str = get_env("LIFTOFF_TEST_HARNESS")) {
        if (auto harness = parse_bool(*harness_str)) {
            config.startup.test_harness = *harness;
        }
    }

    if (auto info_str = get_env("LIFTOFF_LOG_STARTUP_INFO")) {
        if (auto info = parse_bool(*info_str)) {
            config.startup.log_startup_info = *info;
        }
    }

    if (auto banner_str = get_env("LIFTOFF_SHOW_BANNER")) {
        if (auto banner = parse_bool(*banner_str)) {
            config.startup.show_banner = *banner;
        }
    }
}

} // anonymous namespace

// ============================================================================
// Parsing Helpers
// ============================================================================

std::optional<std::chrono::milliseconds> parse_duration(const std::string& duration_str) {
    static const std::regex duration_regex(R"(^(\d+)(ms|s|sec|m|min)$)");
    std::smatch match;

    if (!std::regex_match(duration_str, match, duration_regex)) {
        return std::nullopt;
    }

    long long value = 0;
    try {
        value = std::stoll(match[1].str());
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    std::string unit = match[2].str();

    long long factor = 0;
    if (unit == "ms") {
        factor = 1;
    } else if (unit == "s" || unit == "sec") {
        factor = 1000;
    } else if (unit == "m" || unit == "min") {
        factor = 60 * 1000;
    } else {
        return std::nullopt;
    }

    if (value > std::numeric_limits<long long>::max() / factor) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(value * factor);
}

std::optional<bool> parse_bool(const std::string& value) {
    std::string lower_value = to_lower(trim(value));

    if (lower_value == "true" || lower_value == "yes" || lower_value == "1" || lower_value == "on") {
        return true;
    } else if (lower_value == "false" || lower_value == "no" || lower_value == "0" || lower_value == "off") {
        return false;
    }

    return std::nullopt;
}

std::optional<LogFormat> log_format_from_string(const std::string& format_str) {
    std::string lower = to_lower(trim(format_str));
    if (lower == "text") return LogFormat::TEXT;
    if (lower == "json") return LogFormat::JSON;
    return std::nullopt;
}

// ============================================================================
// ValidationResult
// ============================================================================

std::string ValidationResult::report() const {
    std::ostringstream oss;
    oss << (is_valid ? "Configuration is valid" : "Configuration is invalid");

    for (const auto& error : errors) {
        oss << "\n  error: " << error;
    }
    for (const auto& warning : warnings) {
        oss << "\n  warning: " << warning;
    }

    return oss.str();
}

// ============================================================================
// Factories
// ============================================================================

LaunchConfig LaunchConfig::defaults() {
    return LaunchConfig{};
}

LaunchConfig LaunchConfig::from_environment() {
    LaunchConfig config = defaults();
    apply_environment(config);
    return config;
}

LaunchConfig LaunchConfig::with_environment_overrides() const {
    LaunchConfig result = *this;
    apply_environment(result);
    return result;
}

// ============================================================================
// TOML Configuration Support
// ============================================================================

#ifdef LIFTOFF_HAS_TOML11

namespace {

LaunchConfig from_toml_data(const toml::value& toml_data) {
    LaunchConfig config;

    if (toml_data.contains("logging")) {
        const auto& logging_section = toml::find(toml_data, "logging");

        if (logging_section.contains("level")) {
            auto level_str = toml::find<std::string>(logging_section, "level");
            if (is_known_level(level_str)) {
                config.logging.level = from_string(trim(level_str));
            }
        }

        if (logging_section.contains("format")) {
            auto format_str = toml::find<std::string>(logging_section, "format");
            if (auto format = log_format_from_string(format_str)) {
                config.logging.format = *format;
            }
        }

        if (logging_section.contains("colors")) {
            config.logging.use_colors = toml::find<bool>(logging_section, "colors");
        }

        if (logging_section.contains("thread_id")) {
            config.logging.include_thread_id = toml::find<bool>(logging_section, "thread_id");
        }

        if (logging_section.contains("file")) {
            config.logging.file = toml::find<std::string>(logging_section, "file");
        }
    }

    if (toml_data.contains("startup")) {
        const auto& startup_section = toml::find(toml_data, "startup");

        if (startup_section.contains("runtime_name")) {
            config.startup.runtime_name = toml::find<std::string>(startup_section, "runtime_name");
        }

        if (startup_section.contains("host_name_resolve_threshold")) {
            auto threshold_str = toml::find<std::string>(startup_section, "host_name_resolve_threshold");
            if (auto threshold = parse_duration(threshold_str)) {
                config.startup.host_name_resolve_threshold = *threshold;
            }
        }

        if (startup_section.contains("test_harness")) {
            config.startup.test_harness = toml::find<bool>(startup_section, "test_harness");
        }

        if (startup_section.contains("log_startup_info")) {
            config.startup.log_startup_info = toml::find<bool>(startup_section, "log_startup_info");
        }

        if (startup_section.contains("show_banner")) {
            config.startup.show_banner = toml::find<bool>(startup_section, "show_banner");
        }
    }

    return config;
}

} // anonymous namespace

std::optional<LaunchConfig> LaunchConfig::from_toml_file(const std::filesystem::path& config_path) {
    try {
        if (!std::filesystem::exists(config_path)) {
            return std::nullopt;
        }

        auto toml_data = toml::parse(config_path.string());
        return from_toml_data(toml_data);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<LaunchConfig> LaunchConfig::from_toml_string(const std::string& toml_content) {
    try {
        std::istringstream stream(toml_content);
        auto toml_data = toml::parse(stream, "string");
        return from_toml_data(toml_data);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

#else // !LIFTOFF_HAS_TOML11

std::optional<LaunchConfig> LaunchConfig::from_toml_file(const std::filesystem::path& /*config_path*/) {
    // TOML support not compiled in
    return std::nullopt;
}

std::optional<LaunchConfig> LaunchConfig::from_toml_string(const std::string& /*toml_content*/) {
    // TOML support not compiled in
    return std::nullopt;
}

#endif // LIFTOFF_HAS_TOML11

// ============================================================================
// Validation and Serialization
// ============================================================================

ValidationResult LaunchConfig::validate() const {
    ValidationResult result;
    result.is_valid = true;

    if (startup.host_name_resolve_threshold.count() < 0) {
        result.is_valid = false;
        result.errors.push_back("Host name resolve threshold must not be negative");
    }

    if (startup.host_name_resolve_threshold > std::chrono::seconds(10)) {
        result.warnings.push_back("Host name resolve threshold (" +
                                  std::to_string(startup.host_name_resolve_threshold.count()) +
                                  "ms) is very high and will hide slow lookups");
    }

#ifndef LIFTOFF_HAS_JSON
    if (logging.format == LogFormat::JSON) {
        result.is_valid = false;
        result.errors.push_back("JSON log format requires nlohmann_json support");
    }
#endif

    if (logging.level == LogLevel::OFF && startup.log_startup_info) {
        result.warnings.push_back("Startup info is enabled but the log level is OFF");
    }

    return result;
}

std::string LaunchConfig::to_toml() const {
    std::ostringstream oss;

    oss << "[logging]\n";
    oss << "level = \"" << to_string(logging.level) << "\"\n";
    oss << "format = \"" << to_string(logging.format) << "\"\n";
    oss << "colors = " << (logging.use_colors ? "true" : "false") << "\n";
    oss << "thread_id = " << (logging.include_thread_id ? "true" : "false") << "\n";
    oss << "file = " << quote_toml(logging.file) << "\n";

    oss << "\n";

    oss << "[startup]\n";
    oss << "runtime_name = " << quote_toml(startup.runtime_name) << "\n";
    oss << "host_name_resolve_threshold = \"" << startup.host_name_resolve_threshold.count() << "ms\"\n";
    oss << "test_harness = " << (startup.test_harness ? "true" : "false") << "\n";
    oss << "log_startup_info = " << (startup.log_startup_info ? "true" : "false") << "\n";
    oss << "show_banner = " << (startup.show_banner ? "true" : "false") << "\n";

    return oss.str();
}

std::string LaunchConfig::summary() const {
    std::ostringstream oss;
    oss << "level=" << to_string(logging.level)
        << ", format=" << to_string(logging.format)
        << ", output=" << (logging.file.empty() ? "console" : logging.file)
        << ", host_resolve_threshold=" << startup.host_name_resolve_threshold.count() << "ms"
        << ", test_harness=" << (startup.test_harness ? "true" : "false");
    return oss.str();
}

} // namespace liftoff
