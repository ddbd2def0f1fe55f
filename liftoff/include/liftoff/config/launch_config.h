#pragma once

#include "liftoff/utils/logger.h"

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <filesystem>

namespace liftoff {

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * @brief Startup reporting settings
 */
struct StartupConfig {
    std::string runtime_name = "C++";                          ///< Label in "using <name> <version>"
    std::chrono::milliseconds host_name_resolve_threshold{200}; ///< Slow host name warning threshold
    bool test_harness = false;                                 ///< Suppress the application source path
    bool log_startup_info = true;                              ///< Emit Starting/Started lines
    bool show_banner = true;                                   ///< Print the application banner
};

/**
 * @brief Configuration validation result
 */
struct ValidationResult {
    bool is_valid = true;                       ///< Overall validation status
    std::vector<std::string> errors;            ///< Critical errors (prevent startup)
    std::vector<std::string> warnings;          ///< Non-critical warnings

    /**
     * @brief Check if configuration has any issues
     * @return true if there are errors or warnings
     */
    [[nodiscard]] bool has_issues() const noexcept {
        return !errors.empty() || !warnings.empty();
    }

    /**
     * @brief Get formatted validation report
     * @return Human-readable validation report
     */
    [[nodiscard]] std::string report() const;
};

// ============================================================================
// Main Configuration Class
// ============================================================================

/**
 * @brief Complete configuration of an application launch
 *
 * Sources, lowest precedence first: built-in defaults, a TOML file, and
 * `LIFTOFF_*` environment variables.
 *
 * @example
 * ```cpp
 * auto config = LaunchConfig::from_toml_file("liftoff.toml")
 *                   .value_or(LaunchConfig::defaults())
 *                   .with_environment_overrides();
 * ```
 */
struct LaunchConfig {
    LoggingConfig logging;
    StartupConfig startup;

    // ========================================================================
    // Factories
    // ========================================================================

    static LaunchConfig defaults();

    /**
     * @brief Load configuration from TOML file
     * @param config_path Path to TOML configuration file
     * @return Parsed configuration or std::nullopt on error
     */
    static std::optional<LaunchConfig> from_toml_file(const std::filesystem::path& config_path);

    /**
     * @brief Load configuration from TOML string
     * @param toml_content TOML configuration content
     * @return Parsed configuration or std::nullopt on error
     */
    static std::optional<LaunchConfig> from_toml_string(const std::string& toml_content);

    /**
     * @brief Defaults with environment variable overrides applied
     *
     * Environment variables:
     * - LIFTOFF_LOG_LEVEL, LIFTOFF_LOG_FORMAT, LIFTOFF_LOG_FILE
     * - LIFTOFF_LOG_COLORS, LIFTOFF_LOG_THREAD_ID
     * - LIFTOFF_RUNTIME_NAME, LIFTOFF_HOST_RESOLVE_THRESHOLD
     * - LIFTOFF_TEST_HARNESS, LIFTOFF_LOG_STARTUP_INFO, LIFTOFF_SHOW_BANNER
     */
    static LaunchConfig from_environment();

    // ========================================================================
    // Validation and Serialization
    // ========================================================================

    [[nodiscard]] ValidationResult validate() const;

    [[nodiscard]] std::string to_toml() const;

    /**
     * @brief Apply environment variable overrides on top of this configuration
     * @return Copy with every recognised and well-formed variable applied
     */
    [[nodiscard]] LaunchConfig with_environment_overrides() const;

    /**
     * @brief One-line description for diagnostics
     */
    [[nodiscard]] std::string summary() const;
};

/**
 * @brief Parse duration string (e.g. "250ms", "2s", "1min")
 */
[[nodiscard]] std::optional<std::chrono::milliseconds> parse_duration(const std::string& duration_str);

/**
 * @brief Parse boolean from string (true/false, yes/no, 1/0, on/off)
 */
[[nodiscard]] std::optional<bool> parse_bool(const std::string& value);

[[nodiscard]] std::optional<LogFormat> log_format_from_string(const std::string& format_str);

} // namespace liftoff
