#pragma once

#include "liftoff/app/application.h"
#include "liftoff/config/launch_config.h"
#include "liftoff/startup/entry_point.h"
#include "liftoff/startup/stopwatch.h"
#include "liftoff/startup/system_probe.h"
#include "liftoff/utils/logger.h"

#include <exception>
#include <iosfwd>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace liftoff {

// ============================================================================
// Launch Exception Types
// ============================================================================

/**
 * @brief Launch could not begin (invalid configuration, missing instance)
 *
 * Failures raised by the application itself are never wrapped in this type.
 */
class LaunchException : public std::exception {
public:
    explicit LaunchException(const std::string& message) : message_(message) {}
    const char* what() const noexcept override { return message_.c_str(); }

private:
    std::string message_;
};

// ============================================================================
// Launch Lifecycle
// ============================================================================

/**
 * @brief Launch phases, advanced strictly in declaration order
 */
enum class LaunchPhase : int {
    NOT_STARTED = 0,    ///< Nothing has run yet
    RUNNING = 1,        ///< Starting line logged, application created and running
    STOPPED = 2,        ///< run() returned normally, timer stopped
    REPORTED = 3        ///< Started line logged, banner printed
};

[[nodiscard]] std::string to_string(LaunchPhase phase);

/**
 * @brief Runs one application between a "Starting" and a "Started" log line
 *
 * Sequence:
 * 1. read the pid from the probe and configure logging with it
 * 2. log the starting line, start the timer, create the application, run()
 * 3. stop the timer once run() returns
 * 4. log the started line and print the banner
 *
 * Anything thrown by the factory or by run() propagates unchanged; no
 * started line is written in that case and phase() stays RUNNING.
 *
 * @example
 * ```cpp
 * liftoff::AppRunner runner(liftoff::entry_point_of<Gateway>(),
 *                           [] { return std::make_unique<Gateway>(); });
 * runner.run();
 * ```
 */
class AppRunner {
public:
    AppRunner(EntryPoint entry, ApplicationFactory factory,
              LaunchConfig config = LaunchConfig::from_environment());

    AppRunner(const AppRunner&) = delete;
    AppRunner& operator=(const AppRunner&) = delete;

    /**
     * @brief Replace the POSIX probe (host, pid, clock, module paths)
     */
    AppRunner& with_probe(std::shared_ptr<ISystemProbe> probe);

    /**
     * @brief Send every log line to `sink` instead of the configured destination
     */
    AppRunner& with_log_sink(std::shared_ptr<ILogSink> sink);

    /**
     * @brief Stream receiving the banner (std::cout by default)
     */
    AppRunner& with_output(std::ostream& out);

    /**
     * @brief Execute the launch sequence
     * @throws LaunchException if the configuration is invalid or the factory yields no instance
     * @throws anything thrown by the factory or Application::run()
     */
    void run();

    [[nodiscard]] LaunchPhase phase() const noexcept { return phase_; }
    [[nodiscard]] const Stopwatch& stopwatch() const noexcept { return stopwatch_; }
    [[nodiscard]] const LaunchConfig& config() const noexcept { return config_; }

private:
    EntryPoint entry_;
    ApplicationFactory factory_;
    LaunchConfig config_;
    std::shared_ptr<ISystemProbe> probe_;
    std::shared_ptr<ILogSink> log_sink_;
    std::ostream* out_;
    Stopwatch stopwatch_;
    LaunchPhase phase_ = LaunchPhase::NOT_STARTED;

    void configure_logging();
    void print_banner(Application& application);
};

// ============================================================================
// Convenience Entry Points
// ============================================================================

/**
 * @brief Launch an application described by an entry point and a factory
 */
void run_app(EntryPoint entry, ApplicationFactory factory,
             LaunchConfig config = LaunchConfig::from_environment());

/**
 * @brief Launch a default-constructible Application subclass
 *
 * @example
 * ```cpp
 * int main() {
 *     liftoff::run_app<Gateway>();
 * }
 * ```
 */
template<typename App>
void run_app(LaunchConfig config = LaunchConfig::from_environment()) {
    static_assert(std::is_base_of_v<Application, App>, "App must derive from liftoff::Application");
    static_assert(std::is_default_constructible_v<App>, "App must be default constructible");

    run_app(entry_point_of<App>(), [] { return std::make_unique<App>(); }, std::move(config));
}

} // namespace liftoff
