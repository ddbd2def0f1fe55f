#pragma once

#include "liftoff/config/launch_config.h"
#include "liftoff/startup/entry_point.h"
#include "liftoff/startup/stopwatch.h"
#include "liftoff/startup/system_probe.h"
#include "liftoff/utils/logger.h"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace liftoff {

/**
 * @brief Composes the "Starting ..." and "Started ..." lines of an application
 *
 * Starting line:
 * `Starting Demo v1.2 using C++ 20 (GCC 13.2.0) on host1 with PID 4321 (/opt/demo/bin/demo started by alice in /srv/app)`
 *
 * Started line:
 * `Started Demo in 3.2 seconds (process running for 3.41)`
 *
 * Every optional fragment is dropped when its lookup yields nothing, without
 * leaving stray separators. The only side effect is the slow host name
 * warning written to the diagnostics logger while the starting line is built.
 */
class StartupReporter {
public:
    /**
     * @param entry Application entry point, std::nullopt for "application"
     * @param probe Host and process metadata
     * @param diagnostics Receives the slow host name warning
     * @param config Runtime label, warning threshold and test harness flag
     */
    StartupReporter(std::optional<EntryPoint> entry, ISystemProbe& probe, Logger& diagnostics,
                    StartupConfig config = {});

    [[nodiscard]] std::string starting_message();
    [[nodiscard]] std::string started_message(const Stopwatch& stopwatch);

    void log_starting(Logger& log);
    void log_started(Logger& log, const Stopwatch& stopwatch);

    [[nodiscard]] std::optional<std::string> current_pid();

    /**
     * @brief Entry point name, or "application" without one
     */
    [[nodiscard]] std::string application_name() const;

private:
    std::optional<EntryPoint> entry_;
    ISystemProbe& probe_;
    Logger& diagnostics_;
    StartupConfig config_;

    void append_version(std::string& message) const;
    void append_runtime_version(std::string& message);
    void append_on(std::string& message);
    void append_pid(std::string& message);
    void append_context(std::string& message);
    void warn_slow_host_name_resolution(std::int64_t resolve_time_ms);
};

/**
 * @brief Append `prefix + value`, preceded by one space if `message` is not empty
 *
 * Nothing is appended when the value is absent or blank.
 */
void append_field(std::string& message, std::string_view prefix, const std::optional<std::string>& value);

/**
 * @brief Seconds in shortest round-trip form, whole values keep one decimal ("3.0")
 */
[[nodiscard]] std::string format_seconds(double seconds);

} // namespace liftoff
