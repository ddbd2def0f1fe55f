#include "liftoff/startup/startup_reporter.h"
#include "liftoff/startup/home_locator.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>

namespace liftoff {

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

} // anonymous namespace

// ============================================================================
// Formatting Helpers
// ============================================================================

void append_field(std::string& message, std::string_view prefix, const std::optional<std::string>& value) {
    if (!value) {
        return;
    }

    std::string trimmed = trim(*value);
    if (trimmed.empty()) {
        return;
    }

    if (!message.empty()) {
        message += ' ';
    }
    message += prefix;
    message += trimmed;
}

std::string format_seconds(double seconds) {
    char buffer[64];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), seconds);
    if (ec != std::errc()) {
        return std::to_string(seconds);
    }

    std::string result(buffer, ptr);
    if (result.find_first_of(".eEni") == std::string::npos) {
        result += ".0";
    }
    return result;
}

// ============================================================================
// StartupReporter
// ============================================================================

StartupReporter::StartupReporter(std::optional<EntryPoint> entry, ISystemProbe& probe, Logger& diagnostics,
                                 StartupConfig config)
    : entry_(std::move(entry))
    , probe_(probe)
    , diagnostics_(diagnostics)
    , config_(std::move(config)) {
}

std::string StartupReporter::application_name() const {
    if (entry_) {
        std::string name = trim(entry_->name);
        if (!name.empty()) {
            return name;
        }
    }
    return "application";
}

std::optional<std::string> StartupReporter::current_pid() {
    return probe_.process_id();
}

void StartupReporter::log_starting(Logger& log) {
    log.info(starting_message());
}

void StartupReporter::log_started(Logger& log, const Stopwatch& stopwatch) {
    log.info(started_message(stopwatch));
}

std::string StartupReporter::starting_message() {
    std::string message = "Starting " + application_name();
    append_version(message);
    append_runtime_version(message);
    append_on(message);
    append_pid(message);
    append_context(message);
    return message;
}

std::string StartupReporter::started_message(const Stopwatch& stopwatch) {
    std::string message = "Started " + application_name();
    message += " in ";
    message += format_seconds(stopwatch.elapsed_seconds());
    message += " seconds";

    if (auto uptime = probe_.uptime()) {
        message += " (process running for ";
        message += format_seconds(static_cast<double>(uptime->count()) / 1000.0);
        message += ")";
    }
    return message;
}

void StartupReporter::append_version(std::string& message) const {
    if (entry_) {
        append_field(message, "v", entry_->version);
    }
}

void StartupReporter::append_runtime_version(std::string& message) {
    std::string prefix = "using ";
    if (!config_.runtime_name.empty()) {
        prefix += config_.runtime_name + " ";
    }
    append_field(message, prefix, probe_.runtime_version());
}

void StartupReporter::append_on(std::string& message) {
    std::int64_t start_time = probe_.current_time_millis();

    std::optional<std::string> host_name = probe_.host_name();
    if (!host_name || trim(*host_name).empty()) {
        host_name = "localhost";
    }
    append_field(message, "on ", host_name);

    std::int64_t resolve_time = probe_.current_time_millis() - start_time;
    if (resolve_time > config_.host_name_resolve_threshold.count()) {
        warn_slow_host_name_resolution(resolve_time);
    }
}

void StartupReporter::append_pid(std::string& message) {
    append_field(message, "with PID ", current_pid());
}

void StartupReporter::append_context(std::string& message) {
    std::string context;

    const EntryPoint* entry = entry_ ? &*entry_ : nullptr;
    HomeLocator home(entry, probe_, config_.test_harness);
    if (home.source()) {
        append_field(context, "", home.source()->string());
    }

    append_field(context, "started by ", probe_.user_name());

    if (auto cwd = probe_.working_directory()) {
        append_field(context, "in ", cwd->string());
    }

    if (!context.empty()) {
        message += " (";
        message += context;
        message += ")";
    }
}

void StartupReporter::warn_slow_host_name_resolution(std::int64_t resolve_time_ms) {
    std::string warning = "Resolving the local host name (gethostname()) took ";
    warning += std::to_string(resolve_time_ms);
    warning += " milliseconds to respond. Please verify your network configuration";

    auto os_name = probe_.os_name();
    if (os_name && to_lower(*os_name).find("mac") != std::string::npos) {
        warning += " (macOS machines may need to add entries to /etc/hosts)";
    }
    warning += ".";

    diagnostics_.warn(warning);
}

} // namespace liftoff
