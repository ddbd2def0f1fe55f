#include "liftoff/app/app_runner.h"
#include "liftoff/startup/startup_reporter.h"

#include <iostream>
#include <utility>

namespace liftoff {

std::string to_string(LaunchPhase phase) {
    switch (phase) {
        case LaunchPhase::NOT_STARTED: return "NOT_STARTED";
        case LaunchPhase::RUNNING: return "RUNNING";
        case LaunchPhase::STOPPED: return "STOPPED";
        case LaunchPhase::REPORTED: return "REPORTED";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// AppRunner
// ============================================================================

AppRunner::AppRunner(EntryPoint entry, ApplicationFactory factory, LaunchConfig config)
    : entry_(std::move(entry))
    , factory_(std::move(factory))
    , config_(std::move(config))
    , probe_(std::make_shared<PosixSystemProbe>())
    , out_(&std::cout) {
}

AppRunner& AppRunner::with_probe(std::shared_ptr<ISystemProbe> probe) {
    if (probe) {
        probe_ = std::move(probe);
    }
    return *this;
}

AppRunner& AppRunner::with_log_sink(std::shared_ptr<ILogSink> sink) {
    log_sink_ = std::move(sink);
    return *this;
}

AppRunner& AppRunner::with_output(std::ostream& out) {
    out_ = &out;
    return *this;
}

void AppRunner::run() {
    if (phase_ != LaunchPhase::NOT_STARTED) {
        throw LaunchException("Application '" + entry_.name + "' has already been launched");
    }
    if (!factory_) {
        throw LaunchException("No application factory supplied");
    }

    auto validation = config_.validate();
    if (!validation.is_valid) {
        throw LaunchException(validation.report());
    }

    // The pid must reach the formatters before any logger is handed out
    configure_logging();

    Logger& diagnostics = LoggerFactory::get_logger("liftoff.startup");
    for (const auto& warning : validation.warnings) {
        diagnostics.warn("Configuration warning: " + warning);
    }
    diagnostics.debug("Launch configuration: " + config_.summary());

    StartupReporter reporter(entry_, *probe_, diagnostics, config_.startup);
    Logger& startup_log = LoggerFactory::get_logger(reporter.application_name());

    auto probe = probe_;
    stopwatch_ = Stopwatch([probe] { return probe->current_time_millis(); });

    // NOT_STARTED -> RUNNING
    phase_ = LaunchPhase::RUNNING;
    if (config_.startup.log_startup_info) {
        reporter.log_starting(startup_log);
    }
    stopwatch_.start();

    std::unique_ptr<Application> application = factory_();
    if (!application) {
        throw LaunchException("Application factory for '" + reporter.application_name() +
                              "' returned no instance");
    }
    application->run();

    // RUNNING -> STOPPED
    stopwatch_.stop();
    phase_ = LaunchPhase::STOPPED;

    // STOPPED -> REPORTED
    if (config_.startup.log_startup_info) {
        reporter.log_started(startup_log, stopwatch_);
    }
    LoggerFactory::flush_all();
    if (config_.startup.show_banner) {
        print_banner(*application);
    }
    phase_ = LaunchPhase::REPORTED;
}

void AppRunner::configure_logging() {
    LoggingConfig logging = config_.logging;
    logging.pid = probe_->process_id().value_or("");
    LoggerFactory::configure(logging, log_sink_);
}

void AppRunner::print_banner(Application& application) {
    auto banner = application.banner();
    if (banner && !banner->empty()) {
        *out_ << *banner << '\n';
        out_->flush();
    }
}

// ============================================================================
// Convenience Entry Points
// ============================================================================

void run_app(EntryPoint entry, ApplicationFactory factory, LaunchConfig config) {
    AppRunner runner(std::move(entry), std::move(factory), std::move(config));
    runner.run();
}

} // namespace liftoff
