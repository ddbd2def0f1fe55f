#include "liftoff/startup/startup_reporter.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <fstream>
#include <memory>

using liftoff::EntryPoint;
using liftoff::Logger;
using liftoff::LogLevel;
using liftoff::StartupConfig;
using liftoff::StartupReporter;
using liftoff::Stopwatch;
using liftoff::test::CapturingSink;
using liftoff::test::FakeSystemProbe;

namespace {

class StartupReporterTest : public ::testing::Test {
protected:
    FakeSystemProbe probe;
    Logger diagnostics{"liftoff.startup"};
    std::shared_ptr<CapturingSink> warnings = liftoff::test::capture(diagnostics);

    StartupReporter reporter_for(std::optional<EntryPoint> entry, StartupConfig config = {}) {
        return StartupReporter(std::move(entry), probe, diagnostics, std::move(config));
    }

    static EntryPoint demo(std::optional<std::string> version = std::nullopt) {
        return EntryPoint{"Demo", std::move(version), nullptr};
    }

    static Stopwatch stopped_after(std::int64_t start, std::int64_t end) {
        auto calls = std::make_shared<int>(0);
        Stopwatch stopwatch([calls, start, end] { return (*calls)++ == 0 ? start : end; });
        stopwatch.start();
        stopwatch.stop();
        return stopwatch;
    }
};

bool has_double_space(const std::string& text) {
    return text.find("  ") != std::string::npos;
}

} // namespace

// ============================================================================
// Starting message
// ============================================================================

TEST_F(StartupReporterTest, StartingMessageWithAllFragments) {
    auto reporter = reporter_for(demo());

    EXPECT_EQ(reporter.starting_message(),
              "Starting Demo using C++ 20 (GCC 13.2.0) on host1 with PID 4321 "
              "(started by alice in /srv/app)");
}

TEST_F(StartupReporterTest, StartingMessageIncludesVersionWhenPublished) {
    auto reporter = reporter_for(demo("1.4.0"));

    EXPECT_EQ(reporter.starting_message(),
              "Starting Demo v1.4.0 using C++ 20 (GCC 13.2.0) on host1 with PID 4321 "
              "(started by alice in /srv/app)");
}

TEST_F(StartupReporterTest, StartingMessageWithoutEntryPointNamesApplication) {
    auto reporter = reporter_for(std::nullopt);

    EXPECT_EQ(reporter.application_name(), "application");
    EXPECT_EQ(reporter.starting_message().rfind("Starting application using", 0), 0u);
}

TEST_F(StartupReporterTest, StartingMessageIncludesSourcePathWhenKnown) {
    liftoff::test::TempDir install("liftoff-reporter-src");
    auto binary = install.path() / "demo";
    { std::ofstream(binary) << "binary"; }
    probe.module = binary;

    static const int anchor = 0;
    auto reporter = reporter_for(EntryPoint{"Demo", std::nullopt, &anchor});

    EXPECT_NE(reporter.starting_message().find("(" + binary.lexically_normal().string() +
                                                " started by alice in /srv/app)"),
              std::string::npos);
}

TEST_F(StartupReporterTest, TestHarnessOmitsSourcePath) {
    liftoff::test::TempDir install("liftoff-reporter-harness");
    auto binary = install.path() / "demo";
    { std::ofstream(binary) << "binary"; }
    probe.module = binary;

    static const int anchor = 0;
    StartupConfig config;
    config.test_harness = true;
    auto reporter = reporter_for(EntryPoint{"Demo", std::nullopt, &anchor}, config);

    EXPECT_NE(reporter.starting_message().find("(started by alice in /srv/app)"), std::string::npos);
}

TEST_F(StartupReporterTest, AbsentFragmentsLeaveNoStraySpaces) {
    probe.runtime.reset();
    probe.pid.reset();
    probe.user.reset();
    probe.cwd.reset();
    auto reporter = reporter_for(demo());

    auto message = reporter.starting_message();

    EXPECT_EQ(message, "Starting Demo on host1");
    EXPECT_FALSE(has_double_space(message));
}

TEST_F(StartupReporterTest, NeverProducesDoubleOrEdgeWhitespace) {
    for (int mask = 0; mask < 64; ++mask) {
        FakeSystemProbe local;
        if (mask & 1) local.runtime.reset();
        if (mask & 2) local.pid = "";
        if (mask & 4) local.user.reset();
        if (mask & 8) local.cwd.reset();
        if (mask & 16) local.host.reset();
        StartupReporter reporter((mask & 32) ? std::optional<EntryPoint>() : demo("  "),
                                 local, diagnostics);

        auto message = reporter.starting_message();

        EXPECT_FALSE(has_double_space(message)) << message;
        EXPECT_NE(message.front(), ' ') << message;
        EXPECT_NE(message.back(), ' ') << message;
    }
}

TEST_F(StartupReporterTest, OnlyUserKnownKeepsParenthetical) {
    probe.cwd.reset();
    auto reporter = reporter_for(demo());

    auto message = reporter.starting_message();

    EXPECT_NE(message.find("with PID 4321 (started by alice)"), std::string::npos);
}

TEST_F(StartupReporterTest, UnresolvableHostFallsBackToLocalhost) {
    probe.host.reset();
    auto reporter = reporter_for(demo());

    EXPECT_NE(reporter.starting_message().find(" on localhost "), std::string::npos);
}

TEST_F(StartupReporterTest, CustomRuntimeName) {
    StartupConfig config;
    config.runtime_name = "C++/embedded";
    auto reporter = reporter_for(demo(), config);

    EXPECT_NE(reporter.starting_message().find("using C++/embedded 20 (GCC 13.2.0) on"), std::string::npos);
}

// ============================================================================
// Slow host name resolution
// ============================================================================

TEST_F(StartupReporterTest, SlowHostNameResolutionWarns) {
    probe.host_name_delay = 250;
    auto reporter = reporter_for(demo());

    auto message = reporter.starting_message();

    auto lines = warnings->lines_at(LogLevel::WARN);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("took 250"), std::string::npos);
    EXPECT_NE(lines[0].find("gethostname()"), std::string::npos);
    EXPECT_EQ(lines[0].find("macOS"), std::string::npos);
    EXPECT_EQ(lines[0].back(), '.');
    EXPECT_NE(message.find(" on host1 "), std::string::npos);
}

TEST_F(StartupReporterTest, SlowFailedResolutionStillWarns) {
    probe.host.reset();
    probe.host_name_delay = 250;
    auto reporter = reporter_for(demo());

    (void)reporter.starting_message();

    EXPECT_TRUE(warnings->contains("took 250"));
}

TEST_F(StartupReporterTest, SlowResolutionOnMacAddsHostsHint) {
    probe.os = "Mac OS X";
    probe.host_name_delay = 400;
    auto reporter = reporter_for(demo());

    (void)reporter.starting_message();

    EXPECT_TRUE(warnings->contains("(macOS machines may need to add entries to /etc/hosts)."));
}

TEST_F(StartupReporterTest, ResolutionAtThresholdDoesNotWarn) {
    probe.host_name_delay = 200;
    auto reporter = reporter_for(demo());

    (void)reporter.starting_message();

    EXPECT_TRUE(warnings->entries().empty());
}

TEST_F(StartupReporterTest, ThresholdIsConfigurable) {
    StartupConfig config;
    config.host_name_resolve_threshold = std::chrono::milliseconds(50);
    probe.host_name_delay = 60;
    auto reporter = reporter_for(demo(), config);

    (void)reporter.starting_message();

    EXPECT_TRUE(warnings->contains("took 60"));
}

// ============================================================================
// Started message
// ============================================================================

TEST_F(StartupReporterTest, StartedMessageWithoutUptime) {
    auto reporter = reporter_for(demo());

    EXPECT_EQ(reporter.started_message(stopped_after(0, 3200)), "Started Demo in 3.2 seconds");
}

TEST_F(StartupReporterTest, StartedMessageWithUptime) {
    probe.process_uptime = std::chrono::milliseconds(12500);
    auto reporter = reporter_for(demo());

    EXPECT_EQ(reporter.started_message(stopped_after(1000, 2500)),
              "Started Demo in 1.5 seconds (process running for 12.5)");
}

TEST_F(StartupReporterTest, StartedMessageKeepsDecimalForWholeSeconds) {
    auto reporter = reporter_for(demo());

    EXPECT_EQ(reporter.started_message(stopped_after(0, 3000)), "Started Demo in 3.0 seconds");
}

TEST_F(StartupReporterTest, LogMethodsWriteAtInfo) {
    Logger app("Demo");
    auto sink = liftoff::test::capture(app);
    auto reporter = reporter_for(demo());

    reporter.log_starting(app);
    reporter.log_started(app, stopped_after(0, 1200));

    auto lines = sink->lines_at(LogLevel::INFO);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].rfind("Starting Demo", 0), 0u);
    EXPECT_EQ(lines[1], "Started Demo in 1.2 seconds");
}

TEST_F(StartupReporterTest, CurrentPidComesFromProbe) {
    auto reporter = reporter_for(demo());

    EXPECT_EQ(reporter.current_pid(), std::optional<std::string>("4321"));
}

// ============================================================================
// Helpers
// ============================================================================

TEST(AppendFieldTest, SeparatesOnlyNonEmptyMessages) {
    std::string message;
    liftoff::append_field(message, "started by ", std::string("alice"));
    liftoff::append_field(message, "in ", std::nullopt);
    liftoff::append_field(message, "in ", std::string(""));
    liftoff::append_field(message, "in ", std::string("/srv/app"));

    EXPECT_EQ(message, "started by alice in /srv/app");
}

TEST(FormatSecondsTest, ShortestRepresentation) {
    EXPECT_EQ(liftoff::format_seconds(3.2), "3.2");
    EXPECT_EQ(liftoff::format_seconds(1.5), "1.5");
    EXPECT_EQ(liftoff::format_seconds(0.123), "0.123");
    EXPECT_EQ(liftoff::format_seconds(3.0), "3.0");
    EXPECT_EQ(liftoff::format_seconds(0.0), "0.0");
}
