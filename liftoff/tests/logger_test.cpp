#include "liftoff/utils/logger.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

#ifdef LIFTOFF_HAS_JSON
#include <nlohmann/json.hpp>
#endif

using liftoff::FileSink;
using liftoff::Logger;
using liftoff::LoggerFactory;
using liftoff::LoggingConfig;
using liftoff::LogFormat;
using liftoff::LogLevel;
using liftoff::LogMessage;
using liftoff::TextFormatter;
using liftoff::test::CapturingSink;

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(liftoff::from_string("debug"), LogLevel::DEBUG);
    EXPECT_EQ(liftoff::from_string("Warning"), LogLevel::WARN);
    EXPECT_EQ(liftoff::from_string("OFF"), LogLevel::OFF);
    EXPECT_EQ(liftoff::from_string("verbose"), LogLevel::INFO);
    EXPECT_EQ(liftoff::to_string(LogLevel::ERROR), "ERROR");
    EXPECT_EQ(liftoff::to_string(LogFormat::JSON), "json");
}

TEST(TextFormatterTest, RendersPidComponentAndFields) {
    TextFormatter formatter("4321");
    LogMessage message(LogLevel::INFO, "Demo", "Starting Demo");
    message.fields["port"] = "8080";

    auto line = formatter.format(message);

    EXPECT_NE(line.find(" INFO 4321 --- [Demo] Starting Demo {port=8080}"), std::string::npos) << line;
    EXPECT_EQ(line.back(), '}');
}

TEST(TextFormatterTest, OmitsPidWhenUnknown) {
    TextFormatter formatter;
    LogMessage message(LogLevel::WARN, "", "careful");

    auto line = formatter.format(message);

    EXPECT_NE(line.find(" WARN --- careful"), std::string::npos) << line;
}

TEST(TextFormatterTest, ThreadIdIsOptIn) {
    TextFormatter formatter("1", true);
    LogMessage message(LogLevel::INFO, "Demo", "hello");
    message.thread_id = std::this_thread::get_id();

    EXPECT_NE(formatter.format(message).find("[thread="), std::string::npos);
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    Logger logger("Demo");
    auto sink = liftoff::test::capture(logger);
    logger.set_level(LogLevel::WARN);

    logger.info("dropped");
    logger.warn("kept");
    logger.error("kept too");

    ASSERT_EQ(sink->entries().size(), 2u);
    EXPECT_EQ(sink->entries()[0].line, "kept");
    EXPECT_FALSE(logger.is_enabled(LogLevel::INFO));
    EXPECT_FALSE(logger.is_enabled(LogLevel::OFF));
}

TEST(LoggerTest, OffSilencesEverything) {
    Logger logger("Demo");
    auto sink = liftoff::test::capture(logger);
    logger.set_level(LogLevel::OFF);

    logger.fatal("nothing");

    EXPECT_TRUE(sink->entries().empty());
}

TEST(LoggerTest, FieldsAreAttachedUntilCleared) {
    Logger logger("Demo");
    auto sink = std::make_shared<CapturingSink>();
    logger.clear_sinks();
    logger.add_sink(sink);
    logger.set_formatter(std::make_shared<TextFormatter>());

    logger.with_field("request", "42").info("handled");
    logger.clear_fields().info("plain");

    auto lines = sink->lines_at(LogLevel::INFO);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("handled {request=42}"), std::string::npos);
    EXPECT_EQ(lines[1].find('{'), std::string::npos);
}

class LoggerFactoryTest : public ::testing::Test {
protected:
    void SetUp() override { LoggerFactory::reset(); }
    void TearDown() override { LoggerFactory::reset(); }
};

TEST_F(LoggerFactoryTest, ReturnsSameLoggerPerComponent) {
    Logger& first = LoggerFactory::get_logger("Demo");
    Logger& second = LoggerFactory::get_logger("Demo");

    EXPECT_EQ(&first, &second);
    EXPECT_EQ(LoggerFactory::get_default().component(), "liftoff");
}

TEST_F(LoggerFactoryTest, ConfigureReachesExistingAndNewLoggers) {
    Logger& early = LoggerFactory::get_logger("early");
    auto sink = std::make_shared<CapturingSink>();

    LoggingConfig config;
    config.level = LogLevel::DEBUG;
    config.pid = "777";
    LoggerFactory::configure(config, sink);

    Logger& late = LoggerFactory::get_logger("late");
    early.debug("from early");
    late.debug("from late");

    auto lines = sink->lines_at(LogLevel::DEBUG);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("777 --- [early] from early"), std::string::npos) << lines[0];
    EXPECT_NE(lines[1].find("777 --- [late] from late"), std::string::npos) << lines[1];
}

TEST_F(LoggerFactoryTest, GlobalLevelAppliesToRegisteredLoggers) {
    Logger& logger = LoggerFactory::get_logger("Demo");

    LoggerFactory::set_global_level(LogLevel::ERROR);

    EXPECT_EQ(logger.get_level(), LogLevel::ERROR);
}

TEST_F(LoggerFactoryTest, FlushAllReachesConfiguredSink) {
    auto sink = std::make_shared<CapturingSink>();
    LoggerFactory::configure(LoggingConfig{}, sink);
    LoggerFactory::get_logger("Demo").info("pending");

    LoggerFactory::flush_all();

    EXPECT_GE(sink->flushes(), 1);
}

TEST_F(LoggerFactoryTest, UnopenableLogFileKeepsPreviousConfiguration) {
    auto sink = std::make_shared<CapturingSink>();
    LoggerFactory::configure(LoggingConfig{}, sink);

    // A regular file where the log directory should be
    liftoff::test::TempDir dir("liftoff-bad-log");
    auto blocker = dir.path() / "blocker";
    { std::ofstream(blocker) << "x"; }

    LoggingConfig broken;
    broken.file = (blocker / "app.log").string();
    EXPECT_THROW(LoggerFactory::configure(broken), std::runtime_error);

    LoggerFactory::get_logger("Demo").info("still captured");
    EXPECT_TRUE(sink->contains("still captured"));
}

TEST(FileSinkTest, AppendsFormattedLines) {
    liftoff::test::TempDir dir("liftoff-file-sink");
    auto path = (dir.path() / "app.log").string();

    {
        FileSink sink(path);
        EXPECT_EQ(sink.filename(), path);
        sink.write(LogLevel::INFO, "first");
        sink.write(LogLevel::WARN, "second");
        sink.flush();
    }

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), "first\nsecond\n");
}

#ifdef LIFTOFF_HAS_JSON

TEST(JsonFormatterTest, EmitsOneObjectPerLine) {
    liftoff::JsonFormatter formatter("4321");
    LogMessage message(LogLevel::INFO, "Demo", "Started Demo in 1.5 seconds");
    message.fields["port"] = "8080";

    auto line = formatter.format(message);
    auto parsed = nlohmann::json::parse(line);

    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_EQ(parsed["level"], "INFO");
    EXPECT_EQ(parsed["pid"], "4321");
    EXPECT_EQ(parsed["component"], "Demo");
    EXPECT_EQ(parsed["message"], "Started Demo in 1.5 seconds");
    EXPECT_EQ(parsed["fields"]["port"], "8080");
}

#else

TEST(JsonFormatterTest, JsonFormatRejectedWithoutSupport) {
    LoggingConfig config;
    config.format = LogFormat::JSON;

    EXPECT_THROW((void)liftoff::make_formatter(config), std::invalid_argument);
}

#endif
