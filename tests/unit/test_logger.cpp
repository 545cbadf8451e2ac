/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger and the log sinks.
 */

#include "core/logger.hpp"
#include "telemetry/log_sinks.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

using namespace fabric_controller;

namespace {

struct CapturedLogger {
    MemorySink* sink;
    Logger logger;
};

CapturedLogger make_logger(LogLevel level = LogLevel::Debug) {
    auto sink = std::make_unique<MemorySink>();
    auto* raw = sink.get();
    return CapturedLogger{raw, Logger(std::move(sink), level, "test")};
}

}  // namespace

TEST(LoggerTest, EmitsJsonLine) {
    auto [sink, logger] = make_logger();
    logger.info("hello");

    auto lines = sink->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].front(), '{');
    EXPECT_EQ(lines[0].back(), '}');
    EXPECT_NE(lines[0].find(R"("level":"info")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("component":"test")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("msg":"hello")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("ts":")"), std::string::npos);
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    auto [sink, logger] = make_logger(LogLevel::Warn);
    logger.debug("d");
    logger.info("i");
    logger.warn("w");
    logger.error("e");
    EXPECT_EQ(sink->lines().size(), 2u);

    logger.set_level(LogLevel::Debug);
    logger.debug("d");
    EXPECT_EQ(sink->lines().size(), 3u);
}

TEST(LoggerTest, ComponentChildrenShareSinkAndLevel) {
    auto [sink, logger] = make_logger(LogLevel::Info);
    auto child = logger.with_component("reconciler");
    EXPECT_EQ(child.component(), "reconciler");

    child.info("from child");
    EXPECT_TRUE(sink->contains(R"("component":"reconciler")"));

    logger.set_level(LogLevel::Error);
    EXPECT_EQ(child.level(), LogLevel::Error);
    child.warn("suppressed");
    EXPECT_EQ(sink->lines().size(), 1u);
}

TEST(LoggerTest, EscapesMessage) {
    EXPECT_EQ(json_escape(R"(say "hi")"), R"(say \"hi\")");
    EXPECT_EQ(json_escape("a\nb\\c"), "a\\nb\\\\c");
    EXPECT_EQ(json_escape(std::string(1, '\x01')), "\\u0001");

    auto [sink, logger] = make_logger();
    logger.info("line1\nline2");
    EXPECT_TRUE(sink->contains(R"(line1\nline2)"));
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(*parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(*parse_log_level("warning"), LogLevel::Warn);
    auto bad = parse_log_level("loud");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().kind, ErrorKind::InvalidArgument);
}

TEST(JsonFileSinkTest, WritesAndRotates) {
    auto dir = std::filesystem::temp_directory_path() / "fc_test_log_sink";
    std::filesystem::remove_all(dir);
    {
        JsonFileSink sink(dir, "ctl", 1, 2);
        std::string line(1023, 'x');
        // A little over 2 MiB forces two rotations.
        for (int i = 0; i < 2100; ++i) sink.write(line);
        sink.flush();
        EXPECT_TRUE(std::filesystem::exists(sink.current_path()));
    }
    EXPECT_TRUE(std::filesystem::exists(dir / "ctl.1.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir / "ctl.2.ndjson"));
    EXPECT_FALSE(std::filesystem::exists(dir / "ctl.3.ndjson"));
    EXPECT_LE(std::filesystem::file_size(dir / "ctl.1.ndjson"), 1024u * 1024u + 1024u);
    std::filesystem::remove_all(dir);
}
