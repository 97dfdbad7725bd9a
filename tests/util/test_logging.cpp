// DOGEPROV - Logging and Time Tests
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include <gtest/gtest.h>

#include "dogeprov/util/logging.h"
#include "dogeprov/util/time.h"

#include <cstdio>
#include <fstream>
#include <sstream>

namespace dogeprov {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        previousLevel_ = Logger::Instance().GetLevel();
        sink_ = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { entries_.push_back(entry); });
        Logger::Instance().AddSink(sink_);
        Logger::Instance().SetLevel(LogLevel::Debug);
    }

    void TearDown() override {
        Logger::Instance().RemoveSink(sink_);
        Logger::Instance().SetLevel(previousLevel_);
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
    LogLevel previousLevel_{LogLevel::Info};
};

// ============================================================================
// Levels
// ============================================================================

TEST(LogLevelTest, FromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("bogus"), LogLevel::Info);
}

TEST(LogLevelTest, ToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Off), "OFF");
}

// ============================================================================
// Logger
// ============================================================================

TEST_F(LoggingTest, StreamMacroReachesSink) {
    LOG_INFO(LogCategory::PROVIDER) << "connected " << 3 << " origins";

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, LogCategory::PROVIDER);
    EXPECT_EQ(entries_[0].message, "connected 3 origins");
    EXPECT_GT(entries_[0].line, 0);
}

TEST_F(LoggingTest, FormattedEntry) {
    LOG_WARN(LogCategory::APPROVAL) << "Request #7 timed out";
    ASSERT_EQ(entries_.size(), 1u);

    std::string plain = FormatLogEntry(entries_[0], false);
    EXPECT_NE(plain.find("[WARN] [approval] Request #7 timed out"), std::string::npos);
    EXPECT_EQ(plain.find("test_logging.cpp"), std::string::npos);

    std::string located = FormatLogEntry(entries_[0], true);
    EXPECT_NE(located.find("[approval] test_logging.cpp:"), std::string::npos);
}

TEST_F(LoggingTest, BelowThresholdIsDropped) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    LOG_INFO(LogCategory::PROVIDER) << "quiet";
    LOG_WARN(LogCategory::PROVIDER) << "loud";

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "loud");
}

TEST_F(LoggingTest, OffSuppressesEverything) {
    Logger::Instance().SetLevel(LogLevel::Off);
    LOG_ERROR(LogCategory::PROVIDER) << "nothing";
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingTest, ConfigureLoggingWritesFile) {
    std::string path = ::testing::TempDir() + "dogeprov_logging_test.log";
    std::remove(path.c_str());

    ASSERT_TRUE(ConfigureLogging(LogLevel::Debug, path));
    LOG_WARN(LogCategory::DB) << "written to file";
    Logger::Instance().Flush();

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("written to file"), std::string::npos);
    EXPECT_NE(contents.str().find("[db]"), std::string::npos);

    std::remove(path.c_str());
}

TEST_F(LoggingTest, ReconfiguringReplacesFileSink) {
    std::string path = ::testing::TempDir() + "dogeprov_logging_twice.log";
    std::remove(path.c_str());

    ASSERT_TRUE(ConfigureLogging(LogLevel::Debug, path));
    ASSERT_TRUE(ConfigureLogging(LogLevel::Debug, path));
    LOG_WARN(LogCategory::DB) << "exactly once";
    Logger::Instance().Flush();

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    std::string text = contents.str();
    size_t first = text.find("exactly once");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(text.find("exactly once", first + 1), std::string::npos);

    std::remove(path.c_str());
}

TEST_F(LoggingTest, ConfigureLoggingReportsUnwritableFile) {
    EXPECT_FALSE(ConfigureLogging(LogLevel::Info, "/nonexistent-dir/dogeprov.log"));
    EXPECT_EQ(Logger::Instance().GetLevel(), LogLevel::Info);
}

// ============================================================================
// Time
// ============================================================================

TEST(TimeTest, MockTime) {
    SetMockTime(1700000000);
    EXPECT_TRUE(IsMockTimeEnabled());
    EXPECT_EQ(GetTime(), 1700000000);

    AdvanceMockTime(Seconds(300));
    EXPECT_EQ(GetTime(), 1700000300);

    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_GT(GetTime(), 1700000000);
}

} // namespace test
} // namespace util
} // namespace dogeprov
