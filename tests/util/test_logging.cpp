// AMOCA - Logging Tests
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <gtest/gtest.h>

#include <amoca/util/logging.h>

#include <cstdio>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace amoca {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(LogLevel::Trace);
        
        sink_ = std::make_shared<CallbackSink>([this](const LogEntry& entry) {
            entries_.push_back(entry);
        });
        logger.AddSink(sink_);
    }
    
    void TearDown() override {
        Logger& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(LogLevel::Info);
    }
    
    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
};

// ============================================================================
// Levels
// ============================================================================

TEST(LogLevelTest, StringConversion) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_EQ(LogLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("WARNING"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("bogus"), LogLevel::Info);
}

TEST_F(LoggingTest, StreamMacroDeliversEntry) {
    LOG_INFO(LogCategory::LEDGER) << "minted " << 42;
    
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, LogCategory::LEDGER);
    EXPECT_EQ(entries_[0].message, "minted 42");
    EXPECT_GT(entries_[0].line, 0);
    EXPECT_EQ(GetBasename(entries_[0].file), "test_logging.cpp");
}

TEST_F(LoggingTest, LevelFiltersAtLogger) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    LOG_INFO(LogCategory::STAKING) << "hidden";
    LOG_WARN(LogCategory::STAKING) << "shown";
    
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");
}

TEST_F(LoggingTest, LevelFiltersAtSink) {
    sink_->SetLevel(LogLevel::Error);
    LOG_WARN(LogCategory::TX) << "dropped";
    LOG_ERROR(LogCategory::TX) << "kept";
    
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "kept");
}

TEST_F(LoggingTest, DisabledStreamIsNotEvaluated) {
    Logger::Instance().SetLevel(LogLevel::Error);
    int calls = 0;
    auto expensive = [&calls]() { ++calls; return 1; };
    LOG_DEBUG(LogCategory::DB) << expensive();
    EXPECT_EQ(calls, 0);
}

TEST_F(LoggingTest, CategoryFilter) {
    Logger& logger = Logger::Instance();
    logger.EnableCategory(LogCategory::GOVERNANCE);
    
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::GOVERNANCE));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::ACCESS));
    
    LOG_INFO(LogCategory::ACCESS) << "filtered";
    LOG_INFO(LogCategory::GOVERNANCE) << "passed";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].category, LogCategory::GOVERNANCE);
    
    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::ACCESS));
}

TEST_F(LoggingTest, RemoveSink) {
    Logger& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 1u);
    logger.RemoveSink(sink_);
    EXPECT_EQ(logger.SinkCount(), 0u);
    LOG_ERROR(LogCategory::DEFAULT) << "nowhere";
    EXPECT_TRUE(entries_.empty());
}

// ============================================================================
// Scopes
// ============================================================================

TEST_F(LoggingTest, ScopeTagsEntries) {
    LOG_INFO(LogCategory::TX) << "outside";
    {
        LogScope tx("tx 1a2b3c");
        LOG_INFO(LogCategory::TX) << "checking";
        {
            LogScope op("stake_tokens");
            EXPECT_EQ(LogScope::Current(), "tx 1a2b3c stake_tokens");
            LOG_INFO(LogCategory::STAKING) << "locked";
        }
        EXPECT_EQ(LogScope::Current(), "tx 1a2b3c");
    }
    EXPECT_TRUE(LogScope::Current().empty());
    
    ASSERT_EQ(entries_.size(), 3u);
    EXPECT_TRUE(entries_[0].scope.empty());
    EXPECT_EQ(entries_[1].scope, "tx 1a2b3c");
    EXPECT_EQ(entries_[2].scope, "tx 1a2b3c stake_tokens");
}

// ============================================================================
// Setup
// ============================================================================

TEST_F(LoggingTest, ConfigureSelectsDebugCategories) {
    LogOptions options;
    options.level = LogLevel::Error;
    options.debugCategories = {LogCategory::STAKING};
    ASSERT_TRUE(ConfigureLogging(options));
    
    Logger& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);
    EXPECT_EQ(logger.GetLevel(), LogLevel::Debug);
    EXPECT_TRUE(logger.WillLog(LogLevel::Debug, LogCategory::STAKING));
    EXPECT_FALSE(logger.WillLog(LogLevel::Error, LogCategory::ACCESS));
    
    options.debugCategories = {"all"};
    ASSERT_TRUE(ConfigureLogging(options));
    EXPECT_TRUE(logger.WillLog(LogLevel::Debug, LogCategory::ACCESS));
}

TEST_F(LoggingTest, ConfigureOpensLogFile) {
    char path[] = "/tmp/amoca_log_conf_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);
    
    LogOptions options;
    options.level = LogLevel::Info;
    options.filePath = path;
    ASSERT_TRUE(ConfigureLogging(options));
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
    
    options.filePath = "/nonexistent-dir/amoca/debug.log";
    EXPECT_FALSE(ConfigureLogging(options));
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);
    
    std::remove(path);
}

// ============================================================================
// File Sink
// ============================================================================

TEST_F(LoggingTest, FileSinkWritesFormattedLines) {
    char path[] = "/tmp/amoca_log_test_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);
    
    {
        FileSink::Config config;
        config.path = path;
        auto fileSink = std::make_shared<FileSink>(config);
        ASSERT_TRUE(fileSink->IsOpen());
        Logger::Instance().AddSink(fileSink);
        
        LogScope scope("mint_tokens");
        LOG_INFO(LogCategory::LEDGER) << "persisted";
        LOG_TRACE(LogCategory::LEDGER) << "below file level";
        Logger::Instance().RemoveSink(fileSink);
        EXPECT_GT(fileSink->GetCurrentSize(), 0u);
    }
    
    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    std::string text = content.str();
    EXPECT_NE(text.find("[INFO] [ledger] test_logging.cpp:"), std::string::npos);
    EXPECT_NE(text.find("(mint_tokens) persisted"), std::string::npos);
    EXPECT_EQ(text.find("below file level"), std::string::npos);
    
    std::remove(path);
}

TEST(LogHelpersTest, Basename) {
    EXPECT_EQ(GetBasename("/a/b/c.cpp"), "c.cpp");
    EXPECT_EQ(GetBasename("c.cpp"), "c.cpp");
}

} // namespace test
} // namespace util
} // namespace amoca
