// CONCORD - Logging Tests
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <gtest/gtest.h>
#include <concord/util/logging.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

using namespace concord::util;

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(LogLevel::Trace);
        logger.AddSink(std::make_shared<CallbackSink>(
            [this](const LogEntry& e) { entries_.push_back(e); }));
    }

    void TearDown() override {
        auto& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(LogLevel::Info);
    }

    std::vector<LogEntry> entries_;
};

TEST_F(LoggingTest, StreamMacroDeliversEntry) {
    LOG_WARN(LogCategory::FACTS) << "conflict on " << "fact-1" << " v" << 2;

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Warn);
    EXPECT_EQ(entries_[0].category, "facts");
    EXPECT_EQ(entries_[0].message, "conflict on fact-1 v2");
    EXPECT_GT(entries_[0].line, 0);
}

TEST_F(LoggingTest, PrintfMacro) {
    LogInfoF(LogCategory::CASCADE, "task %s -> %s", "t1", "committed");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "task t1 -> committed");
}

TEST_F(LoggingTest, LevelFiltering) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    LOG_DEBUG(LogCategory::DEFAULT) << "hidden";
    LOG_INFO(LogCategory::DEFAULT) << "hidden";
    LOG_ERROR(LogCategory::DEFAULT) << "shown";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");
}

TEST_F(LoggingTest, CategoryFiltering) {
    Logger::Instance().EnableCategory(LogCategory::VOTING);
    LOG_INFO(LogCategory::STORE) << "hidden";
    LOG_INFO(LogCategory::VOTING) << "shown";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].category, "voting");
}

TEST_F(LoggingTest, StreamArgumentsNotEvaluatedWhenFiltered) {
    Logger::Instance().SetLevel(LogLevel::Error);
    int calls = 0;
    auto expensive = [&calls]() { ++calls; return 1; };
    LOG_DEBUG(LogCategory::DEFAULT) << expensive();
    EXPECT_EQ(calls, 0);
}

TEST(LogLevelTest, ParseAndFormat) {
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("warn"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("bogus"), LogLevel::Info);
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
}

TEST(FileSinkTest, WritesAndRotates) {
    std::random_device rd;
    auto dir = std::filesystem::temp_directory_path() /
               ("concord_log_test_" + std::to_string(rd()));
    std::filesystem::create_directories(dir);

    FileSink::Config config;
    config.path = (dir / "concord.log").string();
    config.maxSize = 200;
    config.maxFiles = 2;
    config.autoFlush = true;
    FileSink sink(config);
    ASSERT_TRUE(sink.IsOpen());

    LogEntry entry;
    entry.level = LogLevel::Info;
    entry.category = "store";
    entry.message = std::string(80, 'x');
    entry.timestamp = std::chrono::system_clock::now();
    for (int i = 0; i < 5; ++i) {
        sink.Write(entry);
    }
    sink.Flush();

    EXPECT_TRUE(std::filesystem::exists(config.path));
    EXPECT_TRUE(std::filesystem::exists(config.path + ".1"));
    EXPECT_LE(std::filesystem::file_size(config.path), 200u);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}
