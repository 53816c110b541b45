/**
 * @file test_logger.cpp
 * @brief Tests for the logger sink, levels and redaction
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "voicegate/core/vg_logger.h"

using voicegate::LogLevel;
using voicegate::Logger;

namespace {

struct Captured {
    LogLevel level;
    std::string category;
    std::string message;
};

void capture(LogLevel level, const char* category, const char* message, void* user_data) {
    static_cast<std::vector<Captured>*>(user_data)->push_back({level, category, message});
}

class LoggerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        Logger::instance().setCallback(capture, &records_);
        Logger::instance().setMinLevel(LogLevel::Trace);
        Logger::instance().setRedaction(true);
    }

    void TearDown() override {
        Logger::instance().setCallback(nullptr, nullptr);
        Logger::instance().setMinLevel(LogLevel::Debug);
        Logger::instance().setRedaction(true);
    }

    std::vector<Captured> records_;
};

}  // namespace

TEST_F(LoggerTest, FormatsAndRoutesToCallback) {
    VG_LOG_INFO("Listener", "Captured %d frames", 4);
    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].level, LogLevel::Info);
    EXPECT_EQ(records_[0].category, "Listener");
    EXPECT_EQ(records_[0].message, "Captured 4 frames");
}

TEST_F(LoggerTest, DropsBelowMinLevel) {
    Logger::instance().setMinLevel(LogLevel::Warning);
    VG_LOG_DEBUG("ASR", "hidden");
    VG_LOG_INFO("ASR", "hidden");
    VG_LOG_WARNING("ASR", "shown");
    VG_LOG_ERROR("ASR", "shown");
    EXPECT_EQ(records_.size(), 2u);
}

TEST_F(LoggerTest, RedactsSensitiveWords) {
    VG_LOG_INFO("Config", "Password=%s Token ok", "hunter2");
    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].message, "[REDACTED]=hunter2 [REDACTED] ok");
}

TEST_F(LoggerTest, RedactionCanBeDisabled) {
    Logger::instance().setRedaction(false);
    VG_LOG_INFO("VoiceprintStore", "voiceprint saved");
    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].message, "voiceprint saved");
}

TEST(LoggerRedact, ReplacesEveryOccurrenceCaseInsensitively) {
    EXPECT_EQ(Logger::redact("SECRET secret SeCrEt"), "[REDACTED] [REDACTED] [REDACTED]");
    EXPECT_EQ(Logger::redact("nothing here"), "nothing here");
    EXPECT_EQ(Logger::redact("my voiceprint token"), "my [REDACTED] [REDACTED]");
}

TEST(LogLevelParse, KnownAndUnknownNames) {
    LogLevel level = LogLevel::Info;
    EXPECT_TRUE(voicegate::parse_log_level("WARNING", level));
    EXPECT_EQ(level, LogLevel::Warning);
    EXPECT_TRUE(voicegate::parse_log_level("trace", level));
    EXPECT_EQ(level, LogLevel::Trace);
    EXPECT_FALSE(voicegate::parse_log_level("loud", level));
    EXPECT_EQ(level, LogLevel::Trace);
}
