#include <gtest/gtest.h>

#include "util/logger.hpp"

#include <cstdio>
#include <string>

namespace stash {
namespace {

class LoggerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        prev_ = Logger::Instance().Level();
        sink_ = std::tmpfile();
        ASSERT_NE(sink_, nullptr);
        Logger::Instance().SetOutput(sink_);
    }

    void TearDown() override {
        Logger::Instance().SetOutput(nullptr);
        Logger::Instance().SetLevel(prev_);
        if (sink_) std::fclose(sink_);
    }

    std::string Captured() {
        std::fflush(sink_);
        std::rewind(sink_);
        std::string out;
        char buf[256];
        size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), sink_)) > 0) out.append(buf, n);
        return out;
    }

    std::FILE* sink_ = nullptr;
    LogLevel prev_ = LogLevel::Info;
};

TEST_F(LoggerTest, FiltersBelowLevel) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    LogInfo("hidden %d", 1);
    LogWarn("shown %d", 2);

    const std::string out = Captured();
    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("[WARN]"), std::string::npos);
    EXPECT_NE(out.find("shown 2"), std::string::npos);
    EXPECT_NE(out.find("test_logger.cpp:"), std::string::npos);
}

TEST_F(LoggerTest, NoneSilencesEverything) {
    Logger::Instance().SetLevel(LogLevel::None);
    LogError("nothing");
    EXPECT_TRUE(Captured().empty());
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(ParseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(ParseLogLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(ParseLogLevel("Warning"), LogLevel::Warn);
    EXPECT_EQ(ParseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(ParseLogLevel("none"), LogLevel::None);
    EXPECT_FALSE(ParseLogLevel("verbose").has_value());
}

} // namespace
} // namespace stash
