#include "utils/logger.h"

#include <gtest/gtest.h>

#include <regex>
#include <sstream>

using namespace log_watchdog;

namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_savedLevel = getLogLevel();
        setLogStream(&m_out);
    }
    void TearDown() override {
        setLogStream(nullptr);
        setLogLevel(m_savedLevel);
    }

    std::ostringstream m_out;
    LogLevel m_savedLevel = LogLevel::INFO;
};

} // namespace

TEST_F(LoggerTest, LineFormat) {
    setLogLevel(LogLevel::INFO);
    logWarning("capture slow");
    const std::regex line(R"(^\d{2}:\d{2}:\d{2}\.\d{3} \[WARN\] capture slow\n$)");
    EXPECT_TRUE(std::regex_match(m_out.str(), line)) << m_out.str();
}

TEST_F(LoggerTest, BelowThresholdIsDropped) {
    setLogLevel(LogLevel::WARNING);
    logDebug("a");
    logInfo("b");
    logError("c");
    const std::string out = m_out.str();
    EXPECT_EQ(out.find("[DEBUG]"), std::string::npos);
    EXPECT_EQ(out.find("[INFO]"), std::string::npos);
    EXPECT_NE(out.find("[ERROR] c"), std::string::npos);
}

TEST(LogLevelTest, ParseNames) {
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel(" warn "), LogLevel::WARNING);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::WARNING);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("chatty"), LogLevel::INFO);
    EXPECT_STREQ(logLevelTag(LogLevel::DEBUG), "[DEBUG]");
}
