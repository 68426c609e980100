#include <gtest/gtest.h>

#include "Log.h"
#include "TestSupport.h"

TEST(Log, LinesAboveLevelAreDropped) {
    LogCapture log(LogLevel::Warn);
    logf(LogLevel::Info, "quiet %d", 1);
    logf(LogLevel::Error, "loud %d", 2);
    EXPECT_FALSE(log.contains("quiet"));
    EXPECT_TRUE(log.contains("loud 2"));
}

TEST(Log, LevelNames) {
    EXPECT_STREQ(logLevelName(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(logLevelName(LogLevel::None), "NONE");
}
