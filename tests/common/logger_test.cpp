// =============================================================================
// logq - Logger Level Tests
// =============================================================================

#include "logq/common/logger.h"

#include <gtest/gtest.h>

namespace logq::log {
namespace {

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(levelFromString("trace"), Level::kTrace);
    EXPECT_EQ(levelFromString("DEBUG"), Level::kDebug);
    EXPECT_EQ(levelFromString("Warn"), Level::kWarning);
    EXPECT_EQ(levelFromString("warning"), Level::kWarning);
    EXPECT_EQ(levelFromString("fatal"), Level::kCritical);
}

TEST(LogLevelTest, UnknownNamesFallBackToInfo) {
    EXPECT_EQ(levelFromString(""), Level::kInfo);
    EXPECT_EQ(levelFromString("loud"), Level::kInfo);
}

TEST(LogLevelTest, NamesParseBack) {
    for (Level level : {Level::kTrace, Level::kDebug, Level::kInfo, Level::kWarning,
                        Level::kError, Level::kCritical}) {
        EXPECT_EQ(levelFromString(levelToString(level)), level);
    }
}

}  // namespace
}  // namespace logq::log
