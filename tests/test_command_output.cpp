#include <gtest/gtest.h>

#include "util/command_output.hpp"

namespace stash {

TEST(CommandOutputTest, DefaultIsNormal) {
    EXPECT_EQ(CommandOutput{}, CommandOutput::Normal);
    EXPECT_EQ(CommandOutputFromFlags(false, false), CommandOutput::Normal);
}

TEST(CommandOutputTest, QuietTakesPrecedenceOverVerbose) {
    EXPECT_EQ(CommandOutputFromFlags(true, false), CommandOutput::Quiet);
    EXPECT_EQ(CommandOutputFromFlags(false, true), CommandOutput::Verbose);
    EXPECT_EQ(CommandOutputFromFlags(true, true), CommandOutput::Quiet);
}

TEST(CommandOutputTest, MapsToLogLevels) {
    EXPECT_EQ(LogLevelFor(CommandOutput::Quiet), LogLevel::Error);
    EXPECT_EQ(LogLevelFor(CommandOutput::Normal), LogLevel::Info);
    EXPECT_EQ(LogLevelFor(CommandOutput::Verbose), LogLevel::Debug);
}

} // namespace stash
