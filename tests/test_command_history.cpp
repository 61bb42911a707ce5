#include <gtest/gtest.h>
#include <session/command_history.hpp>

TEST(CommandHistory, RecordSkipsImmediateRepeat) {
    CommandHistory history;
    history.record("ls");
    history.record("ls");
    history.record("pwd");
    history.record("ls");
    ASSERT_EQ(history.entries().size(), 3u);
    EXPECT_EQ(history.entries()[0], "ls");
    EXPECT_EQ(history.entries()[1], "pwd");
    EXPECT_EQ(history.entries()[2], "ls");
}

TEST(CommandHistory, RecordIgnoresEmpty) {
    CommandHistory history;
    history.record("");
    EXPECT_TRUE(history.empty());
}

TEST(CommandHistory, EmptyHistoryDoesNothing) {
    CommandHistory history;
    EXPECT_FALSE(history.previous().has_value());
    EXPECT_FALSE(history.next().has_value());
    EXPECT_FALSE(history.cursor().has_value());
}

TEST(CommandHistory, UpWalksBackAndStopsAtOldest) {
    CommandHistory history;
    history.record("a");
    history.record("b");
    history.record("c");

    EXPECT_EQ(history.previous(), "c");
    EXPECT_EQ(history.previous(), "b");
    EXPECT_EQ(history.previous(), "a");
    EXPECT_EQ(history.previous(), "a");
    EXPECT_EQ(history.cursor(), 0u);
}

TEST(CommandHistory, DownPastNewestClearsInput) {
    CommandHistory history;
    history.record("a");
    history.record("b");

    history.previous();
    history.previous();
    EXPECT_EQ(history.next(), "b");
    EXPECT_EQ(history.next(), "");
    EXPECT_FALSE(history.cursor().has_value());
    EXPECT_FALSE(history.next().has_value());
}

TEST(CommandHistory, ResetCursorRestartsFromNewest) {
    CommandHistory history;
    history.record("a");
    history.record("b");

    history.previous();
    history.previous();
    history.reset_cursor();
    EXPECT_EQ(history.previous(), "b");
}
