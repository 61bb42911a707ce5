#include <gtest/gtest.h>
#include <session/message_log.hpp>

TEST(MessageLog, IdsStartAtOneAndIncrease) {
    MessageLog log;
    EXPECT_EQ(log.append(Role::User, "ls").id, 1);
    EXPECT_EQ(log.append(Role::Server, "a.txt").id, 2);
    EXPECT_EQ(log.append(Role::User, "pwd").id, 3);
    EXPECT_EQ(log.size(), 3u);
}

TEST(MessageLog, ConsecutiveServerOutputMerges) {
    MessageLog log;
    log.append(Role::Server, "first");
    const Message& merged = log.append(Role::Server, "second");
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(merged.id, 1);
    EXPECT_EQ(merged.content, "first\nsecond");
}

TEST(MessageLog, NoExtraBreakWhenAlreadySeparated) {
    MessageLog log;
    log.append(Role::Server, "one\n");
    log.append(Role::Server, "two");
    log.append(Role::Server, "\nthree");
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.messages()[0].content, "one\ntwo\nthree");
}

TEST(MessageLog, ErrorAfterOutputDoesNotMerge) {
    MessageLog log;
    log.append(Role::Server, "ok output");
    log.append(Role::Server, "bad thing", true);
    log.append(Role::Server, "worse thing", true);
    ASSERT_EQ(log.size(), 2u);
    EXPECT_FALSE(log.messages()[0].is_error);
    EXPECT_TRUE(log.messages()[1].is_error);
    EXPECT_EQ(log.messages()[1].content, "bad thing\nworse thing");
}

TEST(MessageLog, UserMessagesNeverMerge) {
    MessageLog log;
    log.append(Role::User, "a");
    log.append(Role::User, "b");
    log.append(Role::Server, "out");
    log.append(Role::User, "c");
    EXPECT_EQ(log.size(), 4u);
}

TEST(MessageLog, MergingCanBeDisabled) {
    MessageLog log(false);
    log.append(Role::Server, "first");
    log.append(Role::Server, "second");
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log.messages()[1].id, 2);
}

TEST(MessageLog, IdsNotReusedAfterClear) {
    MessageLog log;
    log.append(Role::User, "a");
    log.append(Role::Server, "b");
    log.clear();
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(log.append(Role::User, "c").id, 3);
}

TEST(MessageLog, StreamDeltasContinueOpenLine) {
    MessageLog log;
    log.append(Role::Server, "Pass", false, true);
    log.append(Role::Server, "word: ", false, true);
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.messages()[0].content, "Password: ");
}

TEST(MessageLog, StatusAfterOpenStreamLineIsSeparated) {
    MessageLog log;
    log.append(Role::Server, "50%", false, true);
    log.append(Role::Server, "Command finished.");
    log.append(Role::Server, "next", false, true);
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.messages()[0].content, "50%\nCommand finished.\nnext");
}
