#include <gtest/gtest.h>
#include "track.h"

TEST(TrackTest, Accessors) {
    Track t("Imagine", 183);
    EXPECT_EQ(t.title(), QString("Imagine"));
    EXPECT_EQ(t.duration(), 183);
}

TEST(TrackTest, IsShorterThan) {
    Track shortTrack("a", 60);
    Track longTrack("b", 61);
    Track sameTrack("c", 60);
    EXPECT_TRUE(shortTrack.isShorterThan(longTrack));
    EXPECT_FALSE(longTrack.isShorterThan(shortTrack));
    EXPECT_FALSE(shortTrack.isShorterThan(sameTrack));
}

TEST(TrackTest, HasTitleIsCaseInsensitiveExact) {
    Track t("imagine", 183);
    EXPECT_TRUE(t.hasTitle("Imagine"));
    EXPECT_TRUE(t.hasTitle("IMAGINE"));
    EXPECT_FALSE(t.hasTitle("IMAGINE "));
    EXPECT_FALSE(t.hasTitle("imag"));
}

TEST(TrackTest, DurationString) {
    EXPECT_EQ(Track("x", 0).durationString(), QString("0:00"));
    EXPECT_EQ(Track("x", 65).durationString(), QString("1:05"));
    EXPECT_EQ(Track("x", 431).durationString(), QString("7:11"));
}

TEST(TrackTest, ToString) {
    Track t("Hey Jude", 431);
    EXPECT_EQ(t.toString(), QString("Hey Jude, 7:11"));
}

TEST(TrackTest, NegativeDurationClampedToZero) {
    Track t("broken", -5);
    EXPECT_EQ(t.duration(), 0);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
