// BONDVAULT - Time Utility Tests
// Copyright (c) 2024 BondVault Developers
// MIT License

#include <gtest/gtest.h>

#include "bondvault/util/time.h"

namespace bondvault {
namespace util {
namespace test {

class MockTimeTest : public ::testing::Test {
protected:
    void TearDown() override {
        ClearMockTime();
    }
};

TEST(TimeTest, FormatISO8601) {
    EXPECT_EQ(FormatISO8601(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(1700000000), "2023-11-14T22:13:20Z");
}

TEST(TimeTest, FormatDuration) {
    EXPECT_EQ(FormatDuration(0), "0s");
    EXPECT_EQ(FormatDuration(59), "59s");
    EXPECT_EQ(FormatDuration(3600), "1h 0m 0s");
    EXPECT_EQ(FormatDuration(90061), "1d 1h 1m 1s");
    EXPECT_EQ(FormatDuration(-61), "-1m 1s");
}

TEST(TimeTest, RealTimeIsPlausible) {
    EXPECT_GT(GetTime(), 1700000000);
}

TEST_F(MockTimeTest, SetAndAdvance) {
    EXPECT_FALSE(IsMockTimeEnabled());
    SetMockTime(1000);
    EXPECT_TRUE(IsMockTimeEnabled());
    EXPECT_EQ(GetTime(), 1000);

    AdvanceMockTime(Seconds(25 * SECONDS_PER_HOUR));
    EXPECT_EQ(GetTime(), 1000 + 90000);
}

TEST_F(MockTimeTest, ClearRestoresRealClock) {
    SetMockTime(5);
    ClearMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_GT(GetTime(), 5);
}

TEST_F(MockTimeTest, AdvanceWithoutPinIsIgnored) {
    AdvanceMockTime(Seconds(SECONDS_PER_DAY));
    EXPECT_FALSE(IsMockTimeEnabled());
}

TEST_F(MockTimeTest, ScopedMockTime) {
    {
        ScopedMockTime clock(1700000000);
        clock.Advance(Seconds(SECONDS_PER_MINUTE));
        EXPECT_EQ(GetTime(), 1700000060);
    }
    EXPECT_FALSE(IsMockTimeEnabled());
}

} // namespace test
} // namespace util
} // namespace bondvault
