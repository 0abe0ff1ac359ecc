#include <gtest/gtest.h>
#include <core/time_utils.hpp>

TEST(TimeUtils, IsoUtcWholeSeconds) {
    EXPECT_EQ(iso_utc(0), "1970-01-01T00:00:00+00:00");
    EXPECT_EQ(iso_utc(1700000000), "2023-11-14T22:13:20+00:00");
}

TEST(TimeUtils, IsoUtcFractionalSeconds) {
    EXPECT_EQ(iso_utc(1700000000.25), "2023-11-14T22:13:20.250000+00:00");
}

TEST(TimeUtils, EpochToNanoseconds) {
    EXPECT_EQ(epoch_to_ns(0), 0);
    EXPECT_EQ(epoch_to_ns(1700000000.0), 1700000000000000000LL);
    EXPECT_EQ(epoch_to_ns(1.5), 1500000000LL);
}

TEST(TimeUtils, NowIsRecent) {
    // 2020-01-01
    EXPECT_GT(now_epoch_secs(), 1577836800.0);
    EXPECT_EQ(now_iso_utc().substr(now_iso_utc().size() - 6), "+00:00");
}

TEST(TimeUtils, FormatElapsedSeconds) {
    EXPECT_EQ(format_elapsed(45), "45s");
    EXPECT_EQ(format_elapsed(0), "0s");
}

TEST(TimeUtils, FormatElapsedMinutes) {
    EXPECT_EQ(format_elapsed(330), "5m30s");
}

TEST(TimeUtils, FormatElapsedHours) {
    EXPECT_EQ(format_elapsed(2 * 3600 + 15 * 60), "2h15m");
}

TEST(TimeUtils, FormatElapsedNegative) {
    EXPECT_EQ(format_elapsed(-1), "-");
}
