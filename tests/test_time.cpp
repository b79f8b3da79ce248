#include <gtest/gtest.h>
#include <tsdb/time_utils.hpp>

using tsdb::format_rfc3339_nano;
using tsdb::from_unix_nanos;

TEST(TimeFormat, WholeSecondsHaveNoFraction) {
  EXPECT_EQ(format_rfc3339_nano(from_unix_nanos(1'434'055'562'000'000'000LL)),
            "2015-06-11T20:46:02Z");
}

TEST(TimeFormat, TrailingZerosTrimmed) {
  EXPECT_EQ(format_rfc3339_nano(from_unix_nanos(1'434'055'562'500'000'000LL)),
            "2015-06-11T20:46:02.5Z");
  EXPECT_EQ(format_rfc3339_nano(from_unix_nanos(1'434'055'562'000'000'120LL)),
            "2015-06-11T20:46:02.00000012Z");
}

TEST(TimeFormat, FullNanosecondPrecision) {
  EXPECT_EQ(format_rfc3339_nano(from_unix_nanos(1'434'055'562'123'456'789LL)),
            "2015-06-11T20:46:02.123456789Z");
}

TEST(TimeFormat, Epoch) {
  EXPECT_EQ(format_rfc3339_nano(from_unix_nanos(0)), "1970-01-01T00:00:00Z");
}

TEST(TimeFormat, BeforeEpochRoundsDown) {
  // -1 нс: последняя наносекунда 1969 года
  EXPECT_EQ(format_rfc3339_nano(from_unix_nanos(-1)),
            "1969-12-31T23:59:59.999999999Z");
}

TEST(TimeConv, UnixNanosRoundTrip) {
  EXPECT_EQ(tsdb::to_unix_nanos(from_unix_nanos(1'730'000'000'123'456'789LL)),
            1'730'000'000'123'456'789LL);
}
