#include "util/clock_time.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <iomanip>
#include <sstream>

namespace rakelink {
namespace {

TEST(ClockTimeTest, MorningTimeIsUnchanged) {
  EXPECT_EQ(ParseClockTime("08:00"), TrafficTime{480});
}

TEST(ClockTimeTest, EarlyMorningWrapsToNextDay) {
  EXPECT_EQ(ParseClockTime("01:10"), TrafficTime{1510});
}

TEST(ClockTimeTest, TrafficDayBoundary) {
  EXPECT_EQ(ParseClockTime("02:44"), TrafficTime{164 + kMinutesPerDay});
  EXPECT_EQ(ParseClockTime("02:45"), TrafficTime{165});
}

TEST(ClockTimeTest, SecondsAreTruncated) {
  EXPECT_EQ(ParseClockTime("10:15:59"), TrafficTime{615});
}

TEST(ClockTimeTest, SingleDigitHour) {
  EXPECT_EQ(ParseClockTime("9:05"), TrafficTime{545});
}

TEST(ClockTimeTest, SurroundingWhitespaceIsIgnored) {
  EXPECT_EQ(ParseClockTime("  23:59 "), TrafficTime{1439});
}

TEST(ClockTimeTest, DatePrefixIsIgnored) {
  EXPECT_EQ(ParseClockTime("27/11/2024 07:30:00"), TrafficTime{450});
  EXPECT_EQ(ParseClockTime("1/1/24 00:00"), TrafficTime{kMinutesPerDay});
}

TEST(ClockTimeTest, RejectsNonTimes) {
  EXPECT_EQ(ParseClockTime(""), std::nullopt);
  EXPECT_EQ(ParseClockTime("93001"), std::nullopt);
  EXPECT_EQ(ParseClockTime("24:00"), std::nullopt);
  EXPECT_EQ(ParseClockTime("12:60"), std::nullopt);
  EXPECT_EQ(ParseClockTime("12:3"), std::nullopt);
  EXPECT_EQ(ParseClockTime("12:30:"), std::nullopt);
  EXPECT_EQ(ParseClockTime("ARR 12:30"), std::nullopt);
  EXPECT_EQ(ParseClockTime("nan"), std::nullopt);
  EXPECT_FALSE(IsClockTime("Reversed as"));
}

TEST(ClockTimeTest, ToStringWrapsBackToClock) {
  EXPECT_EQ(TrafficTime{480}.ToString(), "08:00");
  EXPECT_EQ(TrafficTime{1510}.ToString(), "01:10");
}

RC_GTEST_PROP(ClockTimeTest, WrapsOnlyBeforeTrafficDayStart, ()) {
  const int hours = *rc::gen::inRange(0, 24);
  const int minutes = *rc::gen::inRange(0, 60);
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << hours << ":" << std::setw(2)
      << minutes;

  std::optional<TrafficTime> parsed = ParseClockTime(oss.str());
  RC_ASSERT(parsed.has_value());

  const int since_midnight = hours * 60 + minutes;
  if (since_midnight < kTrafficDayStartMinutes) {
    RC_ASSERT(parsed->minutes == since_midnight + kMinutesPerDay);
  } else {
    RC_ASSERT(parsed->minutes == since_midnight);
  }
  RC_ASSERT(parsed->ToString() == oss.str());
}

}  // namespace
}  // namespace rakelink
