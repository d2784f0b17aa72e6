#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace rakelink {

// The traffic day starts at 02:45. Clock values before that belong to the
// following calendar day.
inline constexpr int kTrafficDayStartMinutes = 2 * 60 + 45;
inline constexpr int kMinutesPerDay = 24 * 60;

// Minutes since midnight on a single scale spanning one traffic day, i.e.
// values run from 165 (02:45) up to 1604 (02:44 the next morning).
struct TrafficTime {
  int minutes = 0;

  bool operator==(const TrafficTime& other) const {
    return minutes == other.minutes;
  }
  bool operator!=(const TrafficTime& other) const {
    return minutes != other.minutes;
  }
  bool operator<(const TrafficTime& other) const {
    return minutes < other.minutes;
  }
  bool operator<=(const TrafficTime& other) const {
    return minutes <= other.minutes;
  }
  bool operator>(const TrafficTime& other) const {
    return minutes > other.minutes;
  }
  bool operator>=(const TrafficTime& other) const {
    return minutes >= other.minutes;
  }

  // "HH:MM" on the ordinary 24h clock.
  std::string ToString() const;
};

// Parses "HH:MM" or "HH:MM:SS" (hours 0-23, one or two digits), optionally
// preceded by a "d/m/yy " date prefix as written by spreadsheet exports.
// Seconds are truncated. Returns nullopt for anything else; such a cell simply
// carries no timing information.
std::optional<TrafficTime> ParseClockTime(std::string_view text);

// True if `text` parses as a clock time.
bool IsClockTime(std::string_view text);

// Shifts minutes-since-midnight onto the traffic day scale.
TrafficTime ToTrafficTime(int minutes_since_midnight);

inline std::ostream& operator<<(std::ostream& os, const TrafficTime& value) {
  return os << "TrafficTime{" << value.minutes << "}";
}

}  // namespace rakelink
