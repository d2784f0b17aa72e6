#include "util/clock_time.h"

#include <iomanip>
#include <sstream>

#include "util/strings.h"

namespace rakelink {

namespace {

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

// Matches d/m/yy, dd/mm/yyyy and everything in between.
bool IsDatePrefix(std::string_view s) {
  constexpr int kMinDigits[] = {1, 1, 2};
  constexpr int kMaxDigits[] = {2, 2, 4};
  int part = 0;
  int digits = 0;
  for (char c : s) {
    if (c == '/') {
      if (digits < kMinDigits[part] || part == 2) return false;
      ++part;
      digits = 0;
    } else if (IsDigit(c)) {
      if (++digits > kMaxDigits[part]) return false;
    } else {
      return false;
    }
  }
  return part == 2 && digits >= kMinDigits[part];
}

int TwoDigits(std::string_view s) { return (s[0] - '0') * 10 + (s[1] - '0'); }

}  // namespace

std::string TrafficTime::ToString() const {
  int wrapped = ((minutes % kMinutesPerDay) + kMinutesPerDay) % kMinutesPerDay;
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << wrapped / 60 << ":"
      << std::setw(2) << wrapped % 60;
  return oss.str();
}

TrafficTime ToTrafficTime(int minutes_since_midnight) {
  if (minutes_since_midnight < kTrafficDayStartMinutes) {
    return TrafficTime{minutes_since_midnight + kMinutesPerDay};
  }
  return TrafficTime{minutes_since_midnight};
}

std::optional<TrafficTime> ParseClockTime(std::string_view text) {
  std::string_view s = TrimWhitespace(text);

  // Split off an optional date prefix.
  size_t space = s.find_last_of(" \t");
  if (space != std::string_view::npos) {
    if (!IsDatePrefix(TrimWhitespace(s.substr(0, space)))) {
      return std::nullopt;
    }
    s = s.substr(space + 1);
  }

  size_t colon = s.find(':');
  if (colon != 1 && colon != 2) {
    return std::nullopt;
  }
  std::string_view hours_str = s.substr(0, colon);
  std::string_view rest = s.substr(colon + 1);
  if (rest.size() != 2 && rest.size() != 5) {
    return std::nullopt;
  }
  for (char c : hours_str) {
    if (!IsDigit(c)) return std::nullopt;
  }
  if (!IsDigit(rest[0]) || !IsDigit(rest[1])) {
    return std::nullopt;
  }
  if (rest.size() == 5 &&
      (rest[2] != ':' || !IsDigit(rest[3]) || !IsDigit(rest[4]))) {
    return std::nullopt;
  }

  int hours = hours_str.size() == 1 ? hours_str[0] - '0' : TwoDigits(hours_str);
  int minutes = TwoDigits(rest);
  if (hours > 23 || minutes > 59) {
    return std::nullopt;
  }
  if (rest.size() == 5 && TwoDigits(rest.substr(3)) > 59) {
    return std::nullopt;
  }

  return ToTrafficTime(hours * 60 + minutes);
}

bool IsClockTime(std::string_view text) {
  return ParseClockTime(text).has_value();
}

}  // namespace rakelink
