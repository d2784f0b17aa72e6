#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace rakelink {

// A service identifier as printed in the timetable: either a five digit
// number ("93001") or a stabling placeholder ("ETY 12").
struct ServiceId {
  std::string v;

  bool operator==(const ServiceId& other) const { return v == other.v; }
  bool operator!=(const ServiceId& other) const { return v != other.v; }
  bool operator<(const ServiceId& other) const { return v < other.v; }
};

inline constexpr size_t kServiceIdDigits = 5;

// Recognizes an identifier cell and returns its normalized form.
//
// - "ETY 12", "ety12", "SPL ETY 3 LOCAL" -> "ETY 12", "ETY 12", "ETY 3"
// - "93232 L/SPL" -> "93232"
//
// Numeric cells must start with exactly five digits.
std::optional<ServiceId> ParseServiceIdCell(std::string_view cell);

// True for "ETY <n>" placeholders, which name no revenue service.
bool IsStablingPlaceholder(const ServiceId& id);

// True if `text`, trimmed, is exactly a five digit number.
bool IsFiveDigitNumeral(std::string_view text);

inline std::ostream& operator<<(std::ostream& os, const ServiceId& value) {
  return os << value.v;
}

inline void PrintTo(const ServiceId& id, std::ostream* os) {
  *os << "ServiceId{\"" << id.v << "\"}";
}

}  // namespace rakelink

namespace std {
template <>
struct hash<rakelink::ServiceId> {
  size_t operator()(const rakelink::ServiceId& id) const {
    return hash<string>()(id.v);
  }
};
}  // namespace std
