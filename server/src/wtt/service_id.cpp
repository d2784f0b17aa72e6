#include "wtt/service_id.h"

#include <regex>

#include "util/strings.h"

namespace rakelink {

namespace {

const std::regex& NumericIdPattern() {
  static const std::regex pattern(R"(^\s*(\d{5})(?:\b.*)?$)");
  return pattern;
}

const std::regex& PlaceholderPattern() {
  static const std::regex pattern(
      R"(\bETY\s*(\d+)\b)", std::regex::icase
  );
  return pattern;
}

}  // namespace

std::optional<ServiceId> ParseServiceIdCell(std::string_view cell) {
  std::string text(cell);
  std::smatch match;
  if (std::regex_search(text, match, PlaceholderPattern())) {
    std::string number = match[1].str();
    size_t first_nonzero = number.find_first_not_of('0');
    number = first_nonzero == std::string::npos ? "0"
                                                : number.substr(first_nonzero);
    return ServiceId{"ETY " + number};
  }
  if (std::regex_match(text, match, NumericIdPattern())) {
    return ServiceId{match[1].str()};
  }
  return std::nullopt;
}

bool IsStablingPlaceholder(const ServiceId& id) {
  return id.v.find("ETY") != std::string::npos;
}

bool IsFiveDigitNumeral(std::string_view text) {
  text = TrimWhitespace(text);
  if (text.size() != kServiceIdDigits) {
    return false;
  }
  for (char c : text) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

}  // namespace rakelink
