#include "wtt/grid.h"

#include <cctype>

#include "util/strings.h"

namespace rakelink {

bool IsBlankCell(std::string_view cell) {
  std::string_view trimmed = TrimWhitespace(cell);
  if (trimmed.empty()) {
    return true;
  }
  return trimmed.size() == 3 &&
         std::tolower(static_cast<unsigned char>(trimmed[0])) == 'n' &&
         std::tolower(static_cast<unsigned char>(trimmed[1])) == 'a' &&
         std::tolower(static_cast<unsigned char>(trimmed[2])) == 'n';
}

}  // namespace rakelink
