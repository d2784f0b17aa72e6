#pragma once

#include <string_view>

namespace rakelink {

// `text` without leading and trailing whitespace.
std::string_view TrimWhitespace(std::string_view text);

}  // namespace rakelink
