#pragma once
#include <functional>
#include <iostream>
#include <string>
#include <string_view>

namespace rakelink {

using TextLogger = std::function<void(std::string_view)>;

inline TextLogger OstreamLogger(std::ostream& os) {
  return [&os](std::string_view msg) { os << msg << "\n"; };
}

inline TextLogger NullLogger() {
  return [](std::string_view) {};
}

// Prepends "[component] " to every message sent to `logger`.
inline TextLogger ComponentLogger(TextLogger logger, std::string component) {
  return [logger = std::move(logger),
          prefix = "[" + std::move(component) + "] "](std::string_view msg) {
    logger(prefix + std::string(msg));
  };
}

}  // namespace rakelink
