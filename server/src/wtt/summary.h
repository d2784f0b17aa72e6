#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wtt/grid.h"
#include "wtt/service_id.h"

namespace rakelink {

// One rake link as declared in the summary sheet.
struct SummaryLink {
  std::string link_name;
  std::vector<ServiceId> ids;
  // FAST/SLOW label printed two rows under each id, parallel to `ids`.
  std::vector<std::optional<std::string>> line_labels;
};

inline constexpr int kSummaryLinkNameColumn = 1;
inline constexpr int kSummaryFirstIdColumn = 2;
inline constexpr int kSummaryLineLabelOffset = 2;

// One or two capital letters, optionally followed by a dagger. Returns the
// letters.
std::optional<std::string> ParseLinkName(std::string_view cell);

// "FAST"/"SLOW" for exact matches, the trimmed cell for cells mentioning
// either, nullopt otherwise.
std::optional<std::string> ParseLineLabel(std::string_view cell);

// Reads every link of the summary sheet, in sheet order. Fully blank rows are
// ignored, also when counting the two rows down to the line labels. Rows
// without a link name or without any identifier are not links.
std::vector<SummaryLink> ParseSummaryTable(const Table& table);

}  // namespace rakelink
