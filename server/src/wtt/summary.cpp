#include "wtt/summary.h"

#include <regex>

#include "network/station_directory.h"

namespace rakelink {

std::optional<std::string> ParseLinkName(std::string_view cell) {
  static const std::regex pattern(R"(^\s*([A-Z]{1,2})\s*(?:)"
                                  "\xE2\x80\xA0"
                                  R"()?\s*$)");
  std::string name = NormalizeLabel(cell);
  std::smatch match;
  if (!std::regex_match(name, match, pattern)) {
    return std::nullopt;
  }
  return match[1].str();
}

std::optional<std::string> ParseLineLabel(std::string_view cell) {
  if (IsBlankCell(cell)) {
    return std::nullopt;
  }
  std::string upper = NormalizeLabel(cell);
  if (upper == "FAST" || upper == "SLOW") {
    return upper;
  }
  if (upper.find("FAST") != std::string::npos ||
      upper.find("SLOW") != std::string::npos) {
    size_t begin = cell.find_first_not_of(" \t\r\n");
    size_t end = cell.find_last_not_of(" \t\r\n");
    return std::string(cell.substr(begin, end - begin + 1));
  }
  return std::nullopt;
}

std::vector<SummaryLink> ParseSummaryTable(const Table& table) {
  std::vector<int> rows;
  for (int row = 0; row < table.NumRows(); ++row) {
    bool blank = true;
    for (const std::string& cell : table.rows[row]) {
      if (!IsBlankCell(cell)) {
        blank = false;
        break;
      }
    }
    if (!blank) {
      rows.push_back(row);
    }
  }

  std::vector<SummaryLink> links;
  for (size_t i = 0; i < rows.size(); ++i) {
    const int row = rows[i];
    std::optional<std::string> link_name =
        ParseLinkName(table.Cell(row, kSummaryLinkNameColumn));
    if (!link_name.has_value()) {
      continue;
    }
    std::optional<int> line_row;
    if (i + kSummaryLineLabelOffset < rows.size()) {
      line_row = rows[i + kSummaryLineLabelOffset];
    }

    SummaryLink link{.link_name = *link_name};
    const int num_columns = static_cast<int>(table.rows[row].size());
    for (int column = kSummaryFirstIdColumn; column < num_columns; ++column) {
      std::optional<ServiceId> id = ParseServiceIdCell(table.Cell(row, column));
      if (!id.has_value()) {
        continue;
      }
      link.ids.push_back(*id);
      link.line_labels.push_back(
          line_row.has_value() ? ParseLineLabel(table.Cell(*line_row, column))
                               : std::nullopt
      );
    }
    if (!link.ids.empty()) {
      links.push_back(std::move(link));
    }
  }
  return links;
}

}  // namespace rakelink
