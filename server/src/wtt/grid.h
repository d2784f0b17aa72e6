#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace rakelink {

enum class Direction { kUp, kDown };

inline std::string_view DirectionName(Direction direction) {
  return direction == Direction::kUp ? "UP" : "DOWN";
}

// A rectangular-ish table of cell text, as exported from a spreadsheet. Rows
// may have different lengths; missing cells read as empty.
struct Table {
  std::vector<std::vector<std::string>> rows;

  const std::string& Cell(int row, int column) const {
    static const std::string kEmpty;
    if (row < 0 || column < 0 || row >= static_cast<int>(rows.size())) {
      return kEmpty;
    }
    const std::vector<std::string>& r = rows[row];
    if (column >= static_cast<int>(r.size())) {
      return kEmpty;
    }
    return r[column];
  }

  int NumRows() const { return static_cast<int>(rows.size()); }

  int NumColumns() const {
    size_t max_columns = 0;
    for (const auto& row : rows) {
      max_columns = std::max(max_columns, row.size());
    }
    return static_cast<int>(max_columns);
  }
};

// One sheet of the working timetable. Column 0 holds the station labels,
// column 1 the arrival/departure indicators ("A"/"D"), and every further
// column is one working.
struct Grid {
  Direction direction = Direction::kUp;
  Table table;

  static constexpr int kStationColumn = 0;
  static constexpr int kIndicatorColumn = 1;
  static constexpr int kFirstServiceColumn = 2;

  const std::string& Cell(int row, int column) const {
    return table.Cell(row, column);
  }
  const std::string& StationLabel(int row) const {
    return table.Cell(row, kStationColumn);
  }
  const std::string& Indicator(int row) const {
    return table.Cell(row, kIndicatorColumn);
  }
  int NumRows() const { return table.NumRows(); }
  int NumColumns() const { return table.NumColumns(); }
};

// The two sheets of the working timetable.
struct ScheduleGrids {
  Grid up{Direction::kUp, {}};
  Grid down{Direction::kDown, {}};

  const Grid& ForDirection(Direction direction) const {
    return direction == Direction::kUp ? up : down;
  }
};

// True for empty, whitespace-only, and "nan" cells (pandas exports write NaN
// for blank cells).
bool IsBlankCell(std::string_view cell);

}  // namespace rakelink
