#include "wtt/test_util/synthetic_grid.h"

#include "util/clock_time.h"

namespace rakelink {

namespace {

std::string Clock(int minutes) { return TrafficTime{minutes}.ToString(); }

}  // namespace

StationDirectory MakeTestDirectory() {
  return StationDirectory(
      {
          Station{"VIRAR", 60.0},
          Station{"BORIVALI", 34.0},
          Station{"ANDHERI", 22.0},
          Station{"DADAR", 10.0},
          Station{"CHURCHGATE", 0.0},
      },
      {{"ANDHERI (L)", "ANDHERI"}},
      {
          {"VR", "VIRAR"},
          {"BVI", "BORIVALI"},
          {"ADH", "ANDHERI"},
          {"DDR", "DADAR"},
          {"CCG", "CHURCHGATE"},
          {"PNVL", "PANVEL"},
      }
  );
}

std::vector<GridRow> UpRows() {
  return {
      {"", ""},
      {"", ""},
      {"VIRAR", "D"},
      {"BORIVALI", "A"},
      {"", "D"},
      {"ANDHERI", ""},
      {"DADAR", ""},
      {"CHURCHGATE", "A"},
      {"Reversed as", "D"},
      {"", ""},
  };
}

std::vector<GridRow> DownRows() {
  return {
      {"", ""},
      {"", ""},
      {"CHURCHGATE", "D"},
      {"DADAR", ""},
      {"ANDHERI", ""},
      {"BORIVALI", "A"},
      {"", "D"},
      {"VIRAR", "A"},
      {"Reversed as", ""},
  };
}

Grid MakeGrid(
    Direction direction,
    const std::vector<GridRow>& rows,
    const std::vector<ColumnCells>& columns
) {
  Grid grid{direction, {}};
  const int num_columns =
      Grid::kFirstServiceColumn + static_cast<int>(columns.size());
  for (size_t r = 0; r < rows.size(); ++r) {
    std::vector<std::string> row(num_columns);
    row[Grid::kStationColumn] = rows[r].label;
    row[Grid::kIndicatorColumn] = rows[r].indicator;
    for (size_t c = 0; c < columns.size(); ++c) {
      auto it = columns[c].find(static_cast<int>(r));
      if (it != columns[c].end()) {
        row[Grid::kFirstServiceColumn + c] = it->second;
      }
    }
    grid.table.rows.push_back(std::move(row));
  }
  return grid;
}

ColumnCells UpWorking(
    const std::string& id,
    int departs,
    const std::optional<std::string>& successor
) {
  ColumnCells cells{
      {0, id},
      {2, Clock(departs)},
      {3, Clock(departs + 20)},
      {4, Clock(departs + 21)},
      {5, Clock(departs + 32)},
      {6, Clock(departs + 45)},
      {7, Clock(departs + 60)},
  };
  if (successor.has_value()) {
    cells[8] = Clock(departs + 70);
    cells[9] = *successor;
  }
  return cells;
}

ColumnCells DownWorking(
    const std::string& id,
    int departs,
    const std::optional<std::string>& successor
) {
  ColumnCells cells{
      {0, id},
      {2, Clock(departs)},
      {3, Clock(departs + 15)},
      {4, Clock(departs + 28)},
      {5, Clock(departs + 40)},
      {6, Clock(departs + 41)},
      {7, Clock(departs + 70)},
  };
  if (successor.has_value()) {
    cells[8] = *successor;
  }
  return cells;
}

}  // namespace rakelink
