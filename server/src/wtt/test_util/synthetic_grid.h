#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "network/station_directory.h"
#include "wtt/grid.h"
#include "wtt/service_extractor.h"

namespace rakelink {

// A five station line: VIRAR (60 km) - BORIVALI (34) - ANDHERI (22) -
// DADAR (10) - CHURCHGATE (0), with codes VR/BVI/ADH/DDR/CCG, the alias
// "ANDHERI (L)" and the off-line code PNVL.
StationDirectory MakeTestDirectory();

// Synthetic sheets have two header rows: identifier, then remarks.
inline constexpr int kTestHeaderRows = 2;

inline ExtractOptions TestExtractOptions() {
  return ExtractOptions{.header_rows = kTestHeaderRows};
}

struct GridRow {
  std::string label;
  std::string indicator;
};

// Rows of the synthetic UP sheet (VIRAR -> CHURCHGATE):
//   0 id, 1 remarks, 2 VIRAR D, 3 BORIVALI A, 4 D, 5 ANDHERI, 6 DADAR,
//   7 CHURCHGATE A, 8 "Reversed as" D, 9 successor.
std::vector<GridRow> UpRows();

// Rows of the synthetic DOWN sheet (CHURCHGATE -> VIRAR):
//   0 id, 1 remarks, 2 CHURCHGATE D, 3 DADAR, 4 ANDHERI, 5 BORIVALI A, 6 D,
//   7 VIRAR A, 8 "Reversed as" (successor).
std::vector<GridRow> DownRows();

// Cells of one service column, keyed by row.
using ColumnCells = std::map<int, std::string>;

// Lays out `rows` in columns 0 and 1 and `columns` from column 2 on.
Grid MakeGrid(
    Direction direction,
    const std::vector<GridRow>& rows,
    const std::vector<ColumnCells>& columns
);

// A complete VIRAR -> CHURCHGATE run on the UP sheet leaving VIRAR at
// `departs` (traffic-day minutes). With a successor the train departs
// CHURCHGATE ten minutes after arriving, reversing into `successor`.
ColumnCells UpWorking(
    const std::string& id,
    int departs,
    const std::optional<std::string>& successor = std::nullopt
);

// A complete CHURCHGATE -> VIRAR run on the DOWN sheet.
ColumnCells DownWorking(
    const std::string& id,
    int departs,
    const std::optional<std::string>& successor = std::nullopt
);

}  // namespace rakelink
