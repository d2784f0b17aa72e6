#pragma once

#include <string>

#include "wtt/grid.h"

namespace rakelink {

// Loads a CSV export of a timetable sheet. There is no header row; rows may
// have different numbers of cells. The first `skip_rows` rows (sheet title,
// blank spacer rows) are dropped.
//
// Throws std::runtime_error if the file cannot be opened or parsed.
Table TableLoadCsv(const std::string& csv_path, int skip_rows);

// TableLoadCsv for one direction's sheet.
Grid GridLoadCsv(const std::string& csv_path, Direction direction, int skip_rows);

}  // namespace rakelink
