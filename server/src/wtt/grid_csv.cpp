#include "wtt/grid_csv.h"

#include <csv.hpp>
#include <filesystem>
#include <stdexcept>

namespace rakelink {

Table TableLoadCsv(const std::string& csv_path, int skip_rows) {
  if (!std::filesystem::exists(csv_path)) {
    throw std::runtime_error("No such file: " + csv_path);
  }

  Table table;
  try {
    csv::CSVFormat format;
    format.delimiter(',').no_header().variable_columns(
        csv::VariableColumnPolicy::KEEP
    );
    csv::CSVReader reader(csv_path, format);

    int row_index = 0;
    for (csv::CSVRow& row : reader) {
      if (row_index++ < skip_rows) {
        continue;
      }
      std::vector<std::string>& cells = table.rows.emplace_back();
      cells.reserve(row.size());
      for (size_t i = 0; i < row.size(); ++i) {
        cells.push_back(row[i].get<std::string>());
      }
    }
  } catch (const std::exception& e) {
    throw std::runtime_error(
        "Could not open or parse file: " + csv_path + " - " + e.what()
    );
  }

  return table;
}

Grid GridLoadCsv(
    const std::string& csv_path, Direction direction, int skip_rows
) {
  return Grid{direction, TableLoadCsv(csv_path, skip_rows)};
}

}  // namespace rakelink
