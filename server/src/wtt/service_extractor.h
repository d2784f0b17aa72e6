#pragma once

#include <optional>
#include <string>
#include <vector>

#include "network/station_directory.h"
#include "wtt/grid.h"
#include "wtt/timetable.h"

namespace rakelink {

struct ExtractOptions {
  // Rows at the top of each service column that carry identifiers, car count
  // and AC markers.
  int header_rows = 6;
  int default_car_count = kDefaultCarCount;
};

// Station label for `row`, looking up to two rows above when the label cell
// is blank (labels are printed once for an A/D row pair). Empty if all three
// are blank.
std::string LabelNear(const Grid& grid, int row);

// True for the "Reversed as" row label.
bool IsReversalLabel(std::string_view label);

// True if the column only holds "A"/"D" arrival/departure markers.
bool IsIndicatorColumn(const Grid& grid, int column);

// Identifier of the service this column's train turns into, read from the
// "Reversed as" row. Only a plain five digit number counts.
std::optional<ServiceId> FindSuccessor(const Grid& grid, int column);

// Turns one grid column into a Service. Returns nullopt for columns that are
// not workings (blank, repeated station label columns, indicator columns).
std::optional<Service> ExtractService(
    const Grid& grid,
    int column,
    const StationDirectory& directory,
    const ExtractOptions& options = {}
);

// Extracts every working of `grid`, in column order.
std::vector<Service> ExtractServices(
    const Grid& grid,
    const StationDirectory& directory,
    const ExtractOptions& options = {}
);

}  // namespace rakelink
