#pragma once

#include <vector>

#include "network/station_directory.h"
#include "wtt/grid.h"
#include "wtt/timetable.h"

namespace rakelink {

// Turns the timed cells of `service` into station visits, in row order.
//
// A row whose indicator is "A" is an arrival. If the next row is a "D" row
// holding a time, that row is the matching departure at the same station and
// is consumed. Any other timed row is a single arrival-kind event. A
// "Reversed as" row belongs to the station of the previous event. Rows whose
// label does not resolve to a station are skipped.
//
// `grid` must be the sheet the service was extracted from.
std::vector<Event> SequenceEvents(
    const Service& service, const Grid& grid, const StationDirectory& directory
);

}  // namespace rakelink
