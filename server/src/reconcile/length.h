#pragma once

#include <vector>

#include "network/station_directory.h"
#include "wtt/timetable.h"

namespace rakelink {

// Sum of absolute chainage differences between consecutive events. Zero for
// fewer than two events. Throws if an event's station has no chainage.
double ServiceLengthKm(
    const std::vector<Event>& events, const StationDirectory& directory
);

// Sum of the service lengths along `path`.
double ItineraryLengthKm(
    const std::vector<ServiceIdx>& path, const std::vector<Service>& services
);

}  // namespace rakelink
