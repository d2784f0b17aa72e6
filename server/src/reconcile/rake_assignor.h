#pragma once

#include <string>
#include <vector>

#include "wtt/timetable.h"

namespace rakelink {

// Gives every valid itinerary its own Rake, numbered from 1 in itinerary
// order.
//
// The rake is AC as soon as any service on the path needs AC, and takes the
// car count of the first service on the path.
void AssignRakes(Timetable& timetable);

struct AcConversion {
  Timetable timetable;
  // Links whose rake was switched to AC, in the order requested.
  std::vector<std::string> converted;
  // Requested links that were not converted: unknown, not valid, or
  // already AC.
  std::vector<std::string> skipped;
};

// Returns a copy of `timetable` in which the rakes of `link_names`, and every
// service they run, need AC. `timetable` itself is not modified.
AcConversion ConvertLinksToAc(
    const Timetable& timetable, const std::vector<std::string>& link_names
);

}  // namespace rakelink
