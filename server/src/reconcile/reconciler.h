#pragma once

#include <optional>
#include <vector>

#include "log.h"
#include "network/station_directory.h"
#include "wtt/grid.h"
#include "wtt/summary.h"
#include "wtt/timetable.h"

namespace rakelink {

// How a declared link compares with the chain found in the grid.
enum class ChainMatch {
  kExact,
  // The chain stops one or two entries early, and all the missing trailing
  // entries are ETY placeholders.
  kTrailingPlaceholders,
  kMismatch,
};

ChainMatch CompareWithChain(
    const std::vector<ServiceId>& declared,
    const std::vector<std::optional<ServiceId>>& chain_ids
);

// Cross-checks every summary link against the successor chains of
// `services` and builds the timetable.
//
// Links are processed in summary order, and each becomes an Itinerary:
// - any declared id without a service makes it invalid;
// - otherwise the chain starting at its first id must match (exactly, or up
//   to trailing ETY placeholders);
// - if there is no such chain but the first id is another service's
//   successor, the chain is ambiguous and the declared ids are looked up one
//   by one instead;
// - anything else, a service already used by an earlier link, or a service
//   without station events makes it conflicting and records a Conflict.
//
// Events, first/last stations and lengths are only filled in for services of
// valid itineraries. `grids` must be the sheets `services` came from.
Timetable Reconcile(
    std::vector<Service> services,
    const std::vector<SummaryLink>& links,
    const ScheduleGrids& grids,
    const StationDirectory& directory,
    const TextLogger& log
);

}  // namespace rakelink
