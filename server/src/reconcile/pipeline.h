#pragma once

#include <vector>

#include "config/engine_config.h"
#include "log.h"
#include "network/station_directory.h"
#include "wtt/grid.h"
#include "wtt/service_extractor.h"
#include "wtt/timetable.h"

namespace rakelink {

// Services of both sheets, UP columns first.
std::vector<Service> ExtractAllServices(
    const ScheduleGrids& grids,
    const StationDirectory& directory,
    const ExtractOptions& options
);

// Extract, reconcile against the summary sheet, and assign rakes.
Timetable BuildTimetable(
    const ScheduleGrids& grids,
    const Table& summary,
    const StationDirectory& directory,
    const ExtractOptions& options,
    const TextLogger& log
);

struct LoadedTimetable {
  StationDirectory directory;
  Timetable timetable;
};

// Loads every input named by `config` and runs BuildTimetable. Throws
// std::runtime_error if an input cannot be read.
LoadedTimetable BuildTimetableFromConfig(
    const EngineConfig& config, const TextLogger& log
);

}  // namespace rakelink
