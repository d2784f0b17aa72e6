#include "reconcile/pipeline.h"

#include <format>

#include "reconcile/rake_assignor.h"
#include "reconcile/reconciler.h"
#include "wtt/grid_csv.h"
#include "wtt/summary.h"

namespace rakelink {

std::vector<Service> ExtractAllServices(
    const ScheduleGrids& grids,
    const StationDirectory& directory,
    const ExtractOptions& options
) {
  std::vector<Service> services = ExtractServices(grids.up, directory, options);
  for (Service& service : ExtractServices(grids.down, directory, options)) {
    services.push_back(std::move(service));
  }
  return services;
}

Timetable BuildTimetable(
    const ScheduleGrids& grids,
    const Table& summary,
    const StationDirectory& directory,
    const ExtractOptions& options,
    const TextLogger& log
) {
  std::vector<Service> services =
      ExtractAllServices(grids, directory, options);
  log(std::format("Extracted {} services", services.size()));

  std::vector<SummaryLink> links = ParseSummaryTable(summary);
  log(std::format("Read {} links from the summary", links.size()));

  Timetable timetable = Reconcile(
      std::move(services),
      links,
      grids,
      directory,
      ComponentLogger(log, "reconcile")
  );
  AssignRakes(timetable);
  return timetable;
}

LoadedTimetable BuildTimetableFromConfig(
    const EngineConfig& config, const TextLogger& log
) {
  log("Loading stations from: " + config.stations_path);
  StationDirectory directory = StationDirectoryLoad(config.stations_path);

  log("Loading UP sheet from: " + config.up_grid_path);
  log("Loading DOWN sheet from: " + config.down_grid_path);
  ScheduleGrids grids{
      .up = GridLoadCsv(
          config.up_grid_path, Direction::kUp, config.grid_skip_rows
      ),
      .down = GridLoadCsv(
          config.down_grid_path, Direction::kDown, config.grid_skip_rows
      ),
  };

  log("Loading summary from: " + config.summary_path);
  Table summary = TableLoadCsv(config.summary_path, config.summary_skip_rows);

  Timetable timetable =
      BuildTimetable(grids, summary, directory, config.extract, log);
  return LoadedTimetable{std::move(directory), std::move(timetable)};
}

}  // namespace rakelink
