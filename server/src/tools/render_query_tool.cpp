#include <CLI/CLI.hpp>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "config/engine_config.h"
#include "log.h"
#include "reconcile/pipeline.h"
#include "render/render_query.h"
#include "report/report.h"
#include "util/clock_time.h"

using namespace rakelink;

static TrafficTime ParseWindowBound(const std::string& text) {
  std::optional<TrafficTime> time = ParseClockTime(text);
  if (!time.has_value()) {
    throw std::runtime_error("Not a clock time: " + text);
  }
  return *time;
}

int main(int argc, char* argv[]) {
  CLI::App app{"Show which services and rake links match a query"};

  std::string config_path;
  std::string mode = "service";
  std::string ac = "all";
  std::string start_station;
  std::string end_station;
  std::vector<std::string> passing_through;
  std::string window_start;
  std::string window_end;
  std::vector<std::string> directions;
  std::vector<std::string> link_names;
  std::vector<std::string> service_ids;
  int headway_gap = 0;
  bool verbose = false;

  app.add_option("config_path", config_path, "Path to engine TOML config file")
      ->required();
  app.add_option("--mode", mode, "service, rakelink or station")
      ->default_val("service");
  app.add_option("--ac", ac, "all, ac or nonac")->default_val("all");
  app.add_option("--start", start_station, "Station the service starts at");
  app.add_option("--end", end_station, "Station the service ends at");
  app.add_option("--through", passing_through, "Stations passed through");
  app.add_option("--from", window_start, "Window start, HH:MM");
  app.add_option("--to", window_end, "Window end, HH:MM");
  app.add_option("--direction", directions, "UP and/or DOWN");
  app.add_option("--link", link_names, "Only these links");
  app.add_option("--service", service_ids, "Only these services");
  app.add_option(
      "--headway-gap",
      headway_gap,
      "Count gaps longer than this many minutes at the --through stations"
  );
  app.add_flag("-v,--verbose", verbose, "Log pipeline progress");

  CLI11_PARSE(app, argc, argv);

  TextLogger log = verbose ? OstreamLogger(std::cerr) : NullLogger();

  try {
    RenderQuery query;
    std::optional<RenderMode> parsed_mode = ParseRenderMode(mode);
    if (!parsed_mode.has_value()) {
      throw std::runtime_error("Unknown mode: " + mode);
    }
    query.mode = *parsed_mode;
    std::optional<AcFilter> parsed_ac = ParseAcFilter(ac);
    if (!parsed_ac.has_value()) {
      throw std::runtime_error("Unknown AC filter: " + ac);
    }
    query.ac = *parsed_ac;
    if (!start_station.empty()) query.start_station = start_station;
    if (!end_station.empty()) query.end_station = end_station;
    query.passing_through = passing_through;
    if (!window_start.empty()) query.window_start = ParseWindowBound(window_start);
    if (!window_end.empty()) query.window_end = ParseWindowBound(window_end);
    for (const std::string& direction : directions) {
      if (direction == "UP") {
        query.directions.push_back(Direction::kUp);
      } else if (direction == "DOWN") {
        query.directions.push_back(Direction::kDown);
      } else {
        throw std::runtime_error("Unknown direction: " + direction);
      }
    }
    query.link_names = link_names;
    for (const std::string& id : service_ids) {
      query.service_ids.push_back(ServiceId{id});
    }

    LoadedTimetable loaded =
        BuildTimetableFromConfig(EngineConfigLoad(config_path), log);
    Visibility visibility = EvaluateRenderQuery(loaded.timetable, query);

    std::cout << TextReport(loaded.timetable, query, visibility);

    SummaryStatistics stats =
        ComputeSummaryStatistics(loaded.timetable, visibility);
    std::cout << "\n=== Summary ===\n"
              << "Services: " << stats.visible_services << " of "
              << stats.parsed_services << " (" << stats.ac_services << " AC, "
              << stats.non_ac_services << " non-AC)\n"
              << "Links: " << stats.visible_links << " of "
              << stats.parsed_links << ", " << stats.conflicts
              << " conflicts\n";
    for (const LinkLength& link : stats.shortest_links) {
      std::cout << "  shortest " << link.link_name << " " << link.length_km
                << " km\n";
    }
    for (const LinkLength& link : stats.longest_links) {
      std::cout << "  longest " << link.link_name << " " << link.length_km
                << " km\n";
    }

    if (headway_gap > 0) {
      std::cout << "\n=== Headway Gaps > " << headway_gap << " min ===\n";
      for (const auto& [station, count] : CountHeadwayGaps(
               loaded.timetable,
               passing_through,
               query.window_start,
               query.window_end,
               headway_gap
           )) {
        std::cout << station << "\t" << count << "\n";
      }
    }
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
