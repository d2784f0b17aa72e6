#include <CLI/CLI.hpp>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "config/engine_config.h"
#include "log.h"
#include "reconcile/pipeline.h"
#include "reconcile/rake_assignor.h"
#include "render/render_query.h"
#include "report/report.h"
#include "report/timetable_json.h"

using namespace rakelink;

int main(int argc, char* argv[]) {
  CLI::App app{"Reconcile the working timetable against its rake-link summary"};

  std::string config_path;
  std::string output_path;
  std::string report_path;
  std::vector<std::string> ac_links;

  app.add_option("config_path", config_path, "Path to engine TOML config file")
      ->required();
  app.add_option("output_path", output_path, "Output JSON file path")
      ->required();
  app.add_option(
      "--report", report_path, "Also write the text report to this file"
  );
  app.add_option(
      "--convert-ac", ac_links, "Links whose rakes are converted to AC"
  );

  CLI11_PARSE(app, argc, argv);

  TextLogger log = OstreamLogger(std::cout);

  try {
    EngineConfig config = EngineConfigLoad(config_path);
    LoadedTimetable loaded = BuildTimetableFromConfig(config, log);
    Timetable timetable = std::move(loaded.timetable);

    if (!ac_links.empty()) {
      AcConversion conversion = ConvertLinksToAc(timetable, ac_links);
      for (const std::string& link : conversion.converted) {
        log("Converted link " + link + " to AC");
      }
      for (const std::string& link : conversion.skipped) {
        log("Did not convert link " + link);
      }
      timetable = std::move(conversion.timetable);
    }

    RenderQuery query;
    Visibility visibility = EvaluateRenderQuery(timetable, query);

    nlohmann::json j = TimetableToJson(timetable);
    j["summary"] = ComputeSummaryStatistics(timetable, visibility);
    std::ofstream out(output_path);
    if (!out.is_open()) {
      throw std::runtime_error("Could not write " + output_path);
    }
    out << j.dump(2);
    out.close();
    std::cout << "Saved timetable to: " << output_path << "\n";

    std::string report = TextReport(timetable, query, visibility);
    if (report_path.empty()) {
      std::cout << "\n" << report;
    } else {
      std::ofstream report_out(report_path);
      if (!report_out.is_open()) {
        throw std::runtime_error("Could not write " + report_path);
      }
      report_out << report;
      std::cout << "Saved report to: " << report_path << "\n";
    }
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
