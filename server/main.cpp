#include <iostream>
#include <string>

#include "crow.h"
#include "config/engine_config.h"
#include "log.h"
#include "reconcile/pipeline.h"
#include "render/render_query.h"
#include "report/report.h"
#include "report/timetable_json.h"

using namespace rakelink;

static crow::response JsonResponse(const nlohmann::json& j) {
  crow::response res(200, j.dump());
  res.add_header("Content-Type", "application/json");
  return res;
}

int main(int argc, char* argv[]) {
  crow::SimpleApp app;

  const std::string config_path = argc > 1 ? argv[1] : "../data/engine.toml";

  LoadedTimetable loaded;
  try {
    loaded = BuildTimetableFromConfig(
        EngineConfigLoad(config_path), OstreamLogger(std::cout)
    );
    std::cout << "Loaded " << loaded.timetable.services.size()
              << " services and " << loaded.timetable.itineraries.size()
              << " rake links" << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error loading timetable: " << e.what() << std::endl;
    return 1;
  }
  const Timetable& timetable = loaded.timetable;

  CROW_ROUTE(app, "/itineraries")([&timetable]() {
    nlohmann::json j = nlohmann::json::array();
    for (const Itinerary& itinerary : timetable.itineraries) {
      j.push_back(ItineraryToJson(timetable, itinerary));
    }
    return JsonResponse(j);
  });

  CROW_ROUTE(app, "/services")([&timetable]() {
    return JsonResponse(TimetableToJson(timetable)["services"]);
  });

  CROW_ROUTE(app, "/conflicts")([&timetable]() {
    nlohmann::json j = timetable.conflicts;
    return JsonResponse(j);
  });

  CROW_ROUTE(app, "/summary")([&timetable]() {
    nlohmann::json j = ComputeSummaryStatistics(
        timetable, EvaluateRenderQuery(timetable, RenderQuery{})
    );
    return JsonResponse(j);
  });

  CROW_ROUTE(app, "/report")([&timetable]() {
    RenderQuery query;
    crow::response res(
        200, TextReport(timetable, query, EvaluateRenderQuery(timetable, query))
    );
    res.add_header("Content-Type", "text/plain");
    return res;
  });

  CROW_ROUTE(app, "/render")
      .methods(crow::HTTPMethod::Post)([&timetable](const crow::request& req) {
        RenderQuery query;
        try {
          query = RenderQueryFromJson(nlohmann::json::parse(req.body));
        } catch (const nlohmann::json::parse_error& e) {
          return crow::response(400, e.what());
        } catch (const std::runtime_error& e) {
          return crow::response(400, e.what());
        }
        Visibility visibility = EvaluateRenderQuery(timetable, query);
        nlohmann::json j = VisibilityToJson(timetable, visibility);
        j["query"] = RenderQueryToJson(query);
        j["summary"] = ComputeSummaryStatistics(timetable, visibility);
        return JsonResponse(j);
      });

  app.port(18080).multithreaded().run();
}
