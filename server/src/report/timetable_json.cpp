#include "report/timetable_json.h"

#include <stdexcept>
#include <variant>

namespace rakelink {

namespace {

std::string_view KindName(const ServiceKind& kind) {
  if (std::holds_alternative<RegularService>(kind)) return "regular";
  if (std::holds_alternative<StablingService>(kind)) return "stabling";
  return "multi";
}

const Itinerary* ItineraryOf(const Timetable& timetable, ServiceIdx idx) {
  for (const Itinerary& itinerary : timetable.itineraries) {
    if (!itinerary.IsValid()) continue;
    for (ServiceIdx member : itinerary.service_path) {
      if (member == idx) {
        return &itinerary;
      }
    }
  }
  return nullptr;
}

TrafficTime WindowBound(const nlohmann::json& j, const char* key) {
  const nlohmann::json& value = j.at(key);
  if (value.is_number_integer()) {
    return TrafficTime{value.get<int>()};
  }
  if (value.is_string()) {
    std::optional<TrafficTime> parsed =
        ParseClockTime(value.get<std::string>());
    if (parsed.has_value()) {
      return *parsed;
    }
  }
  throw std::runtime_error(
      std::string(key) + " must be minutes or an HH:MM time, got " +
      value.dump()
  );
}

}  // namespace

nlohmann::json ServiceToJson(const Timetable& timetable, ServiceIdx idx) {
  const Service& service = timetable.service(idx);
  const Itinerary* itinerary = ItineraryOf(timetable, idx);
  return nlohmann::json{
      {"index", idx.v},
      {"label", service.Label()},
      {"kind", std::string(KindName(service.kind))},
      {"ids", service.Ids()},
      {"direction", service.direction},
      {"column", service.column},
      {"needs_ac", service.needs_ac},
      {"car_count", service.car_count},
      {"car_count_declared", service.car_count_declared},
      {"successor", service.successor},
      {"first_station", service.first_station},
      {"last_station", service.last_station},
      {"length_km", service.length_km},
      {"link_name",
       itinerary != nullptr ? std::optional<std::string>(itinerary->link_name)
                            : std::nullopt},
      {"events", service.events},
  };
}

nlohmann::json ItineraryToJson(
    const Timetable& timetable, const Itinerary& itinerary
) {
  std::vector<int> indices;
  std::vector<std::string> labels;
  for (ServiceIdx idx : itinerary.service_path) {
    indices.push_back(idx.v);
    labels.push_back(timetable.service(idx).Label());
  }
  return nlohmann::json{
      {"link_name", itinerary.link_name},
      {"status", itinerary.status},
      {"declared_ids", itinerary.declared_ids},
      {"declared_lines", itinerary.declared_lines},
      {"undefined_ids", itinerary.undefined_ids},
      {"services", indices},
      {"service_labels", labels},
      {"length_km", itinerary.length_km},
      {"rake", itinerary.rake},
  };
}

nlohmann::json TimetableToJson(const Timetable& timetable) {
  nlohmann::json services = nlohmann::json::array();
  for (size_t i = 0; i < timetable.services.size(); ++i) {
    services.push_back(
        ServiceToJson(timetable, ServiceIdx{static_cast<int>(i)})
    );
  }
  nlohmann::json itineraries = nlohmann::json::array();
  for (const Itinerary& itinerary : timetable.itineraries) {
    itineraries.push_back(ItineraryToJson(timetable, itinerary));
  }
  return nlohmann::json{
      {"services", services},
      {"itineraries", itineraries},
      {"conflicts", timetable.conflicts},
  };
}

nlohmann::json RenderQueryToJson(const RenderQuery& query) {
  return nlohmann::json{
      {"mode", query.mode},
      {"start_station", query.start_station},
      {"end_station", query.end_station},
      {"passing_through", query.passing_through},
      {"window_start", query.window_start.minutes},
      {"window_end", query.window_end.minutes},
      {"directions", query.directions},
      {"ac", query.ac},
      {"link_names", query.link_names},
      {"service_ids", query.service_ids},
  };
}

RenderQuery RenderQueryFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::runtime_error("Render query must be a JSON object");
  }

  RenderQuery query;
  try {
    if (j.contains("mode")) {
      std::optional<RenderMode> mode =
          ParseRenderMode(j.at("mode").get<std::string>());
      if (!mode.has_value()) {
        throw std::runtime_error("Unknown mode " + j.at("mode").dump());
      }
      query.mode = *mode;
    }
    if (j.contains("ac")) {
      std::optional<AcFilter> ac = ParseAcFilter(j.at("ac").get<std::string>());
      if (!ac.has_value()) {
        throw std::runtime_error("Unknown ac filter " + j.at("ac").dump());
      }
      query.ac = *ac;
    }
    query.start_station =
        j.value("start_station", std::optional<std::string>());
    query.end_station = j.value("end_station", std::optional<std::string>());
    query.passing_through =
        j.value("passing_through", std::vector<std::string>());
    if (j.contains("window_start")) {
      query.window_start = WindowBound(j, "window_start");
    }
    if (j.contains("window_end")) {
      query.window_end = WindowBound(j, "window_end");
    }
    if (j.contains("directions")) {
      for (const nlohmann::json& direction : j.at("directions")) {
        const std::string name = direction.get<std::string>();
        if (name == "UP") {
          query.directions.push_back(Direction::kUp);
        } else if (name == "DOWN") {
          query.directions.push_back(Direction::kDown);
        } else {
          throw std::runtime_error("Unknown direction " + name);
        }
      }
    }
    query.link_names = j.value("link_names", std::vector<std::string>());
    query.service_ids = j.value("service_ids", std::vector<ServiceId>());
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("Malformed render query: ") + e.what());
  }

  if (query.window_end < query.window_start) {
    throw std::runtime_error("Render query window ends before it starts");
  }
  return query;
}

nlohmann::json VisibilityToJson(
    const Timetable& timetable, const Visibility& visibility
) {
  std::vector<std::string> visible_services;
  for (size_t i = 0; i < visibility.services.size(); ++i) {
    if (visibility.services[i]) {
      visible_services.push_back(timetable.services[i].Label());
    }
  }
  std::vector<std::string> visible_links;
  for (size_t i = 0; i < visibility.itineraries.size(); ++i) {
    if (visibility.itineraries[i]) {
      visible_links.push_back(timetable.itineraries[i].link_name);
    }
  }
  return nlohmann::json{
      {"services", visibility.services},
      {"events", visibility.events},
      {"itineraries", visibility.itineraries},
      {"visible_services", visible_services},
      {"visible_links", visible_links},
  };
}

}  // namespace rakelink
