#include "render/render_query.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "network/station_directory.h"

namespace rakelink {

namespace {

bool PassesAcFilter(AcFilter filter, bool is_ac) {
  switch (filter) {
    case AcFilter::kAll:
      return true;
    case AcFilter::kAc:
      return is_ac;
    case AcFilter::kNonAc:
      return !is_ac;
  }
  return true;
}

std::vector<std::string> NormalizedStations(
    const std::vector<std::string>& stations
) {
  std::vector<std::string> result;
  result.reserve(stations.size());
  for (const std::string& station : stations) {
    result.push_back(NormalizeLabel(station));
  }
  return result;
}

// Link name of the valid itinerary each service runs on.
std::unordered_map<ServiceIdx, std::string> LinkNameByService(
    const Timetable& timetable
) {
  std::unordered_map<ServiceIdx, std::string> result;
  for (const Itinerary& itinerary : timetable.itineraries) {
    if (!itinerary.IsValid()) continue;
    for (ServiceIdx idx : itinerary.service_path) {
      result.emplace(idx, itinerary.link_name);
    }
  }
  return result;
}

bool TerminalMatches(
    const Event& event, const std::string& station, const RenderQuery& query
) {
  return event.station == station && query.InWindow(event.time);
}

bool ServiceMatches(
    const Service& service,
    ServiceIdx idx,
    const RenderQuery& query,
    const std::vector<std::string>& passing_through,
    const std::unordered_map<ServiceIdx, std::string>& link_names
) {
  if (!query.directions.empty() &&
      std::find(
          query.directions.begin(), query.directions.end(), service.direction
      ) == query.directions.end()) {
    return false;
  }
  if (!PassesAcFilter(query.ac, service.needs_ac)) {
    return false;
  }
  if (query.start_station.has_value() &&
      !TerminalMatches(
          service.events.front(), NormalizeLabel(*query.start_station), query
      )) {
    return false;
  }
  if (query.end_station.has_value() &&
      !TerminalMatches(
          service.events.back(), NormalizeLabel(*query.end_station), query
      )) {
    return false;
  }

  // Every passing-through station must be visited, the last visit inside the
  // window.
  for (const std::string& station : passing_through) {
    std::optional<TrafficTime> last_visit;
    for (const Event& event : service.events) {
      if (event.station == station) {
        last_visit = event.time;
      }
    }
    if (!last_visit.has_value() || !query.InWindow(*last_visit)) {
      return false;
    }
  }

  if (!query.link_names.empty()) {
    auto it = link_names.find(idx);
    if (it == link_names.end() ||
        std::find(
            query.link_names.begin(), query.link_names.end(), it->second
        ) == query.link_names.end()) {
      return false;
    }
  }
  if (!query.service_ids.empty()) {
    bool selected = false;
    for (const ServiceId& id : query.service_ids) {
      if (service.HasId(id)) {
        selected = true;
        break;
      }
    }
    if (!selected) {
      return false;
    }
  }
  return true;
}

bool ItineraryMatches(
    const Timetable& timetable,
    const Itinerary& itinerary,
    const RenderQuery& query,
    const std::vector<std::string>& passing_through
) {
  if (!itinerary.IsValid() || itinerary.service_path.empty()) {
    return false;
  }
  const Service& first = timetable.service(itinerary.service_path.front());
  const Service& last = timetable.service(itinerary.service_path.back());
  if (first.events.empty() || last.events.empty()) {
    return false;
  }
  if (query.start_station.has_value() &&
      first.events.front().station != NormalizeLabel(*query.start_station)) {
    return false;
  }
  if (query.end_station.has_value() &&
      last.events.back().station != NormalizeLabel(*query.end_station)) {
    return false;
  }

  if (!passing_through.empty()) {
    std::unordered_set<std::string> seen;
    for (ServiceIdx idx : itinerary.service_path) {
      for (const Event& event : timetable.service(idx).events) {
        if (query.InWindow(event.time)) {
          seen.insert(event.station);
        }
      }
    }
    for (const std::string& station : passing_through) {
      if (!seen.contains(station)) {
        return false;
      }
    }
  }

  if (query.ac != AcFilter::kAll &&
      (!itinerary.rake.has_value() ||
       !PassesAcFilter(query.ac, itinerary.rake->is_ac))) {
    return false;
  }
  if (!query.link_names.empty() &&
      std::find(
          query.link_names.begin(), query.link_names.end(), itinerary.link_name
      ) == query.link_names.end()) {
    return false;
  }
  return true;
}

}  // namespace

std::string_view RenderModeName(RenderMode mode) {
  switch (mode) {
    case RenderMode::kService:
      return "service";
    case RenderMode::kRakeLink:
      return "rakelink";
    case RenderMode::kStation:
      return "station";
  }
  return "";
}

std::optional<RenderMode> ParseRenderMode(std::string_view name) {
  for (RenderMode mode :
       {RenderMode::kService, RenderMode::kRakeLink, RenderMode::kStation}) {
    if (RenderModeName(mode) == name) {
      return mode;
    }
  }
  return std::nullopt;
}

std::string_view AcFilterName(AcFilter filter) {
  switch (filter) {
    case AcFilter::kAll:
      return "all";
    case AcFilter::kAc:
      return "ac";
    case AcFilter::kNonAc:
      return "nonac";
  }
  return "";
}

std::optional<AcFilter> ParseAcFilter(std::string_view name) {
  for (AcFilter filter : {AcFilter::kAll, AcFilter::kAc, AcFilter::kNonAc}) {
    if (AcFilterName(filter) == name) {
      return filter;
    }
  }
  return std::nullopt;
}

int Visibility::NumVisibleServices() const {
  return static_cast<int>(std::count(services.begin(), services.end(), true));
}

int Visibility::NumVisibleItineraries() const {
  return static_cast<int>(
      std::count(itineraries.begin(), itineraries.end(), true)
  );
}

Visibility EvaluateRenderQuery(
    const Timetable& timetable, const RenderQuery& query
) {
  const size_t num_services = timetable.services.size();
  Visibility visibility;
  visibility.services.assign(num_services, false);
  visibility.events.resize(num_services);
  visibility.itineraries.assign(timetable.itineraries.size(), false);

  const std::vector<std::string> passing_through =
      NormalizedStations(query.passing_through);

  switch (query.mode) {
    case RenderMode::kService: {
      std::unordered_map<ServiceIdx, std::string> link_names =
          LinkNameByService(timetable);
      for (size_t i = 0; i < num_services; ++i) {
        const Service& service = timetable.services[i];
        const ServiceIdx idx{static_cast<int>(i)};
        visibility.services[i] =
            !service.events.empty() &&
            ServiceMatches(service, idx, query, passing_through, link_names);
      }
      break;
    }
    case RenderMode::kRakeLink: {
      for (const Itinerary& itinerary : timetable.itineraries) {
        if (!ItineraryMatches(timetable, itinerary, query, passing_through)) {
          continue;
        }
        for (ServiceIdx idx : itinerary.service_path) {
          visibility.services[idx.v] = !timetable.service(idx).events.empty();
        }
      }
      break;
    }
    case RenderMode::kStation: {
      for (size_t i = 0; i < num_services; ++i) {
        const Service& service = timetable.services[i];
        visibility.services[i] = !service.events.empty() &&
                                 PassesAcFilter(query.ac, service.needs_ac);
      }
      break;
    }
  }

  for (size_t i = 0; i < num_services; ++i) {
    const std::vector<Event>& events = timetable.services[i].events;
    std::vector<bool>& flags = visibility.events[i];
    flags.resize(events.size());
    for (size_t e = 0; e < events.size(); ++e) {
      flags[e] = visibility.services[i] &&
                 (query.mode != RenderMode::kStation ||
                  query.InWindow(events[e].time));
    }
  }

  for (size_t i = 0; i < timetable.itineraries.size(); ++i) {
    for (ServiceIdx idx : timetable.itineraries[i].service_path) {
      if (visibility.services[idx.v]) {
        visibility.itineraries[i] = true;
        break;
      }
    }
  }

  return visibility;
}

}  // namespace rakelink
