#include "report/report.h"

#include <algorithm>
#include <format>
#include <sstream>

#include "network/station_directory.h"

namespace rakelink {

namespace {

std::string JoinIds(const std::vector<ServiceId>& ids) {
  std::string result;
  for (const ServiceId& id : ids) {
    if (!result.empty()) result += " ";
    result += id.v;
  }
  return result;
}

std::string JoinStrings(const std::vector<std::string>& values) {
  std::string result;
  for (const std::string& value : values) {
    if (!result.empty()) result += " ";
    result += value;
  }
  return result;
}

std::string DescribeQuery(const RenderQuery& query) {
  std::string directions;
  for (Direction direction : query.directions) {
    if (!directions.empty()) directions += ",";
    directions += DirectionName(direction);
  }
  return std::format(
      "mode={} start={} end={} through=[{}] window={}-{} directions={} ac={}",
      RenderModeName(query.mode),
      query.start_station.value_or("*"),
      query.end_station.value_or("*"),
      JoinStrings(query.passing_through),
      query.window_start.ToString(),
      query.window_end.ToString(),
      directions.empty() ? "*" : directions,
      AcFilterName(query.ac)
  );
}

void WriteConflicts(std::ostream& out, const Timetable& timetable) {
  out << "=== Rake Link Inconsistencies ===\n";
  if (timetable.conflicts.empty()) {
    out << "No inconsistencies found.\n";
    return;
  }
  for (const Conflict& conflict : timetable.conflicts) {
    out << std::format(
        "Link {} ({})\n", conflict.link_name,
        ConflictReasonName(conflict.reason)
    );
    out << "  Summary: " << JoinIds(conflict.declared) << "\n";
    out << "  WTT:     " << JoinStrings(conflict.derived) << "\n";
  }
}

void WriteInvalidLinks(std::ostream& out, const Timetable& timetable) {
  bool header = false;
  for (const Itinerary& itinerary : timetable.itineraries) {
    if (itinerary.status != ItineraryStatus::kInvalid) continue;
    if (!header) {
      out << "\n=== Links With Undefined Services ===\n";
      header = true;
    }
    out << std::format(
        "Link {}: {}\n", itinerary.link_name, JoinIds(itinerary.undefined_ids)
    );
  }
}

std::string DescribeLink(const Timetable& timetable, const Itinerary& link) {
  std::vector<std::string> labels;
  for (ServiceIdx idx : link.service_path) {
    labels.push_back(timetable.service(idx).Label());
  }
  std::string rake = "no rake";
  if (link.rake.has_value()) {
    rake = std::format(
        "rake {} {} {}-car", link.rake->rake_id,
        link.rake->is_ac ? "AC" : "NON-AC", link.rake->car_count
    );
  }
  return std::format(
      "Link {}: {} ({:.1f} km, {})", link.link_name, JoinStrings(labels),
      link.length_km, rake
  );
}

void WriteVisibleLinks(
    std::ostream& out,
    const Timetable& timetable,
    const Visibility& visibility
) {
  out << "\n=== Rake Links Shown ===\n";
  int shown = 0;
  for (size_t i = 0; i < timetable.itineraries.size(); ++i) {
    if (!visibility.itineraries[i]) continue;
    out << DescribeLink(timetable, timetable.itineraries[i]) << "\n";
    ++shown;
  }
  if (shown == 0) {
    out << "No rake links match.\n";
  }
}

void WriteVisibleServices(
    std::ostream& out,
    const Timetable& timetable,
    const Visibility& visibility
) {
  out << "\n=== Services Shown ===\n";
  int shown = 0;
  for (size_t i = 0; i < timetable.itineraries.size(); ++i) {
    const Itinerary& itinerary = timetable.itineraries[i];
    if (!visibility.itineraries[i]) continue;
    std::vector<std::string> labels;
    for (ServiceIdx idx : itinerary.service_path) {
      if (visibility.service(idx)) {
        labels.push_back(timetable.service(idx).Label());
      }
    }
    out << std::format(
        "Link {}: {}\n", itinerary.link_name, JoinStrings(labels)
    );
    shown += static_cast<int>(labels.size());
  }
  if (shown == 0) {
    out << "No services match.\n";
  }
}

void WritePassingThrough(
    std::ostream& out,
    const Timetable& timetable,
    const RenderQuery& query,
    const Visibility& visibility
) {
  for (const std::string& station : query.passing_through) {
    out << "\n=== Passing Through " << NormalizeLabel(station) << " ===\n";
    for (const StationVisit& visit :
         PassingThroughTimes(timetable, visibility, station)) {
      out << std::format(
          "{:<24}{}\n", visit.label,
          visit.time.has_value() ? visit.time->ToString() : "---"
      );
    }
  }
}

}  // namespace

SummaryStatistics ComputeSummaryStatistics(
    const Timetable& timetable, const Visibility& visibility
) {
  SummaryStatistics stats;
  stats.parsed_services = static_cast<int>(timetable.services.size());
  stats.visible_services = visibility.NumVisibleServices();
  for (size_t i = 0; i < timetable.services.size(); ++i) {
    if (!visibility.services[i]) continue;
    if (timetable.services[i].needs_ac) {
      ++stats.ac_services;
    } else {
      ++stats.non_ac_services;
    }
  }
  stats.parsed_links = static_cast<int>(timetable.itineraries.size());
  stats.conflicts = static_cast<int>(timetable.conflicts.size());
  stats.visible_links = visibility.NumVisibleItineraries();

  std::vector<LinkLength> lengths;
  for (size_t i = 0; i < timetable.itineraries.size(); ++i) {
    const Itinerary& itinerary = timetable.itineraries[i];
    if (visibility.itineraries[i] && itinerary.length_km > 0.0) {
      lengths.push_back(LinkLength{itinerary.link_name, itinerary.length_km});
    }
  }
  std::stable_sort(
      lengths.begin(), lengths.end(),
      [](const LinkLength& a, const LinkLength& b) {
        return a.length_km < b.length_km;
      }
  );
  const size_t count =
      std::min(lengths.size(), static_cast<size_t>(kExtremeLinkCount));
  stats.shortest_links.assign(lengths.begin(), lengths.begin() + count);
  stats.longest_links.assign(lengths.rbegin(), lengths.rbegin() + count);
  return stats;
}

std::vector<StationVisit> PassingThroughTimes(
    const Timetable& timetable,
    const Visibility& visibility,
    std::string_view station
) {
  const std::string wanted = NormalizeLabel(station);
  std::vector<StationVisit> visited;
  std::vector<StationVisit> missing;
  for (size_t i = 0; i < timetable.services.size(); ++i) {
    if (!visibility.services[i]) continue;
    const Service& service = timetable.services[i];
    StationVisit visit{.label = service.Label()};
    for (size_t e = 0; e < service.events.size(); ++e) {
      if (visibility.events[i][e] &&
          NormalizeLabel(service.events[e].station) == wanted) {
        visit.time = service.events[e].time;
      }
    }
    (visit.time.has_value() ? visited : missing).push_back(std::move(visit));
  }
  std::stable_sort(
      visited.begin(), visited.end(),
      [](const StationVisit& a, const StationVisit& b) {
        return *a.time < *b.time;
      }
  );
  visited.insert(visited.end(), missing.begin(), missing.end());
  return visited;
}

std::map<std::string, int> CountHeadwayGaps(
    const Timetable& timetable,
    const std::vector<std::string>& stations,
    TrafficTime window_start,
    TrafficTime window_end,
    int gap_minutes
) {
  std::map<std::string, int> gaps;
  for (const std::string& station : stations) {
    const std::string wanted = NormalizeLabel(station);
    std::vector<int> times;
    for (const Service& service : timetable.services) {
      for (const Event& event : service.events) {
        if (NormalizeLabel(event.station) == wanted &&
            window_start <= event.time && event.time <= window_end) {
          times.push_back(event.time.minutes);
        }
      }
    }
    std::sort(times.begin(), times.end());
    int count = 0;
    for (size_t i = 1; i < times.size(); ++i) {
      if (times[i] - times[i - 1] > gap_minutes) {
        ++count;
      }
    }
    gaps[wanted] = count;
  }
  return gaps;
}

std::string TextReport(
    const Timetable& timetable,
    const RenderQuery& query,
    const Visibility& visibility
) {
  std::ostringstream out;
  out << "Query: " << DescribeQuery(query) << "\n\n";
  WriteConflicts(out, timetable);
  WriteInvalidLinks(out, timetable);
  switch (query.mode) {
    case RenderMode::kRakeLink:
      WriteVisibleLinks(out, timetable, visibility);
      break;
    case RenderMode::kService:
      WriteVisibleServices(out, timetable, visibility);
      WritePassingThrough(out, timetable, query, visibility);
      break;
    case RenderMode::kStation:
      break;
  }
  return out.str();
}

}  // namespace rakelink
