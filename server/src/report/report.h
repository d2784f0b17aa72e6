#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "render/render_query.h"
#include "util/clock_time.h"
#include "wtt/timetable.h"

namespace rakelink {

struct LinkLength {
  std::string link_name;
  double length_km;

  bool operator==(const LinkLength& other) const {
    return link_name == other.link_name && length_km == other.length_km;
  }
};

inline constexpr int kExtremeLinkCount = 3;

struct SummaryStatistics {
  int parsed_services = 0;
  int visible_services = 0;
  // Among visible services.
  int ac_services = 0;
  int non_ac_services = 0;
  int parsed_links = 0;
  int conflicts = 0;
  int visible_links = 0;
  // Visible links with a positive length, shortest first / longest first.
  std::vector<LinkLength> shortest_links;
  std::vector<LinkLength> longest_links;
};

SummaryStatistics ComputeSummaryStatistics(
    const Timetable& timetable, const Visibility& visibility
);

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(LinkLength, link_name, length_km);

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(
    SummaryStatistics,
    parsed_services,
    visible_services,
    ac_services,
    non_ac_services,
    parsed_links,
    conflicts,
    visible_links,
    shortest_links,
    longest_links
);

// A visible service's last visible visit to a station.
struct StationVisit {
  std::string label;
  std::optional<TrafficTime> time;
};

// Visible services with their last visible visit to `station`, earliest
// first. Services that never stop there come last, in arena order.
std::vector<StationVisit> PassingThroughTimes(
    const Timetable& timetable,
    const Visibility& visibility,
    std::string_view station
);

// For each of `stations`, the number of gaps between consecutive events there
// (all services, both directions, inside [window_start, window_end]) that are
// longer than `gap_minutes`.
std::map<std::string, int> CountHeadwayGaps(
    const Timetable& timetable,
    const std::vector<std::string>& stations,
    TrafficTime window_start,
    TrafficTime window_end,
    int gap_minutes
);

// Human readable discrepancy report: the query, summary-vs-grid conflicts,
// invalid links, and what the query shows.
std::string TextReport(
    const Timetable& timetable,
    const RenderQuery& query,
    const Visibility& visibility
);

}  // namespace rakelink
