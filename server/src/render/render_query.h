#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "util/clock_time.h"
#include "wtt/grid.h"
#include "wtt/service_id.h"
#include "wtt/timetable.h"

namespace rakelink {

enum class RenderMode {
  // Filter individual services.
  kService,
  // Filter whole rake links.
  kRakeLink,
  // Show every service, and only the events inside the time window.
  kStation,
};

enum class AcFilter { kAll, kAc, kNonAc };

std::string_view RenderModeName(RenderMode mode);
std::optional<RenderMode> ParseRenderMode(std::string_view name);

std::string_view AcFilterName(AcFilter filter);
std::optional<AcFilter> ParseAcFilter(std::string_view name);

struct RenderQuery {
  RenderMode mode = RenderMode::kService;

  std::optional<std::string> start_station;
  std::optional<std::string> end_station;
  std::vector<std::string> passing_through;

  // Inclusive.
  TrafficTime window_start{kTrafficDayStartMinutes};
  TrafficTime window_end{kTrafficDayStartMinutes + kMinutesPerDay};

  // Empty means either direction.
  std::vector<Direction> directions;
  AcFilter ac = AcFilter::kAll;

  // Empty means no restriction.
  std::vector<std::string> link_names;
  std::vector<ServiceId> service_ids;

  bool InWindow(TrafficTime time) const {
    return window_start <= time && time <= window_end;
  }
};

// What a query shows. Indexed like the timetable it was evaluated against:
// services[i] and events[i] belong to Timetable::services[i], itineraries[i]
// to Timetable::itineraries[i].
struct Visibility {
  std::vector<bool> services;
  std::vector<std::vector<bool>> events;
  std::vector<bool> itineraries;

  bool operator==(const Visibility& other) const {
    return services == other.services && events == other.events &&
           itineraries == other.itineraries;
  }

  bool service(ServiceIdx idx) const { return services[idx.v]; }
  int NumVisibleServices() const;
  int NumVisibleItineraries() const;
};

// Evaluates `query` against `timetable`. Services without events are never
// visible, and an itinerary is visible iff one of its services is.
Visibility EvaluateRenderQuery(
    const Timetable& timetable, const RenderQuery& query
);

}  // namespace rakelink
