#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>

#include "render/render_query.h"
#include "util/clock_time.h"
#include "wtt/grid.h"
#include "wtt/service_id.h"
#include "wtt/timetable.h"

namespace nlohmann {

// std::optional as the value or null.
template <typename T>
struct adl_serializer<std::optional<T>> {
  static void to_json(json& j, const std::optional<T>& opt) {
    if (opt)
      j = *opt;
    else
      j = nullptr;
  }
  static void from_json(const json& j, std::optional<T>& opt) {
    if (j.is_null())
      opt = std::nullopt;
    else
      opt = j.get<T>();
  }
};

}  // namespace nlohmann

namespace rakelink {

inline void to_json(nlohmann::json& j, const ServiceId& id) { j = id.v; }
inline void from_json(const nlohmann::json& j, ServiceId& id) {
  id.v = j.get<std::string>();
}

// Clock times travel as "HH:MM" strings.
inline void to_json(nlohmann::json& j, const TrafficTime& time) {
  j = time.ToString();
}
inline void from_json(const nlohmann::json& j, TrafficTime& time) {
  std::optional<TrafficTime> parsed = ParseClockTime(j.get<std::string>());
  if (!parsed.has_value()) {
    throw std::runtime_error("Not a clock time: " + j.get<std::string>());
  }
  time = *parsed;
}

NLOHMANN_JSON_SERIALIZE_ENUM(
    Direction, {{Direction::kUp, "UP"}, {Direction::kDown, "DOWN"}}
)

NLOHMANN_JSON_SERIALIZE_ENUM(
    EventKind,
    {{EventKind::kArrival, "arrival"}, {EventKind::kDeparture, "departure"}}
)

NLOHMANN_JSON_SERIALIZE_ENUM(
    ItineraryStatus,
    {
        {ItineraryStatus::kValid, "valid"},
        {ItineraryStatus::kInvalid, "invalid"},
        {ItineraryStatus::kConflicting, "conflicting"},
    }
)

NLOHMANN_JSON_SERIALIZE_ENUM(
    ConflictReason,
    {
        {ConflictReason::kSequenceMismatch, "sequence_mismatch"},
        {ConflictReason::kServiceAlreadyAssigned, "service_already_assigned"},
        {ConflictReason::kNoStationEvents, "no_station_events"},
    }
)

NLOHMANN_JSON_SERIALIZE_ENUM(
    RenderMode,
    {
        {RenderMode::kService, "service"},
        {RenderMode::kRakeLink, "rakelink"},
        {RenderMode::kStation, "station"},
    }
)

NLOHMANN_JSON_SERIALIZE_ENUM(
    AcFilter,
    {
        {AcFilter::kAll, "all"},
        {AcFilter::kAc, "ac"},
        {AcFilter::kNonAc, "nonac"},
    }
)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Event, station, time, kind);

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Rake, rake_id, is_ac, car_count);

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(
    Conflict, link_name, declared, derived, reason
);

}  // namespace rakelink
