#pragma once

#include <nlohmann/json.hpp>

#include "render/render_query.h"
#include "serialization/json.h"
#include "wtt/timetable.h"

namespace rakelink {

// Service `idx` with its events, identifiers and the link it runs on.
nlohmann::json ServiceToJson(const Timetable& timetable, ServiceIdx idx);

nlohmann::json ItineraryToJson(
    const Timetable& timetable, const Itinerary& itinerary
);

// {"services": [...], "itineraries": [...], "conflicts": [...]}
nlohmann::json TimetableToJson(const Timetable& timetable);

nlohmann::json RenderQueryToJson(const RenderQuery& query);

// Reads a query, every field optional:
//
//   {"mode": "service" | "rakelink" | "station",
//    "start_station": "VIRAR", "end_station": "CHURCHGATE",
//    "passing_through": ["DADAR"],
//    "window_start": 480 | "08:00", "window_end": 600 | "10:00",
//    "directions": ["UP"], "ac": "all" | "ac" | "nonac",
//    "link_names": ["A"], "service_ids": ["93001"]}
//
// Throws std::runtime_error on unknown modes, filters or malformed values.
RenderQuery RenderQueryFromJson(const nlohmann::json& j);

// Flags as in Visibility plus the labels of visible services and links.
nlohmann::json VisibilityToJson(
    const Timetable& timetable, const Visibility& visibility
);

}  // namespace rakelink
